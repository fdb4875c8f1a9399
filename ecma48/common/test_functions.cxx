// vi:noai:sw=4
// Copyright © 2026 ecma48 contributors

#include "ecma48/common/functions.hxx"
#include "ecma48/common/ascii.hxx"
#include "ecma48/support/test.hxx"

#include <cctype>
#include <set>

namespace {

std::string toLower(std::string str) {
    for (auto & ch : str) {
        ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    }
    return str;
}

void testTable(Test & test) {
    std::set<std::string> mnemonics;
    std::set<std::pair<int, int>> identifiers;

    for (size_t i = 0; i != NUM_FUNCTIONS; ++i) {
        auto function = static_cast<Function>(i);
        std::string mnemonic = name(function);
        auto inter = intermediateByte(function);
        auto final = finalByte(function);

        test.enforce(!mnemonic.empty(), "mnemonic for " + stringify(i));
        test.enforce(isFinal(final), mnemonic + " final byte");
        test.enforce(inter == '\0' || isIntermediate(inter), mnemonic + " intermediate byte");

        mnemonics.insert(mnemonic);
        identifiers.insert(std::make_pair(inter, final));
    }

    test.enforceEqual<size_t>(mnemonics.size(), NUM_FUNCTIONS, "unique mnemonics");
    test.enforceEqual<size_t>(identifiers.size(), NUM_FUNCTIONS, "unique identifiers");
}

void testBytes(Test & test) {
    test.enforceEqual<int>(finalByte(Function::CUP), 'H', "CUP");
    test.enforceEqual<int>(intermediateByte(Function::CUP), 0, "CUP no intermediate");
    test.enforceEqual<int>(finalByte(Function::ED), 'J', "ED");
    test.enforceEqual<int>(finalByte(Function::SGR), 'm', "SGR");
    test.enforceEqual<int>(finalByte(Function::CPR), 'R', "CPR");
    test.enforceEqual<int>(finalByte(Function::SCOSC), 's', "SCOSC");
    test.enforceEqual<int>(finalByte(Function::SCORC), 'u', "SCORC");
    test.enforceEqual<int>(intermediateByte(Function::SL), ' ', "SL intermediate");
    test.enforceEqual<int>(finalByte(Function::SL), '@', "SL");
    test.enforceEqual<int>(finalByte(Function::SCP), 'k', "SCP");
    test.enforceEqual<int>(finalByte(Function::PTX), '\\', "PTX");
}

void testLookup(Test & test) {
    for (size_t i = 0; i != NUM_FUNCTIONS; ++i) {
        auto function = static_cast<Function>(i);
        auto found    = lookupFunction(toLower(name(function)));
        test.enforce(found && *found == function, std::string("lookup ") + name(function));
    }

    test.enforce(!lookupFunction("XYZ"), "unknown");
    test.enforce(!lookupFunction(""), "empty");
    test.enforceEqual<std::string>(stringify(Function::HVP), "HVP", "operator<<");
}

} // namespace {anonymous}

int main() {
    Test test("common/functions");
    test.run("table", testTable);
    test.run("bytes", testBytes);
    test.run("lookup", testLookup);
    return 0;
}
