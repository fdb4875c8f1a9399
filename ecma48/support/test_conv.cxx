// vi:noai:sw=4
// Copyright © 2026 ecma48 contributors

#include "ecma48/support/conv.hxx"
#include "ecma48/support/exception.hxx"
#include "ecma48/support/test.hxx"

namespace {

template <typename T>
bool rejects(const std::string & str) {
    try {
        unstringify<T>(str);
        return false;
    }
    catch (const ConversionError &) {
        return true;
    }
}

void testStringify(Test & test) {
    test.enforceEqual<std::string>(stringify(42), "42", "int");
    test.enforceEqual<std::string>(stringify("row ", 5, ", col ", 1), "row 5, col 1", "variadic");
}

void testUnstringify(Test & test) {
    test.enforceEqual<uint32_t>(unstringify<uint32_t>("42"), 42, "unsigned");
    test.enforceEqual<uint32_t>(unstringify<uint32_t>("0"), 0, "zero");
    test.enforceEqual<std::string>(unstringify<std::string>("text"), "text", "string");
    test.enforce(unstringify<bool>("true"), "bool true");
    test.enforce(!unstringify<bool>("0"), "bool 0");

    test.enforce(rejects<uint32_t>("-1"), "negative unsigned");
    test.enforce(rejects<uint32_t>("12x"), "trailing garbage");
    test.enforce(rejects<uint32_t>(""), "empty");
    test.enforce(rejects<uint32_t>("x"), "not a number");
    test.enforce(rejects<bool>("maybe"), "bad bool");
}

void testHex(Test & test) {
    test.enforceEqual<std::string>(byteToHex(0x9B), "9B", "CSI");
    test.enforceEqual<std::string>(byteToHex(0x07), "07", "leading zero");
    test.enforceEqual<std::string>(toUpper("sgr"), "SGR", "upper");
}

void testVisible(Test & test) {
    test.enforceEqual<std::string>(toVisible("\x1b[1m"), "^[[1m", "ESC");
    test.enforceEqual<std::string>(toVisible("a\tb"), "a\\x09b", "TAB");
    test.enforceEqual<std::string>(toVisible("\x9b" "2J"), "\\x9B2J", "8-bit");
    test.enforceEqual<std::string>(toVisible("plain"), "plain", "printable");
}

} // namespace {anonymous}

int main() {
    Test test("support/conv");
    test.run("stringify", testStringify);
    test.run("unstringify", testUnstringify);
    test.run("hex", testHex);
    test.run("visible", testVisible);
    return 0;
}
