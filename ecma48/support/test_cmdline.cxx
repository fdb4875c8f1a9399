// vi:noai:sw=4
// Copyright © 2013 David Bryant
// Copyright © 2026 ecma48 contributors

#include "ecma48/support/cmdline.hxx"
#include "ecma48/support/test.hxx"

#include <initializer_list>

namespace {

std::vector<std::string> parse(CmdLine & cmdLine, std::initializer_list<const char *> args) {
    std::vector<const char *> argv(args);
    return cmdLine.parse(static_cast<int>(argv.size()), argv.data());
}

bool throwsUserError(CmdLine & cmdLine, std::initializer_list<const char *> args) {
    try {
        parse(cmdLine, args);
        return false;
    }
    catch (const UserError &) {
        return true;
    }
}

void testBool(Test & test) {
    CmdLine cmdLine("help", "version");
    bool goTrue  = false;
    bool goFalse = true;
    cmdLine.add(std::make_unique<BoolHandler>(goTrue),  '\0', "bool1", true);
    cmdLine.add(std::make_unique<BoolHandler>(goFalse), '\0', "bool2", true);
    auto args = parse(cmdLine, { "dummy", "--bool1", "--no-bool2" });
    test.enforce(goTrue, "--bool1");
    test.enforce(!goFalse, "--no-bool2");
    test.enforce(args.empty(), "no positional arguments");
}

void testValues(Test & test) {
    CmdLine cmdLine("help", "version");
    std::string str;
    uint32_t    num = 0;
    uint32_t    other = 0;
    cmdLine.add(std::make_unique<StringHandler>(str), '\0', "str");
    cmdLine.add(std::make_unique<IStreamHandler<uint32_t>>(num), 'n', "num");
    cmdLine.add(std::make_unique<MiscHandler>([&](const std::string & value) {
        other = unstringify<uint32_t>(value) * 2;
    }), 'o', "other");

    parse(cmdLine, { "dummy", "--str=foo", "--num", "7", "-o21" });
    test.enforceEqual<std::string>(str, "foo", "--str=foo");
    test.enforceEqual<uint32_t>(num, 7, "--num 7");
    test.enforceEqual<uint32_t>(other, 42, "-o21");

    parse(cmdLine, { "dummy", "-n", "9" });
    test.enforceEqual<uint32_t>(num, 9, "-n 9");
}

void testPositional(Test & test) {
    CmdLine cmdLine("help", "version");
    bool flag = false;
    cmdLine.add(std::make_unique<BoolHandler>(flag), 'f', "flag");

    auto args = parse(cmdLine, { "dummy", "CUP", "-f", "", "5", "--", "-f" });
    test.enforce(flag, "-f");
    test.enforceEqual<size_t>(args.size(), 4, "argument count");
    test.enforceEqual<std::string>(args[0], "CUP", "first");
    test.enforceEqual<std::string>(args[1], "", "empty argument kept");
    test.enforceEqual<std::string>(args[2], "5", "third");
    test.enforceEqual<std::string>(args[3], "-f", "after delimiter");
}

void testErrors(Test & test) {
    CmdLine cmdLine("help", "version");
    bool flag = false;
    uint32_t num = 0;
    cmdLine.add(std::make_unique<BoolHandler>(flag), 'f', "flag");
    cmdLine.add(std::make_unique<IStreamHandler<uint32_t>>(num), 'n', "num", true);

    test.enforce(throwsUserError(cmdLine, { "dummy", "--bogus", "-n1" }), "unknown long option");
    test.enforce(throwsUserError(cmdLine, { "dummy", "-x", "-n1" }), "unknown short option");
    test.enforce(throwsUserError(cmdLine, { "dummy", "-f" }), "missing mandatory option");
    test.enforce(throwsUserError(cmdLine, { "dummy", "--num" }), "missing value");
    test.enforce(throwsUserError(cmdLine, { "dummy", "--flag=1", "-n1" }), "unwanted value");
    test.enforce(throwsUserError(cmdLine, { "dummy", "--no-num", "-n1" }), "not negatable");
}

} // namespace {anonymous}

int main() {
    Test test("support/cmdline");
    test.run("bool", testBool);
    test.run("values", testValues);
    test.run("positional", testPositional);
    test.run("errors", testErrors);
    return 0;
}
