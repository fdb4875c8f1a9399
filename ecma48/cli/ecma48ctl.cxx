// vi:noai:sw=4
// Copyright © 2026 ecma48 contributors

#include "ecma48/common/escape.hxx"
#include "ecma48/common/output.hxx"
#include "ecma48/support/cmdline.hxx"
#include "ecma48/support/conv.hxx"
#include "ecma48/support/debug.hxx"
#include "ecma48/support/exception.hxx"

#include <iomanip>
#include <iostream>
#include <sstream>

namespace {

    std::string makeHelp(const std::string & progName) {
        std::ostringstream ost;
        ost << "ecma48ctl " << VERSION << std::endl
            << "Usage: " << progName << " [OPTION]... MNEMONIC [PARAM]..." << std::endl
            << std::endl
            << "Write the ECMA-48 control sequence MNEMONIC (e.g. CUP, SGR, ED)" << std::endl
            << "to standard output. An empty PARAM is omitted. SGR without" << std::endl
            << "parameters is written as the reset, SGR 0." << std::endl
            << std::endl
            << "Options:" << std::endl
            << "  --help" << std::endl
            << "  --version" << std::endl
            << "  --eight-bit       emit C1 functions as single 8-bit bytes" << std::endl
            << "  --visible         print a readable rendering instead of the bytes" << std::endl
            << "  --list            list the known mnemonics" << std::endl;
        return ost.str();
    }

    void listFunctions(std::ostream & ost) {
        for (size_t i = 0; i != NUM_FUNCTIONS; ++i) {
            auto function = static_cast<Function>(i);
            auto inter    = intermediateByte(function);

            ost << std::left << std::setw(6) << name(function)
                << (inter == '\0' ? "  " : "SP")
                << ' ' << static_cast<char>(finalByte(function))
                << std::endl;
        }
    }

    Param parseParam(const std::string & arg) {
        if (arg.empty()) {
            return Param();
        }

        try {
            return unstringify<uint32_t>(arg);
        }
        catch (const ConversionError &) {
            THROW(UserError("Bad parameter: '" + arg + "'"));
        }
    }

} // namespace

int main(int argc, char * argv[]) try {
    bool eightBit = false;
    bool visible  = false;
    bool list     = false;

    CmdLine cmdLine(makeHelp(argv[0]), VERSION);
    cmdLine.add(std::make_unique<BoolHandler>(eightBit), '8', "eight-bit");
    cmdLine.add(std::make_unique<BoolHandler>(visible),  'v', "visible");
    cmdLine.add(std::make_unique<BoolHandler>(list),     'l', "list");

    auto arguments = cmdLine.parse(argc, const_cast<const char **>(argv));

    if (list) {
        listFunctions(std::cout);
        return 0;
    }

    THROW_UNLESS(!arguments.empty(), UserError("No mnemonic, try --help"));

    auto function = lookupFunction(arguments.front());
    THROW_UNLESS(function, UserError("Unknown mnemonic: " + arguments.front()));

    Params params;
    for (auto iter = arguments.begin() + 1; iter != arguments.end(); ++iter) {
        params.push_back(parseParam(*iter));
    }

    // A bare SGR is written as the explicit reset.
    auto seq = *function == Function::SGR && params.empty()
                   ? GraphicRendition::resetSequence()
                   : ControlSequence(*function, params);

    if (visible) {
        if (eightBit) {
            WARNING(<< "--eight-bit has no effect with --visible");
        }
        std::cout << seq.str() << std::endl;
    }
    else {
        seq.exec(eightBit ? Bits::EIGHT : Bits::SEVEN);
    }

    return 0;
}
catch (const UserError & ex) {
    std::cerr << ex.message() << std::endl;
    return 1;
}
catch (const SystemError & ex) {
    std::cerr << ex.what() << std::endl;
    return 1;
}
