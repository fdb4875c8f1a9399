// vi:noai:sw=4
// Copyright © 2026 ecma48 contributors

#include "ecma48/common/functions.hxx"
#include "ecma48/common/ascii.hxx"
#include "ecma48/support/conv.hxx"
#include "ecma48/support/debug.hxx"

#include <array>
#include <iostream>

namespace {

struct Definition {
    const char * mnemonic;
    uint8_t      inter;     // '\0' for none
    uint8_t      final;
};

// Indexed by Function.
constexpr std::array<Definition, NUM_FUNCTIONS> FUNCTION_TABLE = {{
    { "ICH",   '\0', '@'  },
    { "CUU",   '\0', 'A'  },
    { "CUD",   '\0', 'B'  },
    { "CUF",   '\0', 'C'  },
    { "CUB",   '\0', 'D'  },
    { "CNL",   '\0', 'E'  },
    { "CPL",   '\0', 'F'  },
    { "CHA",   '\0', 'G'  },
    //
    { "CUP",   '\0', 'H'  },
    { "CHT",   '\0', 'I'  },
    { "ED",    '\0', 'J'  },
    { "EL",    '\0', 'K'  },
    { "IL",    '\0', 'L'  },
    { "DL",    '\0', 'M'  },
    { "EF",    '\0', 'N'  },
    { "EA",    '\0', 'O'  },
    //
    { "DCH",   '\0', 'P'  },
    { "SEE",   '\0', 'Q'  },
    { "CPR",   '\0', 'R'  },
    { "SU",    '\0', 'S'  },
    { "SD",    '\0', 'T'  },
    { "NP",    '\0', 'U'  },
    { "PP",    '\0', 'V'  },
    { "CTC",   '\0', 'W'  },
    //
    { "ECH",   '\0', 'X'  },
    { "CVT",   '\0', 'Y'  },
    { "CBT",   '\0', 'Z'  },
    { "SRS",   '\0', '['  },
    { "PTX",   '\0', '\\' },
    { "SDS",   '\0', ']'  },
    { "SIMD",  '\0', '^'  },
    //
    { "HPA",   '\0', '`'  },
    { "HPR",   '\0', 'a'  },
    { "REP",   '\0', 'b'  },
    { "DA",    '\0', 'c'  },
    { "VPA",   '\0', 'd'  },
    { "VPR",   '\0', 'e'  },
    { "HVP",   '\0', 'f'  },
    { "TBC",   '\0', 'g'  },
    //
    { "SM",    '\0', 'h'  },
    { "MC",    '\0', 'i'  },
    { "HPB",   '\0', 'j'  },
    { "VPB",   '\0', 'k'  },
    { "RM",    '\0', 'l'  },
    { "SGR",   '\0', 'm'  },
    { "DSR",   '\0', 'n'  },
    { "DAQ",   '\0', 'o'  },
    //
    { "SCOSC", '\0', 's'  },
    { "SCORC", '\0', 'u'  },
    //
    { "SL",    ' ',  '@'  },
    { "SR",    ' ',  'A'  },
    { "GSM",   ' ',  'B'  },
    { "GSS",   ' ',  'C'  },
    { "FNT",   ' ',  'D'  },
    { "TSS",   ' ',  'E'  },
    { "JFY",   ' ',  'F'  },
    //
    { "SPI",   ' ',  'G'  },
    { "QUAD",  ' ',  'H'  },
    { "SSU",   ' ',  'I'  },
    { "PFS",   ' ',  'J'  },
    { "SHS",   ' ',  'K'  },
    { "SVS",   ' ',  'L'  },
    { "IGS",   ' ',  'M'  },
    { "IDCS",  ' ',  'O'  },
    //
    { "PPA",   ' ',  'P'  },
    { "PPR",   ' ',  'Q'  },
    { "PPB",   ' ',  'R'  },
    { "SPD",   ' ',  'S'  },
    { "DTA",   ' ',  'T'  },
    { "SLH",   ' ',  'U'  },
    { "SLL",   ' ',  'V'  },
    { "FNK",   ' ',  'W'  },
    //
    { "SPQR",  ' ',  'X'  },
    { "SEF",   ' ',  'Y'  },
    { "PEC",   ' ',  'Z'  },
    { "SSW",   ' ',  '['  },
    { "SACS",  ' ',  '\\' },
    { "SAPV",  ' ',  ']'  },
    { "STAB",  ' ',  '^'  },
    { "GCC",   ' ',  '_'  },
    //
    { "TATE",  ' ',  '`'  },
    { "TALE",  ' ',  'a'  },
    { "TAC",   ' ',  'b'  },
    { "TCC",   ' ',  'c'  },
    { "TSR",   ' ',  'd'  },
    { "SCO",   ' ',  'e'  },
    { "SRCS",  ' ',  'f'  },
    { "SCS",   ' ',  'g'  },
    //
    { "SLS",   ' ',  'h'  },
    { "SPH",   ' ',  'i'  },
    { "SPL",   ' ',  'j'  },
    { "SCP",   ' ',  'k'  }
}};

const Definition & definition(Function function) {
    auto index = static_cast<size_t>(function);
    ASSERT(index < FUNCTION_TABLE.size(), << "Function out of range: " << index);
    const auto & def = FUNCTION_TABLE[index];
    ASSERT(isFinal(def.final), << def.mnemonic);
    ASSERT(def.inter == '\0' || isIntermediate(def.inter), << def.mnemonic);
    return def;
}

} // namespace {anonymous}

const char * name(Function function) {
    return definition(function).mnemonic;
}

uint8_t intermediateByte(Function function) {
    return definition(function).inter;
}

uint8_t finalByte(Function function) {
    return definition(function).final;
}

std::optional<Function> lookupFunction(const std::string & mnemonic) {
    auto upper = toUpper(mnemonic);

    for (size_t i = 0; i != FUNCTION_TABLE.size(); ++i) {
        if (upper == FUNCTION_TABLE[i].mnemonic) {
            return static_cast<Function>(i);
        }
    }

    return std::nullopt;
}

std::ostream & operator << (std::ostream & ost, Function function) {
    return ost << name(function);
}
