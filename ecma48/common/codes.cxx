// vi:noai:sw=4
// Copyright © 2026 ecma48 contributors

#include "ecma48/common/codes.hxx"
#include "ecma48/common/ascii.hxx"
#include "ecma48/support/debug.hxx"

#include <array>
#include <iostream>

namespace {

// [0x00..0x20)
constexpr std::array<const char *, 0x20> C0_STR = {{
    "NUL",      // 0x00
    "SOH",
    "STX",
    "ETX",
    "EOT",
    "ENQ",
    "ACK",
    "BEL",
    //
    "BS",       // 0x08
    "HT",
    "LF",
    "VT",
    "FF",
    "CR",
    "SO",
    "SI",
    //
    "DLE",      // 0x10
    "DC1",
    "DC2",
    "DC3",
    "DC4",
    "NAK",
    "SYN",
    "ETB",
    //
    "CAN",      // 0x18
    "EM",
    "SUB",
    "ESC",
    "IS4",
    "IS3",
    "IS2",
    "IS1"
}};

// [0x80..0xA0)
constexpr std::array<const char *, 0x20> C1_STR = {{
    "PAD",      // 0x80
    "HOP",
    "BPH",
    "NBH",
    "IND",
    "NEL",
    "SSA",
    "ESA",
    //
    "HTS",      // 0x88
    "HTJ",
    "VTS",
    "PLD",
    "PLU",
    "RI",
    "SS2",
    "SS3",
    //
    "DCS",      // 0x90
    "PU1",
    "PU2",
    "STS",
    "CCH",
    "MW",
    "SPA",
    "EPA",
    //
    "SOS",      // 0x98
    "SGC",
    "SCI",
    "CSI",
    "ST",
    "OSC",
    "PM",
    "APC"
}};

// [0x60..0x7F)
constexpr std::array<const char *, 0x7F - 0x60> FS_STR = {{
    "DMI",      // '`'              0x60
    "INT",      // 'a'
    "EMI",      // 'b'
    "RIS",      // 'c'
    "CMD",      // 'd'
    nullptr,    // 'e'
    nullptr,    // 'f'
    nullptr,    // 'g'
    //
    nullptr,    // 'h'
    nullptr,    // 'i'
    nullptr,    // 'j'
    nullptr,    // 'k'
    nullptr,    // 'l'
    nullptr,    // 'm'
    "LS2",      // 'n'
    "LS3",      // 'o'
    //
    nullptr,    // 'p'              0x70
    nullptr,    // 'q'
    nullptr,    // 'r'
    nullptr,    // 's'
    nullptr,    // 't'
    nullptr,    // 'u'
    nullptr,    // 'v'
    nullptr,    // 'w'
    //
    nullptr,    // 'x'
    nullptr,    // 'y'
    nullptr,    // 'z'
    nullptr,    // '{'
    "LS3R",     // '|'
    "LS2R",     // '}'
    "LS1R"      // '~'
}};

} // namespace {anonymous}

const char * name(C0 c0) {
    auto index = static_cast<size_t>(c0);
    ASSERT(index < C0_STR.size(), << "C0 out of range: " << index);
    return C0_STR[index];
}

const char * name(C1 c1) {
    auto str = C1_STR[static_cast<size_t>(c1) - 0x80];
    ASSERT(str, << "Unassigned C1: " << static_cast<int>(c1));
    return str;
}

const char * name(Fs fs) {
    auto str = FS_STR[static_cast<size_t>(fs) - 0x60];
    ASSERT(str, << "Unassigned Fs: " << static_cast<int>(fs));
    return str;
}

std::string encode(C0 c0) {
    return std::string(1, static_cast<char>(c0));
}

std::string encode(C1 c1, Bits bits) {
    auto byte = static_cast<uint8_t>(c1);

    switch (bits) {
        case Bits::SEVEN: {
            std::string str;
            str.push_back(static_cast<char>(ESC));
            str.push_back(static_cast<char>(byte - 0x40));
            return str;
        }
        case Bits::EIGHT:
            return std::string(1, static_cast<char>(byte));
    }

    FATAL(<< "Unreachable");
}

std::string encode(Fs fs) {
    std::string str;
    str.push_back(static_cast<char>(ESC));
    str.push_back(static_cast<char>(fs));
    return str;
}

std::ostream & operator << (std::ostream & ost, C0 c0) {
    return ost << static_cast<char>(c0);
}

std::ostream & operator << (std::ostream & ost, C1 c1) {
    return ost << encode(c1, Bits::SEVEN);
}

std::ostream & operator << (std::ostream & ost, Fs fs) {
    return ost << encode(fs);
}
