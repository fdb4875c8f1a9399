// vi:noai:sw=4
// Copyright © 2026 ecma48 contributors

#ifndef COMMON__FUNCTIONS__HXX
#define COMMON__FUNCTIONS__HXX

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string>

// The control functions represented by control sequences (ECMA-48 8.3).
// Each one's intermediate and final bytes are fixed by a table, so a
// ControlSequence can only ever end in a valid function identifier.
enum class Function {
    // No intermediate byte.
    ICH,        // '@' insert character
    CUU,        // 'A' cursor up
    CUD,        // 'B' cursor down
    CUF,        // 'C' cursor right
    CUB,        // 'D' cursor left
    CNL,        // 'E' cursor next line
    CPL,        // 'F' cursor preceding line
    CHA,        // 'G' cursor character absolute
    CUP,        // 'H' cursor position
    CHT,        // 'I' cursor forward tabulation
    ED,         // 'J' erase in page
    EL,         // 'K' erase in line
    IL,         // 'L' insert line
    DL,         // 'M' delete line
    EF,         // 'N' erase in field
    EA,         // 'O' erase in area
    DCH,        // 'P' delete character
    SEE,        // 'Q' select editing extent
    CPR,        // 'R' active position report
    SU,         // 'S' scroll up
    SD,         // 'T' scroll down
    NP,         // 'U' next page
    PP,         // 'V' preceding page
    CTC,        // 'W' cursor tabulation control
    ECH,        // 'X' erase character
    CVT,        // 'Y' cursor line tabulation
    CBT,        // 'Z' cursor backward tabulation
    SRS,        // '[' start reversed string
    PTX,        // '\' parallel texts
    SDS,        // ']' start directed string
    SIMD,       // '^' select implicit movement direction
    HPA,        // '`' character position absolute
    HPR,        // 'a' character position forward
    REP,        // 'b' repeat
    DA,         // 'c' device attributes
    VPA,        // 'd' line position absolute
    VPR,        // 'e' line position forward
    HVP,        // 'f' character and line position
    TBC,        // 'g' tabulation clear
    SM,         // 'h' set mode
    MC,         // 'i' media copy
    HPB,        // 'j' character position backward
    VPB,        // 'k' line position backward
    RM,         // 'l' reset mode
    SGR,        // 'm' select graphic rendition
    DSR,        // 'n' device status report
    DAQ,        // 'o' define area qualification
    SCOSC,      // 's' save cursor (private use)
    SCORC,      // 'u' restore cursor (private use)

    // Intermediate byte SPACE.
    SL,         // ' @' scroll left
    SR,         // ' A' scroll right
    GSM,        // ' B' graphic size modification
    GSS,        // ' C' graphic size selection
    FNT,        // ' D' font selection
    TSS,        // ' E' thin space specification
    JFY,        // ' F' justify
    SPI,        // ' G' spacing increment
    QUAD,       // ' H' quad
    SSU,        // ' I' select size unit
    PFS,        // ' J' page format selection
    SHS,        // ' K' select character spacing
    SVS,        // ' L' select line spacing
    IGS,        // ' M' identify graphic subrepertoire
    IDCS,       // ' O' identify device control string
    PPA,        // ' P' page position absolute
    PPR,        // ' Q' page position forward
    PPB,        // ' R' page position backward
    SPD,        // ' S' select presentation directions
    DTA,        // ' T' dimension text area
    SLH,        // ' U' set line home
    SLL,        // ' V' set line limit
    FNK,        // ' W' function key
    SPQR,       // ' X' select print quality and rapidity
    SEF,        // ' Y' sheet eject and feed
    PEC,        // ' Z' presentation expand or contract
    SSW,        // ' [' set space width
    SACS,       // ' \' set additional character separation
    SAPV,       // ' ]' select alternative presentation variants
    STAB,       // ' ^' selective tabulation
    GCC,        // ' _' graphic character combination
    TATE,       // ' `' tabulation aligned trailing edge
    TALE,       // ' a' tabulation aligned leading edge
    TAC,        // ' b' tabulation aligned centred
    TCC,        // ' c' tabulation centred on character
    TSR,        // ' d' tabulation stop remove
    SCO,        // ' e' select character orientation
    SRCS,       // ' f' set reduced character separation
    SCS,        // ' g' set character spacing
    SLS,        // ' h' set line spacing
    SPH,        // ' i' set page home
    SPL,        // ' j' set page limit
    SCP         // ' k' select character path
};

constexpr size_t NUM_FUNCTIONS = static_cast<size_t>(Function::SCP) + 1;

// Mnemonic, e.g. "CUP".
const char * name(Function function);

// The intermediate byte, or NUL if the function has none.
uint8_t intermediateByte(Function function);

uint8_t finalByte(Function function);

// Case-insensitive lookup by mnemonic.
std::optional<Function> lookupFunction(const std::string & mnemonic);

std::ostream & operator << (std::ostream & ost, Function function);

#endif // COMMON__FUNCTIONS__HXX
