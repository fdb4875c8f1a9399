// vi:noai:sw=4
// Copyright © 2026 ecma48 contributors

#ifndef COMMON__CODES__HXX
#define COMMON__CODES__HXX

#include <cstdint>
#include <iosfwd>
#include <string>

// How C1 functions, the CSI introducer among them, reach the output.
enum class Bits {
    SEVEN,      // ESC Fe, e.g. ESC '[' for CSI
    EIGHT       // single byte 0x80..0x9F, e.g. 0x9B for CSI
};

//
// C0 - the 32 control characters of the 7-bit table (ECMA-48 8.2).
//

enum class C0 : uint8_t {
    NUL = 0x00,
    SOH,        // start of heading
    STX,        // start of text
    ETX,        // end of text
    EOT,        // end of transmission
    ENQ,        // enquiry
    ACK,        // acknowledge
    BEL,        // bell
    BS,         // backspace
    HT,         // character tabulation
    LF,         // line feed
    VT,         // line tabulation
    FF,         // form feed
    CR,         // carriage return
    SO,         // shift-out
    SI,         // shift-in
    DLE,        // data link escape
    DC1,        // device control one
    DC2,
    DC3,
    DC4,
    NAK,        // negative acknowledge
    SYN,        // synchronous idle
    ETB,        // end of transmission block
    CAN,        // cancel
    EM,         // end of medium
    SUB,        // substitute
    ESC,        // escape
    IS4,        // information separator four (FS)
    IS3,        // (GS)
    IS2,        // (RS)
    IS1         // (US)
};

// ECMA-48 aliases.
constexpr C0 LS0 = C0::SI;
constexpr C0 LS1 = C0::SO;
constexpr C0 FS  = C0::IS4;
constexpr C0 GS  = C0::IS3;
constexpr C0 RS  = C0::IS2;
constexpr C0 US  = C0::IS1;

//
// C1 - the control functions of columns 08 and 09 of the 8-bit table
// (ECMA-48 8.3). In a 7-bit environment each is ESC followed by the
// byte value less 0x40.
//

enum class C1 : uint8_t {
    PAD = 0x80, // padding character (ECMA-48 3rd edition)
    HOP,        // high octet preset (ECMA-48 3rd edition)
    BPH,        // break permitted here
    NBH,        // no break here
    IND,        // index (ECMA-48 4th edition)
    NEL,        // next line
    SSA,        // start of selected area
    ESA,        // end of selected area
    HTS,        // character tabulation set
    HTJ,        // character tabulation with justification
    VTS,        // line tabulation set
    PLD,        // partial line forward
    PLU,        // partial line backward
    RI,         // reverse line feed
    SS2,        // single-shift two
    SS3,        // single-shift three
    DCS,        // device control string
    PU1,        // private use one
    PU2,        // private use two
    STS,        // set transmit state
    CCH,        // cancel character
    MW,         // message waiting
    SPA,        // start of guarded area
    EPA,        // end of guarded area
    SOS,        // start of string
    SGC,        // single graphic character introducer (ECMA-48 3rd edition)
    SCI,        // single character introducer
    CSI,        // control sequence introducer
    ST,         // string terminator
    OSC,        // operating system command
    PM,         // privacy message
    APC         // application program command
};

//
// Fs - independent control functions (ECMA-48 5.5), always ESC Fs.
//

enum class Fs : uint8_t {
    DMI  = 0x60, // disable manual input
    INT,         // interrupt
    EMI,         // enable manual input
    RIS,         // reset to initial state
    CMD,         // coding method delimiter
    LS2  = 0x6E, // locking-shift two
    LS3,         // locking-shift three
    LS3R = 0x7C, // locking-shift three right
    LS2R,        // locking-shift two right
    LS1R         // locking-shift one right
};

// Mnemonics, e.g. "BEL", "CSI", "RIS".
const char * name(C0 c0);
const char * name(C1 c1);
const char * name(Fs fs);

// The exact bytes of each function.
std::string encode(C0 c0);
std::string encode(C1 c1, Bits bits = Bits::SEVEN);
std::string encode(Fs fs);

// Stream the exact bytes. C1 functions use their 7-bit form.
std::ostream & operator << (std::ostream & ost, C0 c0);
std::ostream & operator << (std::ostream & ost, C1 c1);
std::ostream & operator << (std::ostream & ost, Fs fs);

#endif // COMMON__CODES__HXX
