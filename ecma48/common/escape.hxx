// vi:noai:sw=4
// Copyright © 2013-2015 David Bryant
// Copyright © 2026 ecma48 contributors

#ifndef COMMON__ESCAPE__HXX
#define COMMON__ESCAPE__HXX

#include "ecma48/common/codes.hxx"
#include "ecma48/common/functions.hxx"
#include "ecma48/common/parameters.hxx"

#include <iosfwd>
#include <string>
#include <utility>

//
// Control Sequence: CSI, parameter bytes, intermediate byte, final byte.
//

class ControlSequence {
    Function _function;
    Params   _params;

public:
    explicit ControlSequence(Function function, Params params = Params()) :
        _function(function), _params(std::move(params)) {}

    Function       getFunction() const { return _function; }
    const Params & getParams()   const { return _params; }

    // The exact bytes.
    std::string toString(Bits bits = Bits::SEVEN) const;

    // Convert to human readable string, e.g. "^[[5;1H(CUP)".
    std::string str() const;

    // Write the bytes to standard output.
    void exec(Bits bits = Bits::SEVEN) const;

    void write(std::ostream & ost, Bits bits) const;
};

std::ostream & operator << (std::ostream & ost, const ControlSequence & seq);

//
// Escape Sequence: ESC Fe (a C1 function in 7-bit form) or ESC Fs.
//

class EscapeSequence {
    uint8_t _code;
    bool    _c1;

public:
    explicit EscapeSequence(C1 c1) : _code(static_cast<uint8_t>(c1)), _c1(true) {}
    explicit EscapeSequence(Fs fs) : _code(static_cast<uint8_t>(fs)), _c1(false) {}

    // Mnemonic, e.g. "RIS".
    const char * getName() const;

    // The exact bytes. 'bits' only matters for C1 functions.
    std::string toString(Bits bits = Bits::SEVEN) const;

    // Convert to human readable string, e.g. "^[c(RIS)".
    std::string str() const;

    void exec(Bits bits = Bits::SEVEN) const;
};

std::ostream & operator << (std::ostream & ost, const EscapeSequence & esc);

//
// Control String: an opening delimiter, a command or character string,
// and STRING TERMINATOR. SCI instead takes exactly one character.
//

class ControlString {
    C1          _opener;
    std::string _content;

    ControlString(C1 opener, std::string content) :
        _opener(opener), _content(std::move(content)) {}

public:
    // Command strings: bytes 0x08..0x0D and 0x20..0x7E only.
    // Throw ConversionError for anything else.
    static ControlString APC(const std::string & command);
    static ControlString DCS(const std::string & command);
    static ControlString OSC(const std::string & command);
    static ControlString PM(const std::string & command);

    // Character string: anything but SOS and ST in their 7-bit form.
    static ControlString SOS(const std::string & characters);

    // SINGLE CHARACTER INTRODUCER and its one following character,
    // which must be 0x08..0x0D or 0x20..0x7E.
    static ControlString SCI(char ch);

    C1                  getOpener()  const { return _opener; }
    const std::string & getContent() const { return _content; }

    std::string toString(Bits bits = Bits::SEVEN) const;

    // Convert to human readable string, e.g. "^[]0;title^[\(OSC)".
    std::string str() const;

    void exec(Bits bits = Bits::SEVEN) const;
};

std::ostream & operator << (std::ostream & ost, const ControlString & cs);

#endif // COMMON__ESCAPE__HXX
