// vi:noai:sw=4
// Copyright © 2013-2015 David Bryant
// Copyright © 2026 ecma48 contributors

#include "ecma48/common/escape.hxx"
#include "ecma48/common/ascii.hxx"
#include "ecma48/common/output.hxx"
#include "ecma48/support/conv.hxx"
#include "ecma48/support/debug.hxx"
#include "ecma48/support/exception.hxx"

#include <iostream>
#include <sstream>

namespace {

// ECMA-48 5.6: command strings consist of bit combinations in the
// range 0x08 to 0x0D and 0x20 to 0x7E.
bool isCommandByte(uint8_t c) {
    return (c >= 0x08 && c <= 0x0D) || (c >= SPACE && c < DEL);
}

void checkCommand(const std::string & command, const char * opener) {
    for (auto ch : command) {
        auto byte = static_cast<uint8_t>(ch);
        THROW_UNLESS(isCommandByte(byte),
                     ConversionError(std::string("Invalid byte in ") + opener +
                                     " string: 0x" + byteToHex(byte)));
    }
}

// A character string may contain anything but SOS and ST. Only their
// 7-bit forms are rejected: the 8-bit bytes occur inside UTF-8 text.
void checkCharacters(const std::string & characters) {
    for (auto ch : {C1::SOS, C1::ST}) {
        THROW_UNLESS(characters.find(encode(ch, Bits::SEVEN)) == std::string::npos,
                     ConversionError(std::string("SOS string contains ") + name(ch)));
    }
}

} // namespace {anonymous}

//
// ControlSequence
//

void ControlSequence::write(std::ostream & ost, Bits bits) const {
    ost << encode(C1::CSI, bits);

    ost << encodeParameters(_params);

    auto inter = intermediateByte(_function);
    if (inter != '\0') { ost << inter; }

    ost << finalByte(_function);
}

std::string ControlSequence::toString(Bits bits) const {
    std::ostringstream ost;
    write(ost, bits);
    return ost.str();
}

std::string ControlSequence::str() const {
    std::ostringstream ost;
    ost << toVisible(toString()) << '(' << name(_function) << ')';
    return ost.str();
}

void ControlSequence::exec(Bits bits) const {
    execute(toString(bits));
}

std::ostream & operator << (std::ostream & ost, const ControlSequence & seq) {
    seq.write(ost, Bits::SEVEN);
    return ost;
}

//
// EscapeSequence
//

const char * EscapeSequence::getName() const {
    return _c1 ? name(static_cast<C1>(_code)) : name(static_cast<Fs>(_code));
}

std::string EscapeSequence::toString(Bits bits) const {
    if (_c1) {
        return encode(static_cast<C1>(_code), bits);
    }
    else {
        return encode(static_cast<Fs>(_code));
    }
}

std::string EscapeSequence::str() const {
    std::ostringstream ost;
    ost << toVisible(toString()) << '(' << getName() << ')';
    return ost.str();
}

void EscapeSequence::exec(Bits bits) const {
    execute(toString(bits));
}

std::ostream & operator << (std::ostream & ost, const EscapeSequence & esc) {
    return ost << esc.toString();
}

//
// ControlString
//

ControlString ControlString::APC(const std::string & command) {
    checkCommand(command, "APC");
    return ControlString(C1::APC, command);
}

ControlString ControlString::DCS(const std::string & command) {
    checkCommand(command, "DCS");
    return ControlString(C1::DCS, command);
}

ControlString ControlString::OSC(const std::string & command) {
    checkCommand(command, "OSC");
    return ControlString(C1::OSC, command);
}

ControlString ControlString::PM(const std::string & command) {
    checkCommand(command, "PM");
    return ControlString(C1::PM, command);
}

ControlString ControlString::SOS(const std::string & characters) {
    checkCharacters(characters);
    return ControlString(C1::SOS, characters);
}

ControlString ControlString::SCI(char ch) {
    std::string content(1, ch);
    checkCommand(content, "SCI");
    return ControlString(C1::SCI, content);
}

std::string ControlString::toString(Bits bits) const {
    auto str = encode(_opener, bits) + _content;
    if (_opener != C1::SCI) {
        str += encode(C1::ST, bits);
    }
    return str;
}

std::string ControlString::str() const {
    std::ostringstream ost;
    ost << toVisible(toString()) << '(' << name(_opener) << ')';
    return ost.str();
}

void ControlString::exec(Bits bits) const {
    execute(toString(bits));
}

std::ostream & operator << (std::ostream & ost, const ControlString & cs) {
    return ost << cs.toString();
}
