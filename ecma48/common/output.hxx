// vi:noai:sw=4
// Copyright © 2026 ecma48 contributors

#ifndef COMMON__OUTPUT__HXX
#define COMMON__OUTPUT__HXX

#include "ecma48/common/rendition.hxx"

#include <string>

// Write 'bytes' to standard output, unbuffered, after flushing anything
// pending in std::cout and stdio.
// Throws SystemError if the write fails.
void execute(const std::string & bytes);

// Activation sequence, 'text', then ESC [ 0 m.
std::string wrap(const std::string & text, const GraphicRendition & rendition);

// ED(2) followed by CUP(1;1).
std::string clearScreenString(Bits bits = Bits::SEVEN);

void clearScreen(Bits bits = Bits::SEVEN);

#endif // COMMON__OUTPUT__HXX
