// vi:noai:sw=4
// Copyright © 2026 ecma48 contributors

#include "ecma48/common/output.hxx"
#include "ecma48/common/cursor.hxx"
#include "ecma48/common/editor.hxx"
#include "ecma48/support/sys.hxx"

#include <cstdio>
#include <iostream>

#include <unistd.h>

void execute(const std::string & bytes) {
    // Text already given to std::cout or stdio must precede the bytes.
    std::cout.flush();
    std::fflush(stdout);

    writeAll(STDOUT_FILENO, bytes.data(), bytes.size());
}

std::string wrap(const std::string & text, const GraphicRendition & rendition) {
    return rendition.toString() + text + GraphicRendition::resetSequence().toString();
}

std::string clearScreenString(Bits bits) {
    return
        editor::eraseDisplay(editor::EraseDisplay::ALL).toString(bits) +
        cursor::setPosition(1, 1).toString(bits);
}

void clearScreen(Bits bits) {
    execute(clearScreenString(bits));
}
