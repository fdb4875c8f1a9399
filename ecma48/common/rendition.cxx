// vi:noai:sw=4
// Copyright © 2026 ecma48 contributors

#include "ecma48/common/rendition.hxx"
#include "ecma48/support/debug.hxx"

#include <array>
#include <iostream>

namespace {

constexpr std::array<uint32_t, static_cast<size_t>(GraphicRendition::Stock::RESET_IDEOGRAM) + 1>
SGR_TABLE = {{
    0,      // reset all

    1,      // bold
    2,      // faint
    3,      // italic
    4,      // underline
    5,      // blink slow
    6,      // blink rapid
    7,      // inverse / negative
    8,      // conceal
    9,      // crossed out

    20,     // fraktur
    21,     // double underline

    22,     // clear weight
    23,     // clear slant
    24,     // clear underline
    25,     // clear blink
    27,     // clear inverse
    28,     // clear conceal
    29,     // clear crossed out

    51,     // framed
    52,     // encircled
    53,     // overlined
    54,     // clear framed / encircled
    55,     // clear overlined

    60,     // ideogram underline
    61,     // ideogram double underline
    62,     // ideogram overline
    63,     // ideogram double overline
    64,     // ideogram stress marking
    65      // clear ideogram
}};

constexpr uint32_t FG_BASE        = 30;
constexpr uint32_t FG_DEFAULT     = 39;
constexpr uint32_t FG_BRIGHT_BASE = 90;
constexpr uint32_t FG_EXTENDED    = 38;
constexpr uint32_t BG_OFFSET      = 10;     // 40.., 49, 100.., 48

constexpr uint32_t FONT_BASE      = 10;

// Second parameter of 38/48.
constexpr uint32_t EXTENDED_DIRECT  = 2;
constexpr uint32_t EXTENDED_INDEXED = 5;

uint32_t fgCode(Color color) {
    auto index = static_cast<uint32_t>(color);

    if (color < Color::DEFAULT) {
        return FG_BASE + index;
    }
    else if (color == Color::DEFAULT) {
        return FG_DEFAULT;
    }
    else {
        return FG_BRIGHT_BASE + (index - static_cast<uint32_t>(Color::BRIGHT_BLACK));
    }
}

} // namespace {anonymous}

GraphicRendition & GraphicRendition::add(Stock stock) {
    auto index = static_cast<size_t>(stock);
    ASSERT(index < SGR_TABLE.size(), << "Stock SGR out of range: " << index);
    return push(SGR_TABLE[index]);
}

GraphicRendition & GraphicRendition::font(Font font) {
    return push(FONT_BASE + static_cast<uint32_t>(font));
}

GraphicRendition & GraphicRendition::fg(Color color) {
    return push(fgCode(color));
}

GraphicRendition & GraphicRendition::bg(Color color) {
    return push(fgCode(color) + BG_OFFSET);
}

GraphicRendition & GraphicRendition::fgIndexed(uint8_t index) {
    return push(FG_EXTENDED).push(EXTENDED_INDEXED).push(index);
}

GraphicRendition & GraphicRendition::bgIndexed(uint8_t index) {
    return push(FG_EXTENDED + BG_OFFSET).push(EXTENDED_INDEXED).push(index);
}

GraphicRendition & GraphicRendition::fgDirect(uint8_t r, uint8_t g, uint8_t b) {
    return push(FG_EXTENDED).push(EXTENDED_DIRECT).push(r).push(g).push(b);
}

GraphicRendition & GraphicRendition::bgDirect(uint8_t r, uint8_t g, uint8_t b) {
    return push(FG_EXTENDED + BG_OFFSET).push(EXTENDED_DIRECT).push(r).push(g).push(b);
}

ControlSequence GraphicRendition::toSequence() const {
    if (_codes.empty()) {
        return resetSequence();
    }

    return ControlSequence(Function::SGR, Params(_codes.begin(), _codes.end()));
}

ControlSequence GraphicRendition::resetSequence() {
    return ControlSequence(Function::SGR, { SGR_TABLE[static_cast<size_t>(Stock::RESET_ALL)] });
}

std::ostream & operator << (std::ostream & ost, const GraphicRendition & sgr) {
    return ost << sgr.toSequence();
}
