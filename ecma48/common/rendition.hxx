// vi:noai:sw=4
// Copyright © 2026 ecma48 contributors

#ifndef COMMON__RENDITION__HXX
#define COMMON__RENDITION__HXX

#include "ecma48/common/escape.hxx"

#include <cstdint>
#include <iosfwd>
#include <vector>

// The named colors of SGR 30-37/40-47, the default (39/49) and the
// bright variants (90-97/100-107).
enum class Color {
    BLACK,
    RED,
    GREEN,
    YELLOW,
    BLUE,
    MAGENTA,
    CYAN,
    WHITE,

    DEFAULT,

    BRIGHT_BLACK,
    BRIGHT_RED,
    BRIGHT_GREEN,
    BRIGHT_YELLOW,
    BRIGHT_BLUE,
    BRIGHT_MAGENTA,
    BRIGHT_CYAN,
    BRIGHT_WHITE
};

// SGR 10-19 and FNT.
enum class Font {
    PRIMARY,
    ALTERNATIVE_1,
    ALTERNATIVE_2,
    ALTERNATIVE_3,
    ALTERNATIVE_4,
    ALTERNATIVE_5,
    ALTERNATIVE_6,
    ALTERNATIVE_7,
    ALTERNATIVE_8,
    ALTERNATIVE_9
};

//
// SGR - Select Graphic Rendition.
//
// Accumulates parameter values in call order; later values may override
// earlier ones at the device, so the order is never normalised.
//
//     auto sgr = GraphicRendition().fg(Color::RED).bold().underline();
//     std::cout << sgr;   // ESC [ 31;1;4 m
//
class GraphicRendition {
public:
    enum class Stock {
        RESET_ALL,              // (normal)

        BOLD,                   // or increased intensity
        FAINT,                  // (decreased intensity)
        ITALIC,
        UNDERLINE,
        BLINK_SLOW,
        BLINK_RAPID,
        INVERSE,                // (negative)
        CONCEAL,
        CROSSED_OUT,

        FRAKTUR,
        DOUBLE_UNDERLINE,

        RESET_WEIGHT,           // remove bold/faint
        RESET_SLANT,            // remove italic/fraktur
        RESET_UNDERLINE,
        RESET_BLINK,
        RESET_INVERSE,          // (positive)
        RESET_CONCEAL,          // (reveal)
        RESET_CROSSED_OUT,

        FRAMED,
        ENCIRCLED,
        OVERLINED,
        RESET_FRAMED,           // remove framed/encircled
        RESET_OVERLINED,

        IDEOGRAM_UNDERLINE,     // or right side line
        IDEOGRAM_DOUBLE_UNDERLINE,
        IDEOGRAM_OVERLINE,      // or left side line
        IDEOGRAM_DOUBLE_OVERLINE,
        IDEOGRAM_STRESS,
        RESET_IDEOGRAM
    };

private:
    std::vector<uint32_t> _codes;

    GraphicRendition & push(uint32_t code) {
        _codes.push_back(code);
        return *this;
    }

public:
    GraphicRendition & add(Stock stock);

    GraphicRendition & reset()           { return add(Stock::RESET_ALL); }
    GraphicRendition & bold()            { return add(Stock::BOLD); }
    GraphicRendition & faint()           { return add(Stock::FAINT); }
    GraphicRendition & italic()          { return add(Stock::ITALIC); }
    GraphicRendition & underline()       { return add(Stock::UNDERLINE); }
    GraphicRendition & doubleUnderline() { return add(Stock::DOUBLE_UNDERLINE); }
    GraphicRendition & blinkSlow()       { return add(Stock::BLINK_SLOW); }
    GraphicRendition & blinkRapid()      { return add(Stock::BLINK_RAPID); }
    GraphicRendition & inverse()         { return add(Stock::INVERSE); }
    GraphicRendition & conceal()         { return add(Stock::CONCEAL); }
    GraphicRendition & crossedOut()      { return add(Stock::CROSSED_OUT); }
    GraphicRendition & framed()          { return add(Stock::FRAMED); }
    GraphicRendition & encircled()       { return add(Stock::ENCIRCLED); }
    GraphicRendition & overlined()       { return add(Stock::OVERLINED); }

    GraphicRendition & font(Font font);

    GraphicRendition & fg(Color color);
    GraphicRendition & bg(Color color);

    // 38;5;n and 48;5;n - an index into the device's 256 color palette.
    GraphicRendition & fgIndexed(uint8_t index);
    GraphicRendition & bgIndexed(uint8_t index);

    // 38;2;r;g;b and 48;2;r;g;b - a direct color.
    GraphicRendition & fgDirect(uint8_t r, uint8_t g, uint8_t b);
    GraphicRendition & bgDirect(uint8_t r, uint8_t g, uint8_t b);

    const std::vector<uint32_t> & getCodes() const { return _codes; }
    bool empty() const { return _codes.empty(); }

    // With no codes accumulated this is the explicit reset, ESC [ 0 m.
    ControlSequence toSequence() const;

    std::string toString(Bits bits = Bits::SEVEN) const { return toSequence().toString(bits); }
    std::string str() const { return toSequence().str(); }
    void exec(Bits bits = Bits::SEVEN) const { toSequence().exec(bits); }

    // ESC [ 0 m
    static ControlSequence resetSequence();
};

std::ostream & operator << (std::ostream & ost, const GraphicRendition & sgr);

#endif // COMMON__RENDITION__HXX
