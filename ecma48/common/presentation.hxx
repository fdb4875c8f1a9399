// vi:noai:sw=4
// Copyright © 2026 ecma48 contributors

#ifndef COMMON__PRESENTATION__HXX
#define COMMON__PRESENTATION__HXX

#include "ecma48/common/escape.hxx"
#include "ecma48/common/rendition.hxx"

#include <initializer_list>
#include <vector>

// Presentation control: repetition, fonts, string direction,
// justification and the geometry of the presentation component.
namespace presentation {

// REP - Repeat the preceding graphic character n times.
ControlSequence repeat(Param n = Param());

// FNT - Font Selection. 'font' chooses which of the primary and
// alternative fonts SGR 10-19 designates; 'id' is the registered font.
ControlSequence selectFont(Font font, Param id = Param());

enum class MovementDirection {
    SAME,               // 0 same as the character path
    OPPOSITE            // 1 opposite to the character path
};

// SIMD - Select Implicit Movement Direction.
ControlSequence selectMovementDirection(MovementDirection direction);

enum class StringDirection {
    END,                // 0 end of a directed string
    START_LTR,          // 1 start of a left-to-right string
    START_RTL           // 2 start of a right-to-left string
};

// SDS - Start Directed String.
ControlSequence directedString(StringDirection direction);

enum class Reversal {
    END,                // 0 end of a reversed string
    START               // 1 start of a reversed string
};

// SRS - Start Reversed String.
ControlSequence reversedString(Reversal reversal);

enum class Justify {
    NONE,               // 0 no justification, end of justification
    WORD_FILL,          // 1
    WORD_SPACE,         // 2
    LETTER_SPACE,       // 3
    HYPHENATION,        // 4
    FLUSH_HOME,         // 5 flush to line home position margin
    CENTRE,             // 6 centre between home and limit
    FLUSH_LIMIT,        // 7 flush to line limit position margin
    ITALIAN_HYPHENATION // 8
};

// JFY - Justify. Empty 'modes' means the device default (NONE).
ControlSequence justify(std::initializer_list<Justify> modes);

enum class Quad {
    FLUSH_HOME,         // 0
    FLUSH_HOME_FILL,    // 1 and fill with leader
    CENTRE,             // 2
    CENTRE_FILL,        // 3 and fill with leader
    FLUSH_LIMIT,        // 4
    FLUSH_LIMIT_FILL,   // 5 and fill with leader
    FLUSH_BOTH          // 6 flush to both margins
};

// QUAD.
ControlSequence quad(std::initializer_list<Quad> modes);

// Line orientation, line progression and character path.
enum class Directions {
    HORIZONTAL_TTB_LTR,     // 0
    VERTICAL_RTL_TTB,       // 1
    VERTICAL_LTR_TTB,       // 2
    HORIZONTAL_TTB_RTL,     // 3
    VERTICAL_LTR_BTT,       // 4
    HORIZONTAL_BTT_RTL,     // 5
    HORIZONTAL_BTT_LTR,     // 6
    VERTICAL_RTL_BTT        // 7
};

enum class Update {
    UNDEFINED,          // 0 content of the presentation component is undefined
    UPDATE,             // 1 updated according to the data component
    FROM_PRESENTATION   // 2 data component updated from the presentation component
};

// SPD - Select Presentation Directions.
ControlSequence selectDirections(Directions directions, Update update = Update::UNDEFINED);

enum class Path {
    LTR_OR_TTB = 1,     // left-to-right or top-to-bottom
    RTL_OR_BTT = 2      // right-to-left or bottom-to-top
};

// SCP - Select Character Path.
ControlSequence selectPath(Path path, Update update = Update::UNDEFINED);

// DTA - Dimension Text Area, in the unit established by SSU.
ControlSequence dimensionTextArea(uint32_t lines, uint32_t chars);

// GSM - Graphic Size Modification, as percentages of the GSS size.
ControlSequence graphicSizeModification(Param height = Param(), Param width = Param());

// GSS - Graphic Size Selection.
ControlSequence graphicSizeSelection(uint32_t size);

enum class SizeUnit {
    CHARACTER,          // 0
    MILLIMETRE,         // 1
    COMPUTER_DECIPOINT, // 2
    DECIDIDOT,          // 3
    MIL,                // 4
    BMU,                // 5 basic measuring unit
    MICROMETRE,         // 6
    PIXEL,              // 7
    DECIPOINT           // 8
};

// SSU - Select Size Unit.
ControlSequence selectSizeUnit(SizeUnit unit);

// SLS - Set Line Spacing.
ControlSequence lineSpacing(uint32_t spacing);

// SPI - Spacing Increment.
ControlSequence spacingIncrement(uint32_t line, uint32_t character);

enum class Expansion {
    NORMAL,             // 0
    EXPANDED,           // 1
    CONDENSED           // 2
};

// PEC - Presentation Expand or Contract.
ControlSequence expandOrContract(Expansion expansion);

enum class Orientation {
    DEG_0,              // 0
    DEG_45,             // 1
    DEG_90,             // 2
    DEG_135,            // 3
    DEG_180,            // 4
    DEG_225,            // 5
    DEG_270,            // 6
    DEG_315             // 7
};

// SCO - Select Character Orientation.
ControlSequence characterOrientation(Orientation orientation);

enum class ParallelText {
    END,                // 0 end of parallel texts
    PRINCIPAL,          // 1 beginning of a string of principal parallel text
    SUPPLEMENTARY,      // 2 beginning of a string of supplementary parallel text
    PHONETIC_JAPANESE,  // 3 supplementary phonetic annotation, Japanese
    PHONETIC_CHINESE,   // 4 supplementary phonetic annotation, Chinese
    END_PHONETIC        // 5 end of a string of supplementary phonetic annotations
};

// PTX - Parallel Texts.
ControlSequence parallelTexts(ParallelText text);

enum class Combination {
    TWO,                // 0 combine the following two graphic characters
    START,              // 1 start of a string to be combined
    END                 // 2 end of a string to be combined
};

// GCC - Graphic Character Combination.
ControlSequence combine(Combination combination);

enum class Variant {
    DEFAULT,                    // 0 default presentation, cancels the others
    LATIN_DIGITS,               // 1 decimal digits as Latin digits
    ARABIC_DIGITS,              // 2 decimal digits as Arabic digits
    MIRROR_PAIRED,              // 3 mirror horizontally paired characters
    MIRROR_FORMULAE,            // 4 mirror vertically paired characters (formulae)
    ISOLATED,                   // 5 following character in isolated form
    INITIAL,                    // 6 following character in initial form
    MEDIAL,                     // 7 following character in medial form
    FINAL,                      // 8 following character in final form
    DECIMAL_FULL_STOP,          // 9 decimal separator is FULL STOP
    DECIMAL_COMMA,              // 10 decimal separator is COMMA
    VOWELS_ABOVE_BELOW,         // 11 vowels above or below the consonants
    VOWELS_AFTER,               // 12 vowels after the consonants
    SHAPE_WITH_LIGATURE,        // 13 contextual shape, Arabic LAM-ALEPH ligature
    SHAPE_WITHOUT_LIGATURE,     // 14 contextual shape, no ligature
    NO_MIRROR,                  // 15 cancels 3 and 4
    NO_VOWELS,                  // 16 vowels are not presented
    ITALIC_FOLLOWS_DIRECTION,   // 17 slant follows the string direction
    NO_SHAPE,                   // 18 contextual shape determination off
    SHAPE_EXCEPT_DIGITS,        // 19 contextual shape except for digits
    DEVICE_DIGITS,              // 20 device dependent graphic forms of digits
    PERSISTENT_FORMS,           // 21 5 to 8 apply until 22
    CANCEL_PERSISTENT_FORMS     // 22
};

// SAPV - Select Alternative Presentation Variants.
class PresentationVariants {
    std::vector<Variant> _variants;

public:
    PresentationVariants() = default;
    PresentationVariants(std::initializer_list<Variant> variants) : _variants(variants) {}

    PresentationVariants & add(Variant variant) {
        _variants.push_back(variant);
        return *this;
    }

    const std::vector<Variant> & getVariants() const { return _variants; }

    // With no variants this is SAPV with its default, 0.
    ControlSequence toSequence() const;
};

enum class PageFormat {
    TALL_TEXT,              // 0 tall basic text communication format
    WIDE_TEXT,              // 1 wide basic text communication format
    TALL_A4,                // 2
    WIDE_A4,                // 3
    TALL_LETTER,            // 4 tall North American letter
    WIDE_LETTER,            // 5
    TALL_EXTENDED_A4,       // 6
    WIDE_EXTENDED_A4,       // 7
    TALL_LEGAL,             // 8 tall North American legal
    WIDE_LEGAL,             // 9
    A4_SHORT_LINES,         // 10
    A4_LONG_LINES,          // 11
    B5_SHORT_LINES,         // 12
    B5_LONG_LINES,          // 13
    B4_SHORT_LINES,         // 14
    B4_LONG_LINES           // 15
};

// PFS - Page Format Selection.
ControlSequence selectPageFormat(PageFormat format);

enum class CharacterSpacing {
    PER_25MM_10,            // 0 10 characters per 25.4 mm
    PER_25MM_12,            // 1
    PER_25MM_15,            // 2
    PER_25MM_6,             // 3
    PER_25MM_3,             // 4
    PER_50MM_9,             // 5 9 characters per 50.8 mm
    PER_25MM_4              // 6
};

// SHS - Select Character Spacing.
ControlSequence selectCharacterSpacing(CharacterSpacing spacing);

enum class LineSpacing {
    PER_25MM_6,             // 0 6 lines per 25.4 mm
    PER_25MM_4,             // 1
    PER_25MM_3,             // 2
    PER_25MM_12,            // 3
    PER_25MM_8,             // 4
    PER_30MM_6,             // 5 6 lines per 30.0 mm
    PER_30MM_4,             // 6
    PER_30MM_3,             // 7
    PER_30MM_12,            // 8
    PER_25MM_2              // 9
};

// SVS - Select Line Spacing.
ControlSequence selectLineSpacing(LineSpacing spacing);

// Character spacing and separation, in the unit established by SSU.
ControlSequence characterSpacing(uint32_t spacing);     // SCS
ControlSequence thinSpace(uint32_t width);              // TSS
ControlSequence spaceWidth(uint32_t width);             // SSW
ControlSequence addSeparation(uint32_t separation);     // SACS
ControlSequence reduceSeparation(uint32_t separation);  // SRCS

enum class PrintQuality {
    HIGHEST,                // 0 highest available print quality, low print speed
    MEDIUM,                 // 1 medium print quality, medium print speed
    DRAFT                   // 2 draft print quality, highest available print speed
};

// SPQR - Select Print Quality and Rapidity.
ControlSequence printQuality(PrintQuality quality);

// Home and limit positions of lines (character positions) and pages
// (line positions).
ControlSequence lineHome(uint32_t col);     // SLH
ControlSequence lineLimit(uint32_t col);    // SLL
ControlSequence pageHome(uint32_t row);     // SPH
ControlSequence pageLimit(uint32_t row);    // SPL

} // namespace presentation

#endif // COMMON__PRESENTATION__HXX
