// vi:noai:sw=4
// Copyright © 2026 ecma48 contributors

#ifndef COMMON__FORMAT__HXX
#define COMMON__FORMAT__HXX

#include "ecma48/common/escape.hxx"

// Format effectors: positioning in the data component and tabulation
// stops.
namespace format {

// HPA, HPR, HPB.
ControlSequence characterAbsolute(Param col = Param());
ControlSequence characterForward(Param n = Param());
ControlSequence characterBackward(Param n = Param());

// VPA, VPR, VPB.
ControlSequence lineAbsolute(Param row = Param());
ControlSequence lineForward(Param n = Param());
ControlSequence lineBackward(Param n = Param());

// HVP - Character and Line Position.
ControlSequence characterAndLine(uint32_t row, uint32_t col);

// PPA, PPR, PPB.
ControlSequence pageAbsolute(Param page = Param());
ControlSequence pageForward(Param n = Param());
ControlSequence pageBackward(Param n = Param());

enum class TabulationClear {
    CHARACTER,          // 0 character stop at the active position
    LINE,               // 1 line stop at the active line
    CHARACTERS_IN_LINE, // 2 all character stops in the active line
    ALL_CHARACTERS,     // 3 all character stops
    ALL_LINES,          // 4 all line stops
    ALL                 // 5 all stops
};

// TBC - Tabulation Clear.
ControlSequence clearTabulation(TabulationClear clear);

// TSR - Tabulation Stop Remove, at character position 'col' of the
// active line.
ControlSequence removeTabulationStop(uint32_t col);

// STAB - Selective Tabulation, to the stop of tabulation setting 'n'
// of ISO 8613-6.
ControlSequence selectiveTabulation(uint32_t n);

// TATE, TALE, TAC - the next 'col' character positions of the active
// line are laid out against a tabulation stop at its trailing edge,
// leading edge or centre.
ControlSequence alignTrailing(uint32_t col);
ControlSequence alignLeading(uint32_t col);
ControlSequence alignCentred(uint32_t col);

// TCC - Tabulation Centred on Character: the string up to 'col' is
// centred on the first occurrence of the character at code table
// position 'ch' (32..127 or 160..255), or of its trailing edge if
// there is none.
ControlSequence centreOnCharacter(uint32_t col, Param ch = Param());

// HTS, HTJ, VTS set stops; PLD, PLU partial line moves; IND, NEL, RI.
EscapeSequence characterTabulationSet();
EscapeSequence characterTabulationJustify();
EscapeSequence lineTabulationSet();
EscapeSequence partialLineForward();
EscapeSequence partialLineBackward();
EscapeSequence index();
EscapeSequence nextLine();
EscapeSequence reverseLineFeed();

} // namespace format

#endif // COMMON__FORMAT__HXX
