// vi:noai:sw=4
// Copyright © 2026 ecma48 contributors

#ifndef COMMON__EDITOR__HXX
#define COMMON__EDITOR__HXX

#include "ecma48/common/escape.hxx"

// Erasure, insertion and deletion.
namespace editor {

// ED parameter values.
enum class EraseDisplay {
    TO_END,             // 0 active position to end of page
    TO_START,           // 1 start of page to active position
    ALL,                // 2 whole page
    ALL_AND_SCROLLBACK  // 3 whole page and the scroll-back buffer (xterm)
};

// EL, EF and EA parameter values.
enum class Erase {
    TO_END,             // 0 active position to end of line/field/area
    TO_START,           // 1 start of line/field/area to active position
    ALL                 // 2 whole line/field/area
};

// ED - Erase in Page (display).
ControlSequence eraseDisplay(EraseDisplay mode);

// EL - Erase in Line.
ControlSequence eraseLine(Erase mode);

// EF - Erase in Field.
ControlSequence eraseField(Erase mode);

// EA - Erase in Area.
ControlSequence eraseArea(Erase mode);

// ECH - Erase Character.
ControlSequence eraseChars(Param n = Param());

// ICH, DCH, IL, DL.
ControlSequence insertChars(Param n = Param());
ControlSequence deleteChars(Param n = Param());
ControlSequence insertLines(Param n = Param());
ControlSequence deleteLines(Param n = Param());

enum class EditingExtent {
    PAGE,               // 0
    LINE,               // 1
    FIELD,              // 2
    QUALIFIED_AREA,     // 3
    RELEVANT            // 4 relevant part of the whole page
};

// SEE - Select Editing Extent.
ControlSequence selectExtent(EditingExtent extent);

enum class Qualification {
    UNPROTECTED,        // 0 unprotected and unguarded
    PROTECTED_GUARDED,  // 1
    GRAPHIC,            // 2 graphic character input
    NUMERIC,            // 3 numeric input
    ALPHABETIC,         // 4 alphabetic input
    ALIGN_LAST,         // 5 input aligned on the last character position
    FILL_ZEROS,         // 6 fill with ZEROs
    SET_TAB_STOP,       // 7 set a character tabulation stop
    PROTECTED,          // 8 protected and unguarded
    FILL_SPACES,        // 9 fill with SPACEs
    ALIGN_FIRST,        // 10 input aligned on the first character position
    REVERSED            // 11 reversed order of input
};

// DAQ - Define Area Qualification.
ControlSequence defineQualification(Qualification qualification);

// SSA/ESA and SPA/EPA delimit selected and guarded areas.
EscapeSequence startSelectedArea();
EscapeSequence endSelectedArea();
EscapeSequence startGuardedArea();
EscapeSequence endGuardedArea();

} // namespace editor

#endif // COMMON__EDITOR__HXX
