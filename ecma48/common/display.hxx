// vi:noai:sw=4
// Copyright © 2026 ecma48 contributors

#ifndef COMMON__DISPLAY__HXX
#define COMMON__DISPLAY__HXX

#include "ecma48/common/escape.hxx"

// Scrolling and paging of the presentation component.
namespace display {

enum class ScrollDirection {
    UP,         // SU
    DOWN,       // SD
    LEFT,       // SL
    RIGHT       // SR
};

// Scroll by 'n' lines (UP, DOWN) or character positions (LEFT, RIGHT).
ControlSequence scroll(ScrollDirection direction, Param n = Param());

inline ControlSequence scrollUp(Param n = Param())    { return scroll(ScrollDirection::UP, n); }
inline ControlSequence scrollDown(Param n = Param())  { return scroll(ScrollDirection::DOWN, n); }
inline ControlSequence scrollLeft(Param n = Param())  { return scroll(ScrollDirection::LEFT, n); }
inline ControlSequence scrollRight(Param n = Param()) { return scroll(ScrollDirection::RIGHT, n); }

// NP, PP.
ControlSequence nextPage(Param n = Param());
ControlSequence precedingPage(Param n = Param());

} // namespace display

#endif // COMMON__DISPLAY__HXX
