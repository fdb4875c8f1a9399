// vi:noai:sw=4
// Copyright © 2026 ecma48 contributors

#ifndef COMMON__CURSOR__HXX
#define COMMON__CURSOR__HXX

#include "ecma48/common/escape.hxx"

#include <cstdint>
#include <iosfwd>

// 1-based. Values beyond the page are for the device to interpret.
struct Position {
    uint32_t row = 1;
    uint32_t col = 1;
};

inline bool operator == (Position lhs, Position rhs) {
    return lhs.row == rhs.row && lhs.col == rhs.col;
}

inline bool operator != (Position lhs, Position rhs) {
    return !(lhs == rhs);
}

std::ostream & operator << (std::ostream & ost, Position pos);

// Movement and placement of the active presentation position. An
// omitted count means the device default, which is 1 for all of these.
namespace cursor {

enum class Direction {
    UP,                 // CUU
    DOWN,               // CUD
    FORWARD,            // CUF
    BACKWARD,           // CUB
    NEXT_LINE,          // CNL
    PRECEDING_LINE      // CPL
};

ControlSequence move(Direction direction, Param n = Param());

inline ControlSequence up(Param n = Param())            { return move(Direction::UP, n); }
inline ControlSequence down(Param n = Param())          { return move(Direction::DOWN, n); }
inline ControlSequence forward(Param n = Param())       { return move(Direction::FORWARD, n); }
inline ControlSequence backward(Param n = Param())      { return move(Direction::BACKWARD, n); }
inline ControlSequence nextLine(Param n = Param())      { return move(Direction::NEXT_LINE, n); }
inline ControlSequence precedingLine(Param n = Param()) { return move(Direction::PRECEDING_LINE, n); }

// CUP - Cursor Position.
ControlSequence setPosition(uint32_t row, uint32_t col);
ControlSequence setPosition(Position pos);

// CHA - Cursor Character Absolute.
ControlSequence setColumn(Param col = Param());

// SCOSC / SCORC. Not ECMA-48 functions but the private-use finals
// 's' and 'u' that virtually every ANSI terminal accepts.
ControlSequence save();
ControlSequence restore();

// CHT, CBT, CVT - move by tabulation stops.
ControlSequence tabulationForward(Param n = Param());
ControlSequence tabulationBackward(Param n = Param());
ControlSequence lineTabulation(Param n = Param());

enum class TabulationControl {
    SET_CHARACTER,              // 0 set character tabulation stop
    SET_LINE,                   // 1 set line tabulation stop
    CLEAR_CHARACTER,            // 2 clear character stop at active position
    CLEAR_LINE,                 // 3 clear line stop at active line
    CLEAR_CHARACTERS_IN_LINE,   // 4 clear all character stops in active line
    CLEAR_ALL_CHARACTERS,       // 5 clear all character stops
    CLEAR_ALL_LINES             // 6 clear all line stops
};

// CTC - Cursor Tabulation Control.
ControlSequence tabulationControl(TabulationControl control);

// CPR - Active Position Report, as sent by a device in reply to DSR.
ControlSequence positionReport(Position pos);

} // namespace cursor

#endif // COMMON__CURSOR__HXX
