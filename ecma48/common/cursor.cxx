// vi:noai:sw=4
// Copyright © 2026 ecma48 contributors

#include "ecma48/common/cursor.hxx"
#include "ecma48/support/debug.hxx"

#include <iostream>

std::ostream & operator << (std::ostream & ost, Position pos) {
    return ost << pos.row << ',' << pos.col;
}

namespace cursor {

ControlSequence move(Direction direction, Param n) {
    switch (direction) {
        case Direction::UP:
            return ControlSequence(Function::CUU, { n });
        case Direction::DOWN:
            return ControlSequence(Function::CUD, { n });
        case Direction::FORWARD:
            return ControlSequence(Function::CUF, { n });
        case Direction::BACKWARD:
            return ControlSequence(Function::CUB, { n });
        case Direction::NEXT_LINE:
            return ControlSequence(Function::CNL, { n });
        case Direction::PRECEDING_LINE:
            return ControlSequence(Function::CPL, { n });
    }

    FATAL(<< "Unreachable");
}

ControlSequence setPosition(uint32_t row, uint32_t col) {
    return ControlSequence(Function::CUP, { row, col });
}

ControlSequence setPosition(Position pos) {
    return setPosition(pos.row, pos.col);
}

ControlSequence setColumn(Param col) {
    return ControlSequence(Function::CHA, { col });
}

ControlSequence save() {
    return ControlSequence(Function::SCOSC);
}

ControlSequence restore() {
    return ControlSequence(Function::SCORC);
}

ControlSequence tabulationForward(Param n) {
    return ControlSequence(Function::CHT, { n });
}

ControlSequence tabulationBackward(Param n) {
    return ControlSequence(Function::CBT, { n });
}

ControlSequence lineTabulation(Param n) {
    return ControlSequence(Function::CVT, { n });
}

ControlSequence tabulationControl(TabulationControl control) {
    return ControlSequence(Function::CTC, { static_cast<uint32_t>(control) });
}

ControlSequence positionReport(Position pos) {
    return ControlSequence(Function::CPR, { pos.row, pos.col });
}

} // namespace cursor
