// vi:noai:sw=4
// Copyright © 2026 ecma48 contributors

#include "ecma48/common/display.hxx"
#include "ecma48/support/debug.hxx"

namespace display {

ControlSequence scroll(ScrollDirection direction, Param n) {
    switch (direction) {
        case ScrollDirection::UP:    return ControlSequence(Function::SU, { n });
        case ScrollDirection::DOWN:  return ControlSequence(Function::SD, { n });
        case ScrollDirection::LEFT:  return ControlSequence(Function::SL, { n });
        case ScrollDirection::RIGHT: return ControlSequence(Function::SR, { n });
    }

    FATAL(<< "Unreachable");
}

ControlSequence nextPage(Param n) {
    return ControlSequence(Function::NP, { n });
}

ControlSequence precedingPage(Param n) {
    return ControlSequence(Function::PP, { n });
}

} // namespace display
