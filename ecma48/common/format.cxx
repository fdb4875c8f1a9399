// vi:noai:sw=4
// Copyright © 2026 ecma48 contributors

#include "ecma48/common/format.hxx"

namespace format {

ControlSequence characterAbsolute(Param col) {
    return ControlSequence(Function::HPA, { col });
}

ControlSequence characterForward(Param n) {
    return ControlSequence(Function::HPR, { n });
}

ControlSequence characterBackward(Param n) {
    return ControlSequence(Function::HPB, { n });
}

ControlSequence lineAbsolute(Param row) {
    return ControlSequence(Function::VPA, { row });
}

ControlSequence lineForward(Param n) {
    return ControlSequence(Function::VPR, { n });
}

ControlSequence lineBackward(Param n) {
    return ControlSequence(Function::VPB, { n });
}

ControlSequence characterAndLine(uint32_t row, uint32_t col) {
    return ControlSequence(Function::HVP, { row, col });
}

ControlSequence pageAbsolute(Param page) {
    return ControlSequence(Function::PPA, { page });
}

ControlSequence pageForward(Param n) {
    return ControlSequence(Function::PPR, { n });
}

ControlSequence pageBackward(Param n) {
    return ControlSequence(Function::PPB, { n });
}

ControlSequence clearTabulation(TabulationClear clear) {
    return ControlSequence(Function::TBC, { static_cast<uint32_t>(clear) });
}

ControlSequence removeTabulationStop(uint32_t col) {
    return ControlSequence(Function::TSR, { col });
}

ControlSequence selectiveTabulation(uint32_t n) {
    return ControlSequence(Function::STAB, { n });
}

ControlSequence alignTrailing(uint32_t col) {
    return ControlSequence(Function::TATE, { col });
}

ControlSequence alignLeading(uint32_t col) {
    return ControlSequence(Function::TALE, { col });
}

ControlSequence alignCentred(uint32_t col) {
    return ControlSequence(Function::TAC, { col });
}

ControlSequence centreOnCharacter(uint32_t col, Param ch) {
    return ControlSequence(Function::TCC, { col, ch });
}

EscapeSequence characterTabulationSet()     { return EscapeSequence(C1::HTS); }
EscapeSequence characterTabulationJustify() { return EscapeSequence(C1::HTJ); }
EscapeSequence lineTabulationSet()          { return EscapeSequence(C1::VTS); }
EscapeSequence partialLineForward()         { return EscapeSequence(C1::PLD); }
EscapeSequence partialLineBackward()        { return EscapeSequence(C1::PLU); }
EscapeSequence index()                      { return EscapeSequence(C1::IND); }
EscapeSequence nextLine()                   { return EscapeSequence(C1::NEL); }
EscapeSequence reverseLineFeed()            { return EscapeSequence(C1::RI); }

} // namespace format
