// vi:noai:sw=4
// Copyright © 2026 ecma48 contributors

#include "ecma48/common/editor.hxx"

namespace editor {

namespace {

uint32_t value(Erase mode) { return static_cast<uint32_t>(mode); }

} // namespace {anonymous}

ControlSequence eraseDisplay(EraseDisplay mode) {
    return ControlSequence(Function::ED, { static_cast<uint32_t>(mode) });
}

ControlSequence eraseLine(Erase mode) {
    return ControlSequence(Function::EL, { value(mode) });
}

ControlSequence eraseField(Erase mode) {
    return ControlSequence(Function::EF, { value(mode) });
}

ControlSequence eraseArea(Erase mode) {
    return ControlSequence(Function::EA, { value(mode) });
}

ControlSequence eraseChars(Param n) {
    return ControlSequence(Function::ECH, { n });
}

ControlSequence insertChars(Param n) {
    return ControlSequence(Function::ICH, { n });
}

ControlSequence deleteChars(Param n) {
    return ControlSequence(Function::DCH, { n });
}

ControlSequence insertLines(Param n) {
    return ControlSequence(Function::IL, { n });
}

ControlSequence deleteLines(Param n) {
    return ControlSequence(Function::DL, { n });
}

ControlSequence selectExtent(EditingExtent extent) {
    return ControlSequence(Function::SEE, { static_cast<uint32_t>(extent) });
}

ControlSequence defineQualification(Qualification qualification) {
    return ControlSequence(Function::DAQ, { static_cast<uint32_t>(qualification) });
}

EscapeSequence startSelectedArea() { return EscapeSequence(C1::SSA); }
EscapeSequence endSelectedArea()   { return EscapeSequence(C1::ESA); }
EscapeSequence startGuardedArea()  { return EscapeSequence(C1::SPA); }
EscapeSequence endGuardedArea()    { return EscapeSequence(C1::EPA); }

} // namespace editor
