// vi:noai:sw=4
// Copyright © 2026 ecma48 contributors

#include "ecma48/common/device.hxx"

namespace device {

ControlSequence attributes(Param n) {
    return ControlSequence(Function::DA, { n });
}

ControlSequence statusReport(Status status) {
    return ControlSequence(Function::DSR, { static_cast<uint32_t>(status) });
}

ControlSequence functionKey(uint32_t key) {
    return ControlSequence(Function::FNK, { key });
}

ControlSequence mediaCopy(MediaCopy mc) {
    return ControlSequence(Function::MC, { static_cast<uint32_t>(mc) });
}

ControlSequence sheetEjectAndFeed(Param action, Param stacker) {
    return ControlSequence(Function::SEF, { action, stacker });
}

ControlSequence identifyControlString(ControlStringKind kind) {
    return ControlSequence(Function::IDCS, { static_cast<uint32_t>(kind) });
}

ControlSequence identifyGraphicSubrepertoire(uint32_t id) {
    return ControlSequence(Function::IGS, { id });
}

EscapeSequence reset()              { return EscapeSequence(Fs::RIS); }
EscapeSequence disableManualInput() { return EscapeSequence(Fs::DMI); }
EscapeSequence enableManualInput()  { return EscapeSequence(Fs::EMI); }
EscapeSequence interrupt()          { return EscapeSequence(Fs::INT); }

} // namespace device
