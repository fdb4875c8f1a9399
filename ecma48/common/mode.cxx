// vi:noai:sw=4
// Copyright © 2026 ecma48 contributors

#include "ecma48/common/mode.hxx"
#include "ecma48/support/debug.hxx"

namespace {

Params toParams(const std::vector<Mode> & modes) {
    Params params;
    for (auto m : modes) {
        params.push_back(static_cast<uint32_t>(m));
    }
    return params;
}

} // namespace {anonymous}

const char * name(Mode mode) {
    switch (mode) {
        case Mode::GATM: return "GATM";
        case Mode::KAM:  return "KAM";
        case Mode::CRM:  return "CRM";
        case Mode::IRM:  return "IRM";
        case Mode::SRTM: return "SRTM";
        case Mode::ERM:  return "ERM";
        case Mode::VEM:  return "VEM";
        case Mode::BDSM: return "BDSM";
        case Mode::DCSM: return "DCSM";
        case Mode::HEM:  return "HEM";
        case Mode::SRM:  return "SRM";
        case Mode::FEAM: return "FEAM";
        case Mode::FETM: return "FETM";
        case Mode::MATM: return "MATM";
        case Mode::TTM:  return "TTM";
        case Mode::SATM: return "SATM";
        case Mode::TSM:  return "TSM";
        case Mode::GRCM: return "GRCM";
    }

    FATAL(<< "Unreachable");
}

ControlSequence ModeList::set() const {
    ENFORCE(!_modes.empty(), << "SM without modes");
    return ControlSequence(Function::SM, toParams(_modes));
}

ControlSequence ModeList::reset() const {
    ENFORCE(!_modes.empty(), << "RM without modes");
    return ControlSequence(Function::RM, toParams(_modes));
}
