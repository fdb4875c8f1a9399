// vi:noai:sw=4
// Copyright © 2026 ecma48 contributors

#ifndef COMMON__MODE__HXX
#define COMMON__MODE__HXX

#include "ecma48/common/escape.hxx"

#include <initializer_list>
#include <vector>

// ECMA-48 modes (section 7), by their parameter value.
enum class Mode : uint32_t {
    GATM = 1,   // guarded area transfer
    KAM  = 2,   // keyboard action
    CRM  = 3,   // control representation
    IRM  = 4,   // insertion replacement
    SRTM = 5,   // status report transfer
    ERM  = 6,   // erasure
    VEM  = 7,   // line editing
    BDSM = 8,   // bi-directional support
    DCSM = 9,   // device component select
    HEM  = 10,  // character editing
    SRM  = 12,  // send/receive
    FEAM = 13,  // format effector action
    FETM = 14,  // format effector transfer
    MATM = 15,  // multiple area transfer
    TTM  = 16,  // transfer termination
    SATM = 17,  // selected area transfer
    TSM  = 18,  // tabulation stop
    GRCM = 21   // graphic rendition combination
};

const char * name(Mode mode);

// An ordered list of modes for a single SM or RM.
class ModeList {
    std::vector<Mode> _modes;

public:
    ModeList() = default;
    ModeList(std::initializer_list<Mode> modes) : _modes(modes) {}

    ModeList & add(Mode mode) {
        _modes.push_back(mode);
        return *this;
    }

    const std::vector<Mode> & getModes() const { return _modes; }
    bool empty() const { return _modes.empty(); }

    // SM - Set Mode.
    ControlSequence set() const;

    // RM - Reset Mode.
    ControlSequence reset() const;
};

#endif // COMMON__MODE__HXX
