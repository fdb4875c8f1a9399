// vi:noai:sw=4
// Copyright © 2026 ecma48 contributors

#ifndef COMMON__DEVICE__HXX
#define COMMON__DEVICE__HXX

#include "ecma48/common/escape.hxx"

// Device control, identification and status.
namespace device {

// DA - Device Attributes. 0 (or omitted) requests the device's DA.
ControlSequence attributes(Param n = Param());

enum class Status {
    READY,              // 0 no malfunction
    BUSY_RETRY,         // 1 another DSR must be requested later
    BUSY_LATER,         // 2 another DSR will be sent later
    ERROR_RETRY,        // 3 malfunction, another DSR must be requested later
    ERROR_LATER,        // 4 malfunction, another DSR will be sent later
    REQUEST_STATUS,     // 5 a DSR is requested
    REQUEST_POSITION    // 6 a CPR is requested
};

// DSR - Device Status Report.
ControlSequence statusReport(Status status);

// FNK - Function Key.
ControlSequence functionKey(uint32_t key);

enum class MediaCopy {
    TO_PRIMARY,             // 0 initiate transfer to a primary auxiliary device
    FROM_PRIMARY,           // 1
    TO_SECONDARY,           // 2
    FROM_SECONDARY,         // 3
    STOP_RELAY_PRIMARY,     // 4
    START_RELAY_PRIMARY,    // 5
    STOP_RELAY_SECONDARY,   // 6
    START_RELAY_SECONDARY   // 7
};

// MC - Media Copy.
ControlSequence mediaCopy(MediaCopy mc);

// SEF - Sheet Eject and Feed. 'action' 0 is eject only, n > 0 feeds
// from bin n; 'stacker' 0 is no stacking, n > 0 stacks into n.
ControlSequence sheetEjectAndFeed(Param action = Param(), Param stacker = Param());

enum class ControlStringKind {
    DIAGNOSTIC = 1,     // reserved for the diagnostic state of the STATUS REPORT TRANSFER MODE
    DRCS       = 2      // dynamically redefinable character sets (ECMA-35)
};

// IDCS - Identify Device Control String.
ControlSequence identifyControlString(ControlStringKind kind);

// IGS - Identify Graphic Subrepertoire, by its ISO/IEC 7350 registration.
ControlSequence identifyGraphicSubrepertoire(uint32_t id);

// Independent control functions.
EscapeSequence reset();                 // RIS
EscapeSequence disableManualInput();    // DMI
EscapeSequence enableManualInput();     // EMI
EscapeSequence interrupt();             // INT

} // namespace device

#endif // COMMON__DEVICE__HXX
