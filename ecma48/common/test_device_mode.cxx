// vi:noai:sw=4
// Copyright © 2026 ecma48 contributors

#include "ecma48/common/device.hxx"
#include "ecma48/common/mode.hxx"
#include "ecma48/support/debug.hxx"
#include "ecma48/support/test.hxx"

#include <stdexcept>

namespace {

const std::string ESC = "\x1b";
const std::string CSI = "\x1b[";

void testDevice(Test & test) {
    test.enforceEqual<std::string>(device::attributes().toString(), CSI + "c", "DA");
    test.enforceEqual<std::string>(device::attributes(0).toString(), CSI + "0c", "DA 0");
    test.enforceEqual<std::string>(
        device::statusReport(device::Status::REQUEST_POSITION).toString(), CSI + "6n", "DSR 6");
    test.enforceEqual<std::string>(
        device::statusReport(device::Status::READY).toString(), CSI + "0n", "DSR 0");
    test.enforceEqual<std::string>(device::functionKey(3).toString(), CSI + "3 W", "FNK");
    test.enforceEqual<std::string>(
        device::mediaCopy(device::MediaCopy::START_RELAY_SECONDARY).toString(), CSI + "7i", "MC");
    test.enforceEqual<std::string>(device::sheetEjectAndFeed(1, 2).toString(), CSI + "1;2 Y", "SEF");
    test.enforceEqual<std::string>(device::sheetEjectAndFeed().toString(), CSI + " Y", "SEF default");
    test.enforceEqual<std::string>(
        device::identifyControlString(device::ControlStringKind::DRCS).toString(), CSI + "2 O", "IDCS");
    test.enforceEqual<std::string>(device::identifyGraphicSubrepertoire(17).toString(), CSI + "17 M",
                                   "IGS");
}

void testIndependent(Test & test) {
    test.enforceEqual<std::string>(device::reset().toString(), ESC + "c", "RIS");
    test.enforceEqual<std::string>(device::disableManualInput().toString(), ESC + "`", "DMI");
    test.enforceEqual<std::string>(device::interrupt().toString(), ESC + "a", "INT");
    test.enforceEqual<std::string>(device::enableManualInput().toString(), ESC + "b", "EMI");
}

void testMode(Test & test) {
    test.enforceEqual<std::string>(ModeList{ Mode::IRM }.set().toString(), CSI + "4h", "SM IRM");
    test.enforceEqual<std::string>(ModeList().add(Mode::KAM).add(Mode::SRM).reset().toString(),
                                   CSI + "2;12l", "RM KAM SRM");
    test.enforceEqual<std::string>(ModeList{ Mode::GRCM, Mode::GATM }.set().str(),
                                   "^[[21;1h(SM)", "SM str");

    ModeList modes;
    test.enforce(modes.empty(), "empty");
    modes.add(Mode::TSM);
    test.enforceEqual<size_t>(modes.getModes().size(), 1, "getModes");
    test.enforceEqual<std::string>(name(Mode::TSM), "TSM", "name");
}

void throwingTerminate() { throw std::logic_error("terminate"); }

bool terminates(ControlSequence (ModeList::*func)() const) {
    auto oldHandler = setTerminate(&throwingTerminate);
    bool terminated = false;
    try {
        (ModeList().*func)();
    }
    catch (const std::logic_error &) {
        terminated = true;
    }
    setTerminate(oldHandler);
    return terminated;
}

void testEmptyModes(Test & test) {
    test.enforce(terminates(&ModeList::set), "SM without modes");
    test.enforce(terminates(&ModeList::reset), "RM without modes");
}

} // namespace {anonymous}

int main() {
    Test test("common/device-mode");
    test.run("device", testDevice);
    test.run("independent", testIndependent);
    test.run("mode", testMode);
    test.run("empty-modes", testEmptyModes);
    return 0;
}
