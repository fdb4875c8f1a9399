// vi:noai:sw=4
// Copyright © 2026 ecma48 contributors

#include "ecma48/common/editor.hxx"
#include "ecma48/support/test.hxx"

#include <set>

namespace {

const std::string CSI = "\x1b[";

void testEraseDisplay(Test & test) {
    using editor::EraseDisplay;

    const std::pair<EraseDisplay, std::string> modes[] = {
        { EraseDisplay::TO_END,             CSI + "0J" },
        { EraseDisplay::TO_START,           CSI + "1J" },
        { EraseDisplay::ALL,                CSI + "2J" },
        { EraseDisplay::ALL_AND_SCROLLBACK, CSI + "3J" }
    };

    std::set<std::string> distinct;

    for (auto & m : modes) {
        auto str = editor::eraseDisplay(m.first).toString();
        test.enforceEqual<std::string>(str, m.second, "ED " + m.second.substr(2));
        test.enforce(str.compare(0, 2, CSI) == 0 && str.back() == 'J', "CSI ... J");
        distinct.insert(str);
    }

    test.enforceEqual<size_t>(distinct.size(), 4, "four distinct modes");
}

void testErase(Test & test) {
    using editor::Erase;

    test.enforceEqual<std::string>(editor::eraseLine(Erase::TO_END).toString(), CSI + "0K", "EL 0");
    test.enforceEqual<std::string>(editor::eraseLine(Erase::TO_START).toString(), CSI + "1K", "EL 1");
    test.enforceEqual<std::string>(editor::eraseLine(Erase::ALL).toString(), CSI + "2K", "EL 2");
    test.enforceEqual<std::string>(editor::eraseField(Erase::ALL).toString(), CSI + "2N", "EF");
    test.enforceEqual<std::string>(editor::eraseArea(Erase::TO_START).toString(), CSI + "1O", "EA");
    test.enforceEqual<std::string>(editor::eraseChars(4).toString(), CSI + "4X", "ECH");
    test.enforceEqual<std::string>(editor::eraseChars().toString(), CSI + "X", "ECH default");
}

void testInsertDelete(Test & test) {
    test.enforceEqual<std::string>(editor::insertChars(3).toString(), CSI + "3@", "ICH");
    test.enforceEqual<std::string>(editor::deleteChars().toString(), CSI + "P", "DCH");
    test.enforceEqual<std::string>(editor::insertLines(2).toString(), CSI + "2L", "IL");
    test.enforceEqual<std::string>(editor::deleteLines(5).toString(), CSI + "5M", "DL");
}

void testAreas(Test & test) {
    test.enforceEqual<std::string>(editor::selectExtent(editor::EditingExtent::LINE).toString(),
                                   CSI + "1Q", "SEE");
    test.enforceEqual<std::string>(
        editor::defineQualification(editor::Qualification::REVERSED).toString(),
        CSI + "11o", "DAQ");

    test.enforceEqual<std::string>(editor::startSelectedArea().toString(), "\x1b" "F", "SSA");
    test.enforceEqual<std::string>(editor::endSelectedArea().toString(), "\x1b" "G", "ESA");
    test.enforceEqual<std::string>(editor::startGuardedArea().toString(), "\x1b" "V", "SPA");
    test.enforceEqual<std::string>(editor::endGuardedArea().toString(Bits::EIGHT), "\x97", "EPA 8-bit");
}

} // namespace {anonymous}

int main() {
    Test test("common/editor");
    test.run("erase-display", testEraseDisplay);
    test.run("erase", testErase);
    test.run("insert-delete", testInsertDelete);
    test.run("areas", testAreas);
    return 0;
}
