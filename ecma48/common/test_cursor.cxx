// vi:noai:sw=4
// Copyright © 2026 ecma48 contributors

#include "ecma48/common/cursor.hxx"
#include "ecma48/support/test.hxx"

namespace {

const std::string CSI = "\x1b[";

void testMove(Test & test) {
    test.enforceEqual<std::string>(cursor::up().toString(), CSI + "A", "up default");
    test.enforceEqual<std::string>(cursor::up(3).toString(), CSI + "3A", "up");
    test.enforceEqual<std::string>(cursor::down(12).toString(), CSI + "12B", "down");
    test.enforceEqual<std::string>(cursor::forward(1).toString(), CSI + "1C", "forward");
    test.enforceEqual<std::string>(cursor::backward(100).toString(), CSI + "100D", "backward");
    test.enforceEqual<std::string>(cursor::nextLine(2).toString(), CSI + "2E", "next line");
    test.enforceEqual<std::string>(cursor::precedingLine(7).toString(), CSI + "7F", "preceding line");
    test.enforceEqual<std::string>(cursor::move(cursor::Direction::UP, 0).toString(), CSI + "0A",
                                   "explicit zero");

    // Every movement: introducer, decimal count, final byte.
    const std::pair<cursor::Direction, char> moves[] = {
        { cursor::Direction::UP,             'A' },
        { cursor::Direction::DOWN,           'B' },
        { cursor::Direction::FORWARD,        'C' },
        { cursor::Direction::BACKWARD,       'D' },
        { cursor::Direction::NEXT_LINE,      'E' },
        { cursor::Direction::PRECEDING_LINE, 'F' }
    };

    for (auto & m : moves) {
        for (uint32_t n : { 1u, 9u, 10u, 4096u }) {
            auto str = cursor::move(m.first, n).toString();
            test.enforceEqual<std::string>(str, CSI + std::to_string(n) + m.second,
                                           std::string("move ") + m.second + " " + std::to_string(n));
        }
    }
}

void testPosition(Test & test) {
    test.enforceEqual<std::string>(cursor::setPosition(5, 1).toString(), CSI + "5;1H", "5,1");
    test.enforceEqual<std::string>(cursor::setPosition(Position{ 24, 80 }).toString(), CSI + "24;80H",
                                   "Position");
    test.enforceEqual<std::string>(cursor::setPosition(1, 1000).toString(), CSI + "1;1000H",
                                   "no clamping");
    test.enforceEqual<std::string>(cursor::setColumn(10).toString(), CSI + "10G", "CHA");
    test.enforceEqual<std::string>(cursor::setColumn().toString(), CSI + "G", "CHA default");
    test.enforceEqual<std::string>(cursor::positionReport(Position{ 3, 4 }).toString(), CSI + "3;4R",
                                   "CPR");

    test.enforce(Position{ 2, 3 } == Position{ 2, 3 }, "equal");
    test.enforce(Position{ 2, 3 } != Position{ 3, 2 }, "not equal");
    test.enforceEqual<std::string>(stringify(Position{ 2, 3 }), "2,3", "operator<<");
    test.enforce(Position() == Position{ 1, 1 }, "default is home");
}

void testSaveRestore(Test & test) {
    test.enforceEqual<std::string>(cursor::save().toString(), CSI + "s", "save");
    test.enforceEqual<std::string>(cursor::restore().toString(), CSI + "u", "restore");
    test.enforceEqual<std::string>(cursor::save().str(), "^[[s(SCOSC)", "save str");
}

void testTabulation(Test & test) {
    test.enforceEqual<std::string>(cursor::tabulationForward(2).toString(), CSI + "2I", "CHT");
    test.enforceEqual<std::string>(cursor::tabulationBackward().toString(), CSI + "Z", "CBT");
    test.enforceEqual<std::string>(cursor::lineTabulation(3).toString(), CSI + "3Y", "CVT");
    test.enforceEqual<std::string>(
        cursor::tabulationControl(cursor::TabulationControl::SET_CHARACTER).toString(),
        CSI + "0W", "CTC set");
    test.enforceEqual<std::string>(
        cursor::tabulationControl(cursor::TabulationControl::CLEAR_ALL_LINES).toString(),
        CSI + "6W", "CTC clear all lines");
}

} // namespace {anonymous}

int main() {
    Test test("common/cursor");
    test.run("move", testMove);
    test.run("position", testPosition);
    test.run("save-restore", testSaveRestore);
    test.run("tabulation", testTabulation);
    return 0;
}
