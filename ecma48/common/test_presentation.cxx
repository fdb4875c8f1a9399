// vi:noai:sw=4
// Copyright © 2026 ecma48 contributors

#include "ecma48/common/presentation.hxx"
#include "ecma48/support/test.hxx"

namespace {

const std::string CSI = "\x1b[";

using namespace presentation;

void testText(Test & test) {
    test.enforceEqual<std::string>(repeat(3).toString(), CSI + "3b", "REP");
    test.enforceEqual<std::string>(selectFont(Font::ALTERNATIVE_1, 5).toString(), CSI + "1;5 D",
                                   "FNT");
    test.enforceEqual<std::string>(selectFont(Font::PRIMARY).toString(), CSI + "0 D", "FNT default");
    test.enforceEqual<std::string>(combine(Combination::START).toString(), CSI + "1 _", "GCC");
    test.enforceEqual<std::string>(parallelTexts(ParallelText::PRINCIPAL).toString(), CSI + "1\\",
                                   "PTX");
}

void testDirection(Test & test) {
    test.enforceEqual<std::string>(
        selectMovementDirection(MovementDirection::OPPOSITE).toString(), CSI + "1^", "SIMD");
    test.enforceEqual<std::string>(directedString(StringDirection::START_RTL).toString(), CSI + "2]",
                                   "SDS");
    test.enforceEqual<std::string>(reversedString(Reversal::START).toString(), CSI + "1[", "SRS");
    test.enforceEqual<std::string>(selectDirections(Directions::VERTICAL_RTL_TTB).toString(),
                                   CSI + "1;0 S", "SPD");
    test.enforceEqual<std::string>(
        selectDirections(Directions::HORIZONTAL_BTT_LTR, Update::UPDATE).toString(),
        CSI + "6;1 S", "SPD update");
    test.enforceEqual<std::string>(selectPath(Path::RTL_OR_BTT, Update::UPDATE).toString(),
                                   CSI + "2;1 k", "SCP");
    test.enforceEqual<std::string>(characterOrientation(Orientation::DEG_90).toString(),
                                   CSI + "2 e", "SCO");
}

void testLayout(Test & test) {
    test.enforceEqual<std::string>(justify({ Justify::WORD_FILL, Justify::CENTRE }).toString(),
                                   CSI + "1;6 F", "JFY");
    test.enforceEqual<std::string>(justify({}).toString(), CSI + " F", "JFY default");
    test.enforceEqual<std::string>(quad({ Quad::FLUSH_BOTH }).toString(), CSI + "6 H", "QUAD");
    test.enforceEqual<std::string>(dimensionTextArea(24, 80).toString(), CSI + "24;80 T", "DTA");
    test.enforceEqual<std::string>(selectSizeUnit(SizeUnit::PIXEL).toString(), CSI + "7 I", "SSU");
    test.enforceEqual<std::string>(lineSpacing(20).toString(), CSI + "20 h", "SLS");
    test.enforceEqual<std::string>(spacingIncrement(5, 3).toString(), CSI + "5;3 G", "SPI");
    test.enforceEqual<std::string>(expandOrContract(Expansion::CONDENSED).toString(), CSI + "2 Z",
                                   "PEC");
}

void testSize(Test & test) {
    test.enforceEqual<std::string>(graphicSizeModification(Param(), 200).toString(), CSI + ";200 B",
                                   "GSM width only");
    test.enforceEqual<std::string>(graphicSizeModification(150).toString(), CSI + "150 B",
                                   "GSM height only");
    test.enforceEqual<std::string>(graphicSizeSelection(12).toString(), CSI + "12 C", "GSS");
}

void testVariants(Test & test) {
    test.enforceEqual<std::string>(PresentationVariants().toSequence().toString(), CSI + "0 ]",
                                   "SAPV default");
    test.enforceEqual<std::string>(
        PresentationVariants{ Variant::LATIN_DIGITS }.add(Variant::MIRROR_PAIRED).toSequence().toString(),
        CSI + "1;3 ]", "SAPV");
    test.enforceEqual<std::string>(
        PresentationVariants().add(Variant::CANCEL_PERSISTENT_FORMS).toSequence().str(),
        "^[[22 ](SAPV)", "SAPV str");
}

void testPage(Test & test) {
    test.enforceEqual<std::string>(selectPageFormat(PageFormat::WIDE_A4).toString(), CSI + "3 J",
                                   "PFS");
    test.enforceEqual<std::string>(
        selectCharacterSpacing(CharacterSpacing::PER_25MM_12).toString(), CSI + "1 K", "SHS");
    test.enforceEqual<std::string>(selectLineSpacing(LineSpacing::PER_25MM_2).toString(),
                                   CSI + "9 L", "SVS");
    test.enforceEqual<std::string>(characterSpacing(4).toString(), CSI + "4 g", "SCS");
    test.enforceEqual<std::string>(thinSpace(2).toString(), CSI + "2 E", "TSS");
    test.enforceEqual<std::string>(spaceWidth(6).toString(), CSI + "6 [", "SSW");
    test.enforceEqual<std::string>(addSeparation(1).toString(), CSI + "1 \\", "SACS");
    test.enforceEqual<std::string>(reduceSeparation(1).toString(), CSI + "1 f", "SRCS");
    test.enforceEqual<std::string>(printQuality(PrintQuality::DRAFT).toString(), CSI + "2 X",
                                   "SPQR");
    test.enforceEqual<std::string>(lineHome(1).toString(), CSI + "1 U", "SLH");
    test.enforceEqual<std::string>(lineLimit(80).toString(), CSI + "80 V", "SLL");
    test.enforceEqual<std::string>(pageHome(1).toString(), CSI + "1 i", "SPH");
    test.enforceEqual<std::string>(pageLimit(66).toString(), CSI + "66 j", "SPL");
}

} // namespace {anonymous}

int main() {
    Test test("common/presentation");
    test.run("text", testText);
    test.run("direction", testDirection);
    test.run("layout", testLayout);
    test.run("size", testSize);
    test.run("variants", testVariants);
    test.run("page", testPage);
    return 0;
}
