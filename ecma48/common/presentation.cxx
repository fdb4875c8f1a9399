// vi:noai:sw=4
// Copyright © 2026 ecma48 contributors

#include "ecma48/common/presentation.hxx"

namespace presentation {

namespace {

template <typename E>
Params toParams(const E * begin, const E * end) {
    Params params;
    for (auto i = begin; i != end; ++i) {
        params.push_back(static_cast<uint32_t>(*i));
    }
    return params;
}

template <typename E>
Param toParam(E e) {
    return static_cast<uint32_t>(e);
}

} // namespace {anonymous}

ControlSequence repeat(Param n) {
    return ControlSequence(Function::REP, { n });
}

ControlSequence selectFont(Font font, Param id) {
    return ControlSequence(Function::FNT, { toParam(font), id });
}

ControlSequence selectMovementDirection(MovementDirection direction) {
    return ControlSequence(Function::SIMD, { toParam(direction) });
}

ControlSequence directedString(StringDirection direction) {
    return ControlSequence(Function::SDS, { toParam(direction) });
}

ControlSequence reversedString(Reversal reversal) {
    return ControlSequence(Function::SRS, { toParam(reversal) });
}

ControlSequence justify(std::initializer_list<Justify> modes) {
    return ControlSequence(Function::JFY, toParams(modes.begin(), modes.end()));
}

ControlSequence quad(std::initializer_list<Quad> modes) {
    return ControlSequence(Function::QUAD, toParams(modes.begin(), modes.end()));
}

ControlSequence selectDirections(Directions directions, Update update) {
    return ControlSequence(Function::SPD, { toParam(directions), toParam(update) });
}

ControlSequence selectPath(Path path, Update update) {
    return ControlSequence(Function::SCP, { toParam(path), toParam(update) });
}

ControlSequence dimensionTextArea(uint32_t lines, uint32_t chars) {
    return ControlSequence(Function::DTA, { lines, chars });
}

ControlSequence graphicSizeModification(Param height, Param width) {
    return ControlSequence(Function::GSM, { height, width });
}

ControlSequence graphicSizeSelection(uint32_t size) {
    return ControlSequence(Function::GSS, { size });
}

ControlSequence selectSizeUnit(SizeUnit unit) {
    return ControlSequence(Function::SSU, { toParam(unit) });
}

ControlSequence lineSpacing(uint32_t spacing) {
    return ControlSequence(Function::SLS, { spacing });
}

ControlSequence spacingIncrement(uint32_t line, uint32_t character) {
    return ControlSequence(Function::SPI, { line, character });
}

ControlSequence expandOrContract(Expansion expansion) {
    return ControlSequence(Function::PEC, { toParam(expansion) });
}

ControlSequence characterOrientation(Orientation orientation) {
    return ControlSequence(Function::SCO, { toParam(orientation) });
}

ControlSequence parallelTexts(ParallelText text) {
    return ControlSequence(Function::PTX, { toParam(text) });
}

ControlSequence combine(Combination combination) {
    return ControlSequence(Function::GCC, { toParam(combination) });
}

ControlSequence PresentationVariants::toSequence() const {
    if (_variants.empty()) {
        return ControlSequence(Function::SAPV, { toParam(Variant::DEFAULT) });
    }

    return ControlSequence(Function::SAPV,
                           toParams(_variants.data(), _variants.data() + _variants.size()));
}

ControlSequence selectPageFormat(PageFormat format) {
    return ControlSequence(Function::PFS, { toParam(format) });
}

ControlSequence selectCharacterSpacing(CharacterSpacing spacing) {
    return ControlSequence(Function::SHS, { toParam(spacing) });
}

ControlSequence selectLineSpacing(LineSpacing spacing) {
    return ControlSequence(Function::SVS, { toParam(spacing) });
}

ControlSequence characterSpacing(uint32_t spacing) {
    return ControlSequence(Function::SCS, { spacing });
}

ControlSequence thinSpace(uint32_t width) {
    return ControlSequence(Function::TSS, { width });
}

ControlSequence spaceWidth(uint32_t width) {
    return ControlSequence(Function::SSW, { width });
}

ControlSequence addSeparation(uint32_t separation) {
    return ControlSequence(Function::SACS, { separation });
}

ControlSequence reduceSeparation(uint32_t separation) {
    return ControlSequence(Function::SRCS, { separation });
}

ControlSequence printQuality(PrintQuality quality) {
    return ControlSequence(Function::SPQR, { toParam(quality) });
}

ControlSequence lineHome(uint32_t col)  { return ControlSequence(Function::SLH, { col }); }
ControlSequence lineLimit(uint32_t col) { return ControlSequence(Function::SLL, { col }); }
ControlSequence pageHome(uint32_t row)  { return ControlSequence(Function::SPH, { row }); }
ControlSequence pageLimit(uint32_t row) { return ControlSequence(Function::SPL, { row }); }

} // namespace presentation
