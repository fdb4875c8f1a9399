// vi:noai:sw=4
// Copyright © 2026 ecma48 contributors

#ifndef COMMON__PARAMETERS__HXX
#define COMMON__PARAMETERS__HXX

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// A numeric parameter of a control sequence. An empty Param is omitted
// and the receiving device applies the function's default value.
using Param  = std::optional<uint32_t>;
using Params = std::vector<Param>;

// Encode parameters as ECMA-48 parameter bytes (5.4.2): decimal values
// separated by ';'. Omitted values give empty fields, except that
// trailing omitted values are dropped together with their separators.
//
//     encodeParameters({})            -> ""
//     encodeParameters({5, {}, 1})    -> "5;;1"
//     encodeParameters({{}, 2})       -> ";2"
//     encodeParameters({5, {}})       -> "5"
std::string encodeParameters(const Params & params);

#endif // COMMON__PARAMETERS__HXX
