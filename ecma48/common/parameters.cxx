// vi:noai:sw=4
// Copyright © 2026 ecma48 contributors

#include "ecma48/common/parameters.hxx"
#include "ecma48/common/ascii.hxx"

std::string encodeParameters(const Params & params) {
    auto end = params.end();
    while (end != params.begin() && !*(end - 1)) {
        --end;
    }

    std::string str;
    auto first = true;

    for (auto iter = params.begin(); iter != end; ++iter) {
        if (first) { first = false; }
        else       { str.push_back(static_cast<char>(PARAM_SEP)); }

        if (*iter) {
            str += std::to_string(**iter);
        }
    }

    return str;
}
