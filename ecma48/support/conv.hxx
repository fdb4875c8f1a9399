// vi:noai:sw=4
// Copyright © 2013 David Bryant
// Copyright © 2026 ecma48 contributors

#ifndef SUPPORT__CONV__HXX
#define SUPPORT__CONV__HXX

#include "ecma48/support/debug.hxx"
#include "ecma48/support/exception.hxx"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <sstream>
#include <string>
#include <type_traits>

namespace detail {

template <typename T>
void to_ostream(std::ostream & ost, const T & v) {
    ost << v;
}

inline void to_ostream(std::ostream & ost, const bool & v) {
    std::ios_base::fmtflags flags = ost.flags(); // stash current format flags
    ost << std::boolalpha << v;
    ost.flags(flags); // reset to previous format flags
}

template <typename T, typename... Args>
void to_ostream(std::ostream & ost, const T & first, const Args &... remaining) {
    to_ostream(ost, first);
    to_ostream(ost, remaining...);
}

} // namespace detail

template <typename T, typename... Args>
std::string stringify(const T & first, const Args &... remaining) {
    std::ostringstream ost;
    detail::to_ostream(ost, first, remaining...);
    return ost.str();
}

// The whole of 'str' must be consumed. Unsigned types reject a sign,
// which istream would otherwise wrap around.
template <typename T>
T unstringify(const std::string & str) {
    if constexpr (std::is_unsigned_v<T>) {
        THROW_UNLESS(str.find('-') == std::string::npos,
                     ConversionError("Negative value: '" + str + "'"));
    }
    std::istringstream ist(str + '\n');
    auto t = T{};
    ist >> t;
    THROW_UNLESS(ist.good() && ist.get() == '\n',
                 ConversionError("Failed to unstringify: '" + str + "'"));
    return t;
}

template <>
inline std::string unstringify<>(const std::string & str) {
    return str;
}

template <>
inline bool unstringify<>(const std::string & str) {
    if (str == "0" || str == "false") {
        return false;
    }
    else if (str == "1" || str == "true") {
        return true;
    }
    else { THROW(ConversionError("Failed to unstringify: " + str)); }
}

inline std::string toUpper(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return str;
}

inline char nibbleToHex(uint8_t nibble) {
    ASSERT(nibble < 0x10, );
    if (nibble < 0xA) { return '0' +  nibble;       }
    else              { return 'A' + (nibble - 10); }
}

// e.g. 0x9B -> "9B"
inline std::string byteToHex(uint8_t byte) {
    std::string str;
    str.push_back(nibbleToHex((byte >> 4) & 0x0F));
    str.push_back(nibbleToHex(byte & 0x0F));
    return str;
}

// Render bytes printably: ESC as "^[", other control and non-ASCII
// bytes as "\xNN", everything else as itself.
inline std::string toVisible(const std::string & bytes) {
    std::string str;
    for (auto ch : bytes) {
        auto byte = static_cast<uint8_t>(ch);
        if (byte == 0x1B) {
            str += "^[";
        }
        else if (byte < 0x20 || byte >= 0x7F) {
            str += "\\x";
            str += byteToHex(byte);
        }
        else {
            str.push_back(ch);
        }
    }
    return str;
}

#endif // SUPPORT__CONV__HXX
