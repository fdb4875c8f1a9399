// vi:noai:sw=4
// Copyright © 2013 David Bryant
// Copyright © 2026 ecma48 contributors

#ifndef COMMON__ASCII__HXX
#define COMMON__ASCII__HXX

#include <cstdint>

// Bit combinations of the 7-bit code table (ECMA-48 section 5.4) that
// the encoder needs by value.

constexpr uint8_t ESC   = '\x1B'; // '\E'
constexpr uint8_t SPACE = '\x20';
constexpr uint8_t DEL   = '\x7F';

// Parameter bytes: '0'..'9', ':', ';', '<'..'?'
constexpr uint8_t PARAM_FIRST = '\x30';
constexpr uint8_t PARAM_LAST  = '\x3F';
constexpr uint8_t PARAM_SEP   = ';';

// Intermediate bytes: SPACE and '!'..'/'
constexpr uint8_t INTER_FIRST = '\x20';
constexpr uint8_t INTER_LAST  = '\x2F';

// Final bytes: '@'..'~', of which 'p'..'~' are for private use.
constexpr uint8_t FINAL_FIRST   = '\x40';
constexpr uint8_t FINAL_PRIVATE = '\x70';
constexpr uint8_t FINAL_LAST    = '\x7E';

inline bool isIntermediate(uint8_t c) { return c >= INTER_FIRST && c <= INTER_LAST; }
inline bool isFinal(uint8_t c)        { return c >= FINAL_FIRST && c <= FINAL_LAST; }

#endif // COMMON__ASCII__HXX
