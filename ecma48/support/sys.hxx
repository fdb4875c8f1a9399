// vi:noai:sw=4
// Copyright © 2013 David Bryant
// Copyright © 2026 ecma48 contributors

#ifndef SUPPORT__SYS__HXX
#define SUPPORT__SYS__HXX

#include <cstddef>

// Write all 'size' bytes to 'fd', retrying on EINTR and after short
// writes. Throws SystemError if ::write() fails.
void writeAll(int fd, const char * data, size_t size);

#endif // SUPPORT__SYS__HXX
