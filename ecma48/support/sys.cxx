// vi:noai:sw=4
// Copyright © 2013 David Bryant
// Copyright © 2026 ecma48 contributors

#include "ecma48/support/sys.hxx"
#include "ecma48/support/exception.hxx"
#include "ecma48/support/debug.hxx"

#include <cerrno>

#include <unistd.h>

void writeAll(int fd, const char * data, size_t size) {
    while (size != 0) {
        auto rval = TEMP_FAILURE_RETRY(::write(fd, static_cast<const void *>(data), size));

        if (rval == -1) {
            THROW_SYSTEM_ERROR(errno, "write()");
        }
        else if (rval == 0) {
            FATAL(<< "Zero length write");
        }
        else {
            data += rval;
            size -= static_cast<size_t>(rval);
        }
    }
}
