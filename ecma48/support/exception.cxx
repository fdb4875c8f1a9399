// vi:noai:sw=4
// Copyright © 2013 David Bryant
// Copyright © 2026 ecma48 contributors

#include "ecma48/support/exception.hxx"
#include "ecma48/support/debug.hxx"

#include <sstream>

namespace {

    thread_local const char * global_file = nullptr;
    thread_local int          global_line = 0;

} // namespace

void Exception::set_thread_location(const char * file, int line) {
    ASSERT(file && line != 0, );
    global_file = file;
    global_line = line;
}

std::string Exception::get_thread_location() {
    if (!global_file) { return ""; }

    ASSERT(global_line != 0, );
    std::ostringstream ost;
    ost << global_file << ':' << global_line;
    global_file = nullptr;
    global_line = 0;
    return ost.str();
}
