// vi:noai:sw=4
// Copyright © 2013 David Bryant
// Copyright © 2026 ecma48 contributors

#ifndef SUPPORT__EXCEPTION__HXX
#define SUPPORT__EXCEPTION__HXX

#include <cerrno>
#include <stdexcept>
#include <string>
#include <system_error>
#include <type_traits>

// Base class for all ecma48 exceptions. The location recorded by THROW()
// is appended to what().
class Exception : public std::runtime_error {
public:
    static void set_thread_location(const char * file, int line);
    static std::string get_thread_location();

protected:
    explicit Exception(const std::string & what_arg) :
        std::runtime_error(init(what_arg))
    {}

private:
    static std::string init(std::string what_arg) {
        auto loc = get_thread_location();
        if (!loc.empty()) {
            if (what_arg.empty()) {
                what_arg = loc;
            }
            else {
                what_arg += ": " + loc;
            }
        }
        return what_arg;
    }
};

// Bad input from the user, e.g. an unknown mnemonic given to ecma48ctl.
// message() is the text without the throw location.
class UserError final : public Exception {
    std::string _message;

public:
    explicit UserError(const std::string & message) :
        Exception(message),
        _message(message)
    {}

    const std::string & message() const { return _message; }
};

// A string could not be converted to the requested type.
class ConversionError final : public Exception {
public:
    explicit ConversionError(const std::string & what_arg) : Exception(what_arg) {}
};

// A system call failed, typically the write of a sequence to a descriptor.
class SystemError final : public Exception {
    static std::string init(const std::error_code & ec, std::string what_arg) {
        if (ec) {
            if (!what_arg.empty()) {
                what_arg += ": ";
            }
            what_arg += ec.message();
        }
        return what_arg;
    }

    std::error_code _ec;

public:
    SystemError(std::error_code ec, const std::string & what_arg) :
        Exception(init(ec, what_arg)),
        _ec(ec)
    {}

    const std::error_code & code() const { return _ec; }
};

// Throw an exception, e.g.:
//
//     THROW(UserError("Unknown mnemonic: " + name));
#define THROW(exception_) \
    do { \
        Exception::set_thread_location(__FILE__, __LINE__); \
        static_assert(std::is_base_of_v<std::exception, decltype(exception_)>); \
        throw exception_; \
    } while (false)

// Throw a SystemError for a failed system call, e.g.:
//
//     if (rval == -1) { THROW_SYSTEM_ERROR(errno, "write()"); }
#define THROW_SYSTEM_ERROR(errno_, text) \
    do { \
        int errno_copy = errno_; \
        THROW(SystemError(std::error_code(errno_copy, std::generic_category()), text)); \
    } while (false)

// Throw an exception if a condition is not met, e.g.:
//
//     THROW_UNLESS(iter != table.end(), UserError("Not found"));
#define THROW_UNLESS(condition, exception) \
    do { \
        if (!(condition)) { \
            THROW(exception); \
        } \
    } while (false)

#endif // SUPPORT__EXCEPTION__HXX
