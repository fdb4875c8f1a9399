// vi:noai:sw=4
// Copyright © 2013 David Bryant
// Copyright © 2026 ecma48 contributors

#ifndef SUPPORT__DEBUG__HXX
#define SUPPORT__DEBUG__HXX

#include <iostream>

using TerminateHandler = void (*)();

// Invoked by FATAL() and by a failing ENFORCE()/ASSERT().
[[noreturn]] void terminate();
TerminateHandler  setTerminate(TerminateHandler f) noexcept;
TerminateHandler  getTerminate() noexcept;

#define LIKELY(x) __builtin_expect(!!(x), 1)
#define UNLIKELY(x) __builtin_expect(!!(x), 0)

#define UNUSED(x) UNUSED_##x __attribute__((unused))

// BSD doesn't have EINTR retry
#ifndef __linux__
#define TEMP_FAILURE_RETRY(a) (a)
#endif

// Allows the 'output' argument of the macros below to begin with '<<' or
// to be empty.
struct DebugDummyInserter {};
inline std::ostream & operator<<(std::ostream & ost, const DebugDummyInserter &) {
    return ost;
}

#define WARNING(output)                                                                \
    do {                                                                               \
        std::cerr << __FILE__ << ":" << __LINE__ << " " << DebugDummyInserter() output \
                  << std::endl;                                                        \
    } while (false)

#define ERROR(output)                                                                  \
    do {                                                                               \
        std::cerr << __FILE__ << ":" << __LINE__ << " " << DebugDummyInserter() output \
                  << std::endl;                                                        \
    } while (false)

#define FATAL(output)                                                                  \
    do {                                                                               \
        std::cerr << __FILE__ << ":" << __LINE__ << " " << DebugDummyInserter() output \
                  << std::endl;                                                        \
        terminate();                                                                   \
    } while (false)

// ENFORCE never gets compiled out
#define ENFORCE(condition, output)                                                         \
    do {                                                                                   \
        if (!LIKELY(condition)) {                                                          \
            std::cerr << __FILE__ << ":" << __LINE__ << " " << DebugDummyInserter() output \
                      << "  ((" #condition "))" << std::endl;                              \
            terminate();                                                                   \
        }                                                                                  \
    } while (false)

// ASSERT may be compiled out
#if DEBUG
#define ASSERT(condition, output) ENFORCE(condition, output)
#else
#define ASSERT(condition, output) \
    do {                          \
    } while (false)
#endif

#endif // SUPPORT__DEBUG__HXX
