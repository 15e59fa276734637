#pragma once

// TMD_ASSERT(condition, message) checks internal invariants in debug builds and
// aborts with the failed condition and its call site. Under NDEBUG it expands to nothing.

#ifndef NDEBUG

#include <cstdlib>
#include <iostream>
#include <source_location>

namespace toymd::debug {

    [[noreturn]] inline void assertion_failed(
        const char* condition,
        const char* message,
        const std::source_location where = std::source_location::current())
    {
        std::cerr << "toymd: assertion failed: " << message << "\n"
                  << "  condition: " << condition << "\n"
                  << "  location:  " << where.file_name() << ":" << where.line()
                  << " (" << where.function_name() << ")\n";
        std::abort();
    }

} // namespace toymd::debug

#define TMD_ASSERT(Expr, Msg) \
    do { if (!(Expr)) ::toymd::debug::assertion_failed(#Expr, (Msg)); } while (false)

#else

#define TMD_ASSERT(Expr, Msg) do {} while (false)

#endif
