#pragma once

#include <linear-core/assert.hh>

#include <format>
#include <string>

// =========================================================================================================
// LC_ASSERTF - Runtime assertion with std::format message
//
// Same semantics as LC_ASSERT, but the message is a format string with arguments.
// Arguments are only evaluated when the assertion fails.
//
// Usage:
//   LC_ASSERTF(p != nullptr, "allocation of {} bytes (alignment {}) failed", bytes, alignment);
//
// Trade-off: pulls in <format>; the container headers use LC_ASSERT and only the
// allocation backend and tests include this header.
//
#define LC_ASSERTF(cond, msg, ...) LC_IMPL_ASSERTF(cond, msg, ##__VA_ARGS__)

// =========================================================================================================
// LC_ASSERTF_ALWAYS - Always-active formatted assertion
//
#define LC_ASSERTF_ALWAYS(cond, msg, ...) LC_IMPL_ASSERTF_ALWAYS(cond, msg, ##__VA_ARGS__)


// =========================================================================================================
// Implementation details
// =========================================================================================================

#define LC_IMPL_ASSERTF_ALWAYS(cond, msg, ...)                                                            \
    do                                                                                                    \
    {                                                                                                     \
        if (!(cond)) [[unlikely]]                                                                         \
        {                                                                                                 \
            ::lc::impl::handle_assert_failure(#cond, std::format(msg __VA_OPT__(, ) __VA_ARGS__).c_str(), \
                                              ::lc::source_location::current());                          \
            LC_BREAK_AND_ABORT();                                                                         \
        }                                                                                                 \
    } while (false)

#if LC_ASSERT_ENABLED

#define LC_IMPL_ASSERTF(cond, msg, ...) LC_IMPL_ASSERTF_ALWAYS(cond, msg, ##__VA_ARGS__)

#else

// the format string is still checked at compile time
#define LC_IMPL_ASSERTF(cond, msg, ...)                         \
    do                                                          \
    {                                                           \
        LC_UNUSED(cond);                                        \
        LC_UNUSED(std::format(msg __VA_OPT__(, ) __VA_ARGS__)); \
    } while (false)

#endif
