#pragma once

// Lean header with minimal dependencies: every container header includes it.
// For formatted messages use <linear-core/assertf.hh>.
#include <linear-core/macros.hh>

#include <source_location>

namespace lc
{
/// Source position captured by the assertion macros (file, line, column, function).
using source_location = std::source_location;
} // namespace lc

// =========================================================================================================
// LC_ASSERT - Runtime assertion with string literal message
//
// Checks a condition and, on failure, reports it through the active assertion handler,
// breaks into an attached debugger, and aborts.
//
// Assertions guard INVARIANTS and PRECONDITIONS of the containers, e.g.
//   - index out of bounds on the entry storage
//   - operator[] on a key that is not present
//   - value() on an empty optional
//   - touching a map while one of its entry cursors is still alive (debug builds)
//
// They are NOT for expected conditions: a missing key is reported as an empty lc::optional.
//
// Active when LC_ASSERT_ENABLED is 1 (debug and release-with-debug-info, or release with
// LC_ENABLE_ASSERT_IN_RELEASE). Disabled assertions still type-check their arguments.
//
// Usage:
//   LC_ASSERT(0 <= i && i < size(), "index out of bounds");
//
#define LC_ASSERT(cond, msg) LC_IMPL_ASSERT(cond, msg)

// =========================================================================================================
// LC_ASSERT_ALWAYS - Always-active assertion
//
// Like LC_ASSERT but also active in release builds.
// Used where continuing would corrupt memory, e.g. a memory resource returning garbage.
//
#define LC_ASSERT_ALWAYS(cond, msg) LC_IMPL_ASSERT_ALWAYS(cond, msg)

// =========================================================================================================
// LC_DEBUG_BREAK - Break into the debugger if one is attached, otherwise no-op
//
#define LC_DEBUG_BREAK() LC_IMPL_DEBUG_BREAK()

// =========================================================================================================
// LC_BREAK_AND_ABORT - Debug break (if attached) followed by program termination
//
#define LC_BREAK_AND_ABORT() (LC_DEBUG_BREAK(), ::lc::impl::perform_abort())


// =========================================================================================================
// Implementation details
// =========================================================================================================

namespace lc::impl
{
// Called when an assertion fails
// Dispatches to the topmost custom handler or prints diagnostics to stderr
// Note: does not abort, caller must follow with LC_BREAK_AND_ABORT()
LC_COLD_FUNC void handle_assert_failure(char const* expression, char const* message, lc::source_location location);

// Checks if a debugger is currently attached to the process
bool is_debugger_connected() noexcept;

// Terminates the program
[[noreturn]] void perform_abort() noexcept;
} // namespace lc::impl

// The debugger should break right in the assert macro, so this cannot hide in a function call

#ifdef LC_COMPILER_MSVC

// __debugbreak() terminates immediately without an attached debugger
#define LC_IMPL_DEBUG_BREAK() (::lc::impl::is_debugger_connected() ? __debugbreak() : void(0))

#elif defined(LC_COMPILER_POSIX)

// SIGTRAP is 5, see https://man7.org/linux/man-pages/man7/signal.7.html
// declared here to avoid pulling a posix header into every container
extern "C" int raise(int) noexcept;
#define LC_IMPL_DEBUG_BREAK() (::lc::impl::is_debugger_connected() ? (void)::raise(5) : void(0))

#else

#define LC_IMPL_DEBUG_BREAK() void(0)

#endif

#define LC_IMPL_ASSERT_ALWAYS(cond, msg)                                                     \
    do                                                                                       \
    {                                                                                        \
        if (!(cond)) [[unlikely]]                                                            \
        {                                                                                    \
            ::lc::impl::handle_assert_failure(#cond, msg, ::lc::source_location::current()); \
            LC_BREAK_AND_ABORT();                                                            \
        }                                                                                    \
    } while (false)

#if LC_ASSERT_ENABLED

#define LC_IMPL_ASSERT(cond, msg) LC_IMPL_ASSERT_ALWAYS(cond, msg)

#else

#define LC_IMPL_ASSERT(cond, msg) \
    do                            \
    {                             \
        LC_UNUSED(cond);          \
        LC_UNUSED(msg);           \
    } while (false)

#endif
