#include "assert.hh"

#include <linear-core/assert-handler.hh>

#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <stacktrace>
#include <vector>

#ifdef LC_COMPILER_MSVC
extern "C" __declspec(dllimport) int __stdcall IsDebuggerPresent() noexcept;
#endif

#ifdef LC_COMPILER_POSIX
#include <cstring>
#endif

namespace
{
// NOTE: not thread-safe, see assert-handler.hh
std::vector<std::move_only_function<void(lc::impl::assertion_info const&)>> g_assertion_handlers;

void default_assert_handler(lc::impl::assertion_info const& info)
{
    std::cerr << "Assertion failed: " << info.expression << '\n';
    std::cerr << "  Message: " << info.message << '\n';
    std::cerr << "  Location: " << info.location.file_name() << ':' << info.location.line() << ':'
              << info.location.column() << " (" << info.location.function_name() << ")\n";

    std::cerr << "\nStacktrace:\n";
    std::cerr << std::to_string(std::stacktrace::current(1)) << '\n';
}
} // namespace

void lc::impl::push_assertion_handler(std::move_only_function<void(assertion_info const&)> handler)
{
    g_assertion_handlers.push_back(std::move(handler));
}

void lc::impl::pop_assertion_handler()
{
    if (!g_assertion_handlers.empty())
        g_assertion_handlers.pop_back();
}

lc::impl::scoped_assertion_handler::scoped_assertion_handler(std::move_only_function<void(assertion_info const&)> handler)
{
    push_assertion_handler(std::move(handler));
}

lc::impl::scoped_assertion_handler::~scoped_assertion_handler()
{
    pop_assertion_handler();
}

LC_COLD_FUNC void lc::impl::handle_assert_failure(char const* expression, char const* message, lc::source_location location)
{
    assertion_info const info{
        .expression = expression,
        .message = message,
        .location = location,
    };

    if (!g_assertion_handlers.empty())
        g_assertion_handlers.back()(info);
    else
        default_assert_handler(info);

    // no abort here, the macro does it
}

bool lc::impl::is_debugger_connected() noexcept
{
#ifdef LC_COMPILER_MSVC
    return ::IsDebuggerPresent() != 0;
#elif defined(LC_OS_LINUX)
    // TracerPid in /proc/self/status is non-zero while traced
    if (auto* f = std::fopen("/proc/self/status", "r"))
    {
        char buf[1024];
        while (std::fgets(buf, sizeof(buf), f))
        {
            if (std::strncmp(buf, "TracerPid:", 10) == 0)
            {
                int pid = 0;
                std::sscanf(buf + 10, "%d", &pid);
                std::fclose(f);
                return pid != 0;
            }
        }
        std::fclose(f);
    }
    return false;
#else
    return false;
#endif
}

[[noreturn]] void lc::impl::perform_abort() noexcept
{
    std::abort();
}
