#pragma once

#include <linear-core/assert.hh>

#include <functional>
#include <string>

namespace lc::impl
{
// Customizable assertion handler stack
// NOTE: handlers are global state and must be externally synchronized
//
// Usage example:
//   {
//       auto handler = lc::impl::scoped_assertion_handler([](lc::impl::assertion_info const& info) {
//           log_assertion_failure(info);
//           throw assertion_failure_exception{info.message};
//       });
//
//       // any failing LC_ASSERT in this scope reaches the handler above
//       auto const& v = map[missing_key];
//   } // handler is popped here

struct assertion_info
{
    std::string expression;
    std::string message;
    lc::source_location location;
};

// Push a custom assertion handler
// Handlers may throw to unwind to a recovery point; if they return, the program still aborts
void push_assertion_handler(std::move_only_function<void(assertion_info const&)> handler);

// Pop the topmost assertion handler (no-op if the stack is empty)
// Prefer scoped_assertion_handler so that throwing handlers cannot leave the stack unbalanced
void pop_assertion_handler();

// RAII wrapper for pushing/popping assertion handlers
struct scoped_assertion_handler
{
    explicit scoped_assertion_handler(std::move_only_function<void(assertion_info const&)> handler);
    ~scoped_assertion_handler();

    scoped_assertion_handler(scoped_assertion_handler const&) = delete;
    scoped_assertion_handler& operator=(scoped_assertion_handler const&) = delete;
    scoped_assertion_handler(scoped_assertion_handler&&) = delete;
    scoped_assertion_handler& operator=(scoped_assertion_handler&&) = delete;
};
} // namespace lc::impl
