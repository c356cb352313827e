#pragma once

#include <functional>
#include <source_location>
#include <string>

// Assertion handlers decide what happens when a CR_ASSERT* check fails.
// They form a stack: the innermost (most recently pushed) handler sees every failure.
// Without any handler, failures are printed to stderr.
//
// A handler may throw to unwind out of the failing call. If it returns, the program aborts.
//
// The stack is process-global and unsynchronized: install handlers before sharing zippers across
// threads, or guard both with the same lock.
//
// Usage:
//   auto guard = cr::impl::scoped_assertion_handler([](cr::impl::assertion_info const& info) {
//       throw navigation_bug{info.message}; // surfaces a stale ring_view as an exception
//   });
//   redraw_tabs(tabs);

namespace cr::impl
{
struct assertion_info
{
    std::string expression; // the failed condition, as written
    std::string message;    // the (formatted) message
    std::source_location location;
};

using assertion_handler = std::move_only_function<void(assertion_info const&)>;

void push_assertion_handler(assertion_handler handler);

/// No-op on an empty stack.
void pop_assertion_handler();

/// Pushes on construction, pops on destruction (also while a handler exception unwinds).
struct scoped_assertion_handler
{
    explicit scoped_assertion_handler(assertion_handler handler);
    ~scoped_assertion_handler();

    scoped_assertion_handler(scoped_assertion_handler const&) = delete;
    scoped_assertion_handler(scoped_assertion_handler&&) = delete;
    scoped_assertion_handler& operator=(scoped_assertion_handler const&) = delete;
    scoped_assertion_handler& operator=(scoped_assertion_handler&&) = delete;
};
} // namespace cr::impl
