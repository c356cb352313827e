#pragma once

#include <clean-ring/macros.hh>

#include <source_location>
#include <string_view>

#if defined(CR_COMPILER_POSIX)
#include <csignal>
#endif

// =========================================================================================================
// Checks for programmer errors
// =========================================================================================================
//
// clean-ring distinguishes two kinds of "something is missing":
//   - an empty ring has no focus, nothing to take and no i-th element: that is ordinary state,
//     reported as cr::nullopt (see optional.hh)
//   - reading through a ring_view after its zipper changed, indexing a devector out of bounds,
//     or advancing the focus from an empty stack: those are bugs in the calling (or our own) code,
//     reported through the macros below
//
// A failed check is first passed to the innermost assertion handler (assert-handler.hh).
// Handlers may log, or throw to unwind (the tests do that). If the handler returns,
// the program breaks into an attached debugger and aborts.
//
// The debug break is issued from the macro itself, so a debugger stops at the failing line.

/// Checked in CR_DEBUG and CR_RELWITHDEBINFO builds, and in CR_RELEASE builds that define
/// CR_ENABLE_ASSERT_IN_RELEASE. Otherwise only type-checked.
/// Usage:
///   CR_ASSERT(_size > 0, "pop_front() called on empty devector");
#define CR_ASSERT(cond, msg) CR_IMPL_ASSERT(cond, msg)

/// Checked in every build.
/// Reserved for invariants whose violation would hand out stale elements instead of crashing.
/// Usage:
///   CR_ASSERT_ALWAYS(!from.empty(), "advance_focus: no element in the direction of motion");
#define CR_ASSERT_ALWAYS(cond, msg) CR_IMPL_ASSERT_ALWAYS(cond, msg)

/// Stops in an attached debugger, no-op otherwise.
#define CR_DEBUG_BREAK() CR_IMPL_DEBUG_BREAK()

namespace cr::impl
{
/// Passes a failed check to the innermost handler, or prints it to stderr if none is installed.
/// Returns unless the handler throws; the caller aborts afterwards.
CR_COLD_FUNC void report_assert_failure(std::string_view expression, std::string_view message, std::source_location location);

bool is_debugger_connected() noexcept;

[[noreturn]] void perform_abort() noexcept;
} // namespace cr::impl

// =========================================================================================================
// Implementation details
// =========================================================================================================

#if defined(CR_COMPILER_MSVC)
#define CR_IMPL_DEBUG_BREAK() (::cr::impl::is_debugger_connected() ? __debugbreak() : void(0))
#else
#define CR_IMPL_DEBUG_BREAK() (::cr::impl::is_debugger_connected() ? void(std::raise(SIGTRAP)) : void(0))
#endif

#define CR_IMPL_ASSERT_ALWAYS(cond, msg)                                                          \
    do                                                                                            \
    {                                                                                             \
        if (!(cond)) [[unlikely]]                                                                 \
        {                                                                                         \
            ::cr::impl::report_assert_failure(#cond, msg, std::source_location::current());       \
            CR_DEBUG_BREAK();                                                                     \
            ::cr::impl::perform_abort();                                                          \
        }                                                                                         \
    } while (false)

#if CR_ASSERT_ENABLED
#define CR_IMPL_ASSERT(cond, msg) CR_IMPL_ASSERT_ALWAYS(cond, msg)
#else
#define CR_IMPL_ASSERT(cond, msg) \
    do                            \
    {                             \
        CR_UNUSED(cond);          \
        CR_UNUSED(msg);           \
    } while (false)
#endif
