#pragma once

#include <clean-ring/assert.hh>

#include <format>

// CR_ASSERTF / CR_ASSERTF_ALWAYS: CR_ASSERT / CR_ASSERT_ALWAYS with a std::format message.
// The message arguments are only evaluated (and formatted) once the check failed.
// Kept apart from assert.hh so headers without formatted messages don't pay for <format>.
//
// Usage:
//   CR_ASSERTF(0 <= i && i < _size, "index {} out of bounds (size: {})", i, _size);
#define CR_ASSERTF(cond, fmt, ...) CR_IMPL_ASSERTF(cond, fmt __VA_OPT__(, ) __VA_ARGS__)
#define CR_ASSERTF_ALWAYS(cond, fmt, ...) CR_IMPL_ASSERTF_ALWAYS(cond, fmt __VA_OPT__(, ) __VA_ARGS__)

// =========================================================================================================
// Implementation details
// =========================================================================================================

#define CR_IMPL_ASSERTF_ALWAYS(cond, fmt, ...)                                                            \
    do                                                                                                    \
    {                                                                                                     \
        if (!(cond)) [[unlikely]]                                                                         \
        {                                                                                                 \
            ::cr::impl::report_assert_failure(#cond, std::format(fmt __VA_OPT__(, ) __VA_ARGS__),         \
                                              std::source_location::current());                           \
            CR_DEBUG_BREAK();                                                                             \
            ::cr::impl::perform_abort();                                                                  \
        }                                                                                                 \
    } while (false)

#if CR_ASSERT_ENABLED
#define CR_IMPL_ASSERTF(cond, fmt, ...) CR_IMPL_ASSERTF_ALWAYS(cond, fmt __VA_OPT__(, ) __VA_ARGS__)
#else
// the format string is still checked against its arguments
#define CR_IMPL_ASSERTF(cond, fmt, ...)                         \
    do                                                          \
    {                                                           \
        CR_UNUSED(cond);                                        \
        CR_UNUSED(std::format(fmt __VA_OPT__(, ) __VA_ARGS__)); \
    } while (false)
#endif
