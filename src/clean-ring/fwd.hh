#pragma once

#include <cstdint>

// Forward declarations and vocabulary types of clean-ring.
// Include this instead of the full headers where only names are needed.

namespace cr
{
// Sizes, counts and ring offsets are signed:
// offsets are negative in reverse direction, and "i - size()" must not wrap for a small ring.
// Wrap-around is always explicit (cr::euclidean_mod), never unsigned overflow.
using i64 = std::int64_t;
using u64 = std::uint64_t;
using isize = i64;

// absence
struct nullopt_t;
template <class T>
struct optional;

// storage
template <class T>
struct devector;

/// Direction of motion, relative to the order of the source sequence.
enum class sequence_direction
{
    original, // towards the end of the source sequence (wrapping to its start)
    reverse,  // towards the start of the source sequence (wrapping to its end)
};

// ring navigation
template <class T>
struct ring_zipper;
template <class T>
struct ring_view;
} // namespace cr
