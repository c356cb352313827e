#pragma once

#include <clean-ring/assert.hh>
#include <clean-ring/fwd.hh>

#include <cstddef>
#include <type_traits>

// Small helpers shared by the clean-ring containers.
//
//   move / forward / exchange           value-category plumbing without <utility>
//   wrapped_increment / _decrement      slot arithmetic of devector's circular buffer
//   euclidean_mod                       ring offsets, always in [0, n)
//   placement_new / storage_for<T>      manual object lifetime (devector slots, optional payload)
//   always_false_t                      dependent static_assert
//   sentinel                            end marker of ring_view

namespace cr
{
// =========================================================================================================
// Value categories
// =========================================================================================================

/// Usage: zipper.push_focus(cr::move(tab));
template <class T>
[[nodiscard]] CR_FORCE_INLINE constexpr T&& move(T& value) noexcept
{
    return static_cast<T&&>(value);
}

/// Usage: _forward.emplace_front(cr::forward<Args>(args)...);
template <class T>
[[nodiscard]] CR_FORCE_INLINE constexpr T&& forward(T& value) noexcept
{
    return static_cast<T&&>(value);
}
template <class T>
[[nodiscard]] CR_FORCE_INLINE constexpr T&& forward(T&& value) noexcept // NOLINT
{
    return static_cast<T&&>(value);
}

/// Stores new_val in obj, returns what obj held before.
/// Usage: _data(cr::exchange(rhs._data, nullptr))
template <class T, class U = T>
[[nodiscard]] CR_FORCE_INLINE constexpr T exchange(T& obj, U&& new_val) // NOLINT
{
    T old_val = static_cast<T&&>(obj);
    obj = cr::forward<U>(new_val);
    return old_val;
}

// =========================================================================================================
// Ring arithmetic
// =========================================================================================================

/// (pos + 1) mod max, without a division.
/// Precondition: 0 <= pos < max
template <class T>
[[nodiscard]] constexpr T wrapped_increment(T pos, T max)
{
    CR_ASSERT(max > 0, "wrapped_increment: max must be positive");
    ++pos;
    return pos == max ? T(0) : pos;
}

/// (pos - 1) mod max, without a division.
/// Precondition: 0 <= pos < max
template <class T>
[[nodiscard]] constexpr T wrapped_decrement(T pos, T max)
{
    CR_ASSERT(max > 0, "wrapped_decrement: max must be positive");
    return pos == 0 ? max - 1 : pos - 1;
}

/// Remainder that never goes negative: euclidean_mod(-1, 5) == 4, euclidean_mod(7, 5) == 2.
/// This is how a signed ring offset becomes a position.
/// Precondition: n > 0, so an empty ring must be handled before calling this.
template <class T>
[[nodiscard]] constexpr T euclidean_mod(T i, T n)
{
    CR_ASSERT(n > 0, "euclidean_mod: n must be positive");
    auto const r = i % n;
    return r < 0 ? r + n : r;
}

// =========================================================================================================
// Object lifetime
// =========================================================================================================

/// Selects the non-allocating placement new below without including <new> everywhere.
/// Usage: new (cr::placement_new, slot) T(cr::move(value));
struct placement_new_t
{
};
inline constexpr placement_new_t placement_new = {};

/// Raw, aligned room for one T. Never constructs or destroys `value` on its own.
/// Stays trivially destructible for trivially destructible T.
template <class T>
union storage_for
{
    T value;

    constexpr storage_for() {}

    ~storage_for()
        requires std::is_trivially_destructible_v<T>
    = default;
    ~storage_for()
        requires(!std::is_trivially_destructible_v<T>)
    {
    }
};

// =========================================================================================================
// Misc
// =========================================================================================================

/// Usage: static_assert(cr::always_false_t<T>, "T cannot be rendered");
template <class... E>
constexpr bool always_false_t = false;

/// End-of-range marker for iterators that know on their own when they are done.
struct sentinel
{
};
} // namespace cr

[[nodiscard]] inline void* operator new(std::size_t, cr::placement_new_t, void* ptr) noexcept { return ptr; }

// only called if a constructor throws inside placement new
inline void operator delete(void*, cr::placement_new_t, void*) noexcept {}
