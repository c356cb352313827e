#pragma once

#include <clean-ring/assert.hh>
#include <clean-ring/fwd.hh>
#include <clean-ring/utility.hh>

#include <type_traits>

/// Tag of the empty state, see cr::nullopt.
/// Not default constructible, so `opt = {}` keeps meaning "assign a default optional".
struct cr::nullopt_t
{
    enum class _ctor_tag // NOLINT(readability-identifier-naming)
    {
        tag
    };
    explicit constexpr nullopt_t(_ctor_tag) {}
};

namespace cr
{
/// Usage: if (zipper.focus() == cr::nullopt) ...
inline constexpr nullopt_t nullopt = nullopt_t{nullopt_t::_ctor_tag::tag};
} // namespace cr

/// Either a T or nothing.
/// clean-ring reports "no such element" with it: an empty ring_zipper has no focus,
/// take_current_focus() on it yields nothing, ith() has nothing to index.
///
/// Differences to std::optional:
/// - access is spelled value() only (no operator*, no operator->), always checked by CR_ASSERT
/// - moving out of an engaged optional (construction or assignment) leaves the source empty,
///   so a taken element never lingers in a moved-from optional
/// - trivially copyable T gives a trivially copyable optional, moves then copy bits instead
/// - references are supported, see optional<T&> below
template <class T>
struct cr::optional
{
    static_assert(!std::is_same_v<std::remove_cv_t<T>, nullopt_t>, "optional<nullopt_t> is ill-formed");
    static_assert(!std::is_array_v<T>, "optional of an array is not supported");

    // construction
public:
    optional() = default;
    optional(nullopt_t) {}

    /// Implicit where U converts implicitly to T.
    template <class U = std::remove_cv_t<T>>
        requires(!std::is_same_v<std::remove_cvref_t<U>, optional> && !std::is_same_v<std::remove_cvref_t<U>, nullopt_t>
                 && std::is_constructible_v<T, U>)
    explicit(!std::is_convertible_v<U, T>) constexpr optional(U&& value) // NOLINT
    {
        construct(cr::forward<U>(value));
    }

    /// Replaces the content with a T built from args, returns the new value.
    template <class... Args>
    T& emplace(Args&&... args)
    {
        reset();
        construct(cr::forward<Args>(args)...);
        return _storage.value;
    }

    // trivially copyable T: plain bit copies
public:
    optional(optional const&)
        requires std::is_trivially_copyable_v<T>
    = default;
    optional(optional&&)
        requires std::is_trivially_copyable_v<T>
    = default;
    optional& operator=(optional const&)
        requires std::is_trivially_copyable_v<T>
    = default;
    optional& operator=(optional&&)
        requires std::is_trivially_copyable_v<T>
    = default;
    ~optional()
        requires std::is_trivially_destructible_v<T>
    = default;

    // everything else: go through T's special members
public:
    optional(optional const& rhs)
        requires(!std::is_trivially_copyable_v<T> && std::is_copy_constructible_v<T>)
    {
        if (rhs._has_value)
            construct(rhs._storage.value);
    }

    optional(optional&& rhs) noexcept
        requires(!std::is_trivially_copyable_v<T>)
    {
        if (rhs._has_value)
        {
            construct(cr::move(rhs._storage.value));
            rhs.reset();
        }
    }

    optional& operator=(optional const& rhs)
        requires(!std::is_trivially_copyable_v<T> && std::is_copy_constructible_v<T> && std::is_copy_assignable_v<T>)
    {
        if (this != &rhs)
            assign_from(rhs);
        return *this;
    }

    optional& operator=(optional&& rhs) noexcept
        requires(!std::is_trivially_copyable_v<T>)
    {
        if (this != &rhs)
        {
            assign_from(cr::move(rhs));
            rhs.reset();
        }
        return *this;
    }

    ~optional()
        requires(!std::is_trivially_destructible_v<T>)
    {
        reset();
    }

    // access
public:
    [[nodiscard]] bool has_value() const { return _has_value; }

    /// The contained value, with the value category of the optional:
    /// `cr::move(opt).value()` is a T&&, `std::as_const(opt).value()` a T const&.
    /// Precondition: has_value()
    template <class Self>
    [[nodiscard]] auto&& value(this Self&& self)
    {
        CR_ASSERT(self.has_value(), "value() called on empty optional");
        return static_cast<Self&&>(self)._storage.value;
    }

    template <class U>
    [[nodiscard]] T value_or(U&& fallback) const&
    {
        if (_has_value)
            return _storage.value;
        return static_cast<T>(cr::forward<U>(fallback));
    }
    template <class U>
    [[nodiscard]] T value_or(U&& fallback) &&
    {
        if (_has_value)
            return cr::move(_storage.value);
        return static_cast<T>(cr::forward<U>(fallback));
    }

    void reset()
    {
        if (!_has_value)
            return;
        if constexpr (!std::is_trivially_destructible_v<T>)
            _storage.value.~T();
        _has_value = false;
    }

    // comparison
public:
    /// Equal if both are empty, or both hold equal values.
    [[nodiscard]] friend bool operator==(optional const& lhs, optional const& rhs)
        requires requires(T const& v) { bool(v == v); }
    {
        if (!lhs._has_value || !rhs._has_value)
            return lhs._has_value == rhs._has_value;
        return lhs._storage.value == rhs._storage.value;
    }

    [[nodiscard]] friend bool operator==(optional const& lhs, T const& rhs)
        requires requires(T const& v) { bool(v == v); }
    {
        return lhs._has_value && lhs._storage.value == rhs;
    }

    [[nodiscard]] friend bool operator==(optional const& lhs, nullopt_t) { return !lhs._has_value; }

    /// `opt == true` would compare against a converted 1, not test for presence.
    [[nodiscard]] bool operator==(bool) const
        requires(!std::is_same_v<T, bool>)
    = delete;

    // helper
private:
    /// Precondition: !_has_value
    template <class... Args>
    void construct(Args&&... args)
    {
        new (cr::placement_new, &_storage.value) T(cr::forward<Args>(args)...);
        _has_value = true;
    }

    /// Copy or move assignment depending on OptionalT, reusing a live value where possible.
    template <class OptionalT>
    void assign_from(OptionalT&& rhs)
    {
        if (!rhs._has_value)
            reset();
        else if (_has_value)
            _storage.value = cr::forward<OptionalT>(rhs)._storage.value;
        else
            construct(cr::forward<OptionalT>(rhs)._storage.value);
    }

    // members
private:
    cr::storage_for<T> _storage;
    bool _has_value = false;
};

/// Optional reference: either refers to an existing T or to nothing.
/// Used for borrowed access into containers, e.g. ring_zipper::focus() and ring_zipper::ith().
/// Rebinds on assignment (never assigns through), never owns, never binds to temporaries.
/// The referenced object must outlive the optional; mutating the owning container may invalidate it.
template <class T>
struct cr::optional<T&>
{
public:
    optional() = default;
    optional(nullopt_t) {}

    constexpr optional(T& value) : _ptr(&value) {} // NOLINT

    /// no dangling references to temporaries
    optional(std::remove_reference_t<T>&&) = delete;

    /// optional<T&> converts to optional<T const&>
    template <class U>
        requires(!std::is_same_v<U, T> && std::is_convertible_v<U*, T*>)
    constexpr optional(optional<U&> const& rhs) : _ptr(rhs.has_value() ? &rhs.value() : nullptr) // NOLINT
    {
    }

public:
    [[nodiscard]] bool has_value() const { return _ptr != nullptr; }

    /// Precondition: has_value() == true.
    [[nodiscard]] T& value() const
    {
        CR_ASSERT(_ptr != nullptr, "attempted to access value of empty optional reference");
        return *_ptr;
    }

    /// Copies the referenced value out, or returns the fallback when empty.
    template <class U>
    [[nodiscard]] std::remove_cv_t<T> value_or(U&& fallback) const
    {
        return _ptr ? *_ptr : static_cast<std::remove_cv_t<T>>(cr::forward<U>(fallback));
    }

    void reset() { _ptr = nullptr; }

    // comparison
    // NOTE: compares referenced values, not addresses
public:
    [[nodiscard]] friend bool operator==(optional const& lhs, optional const& rhs)
        requires requires(T& v) { bool(v == v); }
    {
        if (lhs.has_value() != rhs.has_value())
            return false;
        if (lhs.has_value())
            return *lhs._ptr == *rhs._ptr;
        return true;
    }

    [[nodiscard]] friend bool operator==(optional const& lhs, std::remove_cv_t<T> const& rhs)
        requires requires(T& v) { bool(v == v); }
    {
        return lhs._ptr != nullptr && *lhs._ptr == rhs;
    }

    [[nodiscard]] friend bool operator==(optional const& lhs, nullopt_t) { return lhs._ptr == nullptr; }

    [[nodiscard]] bool operator==(bool) const
        requires(!std::is_same_v<std::remove_cv_t<T>, bool>)
    = delete;

private:
    T* _ptr = nullptr;
};
