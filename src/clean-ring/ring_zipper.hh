#pragma once

#include <clean-ring/assert.hh>
#include <clean-ring/devector.hh>
#include <clean-ring/fwd.hh>
#include <clean-ring/optional.hh>
#include <clean-ring/ring_view.hh>
#include <clean-ring/to_string.hh>
#include <clean-ring/utility.hh>

#include <initializer_list>
#include <iterator>
#include <ranges>
#include <string>
#include <type_traits>

// -----------------------------------------------------------------------------
// cr::ring_zipper - design summary
// -----------------------------------------------------------------------------

// A zipper is a cursor over a sequence: it holds a "hole" (the focused element)
// together with the context needed to move through the sequence in both directions.
// This zipper additionally closes the sequence into a ring: the successor of the
// last element is the first one and vice versa. Iteration never hits a boundary
// (tabs, window lists, menu entries).

// Representation: two stacks, split around the focus.
//   _forward  : focus, then its successors up to the end of the source order (focus = front)
//   _backward : predecessors of the focus, nearest first (immediate predecessor = front)
// The logical ring read from the focus is _forward ++ reverse(_backward).

// Invariant: size() > 0 implies !_forward.empty().
// Every public operation restores it before returning.

// Stepping moves one element between the fronts of the two stacks.
// When the stack in the direction of motion runs dry, the other stack is drained into it
// (reversing order), which is the wrap-around. That full drain is O(n) but happens once per
// full cycle, so stepping is amortized O(1).

// Equality is representation-sensitive: two zippers over the same ring that split it
// differently are not equal.

/// Ring-shaped zipper over a finite sequence of T with a movable focus.
/// Owns its elements: moved in on construction/insertion, moved out on removal.
///
/// Usage:
///   auto tabs = cr::ring_zipper<int>{0, 1, 2, 3, 4, 5, 6, 7, 8, 9};
///   tabs.refocus([](int i) { return i == 5; });
///   cr::to_string(tabs);   // "[5, 6, 7, 8, 9, 0, 1, 2, 3, 4]"
///   tabs.step_backwards(); // focus 4
template <class T>
struct cr::ring_zipper
{
    static_assert(std::is_object_v<T> && !std::is_const_v<T>, "ring_zipper elements must be non-const objects");

    // factories
public:
    /// Builds a zipper from any finite range, appending elements in order.
    /// The focus is the first element of the range.
    /// Elements are moved out of rvalue ranges that own them and copied otherwise.
    /// Views and borrowed ranges never own their elements, so they are always copied from.
    /// Usage:
    ///   auto z = cr::ring_zipper<std::string>::create_from(std::move(names));
    ///   auto z = cr::ring_zipper<int>::create_from(std::views::iota(0, 10));
    template <class RangeT>
    [[nodiscard]] static ring_zipper create_from(RangeT&& range)
    {
        auto z = ring_zipper();

        if constexpr (requires { std::size(range); })
            z._forward.reserve(isize(std::size(range)));

        for (auto&& v : range)
        {
            if constexpr (owns_elements<RangeT>)
                z._forward.emplace_back(cr::move(v));
            else
                z._forward.emplace_back(v);
        }

        return z;
    }

    // queries
public:
    /// Number of elements in the ring, independent of the focus position.
    [[nodiscard]] isize size() const { return _forward.size() + _backward.size(); }
    [[nodiscard]] bool empty() const { return size() == 0; }

    /// Incremented by every mutation; used by ring_view to detect use after mutation.
    [[nodiscard]] u64 generation() const { return _generation; }

    // element access
public:
    /// The focused element, or nullopt if the zipper is empty.
    [[nodiscard]] optional<T const&> focus() const
    {
        if (_forward.empty())
            return cr::nullopt;
        return _forward.front();
    }
    [[nodiscard]] optional<T&> focus()
    {
        if (_forward.empty())
            return cr::nullopt;
        return _forward.front();
    }

    /// Element at signed offset i from the focus, wrapping around the ring.
    /// Positive i walks in original direction, negative i in reverse direction.
    /// ith(0) is the focus; ith(i) == ith(i + size()) == ith(i - size()).
    /// Returns nullopt for an empty zipper (there is no modulus to wrap with).
    [[nodiscard]] optional<T const&> ith(isize i) const
    {
        auto const count = size();
        if (count == 0)
            return cr::nullopt;

        auto const idx = cr::euclidean_mod(i, count);
        auto const fw_size = _forward.size();
        if (idx < fw_size)
            return _forward[idx];

        // _backward stores the tail of the logical ring in reverse
        return _backward[_backward.size() - (idx - fw_size + 1)];
    }

    // movement
public:
    /// Moves the focus one element in the given direction, wrapping at the ring boundary.
    /// No-op on an empty zipper.
    ring_zipper& step(sequence_direction dir)
    {
        if (empty())
            return *this;

        ++_generation;
        switch (dir)
        {
        case sequence_direction::original:
            // the focus leaves _forward first; refill _forward if that emptied it
            advance_focus(dir);
            rotate_stacks(dir);
            break;
        case sequence_direction::reverse:
            // a predecessor must exist before it can become the focus
            rotate_stacks(dir);
            advance_focus(dir);
            break;
        }
        return *this;
    }

    ring_zipper& step_forwards() { return step(sequence_direction::original); }
    ring_zipper& step_backwards() { return step(sequence_direction::reverse); }

    /// Focuses the first element of the source order.
    /// No-op on an empty zipper.
    ring_zipper& reset_start()
    {
        if (empty())
            return *this;

        ++_generation;
        transfer_reversed(_backward, _forward);
        return *this;
    }

    /// Focuses the last element of the source order.
    /// Idempotent: calling it while focused on the last element changes nothing.
    ring_zipper& reset_end()
    {
        if (empty())
            return *this;

        ++_generation;
        // leaves no focus, the reverse step below restores one
        transfer_reversed(_forward, _backward);
        return step(sequence_direction::reverse);
    }

    /// Steps forward until pred(focus) holds.
    /// The first step is unconditional: a matching focus at the start is only found again
    /// after a full cycle. Terminates after at most size() + 1 steps.
    /// If nothing matches, the focus ends up on the successor of the starting focus.
    template <class Pred>
    ring_zipper& refocus(Pred&& pred)
    {
        return refocus_in(sequence_direction::original, pred);
    }

    /// Steps backward until pred(focus) holds.
    /// Lands on the same element as refocus if exactly one element matches.
    /// If nothing matches, the focus ends up on the predecessor of the starting focus.
    template <class Pred>
    ring_zipper& refocus_backwards(Pred&& pred)
    {
        return refocus_in(sequence_direction::reverse, pred);
    }

    // mutation at the focus
public:
    /// Inserts value in front of the focus and focuses it.
    /// The previously focused element becomes its successor.
    ring_zipper& push_focus(T value)
    {
        ++_generation;
        _forward.push_front(cr::move(value));
        return *this;
    }

    /// Same as push_focus, but constructs the new focus in place.
    template <class... Args>
    T& emplace_focus(Args&&... args)
    {
        ++_generation;
        return _forward.emplace_front(cr::forward<Args>(args)...);
    }

    /// Removes and returns the focused element, or nullopt if empty.
    /// The successor becomes the new focus; if the focus was the last element of the
    /// source order, the new focus is the first remaining element.
    [[nodiscard]] optional<T> take_current_focus()
    {
        if (empty())
            return cr::nullopt;

        ++_generation;
        auto taken = _forward.pop_front();
        if (_forward.empty())
            transfer_reversed(_backward, _forward);
        return optional<T>(cr::move(taken));
    }

    /// Removes and returns the element immediately preceding the focus, or nullopt if empty.
    /// The focus stays where it is, except for a single-element ring, where the focus is its
    /// own predecessor and gets removed.
    [[nodiscard]] optional<T> take_previous_focus()
    {
        if (empty())
            return cr::nullopt;

        ++_generation;

        // without a stored predecessor, the focus is the first element of _forward
        // and its ring predecessor is the last one
        if (_backward.empty())
            return optional<T>(_forward.pop_back());

        return optional<T>(_backward.pop_front());
    }

    /// Destroys all elements. No-op on an empty zipper.
    void clear()
    {
        if (empty())
            return;

        ++_generation;
        _forward.clear();
        _backward.clear();
    }

    // consumption
public:
    /// Takes elements one by one, starting at the focus in original order, and passes them
    /// to f as T&&. The zipper is empty afterwards.
    template <class F>
    void drain(F&& f)
    {
        for (auto v = take_current_focus(); v.has_value(); v = take_current_focus())
            f(cr::move(v).value());
    }

    /// Drains all elements into sink via push_back (see drain).
    template <class ContainerT>
    void drain_into(ContainerT& sink)
    {
        drain([&](T&& v) { sink.push_back(cr::move(v)); });
    }

    // views
public:
    /// All elements starting at the focus in original order.
    [[nodiscard]] ring_view<T> iter() const { return ring_view<T>(*this, sequence_direction::original); }

    /// All elements starting at the focus in reverse order.
    [[nodiscard]] ring_view<T> reverse_iter() const { return ring_view<T>(*this, sequence_direction::reverse); }

    /// See cr::to_string(ring_zipper)
    [[nodiscard]] std::string to_string() const { return cr::to_string(*this); }

    // ctors
public:
    ring_zipper() = default;

    ring_zipper(std::initializer_list<T> values) : _forward(values) {}

    // comparison
public:
    /// Equal iff both stacks are element-wise equal, i.e. same ring, same focus and same split.
    [[nodiscard]] friend bool operator==(ring_zipper const& lhs, ring_zipper const& rhs)
        requires requires(T const& v) { bool(v == v); }
    {
        return lhs._forward == rhs._forward && lhs._backward == rhs._backward;
    }

    // helper
private:
    // rvalue containers own their elements; views (even rvalue ones) only refer to someone else's
    template <class RangeT>
    static constexpr bool owns_elements = !std::is_lvalue_reference_v<RangeT> && !std::ranges::view<std::remove_cvref_t<RangeT>>
                                          && !std::ranges::borrowed_range<RangeT>;

    /// Moves the focus across: pops the front of the stack matching dir and pushes it onto the
    /// front of the other one.
    /// Precondition: the stack matching dir is non-empty (rotate_stacks establishes it for a
    /// non-empty zipper). Checked in every build.
    void advance_focus(sequence_direction dir)
    {
        auto& from = dir == sequence_direction::original ? _forward : _backward;
        auto& to = dir == sequence_direction::original ? _backward : _forward;
        CR_ASSERT_ALWAYS(!from.empty(), "advance_focus: no element in the direction of motion after rotation");
        to.push_front(from.pop_front());
    }

    /// Wraps around if the stack matching dir ran out of elements.
    void rotate_stacks(sequence_direction dir)
    {
        if (dir == sequence_direction::original && _forward.empty())
            transfer_reversed(_backward, _forward);
        else if (dir == sequence_direction::reverse && _backward.empty())
            transfer_reversed(_forward, _backward);
    }

    /// Drains `from` front-to-back onto the front of `to`, which reverses the order.
    static void transfer_reversed(devector<T>& from, devector<T>& to)
    {
        to.reserve(to.size() + from.size());
        while (!from.empty())
            to.push_front(from.pop_front());
    }

    template <class Pred>
    ring_zipper& refocus_in(sequence_direction dir, Pred& pred)
    {
        static_assert(std::is_invocable_r_v<bool, Pred&, T const&>, "predicate must be callable as bool(T const&)");

        ring_zipper const& self = *this;
        isize counter = 0;
        while (true)
        {
            step(dir);
            auto const f = self.focus();
            if (!f.has_value() || pred(f.value()) || counter >= size())
                break;
            ++counter;
        }
        return *this;
    }

    // members
private:
    devector<T> _forward;
    devector<T> _backward;
    u64 _generation = 0;
};
