#pragma once

#include <clean-ring/assert.hh>
#include <clean-ring/fwd.hh>
#include <clean-ring/utility.hh>

#include <cstddef>
#include <iterator>

/// Read-only, lazy, finite view over a ring_zipper, starting at the focus.
/// Yields exactly size() elements (T const&) in the given direction, then ends.
/// Created by ring_zipper::iter() and ring_zipper::reverse_iter().
///
/// Elements are addressed through ring_zipper::ith, so iterating never moves the focus.
/// Each call to iter() creates a fresh, independent view; a view can be iterated multiple times.
///
/// The view borrows the zipper:
/// - the zipper must outlive the view
/// - mutating the zipper while iterating a view is a programmer error, detected by CR_ASSERT
///   (the view remembers the zipper generation it was created for; checked in every build)
///
/// Usage:
///   for (auto const& tab : tabs.iter())
///       draw(tab);
///
///   auto v = std::vector<int>();
///   zipper.reverse_iter().collect_into(v);
template <class T>
struct cr::ring_view
{
    struct iterator
    {
        using value_type = T;
        using difference_type = std::ptrdiff_t;
        using reference = T const&;

        iterator() = default;

        [[nodiscard]] T const& operator*() const
        {
            CR_ASSERT_ALWAYS(_generation == _zipper->generation(), "ring_zipper was mutated while a ring_view is alive");
            return _zipper->ith(_cursor).value();
        }

        iterator& operator++()
        {
            _cursor += _step;
            return *this;
        }
        iterator operator++(int)
        {
            auto tmp = *this;
            ++*this;
            return tmp;
        }

        [[nodiscard]] friend bool operator==(iterator const& it, cr::sentinel)
        {
            return it._cursor <= -it._count || it._cursor >= it._count;
        }

    private:
        iterator(ring_zipper<T> const* zipper, isize count, isize step, u64 generation)
          : _zipper(zipper), _count(count), _step(step), _generation(generation)
        {
        }

        ring_zipper<T> const* _zipper = nullptr;
        isize _cursor = 0;
        isize _count = 0;
        isize _step = 1;
        u64 _generation = 0;

        friend ring_view;
    };

    // construction
public:
    ring_view(ring_zipper<T> const& zipper, sequence_direction dir)
      : _zipper(&zipper), _count(zipper.size()), _direction(dir), _generation(zipper.generation())
    {
    }

    // iteration
public:
    [[nodiscard]] iterator begin() const
    {
        return iterator(_zipper, _count, _direction == sequence_direction::original ? 1 : -1, _generation);
    }
    [[nodiscard]] cr::sentinel end() const { return {}; }

    // queries
public:
    /// Number of elements this view yields (the zipper size at creation).
    [[nodiscard]] isize size() const { return _count; }
    [[nodiscard]] bool empty() const { return _count == 0; }
    [[nodiscard]] sequence_direction direction() const { return _direction; }

    // collection
public:
    /// Copies all viewed elements into `sink` via push_back, in view order.
    template <class ContainerT>
    void collect_into(ContainerT& sink) const
    {
        for (auto const& v : *this)
            sink.push_back(v);
    }

    // members
private:
    ring_zipper<T> const* _zipper;
    isize _count;
    sequence_direction _direction;
    u64 _generation;
};
