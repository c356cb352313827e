#pragma once

#include <clean-ring/assertf.hh>
#include <clean-ring/fwd.hh>
#include <clean-ring/utility.hh>

#include <cstddef>
#include <initializer_list>
#include <new>
#include <type_traits>


/// Growable double-ended vector of T elements with value semantics.
/// Backed by a circular buffer: push/pop at both ends are O(1) amortized.
/// This is the stack type underneath cr::ring_zipper, which needs cheap push_front/pop_front
/// on both of its halves.
///
/// Storage model:
/// - [_data, _data + _capacity) is the owned slot range
/// - the live elements are the _size slots starting at _head, wrapping at _capacity
/// - logical index i lives at physical slot (_head + i) mod _capacity
/// - growth relocates into a fresh buffer of twice the capacity and linearizes (_head becomes 0)
///
/// Elements are moved during relocation; T's move constructor is assumed not to throw.
template <class T>
struct cr::devector
{
    static_assert(std::is_object_v<T> && !std::is_const_v<T>, "devector elements must be non-const objects, not references/functions/void");

    // element access
public:
    /// Access element at logical index i (0 = front).
    [[nodiscard]] T& operator[](isize i)
    {
        CR_ASSERTF(0 <= i && i < _size, "index {} out of bounds (size: {})", i, _size);
        return _data[physical_index(i)];
    }
    [[nodiscard]] T const& operator[](isize i) const
    {
        CR_ASSERTF(0 <= i && i < _size, "index {} out of bounds (size: {})", i, _size);
        return _data[physical_index(i)];
    }

    [[nodiscard]] T& front()
    {
        CR_ASSERT(_size > 0, "front() called on empty devector");
        return _data[_head];
    }
    [[nodiscard]] T const& front() const
    {
        CR_ASSERT(_size > 0, "front() called on empty devector");
        return _data[_head];
    }

    [[nodiscard]] T& back()
    {
        CR_ASSERT(_size > 0, "back() called on empty devector");
        return _data[physical_index(_size - 1)];
    }
    [[nodiscard]] T const& back() const
    {
        CR_ASSERT(_size > 0, "back() called on empty devector");
        return _data[physical_index(_size - 1)];
    }

    // queries
public:
    [[nodiscard]] isize size() const { return _size; }
    [[nodiscard]] bool empty() const { return _size == 0; }

    /// Number of elements that fit without reallocation (shared by both ends).
    [[nodiscard]] isize capacity() const { return _capacity; }

    // modifiers - growth at both ends
public:
    template <class... Args>
    T& emplace_front(Args&&... args)
    {
        if (_size == _capacity)
            return emplace_with_growth(true, cr::forward<Args>(args)...);

        auto const new_head = cr::wrapped_decrement(_head, _capacity);
        auto* p = new (cr::placement_new, _data + new_head) T(cr::forward<Args>(args)...);
        _head = new_head;
        ++_size;
        return *p;
    }

    template <class... Args>
    T& emplace_back(Args&&... args)
    {
        if (_size == _capacity)
            return emplace_with_growth(false, cr::forward<Args>(args)...);

        auto* p = new (cr::placement_new, _data + physical_index(_size)) T(cr::forward<Args>(args)...);
        ++_size;
        return *p;
    }

    void push_front(T const& value) { emplace_front(value); }
    void push_front(T&& value) { emplace_front(cr::move(value)); }
    void push_back(T const& value) { emplace_back(value); }
    void push_back(T&& value) { emplace_back(cr::move(value)); }

    // modifiers - removal at both ends
public:
    /// Removes and returns the first element.
    /// Precondition: !empty()
    [[nodiscard]] T pop_front()
    {
        CR_ASSERT(_size > 0, "pop_front() called on empty devector");
        T result = cr::move(_data[_head]);
        remove_front();
        return result;
    }

    /// Removes and returns the last element.
    /// Precondition: !empty()
    [[nodiscard]] T pop_back()
    {
        CR_ASSERT(_size > 0, "pop_back() called on empty devector");
        T result = cr::move(_data[physical_index(_size - 1)]);
        remove_back();
        return result;
    }

    /// Destroys the first element without returning it.
    void remove_front()
    {
        CR_ASSERT(_size > 0, "remove_front() called on empty devector");
        _data[_head].~T();
        _head = cr::wrapped_increment(_head, _capacity);
        --_size;
    }

    /// Destroys the last element without returning it.
    void remove_back()
    {
        CR_ASSERT(_size > 0, "remove_back() called on empty devector");
        _data[physical_index(_size - 1)].~T();
        --_size;
    }

    /// Destroys all elements, keeps the buffer.
    void clear()
    {
        if constexpr (!std::is_trivially_destructible_v<T>)
        {
            for (isize i = 0; i < _size; ++i)
                _data[physical_index(i)].~T();
        }
        _head = 0;
        _size = 0;
    }

    /// Ensures at least `count` elements fit without reallocation.
    void reserve(isize count)
    {
        if (count <= _capacity)
            return;

        auto* new_data = allocate_slots(count);
        relocate_elements_to(new_data, 0);
        replace_buffer(new_data, count);
    }

    // ctors / assignment
public:
    devector() = default;

    devector(std::initializer_list<T> values)
    {
        reserve(isize(values.size()));
        for (auto const& v : values)
            emplace_back(v);
    }

    devector(devector const& rhs)
        requires std::is_copy_constructible_v<T>
    {
        reserve(rhs._size);
        for (isize i = 0; i < rhs._size; ++i)
            emplace_back(rhs[i]);
    }

    devector(devector&& rhs) noexcept
      : _data(cr::exchange(rhs._data, nullptr)),
        _head(cr::exchange(rhs._head, 0)),
        _size(cr::exchange(rhs._size, 0)),
        _capacity(cr::exchange(rhs._capacity, 0))
    {
    }

    devector& operator=(devector const& rhs)
        requires std::is_copy_constructible_v<T>
    {
        if (this != &rhs)
        {
            auto copy = devector(rhs);
            *this = cr::move(copy);
        }
        return *this;
    }

    devector& operator=(devector&& rhs) noexcept
    {
        if (this != &rhs)
        {
            clear();
            deallocate_slots(_data, _capacity);
            _data = cr::exchange(rhs._data, nullptr);
            _head = cr::exchange(rhs._head, 0);
            _size = cr::exchange(rhs._size, 0);
            _capacity = cr::exchange(rhs._capacity, 0);
        }
        return *this;
    }

    ~devector()
    {
        clear();
        deallocate_slots(_data, _capacity);
    }

    // comparison
public:
    /// Element-wise equality in logical order (capacity and physical layout are ignored).
    [[nodiscard]] friend bool operator==(devector const& lhs, devector const& rhs)
        requires requires(T const& v) { bool(v == v); }
    {
        if (lhs._size != rhs._size)
            return false;

        for (isize i = 0; i < lhs._size; ++i)
            if (!(lhs[i] == rhs[i]))
                return false;

        return true;
    }

    // helper
private:
    [[nodiscard]] isize physical_index(isize i) const
    {
        auto const p = _head + i;
        return p >= _capacity ? p - _capacity : p;
    }

    [[nodiscard]] static T* allocate_slots(isize count)
    {
        return static_cast<T*>(::operator new(std::size_t(count) * sizeof(T), std::align_val_t(alignof(T))));
    }

    static void deallocate_slots(T* data, isize count)
    {
        if (data)
            ::operator delete(data, std::size_t(count) * sizeof(T), std::align_val_t(alignof(T)));
    }

    /// Move-constructs all live elements into dest[offset, offset + _size) and ends their lifetime here.
    void relocate_elements_to(T* dest, isize offset)
    {
        for (isize i = 0; i < _size; ++i)
        {
            auto& src = _data[physical_index(i)];
            new (cr::placement_new, dest + offset + i) T(cr::move(src));
            src.~T();
        }
    }

    /// Frees the current buffer and adopts the given linearized one (elements start at slot 0).
    void replace_buffer(T* new_data, isize new_capacity)
    {
        deallocate_slots(_data, _capacity);
        _data = new_data;
        _capacity = new_capacity;
        _head = 0;
    }

    /// Slow path of emplace_front/emplace_back when the buffer is full.
    /// The new element is constructed before the old elements move,
    /// so args may alias elements of this devector.
    template <class... Args>
    T& emplace_with_growth(bool at_front, Args&&... args)
    {
        auto const new_capacity = _capacity < 4 ? isize(4) : _capacity * 2;
        auto* new_data = allocate_slots(new_capacity);

        auto* p = new_data + (at_front ? 0 : _size);
        try
        {
            new (cr::placement_new, p) T(cr::forward<Args>(args)...);
        }
        catch (...)
        {
            deallocate_slots(new_data, new_capacity);
            throw;
        }

        relocate_elements_to(new_data, at_front ? 1 : 0);
        replace_buffer(new_data, new_capacity);
        ++_size;
        return *p;
    }

    // members
private:
    T* _data = nullptr;
    isize _head = 0;
    isize _size = 0;
    isize _capacity = 0;
};
