#pragma once

#include <clean-storage/assert.hh>
#include <clean-storage/capacity.hh>
#include <clean-storage/fwd.hh>
#include <clean-storage/layout.hh>
#include <clean-storage/result.hh>
#include <clean-storage/span.hh>
#include <clean-storage/storage.hh>
#include <clean-storage/utility.hh>

/// Range storage embedding an array of N slots shaped like S, with capacities of type C.
///
/// The array is reinterpreted for whatever element type is requested:
/// it holds N * sizeof(S) / sizeof(T) elements of T, provided alignof(T) <= alignof(S).
///
/// allocate<T>(capacity) only validates that capacity elements fit and then hands out the whole array:
/// the handle's capacity is always maximum_capacity<T>(), never the (smaller) requested one.
/// The array is fixed by construction: try_grow and try_shrink always fail and leave the handle as is.
/// Deallocation is a no-op, and like cs::inline_element the storage does not track whether it is in use.
///
/// Usage:
///   cs::inline_range<u8, int, 16> storage;       // 16 ints worth of bytes, u8 capacities
///   auto h = storage.allocate<int>(4).value();   // h.capacity() == 16
template <class C, class S, cs::isize N>
struct cs::inline_range
{
    static_assert(cs::capacity_int<C>, "C must be an integer type");
    static_assert(N >= 0, "slot count must be non-negative");

    using capacity_type = C;

    template <class T>
    struct range_handle
    {
        C length;

        [[nodiscard]] constexpr C capacity() const { return length; }
    };

    // construction
public:
    inline_range() = default;

    inline_range(inline_range&&) = default;
    inline_range& operator=(inline_range&&) = default;
    inline_range(inline_range const&) = delete;
    inline_range& operator=(inline_range const&) = delete;

    // range storage
public:
    /// min(N * sizeof(S) / sizeof(T), max of C), or 0 if T is over-aligned for S
    template <class T>
    [[nodiscard]] C maximum_capacity() const
    {
        if (alignof(T) > alignof(S))
            return C(0);

        auto const count = byte_size / isize(sizeof(T));
        return C(cs::min(count, capacity_traits<C>::to_isize(capacity_traits<C>::max())));
    }

    template <class T>
    [[nodiscard]] result<range_handle<T>, allocation_failed> allocate(C capacity)
    {
        if (alignof(T) > alignof(S))
            return cs::err(allocation_failed{});

        auto const max_capacity = maximum_capacity<T>();
        if (capacity_traits<C>::to_isize(capacity) > capacity_traits<C>::to_isize(max_capacity))
            return cs::err(allocation_failed{});

        return cs::ok(range_handle<T>{max_capacity});
    }

    /// The array cannot grow
    template <class T>
    [[nodiscard]] result<range_handle<T>, allocation_failed> try_grow(range_handle<T> h, C new_capacity)
    {
        CS_ASSERT(capacity_traits<C>::to_isize(new_capacity) > capacity_traits<C>::to_isize(h.length),
                  "try_grow requires a larger capacity");
        CS_UNUSED(h);
        CS_UNUSED(new_capacity);
        return cs::err(allocation_failed{});
    }

    template <class T>
    [[nodiscard]] result<range_handle<T>, allocation_failed> try_shrink(range_handle<T> h, C new_capacity)
    {
        CS_ASSERT(capacity_traits<C>::to_isize(new_capacity) < capacity_traits<C>::to_isize(h.length),
                  "try_shrink requires a smaller capacity");
        CS_UNUSED(h);
        CS_UNUSED(new_capacity);
        return cs::err(allocation_failed{});
    }

    template <class T>
    [[nodiscard]] span<T> get(range_handle<T> h) const
    {
        return span<T>(reinterpret_cast<T*>(const_cast<byte*>(_bytes)), capacity_traits<C>::to_isize(h.length));
    }

    template <class T>
    void deallocate(range_handle<T> h)
    {
        CS_UNUSED(h);
    }

    // members
private:
    static constexpr isize byte_size = N * isize(sizeof(S));

    // a zero-length array is not allowed, N == 0 still gets one (unused) slot
    alignas(S) byte _bytes[N > 0 ? byte_size : isize(sizeof(S))];
};
