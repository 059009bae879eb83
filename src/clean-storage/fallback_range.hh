#pragma once

#include <clean-storage/assert.hh>
#include <clean-storage/capacity.hh>
#include <clean-storage/either.hh>
#include <clean-storage/fwd.hh>
#include <clean-storage/layout.hh>
#include <clean-storage/result.hh>
#include <clean-storage/span.hh>
#include <clean-storage/storage.hh>
#include <clean-storage/utility.hh>

/// Range storage composed of two range storages: First is preferred, Second holds what does not fit.
///
/// Capacities are expressed in Second's capacity type. Whenever a capacity is handed to First it is
/// converted to First's capacity type; a value that is not representable there counts as a failure
/// of First (and routes the request to Second) rather than being truncated.
///
/// Migration rules, with data preserved up to min(old, new) elements:
///   allocate             First, else Second
///   grow   a First one   grow First in place, else allocate Second, copy over, release First
///   grow   a Second one  grow Second (never moves back)
///   shrink a First one   shrink First
///   shrink a Second one  allocate First, copy over, release Second, else shrink Second in place
///
/// If a migration cannot allocate its target, the operation fails and the old handle stays valid.
///
/// Usage:
///   // 16 ints inline, larger buffers on the heap
///   cs::fallback_range<cs::inline_range<u8, int, 16>, cs::alloc_range> storage;
template <class F, class S>
struct cs::fallback_range
{
    using capacity_type = typename S::capacity_type;
    using first_capacity_type = typename F::capacity_type;

    template <class T>
    struct range_handle
    {
        either<range_handle_t<F, T>, range_handle_t<S, T>> which;

        /// Capacity of the underlying buffer, clamped to capacity_type
        [[nodiscard]] capacity_type capacity() const
        {
            if (which.is_second())
                return which.second().capacity();

            auto const c = capacity_traits<first_capacity_type>::to_isize(which.first().capacity());
            return capacity_type(cs::min(c, capacity_traits<capacity_type>::to_isize(capacity_traits<capacity_type>::max())));
        }

        [[nodiscard]] constexpr bool is_first() const { return which.is_first(); }
        [[nodiscard]] constexpr bool is_second() const { return which.is_second(); }
    };

    // construction
public:
    fallback_range() = default;
    fallback_range(F first, S second) : _first(cs::move(first)), _second(cs::move(second)) {}

    // range storage
public:
    /// Saturating sum of both maxima, clamped to capacity_type
    template <class T>
    [[nodiscard]] capacity_type maximum_capacity() const
    {
        auto const f = capacity_traits<first_capacity_type>::to_isize(_first.template maximum_capacity<T>());
        auto const s = capacity_traits<capacity_type>::to_isize(_second.template maximum_capacity<T>());
        auto const sum = cs::saturating_add(f, s);
        return capacity_type(cs::min(sum, capacity_traits<capacity_type>::to_isize(capacity_traits<capacity_type>::max())));
    }

    template <class T>
    [[nodiscard]] result<range_handle<T>, allocation_failed> allocate(capacity_type capacity)
    {
        auto const first_capacity = convert_capacity<first_capacity_type>(capacity);
        if (first_capacity.is_ok())
        {
            auto f = _first.template allocate<T>(first_capacity.value());
            if (f.is_ok())
                return cs::ok(from_first<T>(f.value()));
        }

        auto s = _second.template allocate<T>(capacity);
        if (s.is_err())
            return cs::err(allocation_failed{});
        return cs::ok(from_second<T>(s.value()));
    }

    template <class T>
    [[nodiscard]] result<range_handle<T>, allocation_failed> try_grow(range_handle<T> h, capacity_type new_capacity)
    {
        static_assert(is_trivially_relocatable<T>, "range storages relocate elements bytewise");
        CS_ASSERT(capacity_traits<capacity_type>::to_isize(new_capacity) > capacity_of(h), "try_grow requires a larger capacity");

        if (h.is_second())
        {
            auto s = _second.template try_grow<T>(h.which.second(), new_capacity);
            if (s.is_err())
                return cs::err(allocation_failed{});
            return cs::ok(from_second<T>(s.value()));
        }

        auto const first_handle = h.which.first();

        // in place, if First can represent the new capacity at all
        auto const first_capacity = convert_capacity<first_capacity_type>(new_capacity);
        if (first_capacity.is_ok())
        {
            auto f = _first.template try_grow<T>(first_handle, first_capacity.value());
            if (f.is_ok())
                return cs::ok(from_first<T>(f.value()));
        }

        // migrate First -> Second
        auto s = _second.template allocate<T>(new_capacity);
        if (s.is_err())
            return cs::err(allocation_failed{});

        transfer(_first.template get<T>(first_handle), _second.template get<T>(s.value()));
        _first.template deallocate<T>(first_handle);
        return cs::ok(from_second<T>(s.value()));
    }

    template <class T>
    [[nodiscard]] result<range_handle<T>, allocation_failed> try_shrink(range_handle<T> h, capacity_type new_capacity)
    {
        static_assert(is_trivially_relocatable<T>, "range storages relocate elements bytewise");
        CS_ASSERT(capacity_traits<capacity_type>::to_isize(new_capacity) < capacity_of(h), "try_shrink requires a smaller capacity");

        auto const first_capacity = convert_capacity<first_capacity_type>(new_capacity);

        if (h.is_first())
        {
            if (first_capacity.is_err())
                return cs::err(allocation_failed{});

            auto f = _first.template try_shrink<T>(h.which.first(), first_capacity.value());
            if (f.is_err())
                return cs::err(allocation_failed{});
            return cs::ok(from_first<T>(f.value()));
        }

        auto const second_handle = h.which.second();

        // migrate Second -> First if First has room again
        if (first_capacity.is_ok())
        {
            auto f = _first.template allocate<T>(first_capacity.value());
            if (f.is_ok())
            {
                transfer(_second.template get<T>(second_handle), _first.template get<T>(f.value()));
                _second.template deallocate<T>(second_handle);
                return cs::ok(from_first<T>(f.value()));
            }
        }

        auto s = _second.template try_shrink<T>(second_handle, new_capacity);
        if (s.is_err())
            return cs::err(allocation_failed{});
        return cs::ok(from_second<T>(s.value()));
    }

    template <class T>
    [[nodiscard]] span<T> get(range_handle<T> h) const
    {
        if (h.is_first())
            return _first.template get<T>(h.which.first());
        return _second.template get<T>(h.which.second());
    }

    template <class T>
    void deallocate(range_handle<T> h)
    {
        if (h.is_first())
            _first.template deallocate<T>(h.which.first());
        else
            _second.template deallocate<T>(h.which.second());
    }

    // properties
public:
    [[nodiscard]] F& first() { return _first; }
    [[nodiscard]] F const& first() const { return _first; }
    [[nodiscard]] S& second() { return _second; }
    [[nodiscard]] S const& second() const { return _second; }

    // helper
private:
    template <class T>
    [[nodiscard]] static range_handle<T> from_first(range_handle_t<F, T> h)
    {
        return {either<range_handle_t<F, T>, range_handle_t<S, T>>::from_first(h)};
    }

    template <class T>
    [[nodiscard]] static range_handle<T> from_second(range_handle_t<S, T> h)
    {
        return {either<range_handle_t<F, T>, range_handle_t<S, T>>::from_second(h)};
    }

    /// Unclamped capacity of whichever backend holds h
    template <class T>
    [[nodiscard]] static isize capacity_of(range_handle<T> h)
    {
        if (h.is_first())
            return capacity_traits<first_capacity_type>::to_isize(h.which.first().capacity());
        return capacity_traits<capacity_type>::to_isize(h.which.second().capacity());
    }

    /// Copies min(src.size(), dst.size()) elements bytewise
    template <class T>
    static void transfer(span<T> src, span<T> dst)
    {
        auto const count = cs::min(src.size(), dst.size());
        cs::copy_bytes(dst.data(), src.data(), count * isize(sizeof(T)));
    }

    // members
private:
    F _first;
    S _second;
};
