#pragma once

#include <clean-storage/assert.hh>
#include <clean-storage/fwd.hh>
#include <clean-storage/layout.hh>
#include <clean-storage/result.hh>
#include <clean-storage/storage.hh>
#include <clean-storage/utility.hh>

#include <limits>
#include <string>

/// Element storage embedding N slots shaped like S, managed by an intrusive free list.
///
/// Each slot is a union: it either holds the bytes of a value or, while free, the index of the next
/// free slot. All slots start out free and linked in index order (0 -> 1 -> ... -> N-1 -> end).
/// allocate pops the head of the list, deallocate pushes the slot back onto the head, so slots are
/// reused in LIFO order. Both are O(1): no search, no compaction.
///
/// Values must fit into one slot (size and alignment of S), otherwise allocation fails
/// before the free list is touched.
///
/// Handles carry the slot index plus the value's metadata.
///
/// Usage:
///   cs::tracking_element<std::string, 4> storage;
///   auto h = storage.create<std::string>("hello").value();
///   storage.destroy<std::string>(h);
template <class S, cs::isize N>
struct cs::tracking_element : cs::impl::element_storage_base<cs::tracking_element<S, N>>
{
    static_assert(N > 0, "tracking_element needs at least one slot");

    template <class T>
    struct handle
    {
        isize index;
        [[no_unique_address]] metadata_t<T> meta;
    };

    using impl::element_storage_base<tracking_element>::allocate;

    // construction
public:
    /// All slots free, linked in index order
    tracking_element()
    {
        for (isize i = 0; i < N; ++i)
            _slots[i].next = i + 1 < N ? i + 1 : end_of_list;
        _next_free = 0;
    }

    tracking_element(tracking_element&&) = default;
    tracking_element& operator=(tracking_element&&) = default;
    tracking_element(tracking_element const&) = delete;
    tracking_element& operator=(tracking_element const&) = delete;

    // element storage
public:
    template <class T>
    [[nodiscard]] result<handle<T>, allocation_failed> allocate(metadata_t<T> meta)
    {
        auto const l = pointee_traits<T>::layout_of(meta);
        if (l.is_err() || !l.value().fits_into(layout::of<S>()))
            return cs::err(allocation_failed{});

        if (_next_free == end_of_list)
            return cs::err(allocation_failed{});

        auto const index = cs::exchange(_next_free, _slots[_next_free].next);
        return cs::ok(handle<T>{index, meta});
    }

    template <class T>
    [[nodiscard]] pointer_t<T> get(handle<T> h) const
    {
        return pointee_traits<T>::from_parts(slot_bytes(h.index), h.meta);
    }

    template <class U, class T>
        requires coercible_to<T, U>
    [[nodiscard]] handle<U> coerce(handle<T> h) const
    {
        return {h.index, unsize_traits<T, U>::coerce(h.meta, slot_bytes(h.index))};
    }

    template <class T>
    void deallocate(handle<T> h)
    {
        CS_ASSERT(0 <= h.index && h.index < N, "slot index out of range");
        _slots[h.index].next = _next_free;
        _next_free = h.index;
    }

    // diagnostics
public:
    /// Number of slots on the free list (walks the list)
    [[nodiscard]] isize free_count() const
    {
        isize count = 0;
        for (auto i = _next_free; i != end_of_list; i = _slots[i].next)
            ++count;
        return count;
    }

    /// Renders the free list, e.g. "tracking_element{ next: 2 -> 0 -> 1 -> null }"
    [[nodiscard]] std::string to_debug_string() const
    {
        std::string s = "tracking_element{ next: ";
        for (auto i = _next_free; i != end_of_list; i = _slots[i].next)
        {
            s += std::to_string(i);
            s += " -> ";
        }
        s += "null }";
        return s;
    }

    // helper
private:
    [[nodiscard]] byte* slot_bytes(isize index) const
    {
        CS_ASSERT(0 <= index && index < N, "slot index out of range");
        return const_cast<byte*>(_slots[index].bytes);
    }

    // members
private:
    static constexpr isize end_of_list = -1;

    union slot
    {
        isize next;
        alignas(S) byte bytes[sizeof(S)];
    };

    slot _slots[N];
    isize _next_free = end_of_list;
};
