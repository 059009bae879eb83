#pragma once

#include <clean-storage/fwd.hh>
#include <clean-storage/layout.hh>
#include <clean-storage/result.hh>
#include <clean-storage/storage.hh>
#include <clean-storage/utility.hh>

/// Element storage embedding the room for one value shaped like S.
///
/// Any value whose layout fits into S (size and alignment) can be allocated, everything else fails
/// with allocation_failed. The storage does not track whether its room is in use: allocating twice
/// hands out the same bytes, keeping at most one value alive is the caller's discipline.
/// Deallocation is a no-op.
///
/// Handles carry only the metadata of the value, so they are empty for sized types.
///
/// Moving the storage moves the raw bytes; a stored value survives that only if it is trivially relocatable.
///
/// Usage:
///   cs::inline_element<cs::shape_for<int, double>> storage;
///   auto h = storage.create<int>(17);
template <class S>
struct cs::inline_element : cs::impl::element_storage_base<cs::inline_element<S>>
{
    template <class T>
    struct handle
    {
        [[no_unique_address]] metadata_t<T> meta;
    };

    using impl::element_storage_base<inline_element>::allocate;

    // construction
public:
    inline_element() = default;

    inline_element(inline_element&&) = default;
    inline_element& operator=(inline_element&&) = default;
    inline_element(inline_element const&) = delete;
    inline_element& operator=(inline_element const&) = delete;

    // element storage
public:
    template <class T>
    [[nodiscard]] result<handle<T>, allocation_failed> allocate(metadata_t<T> meta)
    {
        auto const l = pointee_traits<T>::layout_of(meta);
        if (l.is_err() || !l.value().fits_into(layout::of<S>()))
            return cs::err(allocation_failed{});

        return cs::ok(handle<T>{meta});
    }

    template <class T>
    [[nodiscard]] pointer_t<T> get(handle<T> h) const
    {
        return pointee_traits<T>::from_parts(bytes(), h.meta);
    }

    template <class U, class T>
        requires coercible_to<T, U>
    [[nodiscard]] handle<U> coerce(handle<T> h) const
    {
        return {unsize_traits<T, U>::coerce(h.meta, bytes())};
    }

    template <class T>
    void deallocate(handle<T> h)
    {
        CS_UNUSED(h);
    }

    // helper
private:
    [[nodiscard]] byte* bytes() const { return const_cast<byte*>(_bytes); }

    // members
private:
    alignas(S) byte _bytes[sizeof(S)];
};
