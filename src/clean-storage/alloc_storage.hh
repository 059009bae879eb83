#pragma once

#include <clean-storage/assert.hh>
#include <clean-storage/fwd.hh>
#include <clean-storage/layout.hh>
#include <clean-storage/memory_resource.hh>
#include <clean-storage/result.hh>
#include <clean-storage/span.hh>
#include <clean-storage/storage.hh>
#include <clean-storage/utility.hh>

#include <limits>

// Storages delegating to a cs::memory_resource.
//
// The resource pointer is stored in the storage; nullptr means cs::default_memory_resource.
// Both storages are cheap to copy: a copy shares the resource, and every handle stays valid with
// either copy because blocks are released through the resource, not through storage state.
//
// Zero-sized requests never reach the resource:
//   - element storage: a zero-byte value (e.g. an empty slice) gets a dangling, suitably aligned address
//   - range storage: a zero capacity is the "null" handle (data == nullptr, capacity 0)

/// Element storage with one resource allocation per value
struct cs::alloc_element : cs::impl::element_storage_base<cs::alloc_element>
{
    template <class T>
    struct handle
    {
        byte* address;
        [[no_unique_address]] metadata_t<T> meta;
    };

    using element_storage_base::allocate;

    // construction
public:
    alloc_element() = default;
    explicit alloc_element(memory_resource const* resource) : _resource(resource) {}

    // element storage
public:
    template <class T>
    [[nodiscard]] result<handle<T>, allocation_failed> allocate(metadata_t<T> meta)
    {
        auto const l = pointee_traits<T>::layout_of(meta);
        if (l.is_err())
            return cs::err(allocation_failed{});

        auto const bytes = l.value().size;
        auto const alignment = l.value().align;
        if (bytes == 0)
            return cs::ok(handle<T>{reinterpret_cast<byte*>(alignment), meta});

        byte* p = nullptr;
        auto const& res = resource();
        if (res.try_allocate_bytes(&p, bytes, bytes, alignment, res.userdata) < 0)
            return cs::err(allocation_failed{});

        return cs::ok(handle<T>{p, meta});
    }

    template <class T>
    [[nodiscard]] pointer_t<T> get(handle<T> h) const
    {
        return pointee_traits<T>::from_parts(h.address, h.meta);
    }

    template <class U, class T>
        requires coercible_to<T, U>
    [[nodiscard]] handle<U> coerce(handle<T> h) const
    {
        return {h.address, unsize_traits<T, U>::coerce(h.meta, h.address)};
    }

    template <class T>
    void deallocate(handle<T> h)
    {
        // same metadata as at allocation, so the layout cannot fail here
        auto const l = pointee_traits<T>::layout_of(h.meta).value();
        if (l.size == 0)
            return;

        auto const& res = resource();
        res.deallocate_bytes(h.address, l.size, l.align, res.userdata);
    }

    // properties
public:
    /// The resource used for allocations (resolved, never null)
    [[nodiscard]] memory_resource const& resource() const { return resolve_resource(_resource); }

    /// The resource as configured, nullptr meaning "the default resource"
    [[nodiscard]] memory_resource const* custom_resource() const { return _resource; }

    // members
private:
    memory_resource const* _resource = nullptr;
};

/// Range storage with one resource allocation per buffer
///
/// Growing and shrinking first asks the resource to resize the block in place.
/// If that fails, a new block is allocated, the first min(old, new) elements are copied bytewise,
/// and the old block is released.
struct cs::alloc_range
{
    using capacity_type = isize;

    template <class T>
    struct range_handle
    {
        T* data;
        isize length;

        [[nodiscard]] constexpr isize capacity() const { return length; }
    };

    // construction
public:
    alloc_range() = default;
    explicit alloc_range(memory_resource const* resource) : _resource(resource) {}

    // range storage
public:
    template <class T>
    [[nodiscard]] isize maximum_capacity() const
    {
        return std::numeric_limits<isize>::max() / isize(sizeof(T));
    }

    /// allocate(0) yields the null handle without touching the resource
    template <class T>
    [[nodiscard]] result<range_handle<T>, allocation_failed> allocate(isize capacity)
    {
        CS_ASSERT(capacity >= 0, "capacity must be non-negative");
        if (capacity == 0)
            return cs::ok(range_handle<T>{nullptr, 0});

        auto const l = layout::array_of<T>(capacity);
        if (l.is_err())
            return cs::err(allocation_failed{});

        byte* p = nullptr;
        auto const& res = resource();
        if (res.try_allocate_bytes(&p, l.value().size, l.value().size, l.value().align, res.userdata) < 0)
            return cs::err(allocation_failed{});

        return cs::ok(range_handle<T>{reinterpret_cast<T*>(p), capacity});
    }

    /// Growing the null handle is a fresh allocation
    template <class T>
    [[nodiscard]] result<range_handle<T>, allocation_failed> try_grow(range_handle<T> h, isize new_capacity)
    {
        static_assert(is_trivially_relocatable<T>, "range storages relocate elements bytewise");
        CS_ASSERT(new_capacity > h.length, "try_grow requires a larger capacity");

        if (h.length == 0)
            return allocate<T>(new_capacity);

        return resize<T>(h, new_capacity);
    }

    /// Shrinking to 0 releases the block and yields the null handle
    /// Shrinking the null handle fails
    template <class T>
    [[nodiscard]] result<range_handle<T>, allocation_failed> try_shrink(range_handle<T> h, isize new_capacity)
    {
        static_assert(is_trivially_relocatable<T>, "range storages relocate elements bytewise");
        if (h.length == 0)
            return cs::err(allocation_failed{});

        CS_ASSERT(0 <= new_capacity && new_capacity < h.length, "try_shrink requires a smaller, non-negative capacity");

        if (new_capacity == 0)
        {
            deallocate<T>(h);
            return cs::ok(range_handle<T>{nullptr, 0});
        }

        return resize<T>(h, new_capacity);
    }

    template <class T>
    [[nodiscard]] span<T> get(range_handle<T> h) const
    {
        return span<T>(h.data, h.length);
    }

    template <class T>
    void deallocate(range_handle<T> h)
    {
        if (h.length == 0)
            return;

        auto const& res = resource();
        res.deallocate_bytes(reinterpret_cast<byte*>(h.data), h.length * isize(sizeof(T)), isize(alignof(T)), res.userdata);
    }

    // properties
public:
    [[nodiscard]] memory_resource const& resource() const { return resolve_resource(_resource); }
    [[nodiscard]] memory_resource const* custom_resource() const { return _resource; }

    // helper
private:
    /// in place if possible, otherwise allocate + copy + free
    template <class T>
    [[nodiscard]] result<range_handle<T>, allocation_failed> resize(range_handle<T> h, isize new_capacity)
    {
        auto const l = layout::array_of<T>(new_capacity);
        if (l.is_err())
            return cs::err(allocation_failed{});

        auto const new_bytes = l.value().size;
        auto const old_bytes = h.length * isize(sizeof(T));
        auto const alignment = isize(alignof(T));
        auto* const old_ptr = reinterpret_cast<byte*>(h.data);
        auto const& res = resource();

        if (res.try_resize_bytes_in_place(old_ptr, old_bytes, new_bytes, new_bytes, alignment, res.userdata) >= 0)
            return cs::ok(range_handle<T>{h.data, new_capacity});

        byte* new_ptr = nullptr;
        if (res.try_allocate_bytes(&new_ptr, new_bytes, new_bytes, alignment, res.userdata) < 0)
            return cs::err(allocation_failed{});

        cs::copy_bytes(new_ptr, old_ptr, cs::min(old_bytes, new_bytes));
        res.deallocate_bytes(old_ptr, old_bytes, alignment, res.userdata);

        return cs::ok(range_handle<T>{reinterpret_cast<T*>(new_ptr), new_capacity});
    }

    // members
private:
    memory_resource const* _resource = nullptr;
};
