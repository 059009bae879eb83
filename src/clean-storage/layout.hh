#pragma once

#include <clean-storage/fwd.hh>
#include <clean-storage/result.hh>
#include <clean-storage/span.hh>
#include <clean-storage/utility.hh>

#include <concepts>
#include <limits>
#include <memory>
#include <type_traits>

// =========================================================================================================
// Shapes of stored values
// =========================================================================================================
//
// Storages only ever see raw bytes. What they need from a value type is its shape:
//   layout                  - size + alignment of a (possibly dynamically-sized) value
//   pointee_traits<T>       - metadata type, layout from metadata, typed view from address + metadata
//   unsize_traits<From, To> - turning the metadata of a concrete value into that of an unsized supertype
//
// Three families of pointees are supported out of the box:
//   T            - sized types, no metadata, view is T*
//   T[]          - slices, metadata is the element count, view is cs::span<T>
//   cs::dyn<B>   - a polymorphic object seen through base B, metadata is {concrete layout, base offset}, view is B*
//
// Both traits are customization points and may be specialized for user types.

/// Size and alignment of a block of bytes
/// align is always a power of two, size is not necessarily a multiple of align
struct cs::layout
{
    isize size = 0;
    isize align = 1;

    template <class T>
    [[nodiscard]] static constexpr layout of()
    {
        return {isize(sizeof(T)), isize(alignof(T))};
    }

    /// Layout of count contiguous Ts
    /// Fails with allocation_failed if count is negative or the byte size overflows isize.
    template <class T>
    [[nodiscard]] static constexpr result<layout, allocation_failed> array_of(isize count)
    {
        if (count < 0 || count > std::numeric_limits<isize>::max() / isize(sizeof(T)))
            return cs::err(allocation_failed{});
        return cs::ok(layout{count * isize(sizeof(T)), isize(alignof(T))});
    }

    /// True if a value of this layout can be placed into a slot of layout `slot`
    [[nodiscard]] constexpr bool fits_into(layout slot) const { return size <= slot.size && align <= slot.align; }

    friend bool operator==(layout, layout) = default;
};

namespace cs
{
/// Marker for "a polymorphic object seen through Base"
/// Never instantiated as an object, only used as the T in handle<T> / pointee_traits<T>
template <class Base>
struct dyn
{
    dyn() = delete;
};

/// Metadata of sized pointees
struct no_metadata
{
    friend bool operator==(no_metadata, no_metadata) = default;
};

/// Metadata of cs::dyn<Base> pointees
struct dyn_metadata
{
    /// layout of the concrete (most derived) object
    layout concrete;
    /// byte offset of the Base subobject inside the concrete object
    isize base_offset = 0;

    friend bool operator==(dyn_metadata, dyn_metadata) = default;
};

// =========================================================================================================
// pointee_traits
// =========================================================================================================

/// Sized types
template <class T>
struct pointee_traits
{
    using metadata = no_metadata;
    using pointer = T*;

    [[nodiscard]] static constexpr result<layout, allocation_failed> layout_of(metadata) { return cs::ok(layout::of<T>()); }

    [[nodiscard]] static pointer from_parts(byte* address, metadata) { return reinterpret_cast<T*>(address); }

    static void destroy(pointer p) { std::destroy_at(p); }
};

/// Slices
template <class T>
struct pointee_traits<T[]>
{
    using metadata = isize;
    using pointer = cs::span<T>;

    [[nodiscard]] static constexpr result<layout, allocation_failed> layout_of(metadata count)
    {
        return layout::array_of<T>(count);
    }

    [[nodiscard]] static pointer from_parts(byte* address, metadata count)
    {
        return cs::span<T>(reinterpret_cast<T*>(address), count);
    }

    static void destroy(pointer p) { std::destroy(p.begin(), p.end()); }
};

/// Polymorphic objects seen through Base
template <class Base>
struct pointee_traits<dyn<Base>>
{
    using metadata = dyn_metadata;
    using pointer = Base*;

    [[nodiscard]] static constexpr result<layout, allocation_failed> layout_of(metadata meta)
    {
        return cs::ok(meta.concrete);
    }

    [[nodiscard]] static pointer from_parts(byte* address, metadata meta)
    {
        return reinterpret_cast<Base*>(address + meta.base_offset);
    }

    static void destroy(pointer p)
    {
        static_assert(std::has_virtual_destructor_v<Base>, "destroying through cs::dyn<Base> requires a virtual destructor");
        p->~Base();
    }
};

template <class T>
using metadata_t = typename pointee_traits<T>::metadata;

template <class T>
using pointer_t = typename pointee_traits<T>::pointer;

/// Pointees without metadata, i.e. the only ones that can be passed around by value
template <class T>
concept sized_pointee = std::is_same_v<metadata_t<T>, no_metadata>;

// =========================================================================================================
// unsize_traits
// =========================================================================================================

/// Not coercible unless specialized
template <class From, class To>
struct unsize_traits
{
};

/// Identity
template <class T>
struct unsize_traits<T, T>
{
    [[nodiscard]] static metadata_t<T> coerce(metadata_t<T> meta, byte*) { return meta; }
};

/// Fixed-size array to slice
template <class T, std::size_t N>
struct unsize_traits<T[N], T[]>
{
    [[nodiscard]] static isize coerce(no_metadata, byte*) { return isize(N); }
};

/// Concrete object to polymorphic view of one of its bases
/// The address is needed because the base offset is only known for an actual object.
template <class Derived, class Base>
    requires std::derived_from<Derived, Base>
struct unsize_traits<Derived, dyn<Base>>
{
    [[nodiscard]] static dyn_metadata coerce(no_metadata, byte* address)
    {
        auto* const derived = reinterpret_cast<Derived*>(address);
        auto* const base = static_cast<Base*>(derived);
        return {layout::of<Derived>(), reinterpret_cast<byte*>(base) - address};
    }
};

/// True if handles for From can be reinterpreted as handles for To
template <class From, class To>
concept coercible_to = requires(metadata_t<From> meta, byte* address) {
    { unsize_traits<From, To>::coerce(meta, address) } -> std::same_as<metadata_t<To>>;
};

// =========================================================================================================
// Slot shapes
// =========================================================================================================

/// A type with exactly the given size and alignment
/// Used as the S parameter of inline storages to describe their slots.
template <isize Size, isize Align>
struct shape
{
    static_assert(Size > 0, "shape size must be positive");
    static_assert(Align > 0 && (Align & (Align - 1)) == 0, "shape alignment must be a power of two");

    alignas(Align) byte bytes[Size];
};

namespace impl
{
template <class... Ts>
constexpr isize max_size_of()
{
    isize r = 1;
    ((r = cs::max(r, isize(sizeof(Ts)))), ...);
    return r;
}
template <class... Ts>
constexpr isize max_align_of()
{
    isize r = 1;
    ((r = cs::max(r, isize(alignof(Ts)))), ...);
    return r;
}
} // namespace impl

/// The smallest shape that can hold any of Ts
/// Usage:
///   cs::inline_element<cs::shape_for<int, double, std::string>> storage;
template <class... Ts>
using shape_for = shape<impl::max_size_of<Ts...>(), impl::max_align_of<Ts...>()>;

// =========================================================================================================
// Relocation
// =========================================================================================================

/// True if a T can be moved to a new address by copying its bytes, without running any constructor or destructor.
/// Range storages rely on this when they grow by reallocation or migrate between backends.
/// Defaults to trivially copyable types.
/// Opt in for a custom type with a `static constexpr bool is_trivially_relocatable = true;` member
/// or by specializing this variable.
template <class T>
constexpr bool is_trivially_relocatable = std::is_trivially_copyable_v<T>;

template <class T>
    requires requires { T::is_trivially_relocatable; }
constexpr bool is_trivially_relocatable<T> = T::is_trivially_relocatable;

} // namespace cs
