#pragma once

#include <clean-storage/assert.hh>
#include <clean-storage/fwd.hh>

#include <cstring>
#include <type_traits>

// =========================================================================================================
// Utility functions for common operations
// =========================================================================================================
//
// Move semantics:
//   move(value)                 - cast value to rvalue reference for moving
//   forward<T>(value)           - perfect forwarding for template arguments
//   exchange(obj, new_val)      - replace obj with new_val and return old value
//
// Comparison:
//   max(a, b) / min(a, b)       - larger / smaller of two values (requires operator<)
//
// Alignment (value or pointer):
//   is_power_of_two(value)      - check if value is a power of 2
//   is_aligned(value, alignment)- check if aligned at boundary (power of 2)
//
// Raw memory:
//   placement_new               - tag for cs-internal placement new
//   copy_bytes(dst, src, bytes) - memcpy for non-overlapping byte ranges (bytes >= 0)
//
// Template metaprogramming:
//   always_false_t<T...>        - always false for static_assert with type parameters
//   function_ptr<Signature>     - convert function signature to function pointer type

namespace cs
{
// =========================================================================================================
// Move semantics
// =========================================================================================================

/// Cast value to rvalue reference to enable move semantics
template <class T>
[[nodiscard]] CS_FORCE_INLINE constexpr T&& move(T& value) noexcept
{
    return static_cast<T&&>(value);
}

/// Perfect forwarding for template arguments
template <class T>
[[nodiscard]] CS_FORCE_INLINE constexpr T&& forward(T& value) noexcept
{
    return static_cast<T&&>(value);
}

template <class T>
[[nodiscard]] CS_FORCE_INLINE constexpr T&& forward(T&& value) noexcept // NOLINT
{
    return static_cast<T&&>(value);
}

/// Replace object with new value and return the old value
/// Usage:
///   auto head = cs::exchange(_next_free, slot.next);  // pop the free list head
template <class T, class U = T>
[[nodiscard]] CS_FORCE_INLINE constexpr T exchange(T& obj, U&& new_val) // NOLINT
{
    T old_val = static_cast<T&&>(obj);
    obj = forward<U>(new_val);
    return old_val;
}

// =========================================================================================================
// Comparison
// =========================================================================================================

template <class T>
[[nodiscard]] constexpr T const& max(T const& a, T const& b)
{
    return a < b ? b : a;
}

template <class T>
[[nodiscard]] constexpr T const& min(T const& a, T const& b)
{
    return b < a ? b : a;
}

// =========================================================================================================
// Alignment (for values or pointers)
// =========================================================================================================

/// Check if a positive value is a power of two
/// Preconditions:
///   value > 0
template <class T>
[[nodiscard]] constexpr bool is_power_of_two(T value)
{
    CS_ASSERT(value > 0, "is_power_of_two: value must be positive");
    return (value & (value - 1)) == 0;
}

/// Check if value is aligned at the given boundary
/// Preconditions:
///   alignment > 0 and alignment must be a power of 2
template <class T>
[[nodiscard]] constexpr bool is_aligned(T value, isize alignment)
{
    CS_ASSERT(alignment > 0 && is_power_of_two(alignment), "is_aligned: alignment must be a power of 2");
    return 0 == ((isize)value & (alignment - 1));
}

// =========================================================================================================
// Raw memory
// =========================================================================================================

/// Tag selecting the cs placement new below
/// Keeps <new> out of the headers and makes every construction into raw storage greppable
struct placement_new_tag
{
};
inline constexpr placement_new_tag placement_new = {};

/// Copies bytes between two non-overlapping ranges
/// bytes == 0 is a no-op, also for null pointers
inline void copy_bytes(void* dst, void const* src, isize bytes)
{
    CS_ASSERT(bytes >= 0, "copy_bytes: byte count must be non-negative");
    if (bytes > 0)
        std::memcpy(dst, src, std::size_t(bytes));
}

// =========================================================================================================
// Template metaprogramming utilities
// =========================================================================================================

/// Helper for indicating errors in static_asserts with dependent types
/// Usage:
///   static_assert(cs::always_false_t<T>, "T is not supported");
template <class... E>
constexpr bool always_false_t = false;

namespace impl
{
template <class T>
struct function_ptr_t
{
    static_assert(always_false_t<T>, "function_ptr should only be used with function signatures");
};
template <class R, class... Args>
struct function_ptr_t<R(Args...)>
{
    using type = R (*)(Args...);
};
template <class R, class... Args>
struct function_ptr_t<R(Args...) noexcept>
{
    using type = R (*)(Args...) noexcept;
};
} // namespace impl

/// Type alias for readable function pointer types
/// Usage:
///   cs::function_ptr<void(cs::byte* p, isize bytes, isize alignment, void* userdata)> deallocate_bytes;
template <class T>
using function_ptr = typename impl::function_ptr_t<T>::type;

} // namespace cs

/// Placement new without <new>: constructs into memory the caller owns
/// Usage:
///   new (cs::placement_new, ptr) T(cs::move(value));
[[nodiscard]] CS_FORCE_INLINE void* operator new(std::size_t, cs::placement_new_tag, void* buffer) noexcept
{
    return buffer;
}
CS_FORCE_INLINE void operator delete(void*, cs::placement_new_tag, void*) noexcept {}
