#pragma once

#include <cstddef>
#include <cstdint>


namespace cs
{

//
// Primitives
//

// Explicitly-sized primitive types
// We use these wherever the range is important for correctness or memory layout.
// "int" stays fine as a default integer for small counts and loop counters.

// signed integers
using i8 = int8_t;
using i16 = int16_t;
using i32 = int32_t;
using i64 = int64_t;

// unsigned integers
using u8 = uint8_t;
using u16 = uint16_t;
using u32 = uint32_t;
using u64 = uint64_t;

// generic bytes
using byte = std::byte;

// signed size type (intentional)
// Sizes, capacities and slot indices are signed i64:
// * "size - 1" on an empty range does not silently wrap around
// * negative values serve as sentinels (e.g. the end of a free list, a failed allocation)
// * we only target 64-bit platforms, so the positive range is plenty
// Capacity types of range storages may be narrower, see cs::capacity_traits.
using isize = i64;

// pointer
using nullptr_t = std::nullptr_t;

//
// Errors
//

struct allocation_failed;
template <class T, class E>
struct result;

//
// Memory
//

struct memory_resource;
struct layout;

//
// Views
//

template <class T>
struct span;

//
// Utility types
//

struct nullopt_t;
template <class T>
struct optional;

template <class A, class B>
struct either;

//
// Storages
//

struct alloc_element;
struct alloc_range;

template <class S>
struct inline_element;
template <class C, class S, isize N>
struct inline_range;
template <class S, isize N>
struct tracking_element;

template <class F, class S>
struct fallback_element;
template <class F, class S>
struct fallback_range;

struct resource_builder;
template <class S>
struct default_builder;

template <class F, class S, class FB = default_builder<F>, class SB = default_builder<S>>
struct alternative_element;

//
// Collections
//

template <class T, class StorageT>
struct raw_linked_list;

} // namespace cs
