#pragma once

#include <clean-storage/fwd.hh>
#include <clean-storage/utility.hh>

// Memory is obtained from a polymorphic cs::memory_resource (POD, function-pointer based, static-init safe).
// The allocator-backed storages (cs::alloc_element, cs::alloc_range) store a resource pointer,
// not an allocator template argument. A null resource means "use cs::default_memory_resource".
//
// Storages only ever use the fallible entry points (try_allocate_bytes, try_resize_bytes_in_place):
// an exhausted resource must surface as cs::allocation_failed so that composites can fall back.
// allocate_bytes stays part of the interface for resources shared with code that prefers fatal failure.

namespace cs
{
/// Default memory resource used when a storage is given no resource.
/// This is a system allocator stored in the data segment, making the pointer valid even during
/// static initialization in other translation units.
extern cs::memory_resource const* const default_memory_resource;
} // namespace cs

/// Polymorphic memory resource interface.
/// Custom allocators implement this interface to provide pluggable allocation strategies.
/// The design favors explicit size/alignment tracking and non-movable in-place resize over realloc.
/// This is a POD struct using function pointers to avoid virtual dispatch and non-trivial constructors.
struct cs::memory_resource
{
    /// Allocate between `min_bytes` and `max_bytes` with at least `alignment` alignment.
    /// Returns the actual allocated size, which will be in [min_bytes, max_bytes].
    /// The allocated pointer is stored in `*out_ptr`.
    /// min_bytes == 0 always sets *out_ptr to nullptr and returns 0.
    /// min_bytes > 0 always sets *out_ptr to non-null; failure is fatal (assert/terminate) or throws.
    cs::function_ptr<isize(cs::byte** out_ptr, isize min_bytes, isize max_bytes, isize alignment, void* userdata)> allocate_bytes
        = nullptr;

    /// Attempt to allocate between `min_bytes` and `max_bytes` with at least `alignment` alignment.
    /// Returns the actual allocated size on success, or -1 on failure.
    /// The allocated pointer is stored in `*out_ptr` on success, or nullptr on failure.
    /// min_bytes == 0 always sets *out_ptr to nullptr and returns 0.
    /// Implementations should prefer returning -1 over fatal failure when feasible.
    cs::function_ptr<isize(cs::byte** out_ptr, isize min_bytes, isize max_bytes, isize alignment, void* userdata)> try_allocate_bytes
        = nullptr;

    /// Deallocate a block previously obtained from this resource with matching bytes and alignment.
    /// `p` must be the exact pointer returned by allocate_bytes or try_allocate_bytes.
    /// `bytes` must be the size the allocation call returned, `alignment` the one passed to it.
    cs::function_ptr<void(cs::byte* p, isize bytes, isize alignment, void* userdata)> deallocate_bytes = nullptr;

    /// Attempt to resize an existing allocation in place without moving or freeing it.
    ///
    /// Preconditions:
    /// `p` was allocated from this resource with `old_bytes` and `alignment`.
    /// `1 <= min_bytes <= max_bytes`.
    ///
    /// Success (returns new_bytes in [min_bytes, max_bytes]):
    /// The allocation remains at address `p` (no move).
    /// The first min(old_bytes, new_bytes) bytes are preserved.
    /// The returned size becomes the canonical size for future resize/deallocate calls.
    ///
    /// Failure (returns -1):
    /// The allocation remains valid and unchanged at `p` with size `old_bytes`.
    ///
    /// Supports both growth (min_bytes > old_bytes) and shrink (max_bytes < old_bytes).
    /// Range storages try this first and only fall back to allocate + copy + free when it fails.
    cs::function_ptr<isize(cs::byte* p, isize old_bytes, isize min_bytes, isize max_bytes, isize alignment, void* userdata)>
        try_resize_bytes_in_place = nullptr;

    /// User-defined data for custom allocators. Can be nullptr for stateless allocators.
    void* userdata = nullptr;
};

namespace cs
{
/// Resolves a possibly-null resource pointer to the resource to actually use
[[nodiscard]] inline memory_resource const& resolve_resource(memory_resource const* resource)
{
    return resource ? *resource : *default_memory_resource;
}
} // namespace cs
