#include "memory_resource.hh"

#include <clean-storage/assert.hh>
#include <clean-storage/macros.hh>
#include <clean-storage/utility.hh>

#include <cstdlib>

namespace
{
/// Static function implementations for the system memory resource.
/// These ignore the userdata parameter as the system allocator is stateless.

cs::byte* system_aligned_alloc(cs::isize bytes, cs::isize alignment)
{
#ifdef CS_OS_WINDOWS
    return static_cast<cs::byte*>(_aligned_malloc(bytes, alignment));
#else
    // posix_memalign does not require bytes % alignment == 0 (unlike std::aligned_alloc),
    // but it requires alignment >= sizeof(void*), so we clamp to that minimum.
    void* raw_ptr = nullptr;
    cs::isize const effective_alignment = alignment < cs::isize(sizeof(void*)) ? cs::isize(sizeof(void*)) : alignment;
    int const result = posix_memalign(&raw_ptr, effective_alignment, bytes);
    return result == 0 ? static_cast<cs::byte*>(raw_ptr) : nullptr;
#endif
}

cs::isize system_try_allocate_bytes(cs::byte** out_ptr, cs::isize min_bytes, cs::isize max_bytes, cs::isize alignment, void* userdata)
{
    CS_UNUSED(max_bytes);
    CS_UNUSED(userdata);

    CS_ASSERT(out_ptr != nullptr, "out_ptr must not be null");
    CS_ASSERT(alignment > 0 && cs::is_power_of_two(alignment), "alignment must be a power of 2");
    CS_ASSERT(0 <= min_bytes && min_bytes <= max_bytes, "must have 0 <= min_bytes <= max_bytes");

    // Contract: min_bytes == 0 always returns nullptr
    if (min_bytes == 0)
    {
        *out_ptr = nullptr;
        return 0;
    }

    *out_ptr = system_aligned_alloc(min_bytes, alignment);
    if (*out_ptr == nullptr)
        return -1;

    CS_ASSERT(cs::is_aligned(*out_ptr, alignment), "system allocator returned a misaligned block");
    return min_bytes;
}

cs::isize system_allocate_bytes(cs::byte** out_ptr, cs::isize min_bytes, cs::isize max_bytes, cs::isize alignment, void* userdata)
{
    auto const bytes = system_try_allocate_bytes(out_ptr, min_bytes, max_bytes, alignment, userdata);
    CS_ASSERT_ALWAYS(bytes >= 0, "system allocation failed");
    return bytes;
}

void system_deallocate_bytes(cs::byte* p, cs::isize bytes, cs::isize alignment, void* userdata)
{
    CS_UNUSED(bytes);
    CS_UNUSED(alignment);
    CS_UNUSED(userdata);

    // IMPORTANT: Must use matching free function for the platform's allocator
#ifdef CS_OS_WINDOWS
    _aligned_free(p);
#else
    std::free(p);
#endif
}

cs::isize system_try_resize_bytes_in_place(cs::byte* p,
                                           cs::isize old_bytes,
                                           cs::isize min_bytes,
                                           cs::isize max_bytes,
                                           cs::isize alignment,
                                           void* userdata)
{
    CS_UNUSED(userdata);

    CS_ASSERT(p != nullptr, "cannot resize null pointer");
    CS_ASSERT(alignment > 0 && cs::is_power_of_two(alignment), "alignment must be a power of 2");
    CS_ASSERT(old_bytes > 0, "old_bytes must be positive");
    CS_ASSERT(1 <= min_bytes && min_bytes <= max_bytes, "must have 1 <= min_bytes <= max_bytes");

    CS_UNUSED(p);
    CS_UNUSED(old_bytes);
    CS_UNUSED(min_bytes);
    CS_UNUSED(max_bytes);
    CS_UNUSED(alignment);

    // Standard malloc/posix_memalign do not support in-place resize.
    // Unlike realloc, we cannot move the allocation here: the range storages copy the
    // elements themselves and must keep the old block valid until then.
    return -1;
}

/// System memory resource instance stored in the data segment.
/// Stored in the data segment (not on heap) so it remains valid during static initialization,
/// making cs::default_memory_resource safe to use in global/static constructors.
constinit cs::memory_resource const system_memory_resource = {
    .allocate_bytes = system_allocate_bytes,
    .try_allocate_bytes = system_try_allocate_bytes,
    .deallocate_bytes = system_deallocate_bytes,
    .try_resize_bytes_in_place = system_try_resize_bytes_in_place,
    .userdata = nullptr,
};

} // namespace

constinit cs::memory_resource const* const cs::default_memory_resource = &system_memory_resource;
