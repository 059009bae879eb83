#pragma once

#include <clean-storage/assert-handler.hh>
#include <clean-storage/assert.hh>
#include <clean-storage/memory_resource.hh>

#include <string>

#ifndef CS_HAS_CPP_EXCEPTIONS
#error "the tests report failed assertions by throwing, they need exceptions enabled"
#endif

// Helpers shared by the storage tests:
//   - spy_resource: forwards to the default resource and records every call
//   - tracked: a value type counting its constructions and destructions
//   - fails_assertion: runs a callable and reports whether an assertion fired

namespace test
{
using cs::isize;

/// Counters and knobs of a spy resource
struct spy_state
{
    isize allocations = 0;
    isize deallocations = 0;
    isize failed_allocations = 0;
    isize in_place_resizes = 0;
    isize live_bytes = 0;

    /// total byte budget of live allocations, -1 for unlimited
    isize budget = -1;

    /// if set, shrinking in place succeeds (the block simply keeps its tail)
    bool shrink_in_place = false;

    [[nodiscard]] isize live_blocks() const { return allocations - deallocations; }
};

inline isize spy_try_allocate(cs::byte** out_ptr, isize min_bytes, isize max_bytes, isize alignment, void* userdata)
{
    auto& s = *static_cast<spy_state*>(userdata);
    if (s.budget >= 0 && s.live_bytes + min_bytes > s.budget)
    {
        ++s.failed_allocations;
        *out_ptr = nullptr;
        return -1;
    }

    auto const& sys = *cs::default_memory_resource;
    auto const bytes = sys.try_allocate_bytes(out_ptr, min_bytes, max_bytes, alignment, sys.userdata);
    if (bytes < 0)
    {
        ++s.failed_allocations;
        return -1;
    }

    ++s.allocations;
    s.live_bytes += bytes;
    return bytes;
}

inline isize spy_allocate(cs::byte** out_ptr, isize min_bytes, isize max_bytes, isize alignment, void* userdata)
{
    auto const bytes = spy_try_allocate(out_ptr, min_bytes, max_bytes, alignment, userdata);
    CS_ASSERT_ALWAYS(bytes >= 0, "spy resource exhausted");
    return bytes;
}

inline void spy_deallocate(cs::byte* p, isize bytes, isize alignment, void* userdata)
{
    auto& s = *static_cast<spy_state*>(userdata);
    ++s.deallocations;
    s.live_bytes -= bytes;

    auto const& sys = *cs::default_memory_resource;
    sys.deallocate_bytes(p, bytes, alignment, sys.userdata);
}

inline isize spy_try_resize_in_place(cs::byte* p, isize old_bytes, isize min_bytes, isize max_bytes, isize alignment, void* userdata)
{
    CS_UNUSED(p);
    CS_UNUSED(max_bytes);
    CS_UNUSED(alignment);

    auto& s = *static_cast<spy_state*>(userdata);
    if (!s.shrink_in_place || min_bytes > old_bytes)
        return -1;

    ++s.in_place_resizes;
    s.live_bytes -= old_bytes - min_bytes;
    return min_bytes;
}

/// A resource recording into state, which must outlive the resource
[[nodiscard]] inline cs::memory_resource make_spy_resource(spy_state& state)
{
    cs::memory_resource r;
    r.allocate_bytes = spy_allocate;
    r.try_allocate_bytes = spy_try_allocate;
    r.deallocate_bytes = spy_deallocate;
    r.try_resize_bytes_in_place = spy_try_resize_in_place;
    r.userdata = &state;
    return r;
}

/// Counts constructions and destructions, moved-from values have value -1
struct tracked
{
    int value = 0;

    static inline int ctor_count = 0;
    static inline int move_count = 0;
    static inline int dtor_count = 0;

    static void reset_counters()
    {
        ctor_count = 0;
        move_count = 0;
        dtor_count = 0;
    }

    static int alive() { return ctor_count + move_count - dtor_count; }

    explicit tracked(int v) : value(v) { ++ctor_count; }
    tracked(tracked&& rhs) noexcept : value(rhs.value)
    {
        rhs.value = -1;
        ++move_count;
    }
    tracked(tracked const&) = delete;
    tracked& operator=(tracked const&) = delete;
    tracked& operator=(tracked&&) = delete;
    ~tracked() { ++dtor_count; }
};

struct assertion_fired
{
    std::string message;
};

/// Runs f with a throwing assertion handler installed
/// Returns the message of the first failing assertion, or an empty string if none fired.
template <class F>
[[nodiscard]] std::string fails_assertion(F&& f)
{
    auto handler = cs::impl::scoped_assertion_handler([](cs::impl::assertion_info const& info)
                                                      { throw assertion_fired{info.message}; });
    try
    {
        cs::forward<F>(f)();
    }
    catch (assertion_fired const& e)
    {
        return e.message.empty() ? std::string("<no message>") : e.message;
    }
    return {};
}
} // namespace test
