#pragma once

#include <clean-storage/assert.hh>
#include <clean-storage/fwd.hh>

#include <type_traits>

/// Tagged union of two trivially copyable values, exactly one of which is live.
/// This is the handle representation of the composite storages:
/// the tag records which backend produced the handle, the active arm holds that backend's handle.
///
/// Reading the inactive arm is a programmer error and fatal in every build configuration:
/// interpreting one backend's handle bytes as another's would silently corrupt memory.
///
/// Usage:
///   auto h = cs::either<A, B>::from_first(a);
///   if (h.is_first())
///       use(h.first());
template <class A, class B>
struct cs::either
{
    static_assert(std::is_trivially_copyable_v<A> && std::is_trivially_copyable_v<B>,
                  "either is meant for plain handle values");

    // construction
public:
    [[nodiscard]] static constexpr either from_first(A value) { return either(value, first_tag{}); }
    [[nodiscard]] static constexpr either from_second(B value) { return either(value, second_tag{}); }

    // queries and access
public:
    [[nodiscard]] constexpr bool is_first() const { return !_is_second; }
    [[nodiscard]] constexpr bool is_second() const { return _is_second; }

    /// Precondition (always checked): is_first()
    [[nodiscard]] A const& first() const
    {
        CS_ASSERT_ALWAYS(!_is_second, "handle accessed through the wrong arm (holds a second-backend handle)");
        return _first;
    }

    /// Precondition (always checked): is_second()
    [[nodiscard]] B const& second() const
    {
        CS_ASSERT_ALWAYS(_is_second, "handle accessed through the wrong arm (holds a first-backend handle)");
        return _second;
    }

    // internals
private:
    struct first_tag
    {
    };
    struct second_tag
    {
    };

    constexpr either(A value, first_tag) : _first(value), _is_second(false) {}
    constexpr either(B value, second_tag) : _second(value), _is_second(true) {}

    // members
private:
    union
    {
        A _first;
        B _second;
    };
    bool _is_second;
};
