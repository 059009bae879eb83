#pragma once

#include <clean-storage/assert.hh>
#include <clean-storage/fwd.hh>
#include <clean-storage/result.hh>

#include <concepts>
#include <limits>
#include <type_traits>
#include <utility>

namespace cs
{
/// Integer types usable as the capacity type of a range storage
/// A narrow capacity type (e.g. u8) keeps handles of small inline ranges small.
template <class C>
concept capacity_int = std::integral<C> && !std::is_same_v<C, bool>;

/// Conversions between a capacity type C and the universal size cs::isize
///
/// Storages compute with isize internally and convert at their boundaries:
///   to_isize(c)      - always exact, c must be non-negative
///   from_isize(n)    - fails with allocation_failed if n is not representable as C
///   max()            - the largest C that is also representable as isize
///
/// Composites whose backends use different capacity types route every capacity through
/// from_isize, so that "not representable" surfaces as an ordinary allocation failure.
template <capacity_int C>
struct capacity_traits
{
    [[nodiscard]] static constexpr C max()
    {
        if constexpr (std::cmp_greater(std::numeric_limits<C>::max(), std::numeric_limits<isize>::max()))
            return C(std::numeric_limits<isize>::max());
        else
            return std::numeric_limits<C>::max();
    }

    [[nodiscard]] static constexpr isize to_isize(C capacity)
    {
        CS_ASSERT(capacity >= 0, "capacities are never negative");
        return isize(capacity);
    }

    [[nodiscard]] static constexpr result<C, allocation_failed> from_isize(isize n)
    {
        if (n < 0 || std::cmp_greater(n, max()))
            return cs::err(allocation_failed{});
        return cs::ok(C(n));
    }
};

/// Convert between two capacity types, failing if the value does not fit
/// Usage:
///   auto first_capacity = cs::convert_capacity<u8>(capacity); // result<u8, allocation_failed>
template <capacity_int To, capacity_int From>
[[nodiscard]] constexpr result<To, allocation_failed> convert_capacity(From capacity)
{
    return capacity_traits<To>::from_isize(capacity_traits<From>::to_isize(capacity));
}

/// a + b, clamped to isize max instead of overflowing
/// Both inputs must be non-negative.
[[nodiscard]] constexpr isize saturating_add(isize a, isize b)
{
    CS_ASSERT(a >= 0 && b >= 0, "saturating_add expects non-negative operands");
    if (a > std::numeric_limits<isize>::max() - b)
        return std::numeric_limits<isize>::max();
    return a + b;
}
} // namespace cs
