#include <clean-storage/capacity.hh>

#include <nexus/test.hh>

#include <limits>

using namespace cs;

static_assert(capacity_int<u8>);
static_assert(capacity_int<i32>);
static_assert(capacity_int<isize>);
static_assert(capacity_int<u64>);
static_assert(!capacity_int<bool>);
static_assert(!capacity_int<float>);

static_assert(capacity_traits<u8>::max() == 255);
static_assert(capacity_traits<i16>::max() == 32767);
static_assert(capacity_traits<isize>::max() == std::numeric_limits<isize>::max());
// wider than isize: clamped so that every capacity converts to isize
static_assert(capacity_traits<u64>::max() == u64(std::numeric_limits<isize>::max()));

TEST("capacity - to and from isize")
{
    CHECK(capacity_traits<u8>::to_isize(u8(200)) == 200);

    SECTION("representable")
    {
        auto const c = capacity_traits<u8>::from_isize(255);
        REQUIRE(c.is_ok());
        CHECK(c.value() == 255);
    }

    SECTION("too large")
    {
        CHECK(capacity_traits<u8>::from_isize(256).is_err());
        CHECK(capacity_traits<i8>::from_isize(128).is_err());
    }

    SECTION("negative")
    {
        CHECK(capacity_traits<u8>::from_isize(-1).is_err());
        CHECK(capacity_traits<isize>::from_isize(-1).is_err());
    }
}

TEST("capacity - conversion between capacity types")
{
    CHECK(convert_capacity<u8>(isize(17)).value() == 17);
    CHECK(convert_capacity<isize>(u8(255)).value() == 255);
    CHECK(convert_capacity<u16>(u8(0)).value() == 0);

    CHECK(convert_capacity<u8>(isize(300)).is_err());
    CHECK(convert_capacity<i8>(u16(200)).is_err());
}

TEST("capacity - saturating addition")
{
    auto constexpr max = std::numeric_limits<isize>::max();

    CHECK(saturating_add(2, 3) == 5);
    CHECK(saturating_add(0, 0) == 0);
    CHECK(saturating_add(max, 0) == max);
    CHECK(saturating_add(max, 1) == max);
    CHECK(saturating_add(max - 10, 20) == max);
    CHECK(saturating_add(max / 2, max / 2 + 1) == max);
}
