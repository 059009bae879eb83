#include <clean-storage/alloc_storage.hh>

#include <nexus/test.hh>

#include <cstdint>
#include <limits>
#include <string>

#include "test-resources.hh"

static_assert(cs::element_storage<cs::alloc_element>);
static_assert(cs::range_storage<cs::alloc_range>);

// handles of sized values are a single pointer
static_assert(sizeof(cs::alloc_element::handle<int>) == sizeof(void*));

namespace
{
struct shape
{
    virtual ~shape() = default;
    virtual int area() const = 0;
};

struct square : shape
{
    int side;
    explicit square(int s) : side(s) {}
    int area() const override { return side * side; }
};
} // namespace

TEST("alloc_element - create, get, destroy")
{
    test::spy_state state;
    auto const spy = test::make_spy_resource(state);
    cs::alloc_element storage(&spy);

    auto h = storage.create<std::string>(std::string("a string long enough to not be stored inline"));
    REQUIRE(h.is_ok());
    CHECK(state.allocations == 1);
    CHECK(state.live_bytes == cs::isize(sizeof(std::string)));

    auto* s = storage.get<std::string>(h.value());
    CHECK(*s == "a string long enough to not be stored inline");
    CHECK(reinterpret_cast<std::uintptr_t>(s) % alignof(std::string) == 0);

    storage.destroy<std::string>(h.value());
    CHECK(state.deallocations == 1);
    CHECK(state.live_bytes == 0);
}

TEST("alloc_element - allocate leaves the room uninitialized")
{
    test::spy_state state;
    auto const spy = test::make_spy_resource(state);
    cs::alloc_element storage(&spy);

    auto h = storage.allocate<double>();
    REQUIRE(h.is_ok());

    auto* p = storage.get<double>(h.value());
    new (cs::placement_new, p) double(2.5);
    CHECK(*storage.get<double>(h.value()) == 2.5);

    storage.deallocate<double>(h.value());
    CHECK(state.live_blocks() == 0);
}

TEST("alloc_element - exhausted resource")
{
    test::spy_state state;
    state.budget = 0;
    auto const spy = test::make_spy_resource(state);
    cs::alloc_element storage(&spy);

    SECTION("allocate fails")
    {
        CHECK(storage.allocate<int>().is_err());
        CHECK(state.failed_allocations == 1);
    }

    SECTION("create hands the value back")
    {
        auto r = storage.create<std::string>(std::string("rejected"));
        REQUIRE(r.is_err());
        CHECK(r.error() == "rejected");
        CHECK(state.live_blocks() == 0);
    }
}

TEST("alloc_element - slices")
{
    test::spy_state state;
    auto const spy = test::make_spy_resource(state);
    cs::alloc_element storage(&spy);

    SECTION("allocate by element count")
    {
        auto h = storage.allocate<int[]>(4);
        REQUIRE(h.is_ok());
        CHECK(state.live_bytes == 4 * cs::isize(sizeof(int)));

        auto s = storage.get<int[]>(h.value());
        REQUIRE(s.size() == 4);
        for (cs::isize i = 0; i < 4; ++i)
            s[i] = int(i * 10);
        CHECK(storage.get<int[]>(h.value())[3] == 30);

        storage.deallocate<int[]>(h.value());
        CHECK(state.live_bytes == 0);
    }

    SECTION("empty slices never reach the resource")
    {
        auto h = storage.allocate<double[]>(0);
        REQUIRE(h.is_ok());
        CHECK(state.allocations == 0);

        auto s = storage.get<double[]>(h.value());
        CHECK(s.empty());
        CHECK(s.data() != nullptr);
        CHECK(reinterpret_cast<std::uintptr_t>(s.data()) % alignof(double) == 0);

        storage.deallocate<double[]>(h.value());
        CHECK(state.deallocations == 0);
    }

    SECTION("overflowing slices fail")
    {
        CHECK(storage.allocate<int[]>(std::numeric_limits<cs::isize>::max() / 2).is_err());
        CHECK(state.allocations == 0);
    }

    SECTION("fixed-size array coerced to a slice")
    {
        auto h = storage.allocate<int[3]>();
        REQUIRE(h.is_ok());

        auto slice = storage.coerce<int[]>(h.value());
        auto s = storage.get<int[]>(slice);
        REQUIRE(s.size() == 3);
        CHECK(static_cast<void*>(s.data()) == static_cast<void*>(storage.get<int[3]>(h.value())));

        storage.deallocate<int[]>(slice);
        CHECK(state.live_bytes == 0);
    }
}

TEST("alloc_element - polymorphic values")
{
    test::spy_state state;
    auto const spy = test::make_spy_resource(state);
    cs::alloc_element storage(&spy);

    auto h = storage.create<square>(square(3));
    REQUIRE(h.is_ok());

    auto dyn = storage.coerce<cs::dyn<shape>>(h.value());
    shape* s = storage.get<cs::dyn<shape>>(dyn);
    CHECK(s->area() == 9);

    // destroy through the base runs the virtual destructor and frees the concrete size
    storage.destroy<cs::dyn<shape>>(dyn);
    CHECK(state.live_bytes == 0);
    CHECK(state.deallocations == 1);
}

TEST("alloc_element - copies share the resource")
{
    test::spy_state state;
    auto const spy = test::make_spy_resource(state);
    cs::alloc_element storage(&spy);
    auto copy = storage;

    CHECK(copy.custom_resource() == &spy);
    CHECK(&copy.resource() == &spy);

    auto h = storage.create<int>(5);
    REQUIRE(h.is_ok());
    CHECK(*copy.get<int>(h.value()) == 5);
    copy.destroy<int>(h.value());
    CHECK(state.live_blocks() == 0);

    cs::alloc_element defaulted;
    CHECK(defaulted.custom_resource() == nullptr);
    CHECK(&defaulted.resource() == cs::default_memory_resource);
}

TEST("alloc_range - allocate and access")
{
    test::spy_state state;
    auto const spy = test::make_spy_resource(state);
    cs::alloc_range storage(&spy);

    auto h = storage.allocate<int>(8);
    REQUIRE(h.is_ok());
    CHECK(h.value().capacity() == 8);
    CHECK(state.live_bytes == 8 * cs::isize(sizeof(int)));

    auto s = storage.get<int>(h.value());
    CHECK(s.size() == 8);

    storage.deallocate<int>(h.value());
    CHECK(state.live_bytes == 0);
}

TEST("alloc_range - zero capacity is the null handle")
{
    test::spy_state state;
    auto const spy = test::make_spy_resource(state);
    cs::alloc_range storage(&spy);

    auto h = storage.allocate<int>(0);
    REQUIRE(h.is_ok());
    CHECK(h.value().capacity() == 0);
    CHECK(storage.get<int>(h.value()).empty());
    CHECK(state.allocations == 0);

    SECTION("growing it allocates")
    {
        auto g = storage.try_grow<int>(h.value(), 4);
        REQUIRE(g.is_ok());
        CHECK(g.value().capacity() == 4);
        CHECK(state.allocations == 1);
        storage.deallocate<int>(g.value());
    }

    SECTION("shrinking it fails")
    {
        CHECK(storage.try_shrink<int>(h.value(), 0).is_err());
    }

    storage.deallocate<int>(h.value());
    CHECK(state.live_blocks() == 0);
}

TEST("alloc_range - grow preserves contents")
{
    test::spy_state state;
    auto const spy = test::make_spy_resource(state);
    cs::alloc_range storage(&spy);

    auto h = storage.allocate<int>(4).value();
    auto s = storage.get<int>(h);
    for (cs::isize i = 0; i < 4; ++i)
        s[i] = int(i + 1);

    auto g = storage.try_grow<int>(h, 16);
    REQUIRE(g.is_ok());
    CHECK(g.value().capacity() == 16);

    auto gs = storage.get<int>(g.value());
    CHECK(gs.size() == 16);
    CHECK(gs[0] == 1);
    CHECK(gs[3] == 4);

    // the old block was released after copying
    CHECK(state.allocations == 2);
    CHECK(state.deallocations == 1);

    storage.deallocate<int>(g.value());
    CHECK(state.live_bytes == 0);
}

TEST("alloc_range - shrink")
{
    test::spy_state state;
    auto const spy = test::make_spy_resource(state);
    cs::alloc_range storage(&spy);

    auto h = storage.allocate<int>(8).value();
    auto s = storage.get<int>(h);
    for (cs::isize i = 0; i < 8; ++i)
        s[i] = int(i);

    SECTION("by reallocation")
    {
        auto r = storage.try_shrink<int>(h, 3);
        REQUIRE(r.is_ok());
        CHECK(r.value().capacity() == 3);
        CHECK(storage.get<int>(r.value())[2] == 2);
        CHECK(state.allocations == 2);
        storage.deallocate<int>(r.value());
    }

    SECTION("in place when the resource allows it")
    {
        state.shrink_in_place = true;
        auto r = storage.try_shrink<int>(h, 3);
        REQUIRE(r.is_ok());
        CHECK(r.value().data == h.data);
        CHECK(state.in_place_resizes == 1);
        CHECK(state.allocations == 1);
        storage.deallocate<int>(r.value());
    }

    SECTION("to zero releases the block")
    {
        auto r = storage.try_shrink<int>(h, 0);
        REQUIRE(r.is_ok());
        CHECK(r.value().capacity() == 0);
        CHECK(state.deallocations == 1);
        storage.deallocate<int>(r.value());
    }

    CHECK(state.live_bytes == 0);
}

TEST("alloc_range - failure leaves the handle intact")
{
    test::spy_state state;
    auto const spy = test::make_spy_resource(state);
    cs::alloc_range storage(&spy);

    auto h = storage.allocate<int>(4).value();
    storage.get<int>(h)[0] = 42;

    state.budget = state.live_bytes; // nothing more fits
    CHECK(storage.try_grow<int>(h, 1000).is_err());
    CHECK(storage.allocate<int>(1).is_err());

    CHECK(storage.get<int>(h)[0] == 42);
    CHECK(h.capacity() == 4);

    storage.deallocate<int>(h);
    CHECK(state.live_blocks() == 0);
}

TEST("alloc_range - maximum capacity")
{
    cs::alloc_range storage;
    CHECK(storage.maximum_capacity<cs::u8>() == std::numeric_limits<cs::isize>::max());
    CHECK(storage.maximum_capacity<cs::i64>() == std::numeric_limits<cs::isize>::max() / 8);
    CHECK(storage.allocate<cs::i64>(storage.maximum_capacity<cs::i64>() + 1).is_err());
}

TEST("alloc_range - contract violations")
{
#if CS_ASSERT_ENABLED
    cs::alloc_range storage;
    auto h = storage.allocate<int>(4).value();
    CHECK(!test::fails_assertion([&] { (void)storage.try_grow<int>(h, 2); }).empty());
    CHECK(!test::fails_assertion([&] { (void)storage.try_shrink<int>(h, 8); }).empty());
    storage.deallocate<int>(h);
#endif
}
