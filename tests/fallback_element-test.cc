#include <clean-storage/alloc_storage.hh>
#include <clean-storage/fallback_element.hh>
#include <clean-storage/inline_element.hh>
#include <clean-storage/tracking_element.hh>

#include <nexus/test.hh>

#include <string>

#include "test-resources.hh"

namespace
{
using small_then_heap = cs::fallback_element<cs::tracking_element<cs::shape<16, 8>, 2>, cs::alloc_element>;

struct widget
{
    virtual ~widget() = default;
    virtual int id() const = 0;
};

struct small_widget : widget
{
    int id() const override { return 1; }
};

struct big_widget : widget
{
    char payload[64] = {};
    int id() const override { return 2; }
};
} // namespace

static_assert(cs::element_storage<small_then_heap>);

TEST("fallback_element - first until exhausted, then second")
{
    test::spy_state state;
    auto const spy = test::make_spy_resource(state);
    small_then_heap storage({}, cs::alloc_element(&spy));

    auto a = storage.create<int>(1).value();
    auto b = storage.create<int>(2).value();
    CHECK(a.is_first());
    CHECK(b.is_first());
    CHECK(state.allocations == 0);

    auto c = storage.create<int>(3).value();
    CHECK(c.is_second());
    CHECK(state.allocations == 1);

    CHECK(*storage.get<int>(a) == 1);
    CHECK(*storage.get<int>(b) == 2);
    CHECK(*storage.get<int>(c) == 3);

    SECTION("freed first slots are preferred again")
    {
        storage.destroy<int>(a);
        auto d = storage.create<int>(4).value();
        CHECK(d.is_first());
        storage.destroy<int>(d);
    }

    storage.destroy<int>(b);
    storage.destroy<int>(c);
    CHECK(storage.first().free_count() == 2);
    CHECK(state.live_blocks() == 0);
}

TEST("fallback_element - shapes first cannot hold go to second")
{
    test::spy_state state;
    auto const spy = test::make_spy_resource(state);
    small_then_heap storage({}, cs::alloc_element(&spy));

    auto h = storage.create<std::string>(std::string("does not fit into 16 bytes"));
    REQUIRE(h.is_ok());
    CHECK(h.value().is_second());
    CHECK(storage.first().free_count() == 2);

    CHECK(*storage.get<std::string>(h.value()) == "does not fit into 16 bytes");
    storage.destroy<std::string>(h.value());
    CHECK(state.live_blocks() == 0);
}

TEST("fallback_element - both exhausted")
{
    test::spy_state state;
    state.budget = 0;
    auto const spy = test::make_spy_resource(state);
    cs::fallback_element<cs::inline_element<char>, cs::alloc_element> storage({}, cs::alloc_element(&spy));

    SECTION("allocate fails")
    {
        CHECK(storage.allocate<double>().is_err());
    }

    SECTION("create hands the value back through both backends")
    {
        test::tracked::reset_counters();
        {
            auto r = storage.create<test::tracked>(test::tracked(9));
            REQUIRE(r.is_err());
            CHECK(r.error().value == 9);
        }
        CHECK(test::tracked::alive() == 0);
    }
}

TEST("fallback_element - polymorphic values in either backend")
{
    cs::fallback_element<cs::inline_element<cs::shape_for<small_widget>>, cs::alloc_element> storage;

    auto s = storage.create<small_widget>(small_widget()).value();
    auto b = storage.create<big_widget>(big_widget()).value();
    CHECK(s.is_first());
    CHECK(b.is_second());

    auto ds = storage.coerce<cs::dyn<widget>, small_widget>(s);
    auto db = storage.coerce<cs::dyn<widget>, big_widget>(b);
    CHECK(ds.is_first());
    CHECK(db.is_second());
    CHECK(storage.get<cs::dyn<widget>>(ds)->id() == 1);
    CHECK(storage.get<cs::dyn<widget>>(db)->id() == 2);

    storage.destroy<cs::dyn<widget>>(ds);
    storage.destroy<cs::dyn<widget>>(db);
}

TEST("fallback_element - slices")
{
    small_then_heap storage;

    auto small = storage.allocate<int[]>(4).value();
    auto large = storage.allocate<int[]>(100).value();
    CHECK(small.is_first());
    CHECK(large.is_second());
    CHECK(storage.get<int[]>(small).size() == 4);
    CHECK(storage.get<int[]>(large).size() == 100);

    storage.deallocate<int[]>(small);
    storage.deallocate<int[]>(large);
}
