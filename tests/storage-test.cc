#include <clean-storage/storage.hh>

#include <nexus/test.hh>

#include <string>

#include "test-resources.hh"

namespace
{
// smallest storage built on the mixin: one std::string-sized slot
struct single_slot : cs::impl::element_storage_base<single_slot>
{
    template <class T>
    struct handle
    {
        [[no_unique_address]] cs::metadata_t<T> meta;
    };

    using cs::impl::element_storage_base<single_slot>::allocate;

    template <class T>
    [[nodiscard]] cs::result<handle<T>, cs::allocation_failed> allocate(cs::metadata_t<T> meta)
    {
        auto const l = cs::pointee_traits<T>::layout_of(meta);
        if (used || l.is_err() || !l.value().fits_into(cs::layout::of<std::string>()))
            return cs::err(cs::allocation_failed{});
        used = true;
        return cs::ok(handle<T>{meta});
    }

    template <class T>
    [[nodiscard]] cs::pointer_t<T> get(handle<T> h) const
    {
        return cs::pointee_traits<T>::from_parts(const_cast<cs::byte*>(bytes), h.meta);
    }

    template <class U, class T>
    [[nodiscard]] handle<U> coerce(handle<T> h) const
    {
        return {cs::unsize_traits<T, U>::coerce(h.meta, const_cast<cs::byte*>(bytes))};
    }

    template <class T>
    void deallocate(handle<T>)
    {
        used = false;
    }

    alignas(std::string) cs::byte bytes[sizeof(std::string)];
    bool used = false;
};
} // namespace

static_assert(cs::element_storage<single_slot>);

TEST("storage - mixin operations on a storage deriving from it")
{
    single_slot storage;

    SECTION("sized allocate forwards to the metadata overload")
    {
        auto h = storage.allocate<int>();
        REQUIRE(h.is_ok());
        CHECK(storage.used);
        CHECK(storage.allocate<int>().is_err());
        storage.deallocate<int>(h.value());
        CHECK(!storage.used);
    }

    SECTION("create and destroy run constructor and destructor once")
    {
        test::tracked::reset_counters();
        {
            auto h = storage.create<test::tracked>(test::tracked(7));
            REQUIRE(h.is_ok());
            CHECK(storage.get<test::tracked>(h.value())->value == 7);
            storage.destroy<test::tracked>(h.value());
        }
        CHECK(!storage.used);
        CHECK(test::tracked::alive() == 0);
    }

    SECTION("a rejected create hands the value back")
    {
        auto first = storage.create<std::string>(std::string("first"));
        REQUIRE(first.is_ok());

        auto second = storage.create<std::string>(std::string("second"));
        REQUIRE(second.is_err());
        CHECK(second.error() == "second");

        storage.destroy<std::string>(first.value());
    }
}
