#pragma once

#include <clean-storage/alloc_storage.hh>
#include <clean-storage/fwd.hh>
#include <clean-storage/memory_resource.hh>
#include <clean-storage/utility.hh>

#include <concepts>
#include <type_traits>

// Builders materialize a storage on demand.
//
// cs::alternative_element holds the builder of its not-yet-existing backend and only turns it into a
// storage when it switches over. A builder is a small value that remembers how to make a storage
// (e.g. which memory resource to use) without paying for the storage itself.

namespace cs
{
/// B can produce an S (consuming itself) and can be recovered from an existing S
template <class B, class S>
concept storage_builder = std::is_move_constructible_v<B> && requires(B&& b, S const& s) {
    { cs::move(b).into_storage() } -> std::same_as<S>;
    { B::from_storage(s) } -> std::same_as<B>;
};
} // namespace cs

/// Builder of cs::alloc_element storages, remembering only the memory resource
/// A null resource builds storages using cs::default_memory_resource.
struct cs::resource_builder
{
    memory_resource const* resource = nullptr;

    [[nodiscard]] alloc_element into_storage() && { return alloc_element(resource); }

    [[nodiscard]] static resource_builder from_storage(alloc_element const& storage)
    {
        return resource_builder{storage.custom_resource()};
    }
};

/// Builder of default-constructed storages
template <class S>
struct cs::default_builder
{
    static_assert(std::is_default_constructible_v<S>, "default_builder requires a default-constructible storage");

    [[nodiscard]] S into_storage() && { return S(); }

    [[nodiscard]] static default_builder from_storage(S const&) { return {}; }
};
