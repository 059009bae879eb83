#pragma once

#include <clean-storage/capacity.hh>
#include <clean-storage/fwd.hh>
#include <clean-storage/layout.hh>
#include <clean-storage/result.hh>
#include <clean-storage/span.hh>
#include <clean-storage/utility.hh>

#include <concepts>
#include <type_traits>

// =========================================================================================================
// Storage contracts
// =========================================================================================================
//
// A storage hands out raw room for values and nothing else. Containers hold exactly one storage and
// address its contents only through handles the storage produced; only that storage can turn a
// handle back into a typed view.
//
// Handles are opaque, trivially copyable, non-owning tokens. A handle is valid for the storage
// instance that produced it until it is deallocated, invalidated by a successful grow / shrink,
// or the storage is destroyed. Using a stale handle is undefined behavior.
// Storages never run constructors or destructors on their own, except for the create / destroy
// conveniences below.
//
// Element storage (single values, T may be sized, a slice T[] or a polymorphic cs::dyn<B>):
//
//   s.allocate<T>(meta)   -> result<handle<T>, allocation_failed>   uninitialized room for the shape of meta
//   s.allocate<T>()       -> result<handle<T>, allocation_failed>   sized T only
//   s.create<T>(value)    -> result<handle<T>, T>                   allocate + move-construct, hands value back on failure
//   s.get<T>(h)           -> pointer_t<T>                           typed view (T*, span<T>, B*)
//   s.coerce<U>(h)        -> handle<U>                              reinterpret as unsized supertype (T[N] -> T[], D -> dyn<B>)
//   s.deallocate<T>(h)                                              release the room, runs no destructor
//   s.destroy<T>(h)                                                 run the destructor(s), then deallocate
//
// Range storage (resizable buffers of sized, trivially relocatable T):
//
//   capacity_type                                                   integer type of capacities
//   s.maximum_capacity<T>() -> capacity_type                        largest capacity this storage could ever provide
//   s.allocate<T>(cap)     -> result<range_handle<T>, allocation_failed>
//   s.try_grow<T>(h, cap)  -> result<range_handle<T>, allocation_failed>   cap > h.capacity()
//   s.try_shrink<T>(h, cap)-> result<range_handle<T>, allocation_failed>   cap < h.capacity()
//   s.get<T>(h)            -> span<T>                               h.capacity() uninitialized slots
//   s.deallocate<T>(h)
//
// On success of try_grow / try_shrink the old handle is invalid and must be discarded.
// On failure the old handle and its contents are untouched.
// Element types of range storages are moved by copying bytes, see cs::is_trivially_relocatable.

namespace cs
{
template <class S>
concept element_storage = requires(S& s, typename S::template handle<int> h) {
    { s.template allocate<int>(no_metadata{}) } -> std::same_as<result<typename S::template handle<int>, allocation_failed>>;
    { s.template allocate<int>() } -> std::same_as<result<typename S::template handle<int>, allocation_failed>>;
    { s.template create<int>(0) } -> std::same_as<result<typename S::template handle<int>, int>>;
    { s.template get<int>(h) } -> std::same_as<int*>;
    s.template deallocate<int>(h);
    s.template destroy<int>(h);
};

template <class S>
concept range_storage = requires(S& s, typename S::capacity_type c, typename S::template range_handle<int> h) {
    requires capacity_int<typename S::capacity_type>;
    { h.capacity() } -> std::same_as<typename S::capacity_type>;
    { s.template maximum_capacity<int>() } -> std::same_as<typename S::capacity_type>;
    { s.template allocate<int>(c) } -> std::same_as<result<typename S::template range_handle<int>, allocation_failed>>;
    { s.template try_grow<int>(h, c) } -> std::same_as<result<typename S::template range_handle<int>, allocation_failed>>;
    { s.template try_shrink<int>(h, c) } -> std::same_as<result<typename S::template range_handle<int>, allocation_failed>>;
    { s.template get<int>(h) } -> std::same_as<span<int>>;
    s.template deallocate<int>(h);
};

template <class S, class T>
using handle_t = typename S::template handle<T>;

template <class S, class T>
using range_handle_t = typename S::template range_handle<T>;

namespace impl
{
/// Mixin implementing the parts of the element storage contract that follow from the core operations.
///
/// CRTP helper: a concrete element storage derives from `cs::impl::element_storage_base<Storage>`,
/// implements allocate<T>(meta), get<T>(h), coerce<U>(h) and deallocate<T>(h), and re-exposes
/// the sized allocate<T>() overload via `using base::allocate;`.
///
/// StorageT is still incomplete when this base is instantiated, so member signatures name its
/// handles only through the defaulted Self parameter.
///
/// Composites that must route a rejected value to another backend (fallback, alternative)
/// provide their own create; it hides the one here.
template <class StorageT>
struct element_storage_base
{
    /// Uninitialized room for one sized T
    template <sized_pointee T, class Self = StorageT>
    [[nodiscard]] result<handle_t<Self, T>, allocation_failed> allocate()
    {
        return self().template allocate<T>(no_metadata{});
    }

    /// Allocates room for a T and moves value into it
    /// On failure, value is returned unchanged in the error channel and the storage is unchanged.
    /// If T's move constructor throws, the room is released again and the exception propagates.
    template <sized_pointee T, class Self = StorageT>
    [[nodiscard]] result<handle_t<Self, T>, T> create(T value)
    {
        auto h = self().template allocate<T>(no_metadata{});
        if (h.is_err())
            return cs::err(cs::move(value));

        if constexpr (std::is_nothrow_move_constructible_v<T>)
        {
            new (cs::placement_new, self().template get<T>(h.value())) T(cs::move(value));
        }
        else
        {
            try
            {
                new (cs::placement_new, self().template get<T>(h.value())) T(cs::move(value));
            }
            catch (...)
            {
                self().template deallocate<T>(h.value());
                throw;
            }
        }

        return cs::ok(h.value());
    }

    /// Runs the destructor(s) of the value behind h, then releases its room
    template <class T, class Self = StorageT>
    void destroy(handle_t<Self, T> h)
    {
        pointee_traits<T>::destroy(self().template get<T>(h));
        self().template deallocate<T>(h);
    }

private:
    StorageT& self() { return static_cast<StorageT&>(*this); }
};
} // namespace impl
} // namespace cs
