#pragma once

#include <clean-storage/either.hh>
#include <clean-storage/fwd.hh>
#include <clean-storage/layout.hh>
#include <clean-storage/result.hh>
#include <clean-storage/storage.hh>
#include <clean-storage/utility.hh>

/// Element storage composed of two element storages: First is preferred, Second takes what First rejects.
///
/// allocate and create try First and, on failure, Second. create hands the value rejected by First
/// on to Second, and only if both reject it, back to the caller.
/// Handles are tagged with the backend that produced them; get / coerce / deallocate dispatch on the tag.
///
/// Usage:
///   // first two values inline, the rest on the heap
///   cs::fallback_element<cs::tracking_element<node, 2>, cs::alloc_element> storage;
template <class F, class S>
struct cs::fallback_element : cs::impl::element_storage_base<cs::fallback_element<F, S>>
{
    template <class T>
    using handle = either<handle_t<F, T>, handle_t<S, T>>;

    using impl::element_storage_base<fallback_element>::allocate;

    // construction
public:
    fallback_element() = default;
    fallback_element(F first, S second) : _first(cs::move(first)), _second(cs::move(second)) {}

    // element storage
public:
    template <class T>
    [[nodiscard]] result<handle<T>, allocation_failed> allocate(metadata_t<T> meta)
    {
        auto f = _first.template allocate<T>(meta);
        if (f.is_ok())
            return cs::ok(handle<T>::from_first(f.value()));

        auto s = _second.template allocate<T>(meta);
        if (s.is_ok())
            return cs::ok(handle<T>::from_second(s.value()));

        return cs::err(allocation_failed{});
    }

    template <sized_pointee T>
    [[nodiscard]] result<handle<T>, T> create(T value)
    {
        auto f = _first.template create<T>(cs::move(value));
        if (f.is_ok())
            return cs::ok(handle<T>::from_first(f.value()));

        auto s = _second.template create<T>(cs::move(f).error());
        if (s.is_ok())
            return cs::ok(handle<T>::from_second(s.value()));

        return cs::err(cs::move(s).error());
    }

    template <class T>
    [[nodiscard]] pointer_t<T> get(handle<T> h) const
    {
        if (h.is_first())
            return _first.template get<T>(h.first());
        return _second.template get<T>(h.second());
    }

    template <class U, class T>
        requires coercible_to<T, U>
    [[nodiscard]] handle<U> coerce(handle<T> h) const
    {
        if (h.is_first())
            return handle<U>::from_first(_first.template coerce<U, T>(h.first()));
        return handle<U>::from_second(_second.template coerce<U, T>(h.second()));
    }

    template <class T>
    void deallocate(handle<T> h)
    {
        if (h.is_first())
            _first.template deallocate<T>(h.first());
        else
            _second.template deallocate<T>(h.second());
    }

    // properties
public:
    [[nodiscard]] F& first() { return _first; }
    [[nodiscard]] F const& first() const { return _first; }
    [[nodiscard]] S& second() { return _second; }
    [[nodiscard]] S const& second() const { return _second; }

    // members
private:
    F _first;
    S _second;
};
