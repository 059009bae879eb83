#pragma once

#include <clean-storage/assert.hh>
#include <clean-storage/builder.hh>
#include <clean-storage/either.hh>
#include <clean-storage/fwd.hh>
#include <clean-storage/layout.hh>
#include <clean-storage/optional.hh>
#include <clean-storage/result.hh>
#include <clean-storage/storage.hh>
#include <clean-storage/utility.hh>

#include <type_traits>

namespace cs
{
enum class alternative_state
{
    first,
    second,
    /// a switch to the second storage was interrupted by an exception, terminal
    poisoned,
};
} // namespace cs

/// Element storage that starts out with First and switches to Second once First cannot serve a request.
///
/// Unlike cs::fallback_element, only one backend serves new requests at any time:
///   - in state first, allocate / create go to First
///   - the first failure of First triggers the one and only switch:
///       the state becomes poisoned, Second is built from the second builder (SB::into_storage),
///       the failed request is retried on Second, and the state becomes second
///     The result of the retry is returned as is, i.e. it may fail as well.
///   - in state second, everything new goes to Second, there is no way back
///
/// First is retired, not destroyed, by the switch: handles it produced earlier stay valid and keep
/// resolving to First until they are deallocated. The builder of First is recovered from it
/// (FB::from_storage) so that a second-state storage always carries its First builder.
///
/// If anything throws during the switch (the builder, Second, or a value's move constructor),
/// the storage stays poisoned and every later call is a fatal assertion.
///
/// Usage:
///   // one value inline until that is not enough, then the default memory resource
///   using storage = cs::alternative_element<cs::inline_element<node>, cs::alloc_element,
///                                           cs::default_builder<cs::inline_element<node>>, cs::resource_builder>;
///   auto s = storage::first(cs::inline_element<node>(), cs::resource_builder{});
template <class F, class S, class FB, class SB>
struct cs::alternative_element : cs::impl::element_storage_base<cs::alternative_element<F, S, FB, SB>>
{
    static_assert(storage_builder<FB, F>, "FB must build F");
    static_assert(storage_builder<SB, S>, "SB must build S");

    template <class T>
    using handle = either<handle_t<F, T>, handle_t<S, T>>;

    using impl::element_storage_base<alternative_element>::allocate;

    // construction
public:
    /// Starts in state first with a default-constructed First and second builder
    alternative_element()
        requires(std::is_default_constructible_v<F> && std::is_default_constructible_v<SB>)
      : _state(alternative_state::first)
    {
        _first.emplace();
        _second_builder.emplace();
    }

    /// Starts in state first, Second is built from second_builder on demand
    [[nodiscard]] static alternative_element first(F storage, SB second_builder)
    {
        alternative_element r(alternative_state::first);
        r._first.emplace(cs::move(storage));
        r._second_builder.emplace(cs::move(second_builder));
        return r;
    }

    /// Starts in state second, First is never used
    [[nodiscard]] static alternative_element second(S storage, FB first_builder)
    {
        alternative_element r(alternative_state::second);
        r._second.emplace(cs::move(storage));
        r._first_builder.emplace(cs::move(first_builder));
        return r;
    }

    // element storage
public:
    template <class T>
    [[nodiscard]] result<handle<T>, allocation_failed> allocate(metadata_t<T> meta)
    {
        check_usable();

        if (_state == alternative_state::first)
        {
            auto f = _first.value().template allocate<T>(meta);
            if (f.is_ok())
                return cs::ok(handle<T>::from_first(f.value()));

            begin_switch();
            auto s = _second.value().template allocate<T>(meta);
            _state = alternative_state::second;

            if (s.is_err())
                return cs::err(allocation_failed{});
            return cs::ok(handle<T>::from_second(s.value()));
        }

        auto s = _second.value().template allocate<T>(meta);
        if (s.is_err())
            return cs::err(allocation_failed{});
        return cs::ok(handle<T>::from_second(s.value()));
    }

    /// Moves value into First or, after a switch, into Second
    /// A value rejected by First is handed to Second by the switch, so it is only returned
    /// if Second rejects it as well.
    template <sized_pointee T>
    [[nodiscard]] result<handle<T>, T> create(T value)
    {
        check_usable();

        if (_state == alternative_state::first)
        {
            auto f = _first.value().template create<T>(cs::move(value));
            if (f.is_ok())
                return cs::ok(handle<T>::from_first(f.value()));

            begin_switch();
            auto s = _second.value().template create<T>(cs::move(f).error());
            _state = alternative_state::second;

            if (s.is_err())
                return cs::err(cs::move(s).error());
            return cs::ok(handle<T>::from_second(s.value()));
        }

        auto s = _second.value().template create<T>(cs::move(value));
        if (s.is_err())
            return cs::err(cs::move(s).error());
        return cs::ok(handle<T>::from_second(s.value()));
    }

    template <class T>
    [[nodiscard]] pointer_t<T> get(handle<T> h) const
    {
        check_usable();
        if (h.is_first())
            return _first.value().template get<T>(h.first());
        return _second.value().template get<T>(h.second());
    }

    template <class U, class T>
        requires coercible_to<T, U>
    [[nodiscard]] handle<U> coerce(handle<T> h) const
    {
        check_usable();
        if (h.is_first())
            return handle<U>::from_first(_first.value().template coerce<U, T>(h.first()));
        return handle<U>::from_second(_second.value().template coerce<U, T>(h.second()));
    }

    template <class T>
    void deallocate(handle<T> h)
    {
        check_usable();
        if (h.is_first())
            _first.value().template deallocate<T>(h.first());
        else
            _second.value().template deallocate<T>(h.second());
    }

    // properties
public:
    [[nodiscard]] alternative_state state() const { return _state; }

    /// True if a First storage exists, either active or retired by the switch
    [[nodiscard]] bool has_first() const { return _first.has_value(); }

    // helper
private:
    explicit alternative_element(alternative_state state) : _state(state) {}

    void check_usable() const
    {
        CS_ASSERT_ALWAYS(_state != alternative_state::poisoned,
                         "alternative_element is poisoned: a switch to its second storage was interrupted");
    }

    /// Everything up to the retry on Second
    /// Leaves the state poisoned, the caller marks it second once the retry returned.
    void begin_switch()
    {
        _state = alternative_state::poisoned;

        _second.emplace(cs::move(_second_builder.value()).into_storage());
        _second_builder.reset();
        _first_builder.emplace(FB::from_storage(_first.value()));
    }

    // members
private:
    optional<F> _first;
    optional<S> _second;
    optional<FB> _first_builder;
    optional<SB> _second_builder;
    alternative_state _state;
};
