#pragma once

#include <clean-storage/assert.hh>
#include <clean-storage/fwd.hh>
#include <clean-storage/utility.hh>

#include <type_traits>

/// The single error kind of every fallible storage operation.
/// Covers exhausted space, a shape a fixed-capacity backend cannot hold,
/// and a capacity that is not representable in the required integer width.
/// Deliberately carries no payload: callers only ever branch on success.
struct cs::allocation_failed
{
    friend bool operator==(allocation_failed, allocation_failed) = default;
};

namespace cs
{
/// Success payload on its way into a result<T, E>, built by cs::ok(v)
template <class T>
struct ok_value
{
    T value;
};

/// Error payload on its way into a result<T, E>, built by cs::err(e)
template <class E>
struct error_value
{
    E value;
};

/// Wraps a value so that it converts into the success state of any compatible result<T, E>
/// Usage:
///   return cs::ok(handle);
template <class T>
[[nodiscard]] constexpr ok_value<std::decay_t<T>> ok(T&& value)
{
    return {cs::forward<T>(value)};
}

/// Wraps a value so that it converts into the error state of any compatible result<T, E>
/// Usage:
///   return cs::err(cs::allocation_failed{});
///   return cs::err(cs::move(value)); // hand a rejected value back to the caller
template <class E>
[[nodiscard]] constexpr error_value<std::decay_t<E>> err(E&& error)
{
    return {cs::forward<E>(error)};
}
} // namespace cs

/// Sum type holding either a success value T or an error E.
/// This is the "expected error" channel of clean-storage:
///   - allocate / try_grow / try_shrink return result<handle, cs::allocation_failed>
///   - create returns result<handle, T> so that a rejected value is handed back unchanged
///
/// There is no implicit conversion from T or E, construction goes through cs::ok / cs::err.
/// This keeps result<T, T>-like situations unambiguous.
/// Trivially copyable when both T and E are.
template <class T, class E>
struct cs::result
{
    static_assert(!std::is_reference_v<T> && !std::is_reference_v<E>, "result does not hold references");

    // construction
public:
    template <class U>
        requires std::is_constructible_v<T, U&&>
    constexpr result(ok_value<U>&& v) : _value(cs::move(v.value)), _is_ok(true) // NOLINT
    {
    }

    template <class U>
        requires std::is_constructible_v<E, U&&>
    constexpr result(error_value<U>&& e) : _error(cs::move(e.value)), _is_ok(false) // NOLINT
    {
    }

    // trivial copy/move/destroy
public:
    result(result&&)
        requires(std::is_trivially_copyable_v<T> && std::is_trivially_copyable_v<E>)
    = default;
    result(result const&)
        requires(std::is_trivially_copyable_v<T> && std::is_trivially_copyable_v<E>)
    = default;
    result& operator=(result&&)
        requires(std::is_trivially_copyable_v<T> && std::is_trivially_copyable_v<E>)
    = default;
    result& operator=(result const&)
        requires(std::is_trivially_copyable_v<T> && std::is_trivially_copyable_v<E>)
    = default;

    ~result()
        requires(std::is_trivially_destructible_v<T> && std::is_trivially_destructible_v<E>)
    = default;

    // non-trivial copy/move/destroy
public:
    result(result&& rhs) noexcept
        requires(!(std::is_trivially_copyable_v<T> && std::is_trivially_copyable_v<E>))
      : _is_ok(rhs._is_ok)
    {
        if (_is_ok)
            new (cs::placement_new, &_value) T(cs::move(rhs._value));
        else
            new (cs::placement_new, &_error) E(cs::move(rhs._error));
    }

    result(result const& rhs)
        requires(!(std::is_trivially_copyable_v<T> && std::is_trivially_copyable_v<E>)
                 && std::is_copy_constructible_v<T> && std::is_copy_constructible_v<E>)
      : _is_ok(rhs._is_ok)
    {
        if (_is_ok)
            new (cs::placement_new, &_value) T(rhs._value);
        else
            new (cs::placement_new, &_error) E(rhs._error);
    }

    result& operator=(result&& rhs) noexcept
        requires(!(std::is_trivially_copyable_v<T> && std::is_trivially_copyable_v<E>))
    {
        if (this != &rhs)
        {
            destroy_active();
            _is_ok = rhs._is_ok;
            if (_is_ok)
                new (cs::placement_new, &_value) T(cs::move(rhs._value));
            else
                new (cs::placement_new, &_error) E(cs::move(rhs._error));
        }
        return *this;
    }

    result& operator=(result const& rhs)
        requires(!(std::is_trivially_copyable_v<T> && std::is_trivially_copyable_v<E>)
                 && std::is_copy_constructible_v<T> && std::is_copy_constructible_v<E>)
    {
        if (this != &rhs)
        {
            destroy_active();
            _is_ok = rhs._is_ok;
            if (_is_ok)
                new (cs::placement_new, &_value) T(rhs._value);
            else
                new (cs::placement_new, &_error) E(rhs._error);
        }
        return *this;
    }

    ~result()
        requires(!(std::is_trivially_destructible_v<T> && std::is_trivially_destructible_v<E>))
    {
        destroy_active();
    }

    // queries and access
public:
    [[nodiscard]] constexpr bool is_ok() const { return _is_ok; }
    [[nodiscard]] constexpr bool is_err() const { return !_is_ok; }

    /// Success value, preserving the value category of the result.
    /// Precondition: is_ok().
    [[nodiscard]] T& value() &
    {
        CS_ASSERT(_is_ok, "attempted to access value of an error result");
        return _value;
    }
    [[nodiscard]] T const& value() const&
    {
        CS_ASSERT(_is_ok, "attempted to access value of an error result");
        return _value;
    }
    [[nodiscard]] T&& value() &&
    {
        CS_ASSERT(_is_ok, "attempted to access value of an error result");
        return cs::move(_value);
    }

    /// Error value, preserving the value category of the result.
    /// Precondition: is_err().
    [[nodiscard]] E& error() &
    {
        CS_ASSERT(!_is_ok, "attempted to access error of a successful result");
        return _error;
    }
    [[nodiscard]] E const& error() const&
    {
        CS_ASSERT(!_is_ok, "attempted to access error of a successful result");
        return _error;
    }
    [[nodiscard]] E&& error() &&
    {
        CS_ASSERT(!_is_ok, "attempted to access error of a successful result");
        return cs::move(_error);
    }

private:
    void destroy_active()
    {
        if (_is_ok)
        {
            if constexpr (!std::is_trivially_destructible_v<T>)
                _value.~T();
        }
        else
        {
            if constexpr (!std::is_trivially_destructible_v<E>)
                _error.~E();
        }
    }

    // members
private:
    union
    {
        T _value;
        E _error;
    };
    bool _is_ok;
};
