#pragma once

#include <clean-storage/assert.hh>
#include <clean-storage/fwd.hh>
#include <clean-storage/utility.hh>

#include <type_traits>

/// Sentinel type used to represent the "no value" state in optional.
/// Deliberately lacks a default constructor to avoid ambiguity in optional<T> = {}.
struct cs::nullopt_t
{
    enum class _ctor_tag // NOLINT(readability-identifier-naming)
    {
        tag
    };
    explicit constexpr nullopt_t(_ctor_tag) {}
};

namespace cs
{
/// The canonical instance of nullopt_t used to construct or assign empty optionals.
constexpr nullopt_t nullopt = nullopt_t{nullopt_t::_ctor_tag::tag};
} // namespace cs

/// Sum type representing either a value of type T or no value (T | none).
/// Used for the "next" link of list nodes and for the backend slots of cs::alternative_element,
/// which are filled and emptied as the composite switches backends.
/// No operator* or operator->: access goes through value(), which asserts engagement.
/// Trivially copyable when T is trivially copyable, so optional handles stay plain bytes.
template <class T>
struct cs::optional
{
    // construction
public:
    /// Default optional is empty: has_value() == false.
    optional() = default;

    /// Constructs an optional holding the given value; conditionally explicit.
    template <class U = std::remove_cv_t<T>>
        requires(!std::is_same_v<std::remove_cvref_t<U>, optional> && !std::is_same_v<std::remove_cvref_t<U>, nullopt_t>)
    explicit(!std::is_convertible_v<U, T>) constexpr optional(U&& value) : _has_value(true) // NOLINT
    {
        new (cs::placement_new, &_storage.value) T(cs::forward<U>(value));
    }

    /// Constructs an empty optional from cs::nullopt.
    optional(nullopt_t) {}

    // trivial copy/move/destroy - defaulted when T allows bitwise operations
public:
    optional(optional&&)
        requires std::is_trivially_copyable_v<T>
    = default;
    optional(optional const&)
        requires std::is_trivially_copyable_v<T>
    = default;
    optional& operator=(optional&&)
        requires std::is_trivially_copyable_v<T>
    = default;
    optional& operator=(optional const&)
        requires std::is_trivially_copyable_v<T>
    = default;

    ~optional()
        requires std::is_trivially_destructible_v<T>
    = default;

    // non-trivial copy/move/destroy
public:
    /// Move-constructs the value, then destroys it in rhs and marks rhs empty.
    optional(optional&& rhs) noexcept
        requires(!std::is_trivially_copyable_v<T>)
      : _has_value(rhs._has_value)
    {
        if (_has_value)
        {
            new (cs::placement_new, &_storage.value) T(cs::move(rhs._storage.value));
            rhs._storage.value.~T();
            rhs._has_value = false;
        }
    }

    optional(optional const& rhs)
        requires(!std::is_trivially_copyable_v<T> && std::is_copy_constructible_v<T>)
      : _has_value(rhs._has_value)
    {
        if (_has_value)
            new (cs::placement_new, &_storage.value) T(rhs._storage.value);
    }

    /// Leaves rhs engaged with a moved-from value (matches std::optional behavior).
    /// Values without move assignment (e.g. storages with const members) are reconstructed instead.
    optional& operator=(optional&& rhs) noexcept
        requires(!std::is_trivially_copyable_v<T>)
    {
        if (this == &rhs)
            return *this;

        if (rhs._has_value)
        {
            if constexpr (std::is_move_assignable_v<T>)
            {
                if (_has_value)
                    _storage.value = cs::move(rhs._storage.value);
                else
                    new (cs::placement_new, &_storage.value) T(cs::move(rhs._storage.value));
            }
            else
            {
                reset();
                new (cs::placement_new, &_storage.value) T(cs::move(rhs._storage.value));
            }
            _has_value = true;
        }
        else
        {
            reset();
        }

        return *this;
    }

    optional& operator=(optional const& rhs)
        requires(!std::is_trivially_copyable_v<T> && std::is_copy_constructible_v<T> && std::is_copy_assignable_v<T>)
    {
        if (this != &rhs)
        {
            if (rhs._has_value)
            {
                if (_has_value)
                    _storage.value = rhs._storage.value;
                else
                    new (cs::placement_new, &_storage.value) T(rhs._storage.value);

                _has_value = true;
            }
            else
            {
                reset();
            }
        }

        return *this;
    }

    ~optional()
        requires(!std::is_trivially_destructible_v<T>)
    {
        if (_has_value)
            _storage.value.~T();
    }

    // modifiers
public:
    /// Destroys the held value (if any) and constructs a new one in place.
    /// Returns a reference to the new value.
    template <class... Args>
    T& emplace(Args&&... args)
    {
        reset();
        new (cs::placement_new, &_storage.value) T(cs::forward<Args>(args)...);
        _has_value = true;
        return _storage.value;
    }

    /// Destroys the held value (if any), leaving the optional empty.
    void reset()
    {
        if (_has_value)
        {
            if constexpr (!std::is_trivially_destructible_v<T>)
                _storage.value.~T();
            _has_value = false;
        }
    }

    // queries and access
public:
    /// Returns true if this optional holds a value, false if empty.
    [[nodiscard]] bool has_value() const { return _has_value; }

    /// Returns a reference to the held value, preserving the value category of the optional.
    /// Precondition: has_value() == true.
    [[nodiscard]] T& value() &
    {
        CS_ASSERT(_has_value, "attempted to access value of empty optional");
        return _storage.value;
    }
    [[nodiscard]] T const& value() const&
    {
        CS_ASSERT(_has_value, "attempted to access value of empty optional");
        return _storage.value;
    }
    [[nodiscard]] T&& value() &&
    {
        CS_ASSERT(_has_value, "attempted to access value of empty optional");
        return cs::move(_storage.value);
    }

    // comparison
public:
    /// Two optionals are equal if both are empty or both hold equal values.
    [[nodiscard]] friend bool operator==(optional const& lhs, optional const& rhs)
        requires requires(T const& v) { bool(v == v); }
    {
        if (lhs._has_value != rhs._has_value)
            return false;
        if (lhs._has_value)
            return lhs._storage.value == rhs._storage.value;
        return true;
    }

    // members
private:
    /// Room for one T that never constructs or destroys value on its own
    union value_storage
    {
        T value;

        constexpr value_storage() {}

        value_storage(value_storage const&) = default;
        value_storage(value_storage&&) = default;
        value_storage& operator=(value_storage const&) = default;
        value_storage& operator=(value_storage&&) = default;

        ~value_storage()
            requires std::is_trivially_destructible_v<T>
        = default;
        ~value_storage()
            requires(!std::is_trivially_destructible_v<T>)
        {
        }
    };

    value_storage _storage;

    /// True when _storage.value holds a live T object.
    bool _has_value = false;
};
