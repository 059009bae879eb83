#pragma once

#include <clean-storage/assert.hh>
#include <clean-storage/fwd.hh>

#include <cstddef>

/// Non-owning view over a contiguous sequence of T.
/// This is the typed view every range storage hands out for a range handle
/// and the view of a slice (T[]) stored in an element storage.
/// Stores a pointer and runtime size. Trivially copyable regardless of T's triviality.
/// The viewed slots may be uninitialized: the storage only guarantees the room, not live objects.
template <class T>
struct cs::span
{
    // construction
public:
    /// Default span is empty: data() == nullptr, size() == 0.
    constexpr span() = default;

    // keep triviality
    constexpr span(span const&) = default;
    constexpr span(span&&) = default;
    constexpr span& operator=(span const&) = default;
    constexpr span& operator=(span&&) = default;
    constexpr ~span() = default;

    /// Creates a span viewing [ptr, ptr+size).
    /// Precondition: size >= 0.
    constexpr explicit span(T* ptr, isize size) : _data(ptr), _size(size)
    {
        CS_ASSERT(size >= 0, "span size must be non-negative");
    }

    /// Creates a span viewing the entire C array.
    template <std::size_t N>
    constexpr span(T (&arr)[N]) : _data(arr), _size(static_cast<isize>(N))
    {
    }

    // element access
public:
    /// Returns a reference to the element at index i.
    /// Precondition: 0 <= i < size().
    [[nodiscard]] constexpr T& operator[](isize i) const
    {
        CS_ASSERT(0 <= i && i < _size, "index out of bounds");
        return _data[i];
    }

    /// Returns a pointer to the underlying contiguous storage.
    /// May be nullptr for an empty view (e.g. a zero-capacity range handle).
    [[nodiscard]] constexpr T* data() const { return _data; }

    // iterators
public:
    [[nodiscard]] constexpr T* begin() const { return _data; }
    [[nodiscard]] constexpr T* end() const { return _data + _size; }

    // queries
public:
    [[nodiscard]] constexpr isize size() const { return _size; }
    [[nodiscard]] constexpr isize size_bytes() const { return _size * isize(sizeof(T)); }
    [[nodiscard]] constexpr bool empty() const { return _size == 0; }

    // members
private:
    T* _data = nullptr;
    isize _size = 0;
};
