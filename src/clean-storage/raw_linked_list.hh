#pragma once

#include <clean-storage/fwd.hh>
#include <clean-storage/optional.hh>
#include <clean-storage/result.hh>
#include <clean-storage/storage.hh>
#include <clean-storage/utility.hh>

#include <type_traits>

namespace cs
{
/// Slot shape of a cs::raw_linked_list node holding a T, for a handle that looks like H
/// Inline storages need their slot shape up front, before the node (and thus its handle) exists.
/// Pick an H at least as large and as aligned as the storage's handle, e.g. isize for cs::tracking_element.
/// Usage:
///   cs::raw_linked_list<int, cs::tracking_element<cs::raw_linked_list_node_shape<int, cs::isize>, 8>> list;
template <class T, class H>
struct raw_linked_list_node_shape
{
    optional<H> next;
    T element;
};
} // namespace cs

/// Singly-linked list whose nodes live in an element storage
///
/// The list owns its storage and addresses every node through a storage handle, so the same list works
/// on top of inline, free-list, heap, or composite storages.
/// push and pop work at the front, both O(1).
///
/// push hands the value back when the storage is exhausted; nothing else in the list can fail.
/// The list is neither copyable nor movable. The destructor destroys all remaining elements.
///
/// Usage:
///   cs::raw_linked_list<std::string, cs::alloc_element> list;
///   if (auto r = list.push("a"); r.is_err())
///       handle_full(cs::move(r).error());
///   auto s = list.pop(); // optional<std::string>
template <class T, class StorageT>
struct cs::raw_linked_list
{
    static_assert(std::is_move_constructible_v<T>, "elements are moved into and out of nodes");

    struct node
    {
        optional<handle_t<StorageT, node>> next;
        T element;
    };

    using node_handle = handle_t<StorageT, node>;

    // construction
public:
    raw_linked_list()
        requires std::is_default_constructible_v<StorageT>
    = default;
    explicit raw_linked_list(StorageT storage) : _storage(cs::move(storage)) {}

    raw_linked_list(raw_linked_list const&) = delete;
    raw_linked_list(raw_linked_list&&) = delete;
    raw_linked_list& operator=(raw_linked_list const&) = delete;
    raw_linked_list& operator=(raw_linked_list&&) = delete;

    ~raw_linked_list() { clear(); }

    // modifiers
public:
    /// Inserts value at the front
    /// Returns the stored element, or value itself if the storage could not take another node.
    /// On failure the list is unchanged.
    [[nodiscard]] result<T*, T> push(T value)
    {
        auto r = _storage.template create<node>(node{_head, cs::move(value)});
        if (r.is_err())
            return cs::err(cs::move(r.error().element));

        _head = r.value();
        return cs::ok(&_storage.template get<node>(r.value())->element);
    }

    /// Removes the front element and returns it, or nullopt if the list is empty
    optional<T> pop()
    {
        if (!_head.has_value())
            return nullopt;

        auto const h = _head.value();
        node* const n = _storage.template get<node>(h);

        optional<T> value = cs::move(n->element);
        _head = n->next;
        _storage.template destroy<node>(h);
        return value;
    }

    /// Destroys all elements, front to back
    void clear()
    {
        while (_head.has_value())
        {
            auto const h = _head.value();
            _head = _storage.template get<node>(h)->next;
            _storage.template destroy<node>(h);
        }
    }

    // queries and access
public:
    /// The front element, or nullptr if the list is empty
    [[nodiscard]] T* front()
    {
        if (!_head.has_value())
            return nullptr;
        return &_storage.template get<node>(_head.value())->element;
    }
    [[nodiscard]] T const* front() const
    {
        if (!_head.has_value())
            return nullptr;
        return &_storage.template get<node>(_head.value())->element;
    }

    [[nodiscard]] bool is_empty() const { return !_head.has_value(); }

    /// Walks the list
    [[nodiscard]] isize size() const
    {
        isize count = 0;
        for (auto h = _head; h.has_value(); h = _storage.template get<node>(h.value())->next)
            ++count;
        return count;
    }

    [[nodiscard]] StorageT& storage() { return _storage; }
    [[nodiscard]] StorageT const& storage() const { return _storage; }

    // members
private:
    StorageT _storage;
    optional<node_handle> _head;
};
