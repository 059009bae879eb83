#pragma once

#include <clean-storage/assert.hh>
#include <clean-storage/source_location.hh>

#include <functional>
#include <string>

// Replaceable reporting of failed assertions.
//
// Handlers form a stack, the innermost one receives every failure. Without any handler the failure is
// printed to stderr. A handler that returns lets the assertion abort; a handler that throws unwinds to
// the caller instead, which is how the tests observe fatal storage conditions.
// The stack is global and not synchronized.
//
// Usage:
//   auto handler = cs::impl::scoped_assertion_handler([](cs::impl::assertion_info const& info) {
//       throw storage_misuse{info.message};
//   });
//   storage.get<int>(stale_handle); // throws instead of aborting

namespace cs::impl
{
struct assertion_info
{
    assertion_kind kind;
    std::string expression;
    std::string message;
    cs::source_location location;
};

using assertion_handler = std::move_only_function<void(assertion_info const&)>;

void push_assertion_handler(assertion_handler handler);

/// Popping an empty stack does nothing
void pop_assertion_handler();

/// Pushes a handler for the lifetime of this object
struct scoped_assertion_handler
{
    explicit scoped_assertion_handler(assertion_handler handler);
    ~scoped_assertion_handler();

    scoped_assertion_handler(scoped_assertion_handler const&) = delete;
    scoped_assertion_handler& operator=(scoped_assertion_handler const&) = delete;
    scoped_assertion_handler(scoped_assertion_handler&&) = delete;
    scoped_assertion_handler& operator=(scoped_assertion_handler&&) = delete;
};
} // namespace cs::impl
