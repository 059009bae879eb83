#pragma once

// Included by every storage header, so it stays free of heavy includes.
#include <clean-storage/macros.hh>
#include <clean-storage/source_location.hh>

// =========================================================================================================
// Assertions
// =========================================================================================================
//
// clean-storage separates two kinds of errors:
//   - running out of room (or being asked for a shape a fixed storage cannot hold) is expected,
//     every storage reports it as cs::result<..., cs::allocation_failed>
//   - breaking a storage contract is a programmer error and reported through the macros below
//
// CS_ASSERT(cond, msg)
//   Preconditions of single operations, e.g. try_grow to a smaller capacity, a slot index no storage
//   handed out, a span index out of bounds.
//   Checked in CS_DEBUG and CS_RELWITHDEBINFO builds; in CS_RELEASE only with CS_ENABLE_ASSERT_IN_RELEASE.
//
// CS_ASSERT_ALWAYS(cond, msg)
//   Conditions after which no storage state can be trusted anymore, checked in every build:
//   reading a composite handle through the wrong arm, using a poisoned alternative storage.
//
// A failing assertion is reported to the innermost handler (see assert-handler.hh, stderr by default),
// then breaks into an attached debugger and aborts. A handler may throw instead to unwind.
//
// Usage:
//   CS_ASSERT(0 <= index && index < N, "slot index out of range");

#define CS_ASSERT(cond, msg) CS_IMPL_ASSERT(cond, msg)
#define CS_ASSERT_ALWAYS(cond, msg) CS_IMPL_CHECK(::cs::impl::assertion_kind::fatal, cond, msg)

namespace cs::impl
{
/// Which macro detected the failure
enum class assertion_kind
{
    /// CS_ASSERT
    precondition,
    /// CS_ASSERT_ALWAYS
    fatal,
};

/// Reports to the innermost handler, does not abort by itself
CS_COLD_FUNC void handle_assert_failure(assertion_kind kind, char const* expression, char const* message, cs::source_location location);

[[nodiscard]] bool is_debugger_connected() noexcept;

[[noreturn]] void perform_abort() noexcept;
} // namespace cs::impl

// =========================================================================================================
// Implementation details
// =========================================================================================================

// the break has to happen inside the macro so the debugger stops at the failing line

#if defined(CS_COMPILER_MSVC)
#define CS_IMPL_DEBUG_BREAK() (::cs::impl::is_debugger_connected() ? __debugbreak() : void(0))
#elif defined(CS_COMPILER_POSIX)
// raise(SIGTRAP), declared by hand to keep <csignal> out of every header
extern "C" int raise(int) noexcept;
#define CS_IMPL_DEBUG_BREAK() (::cs::impl::is_debugger_connected() ? (void)::raise(5) : void(0))
#else
#define CS_IMPL_DEBUG_BREAK() void(0)
#endif

#define CS_IMPL_CHECK(kind, cond, msg)                                                             \
    do                                                                                             \
    {                                                                                              \
        if (!(cond)) [[unlikely]]                                                                  \
        {                                                                                          \
            ::cs::impl::handle_assert_failure(kind, #cond, msg, ::cs::source_location::current()); \
            CS_IMPL_DEBUG_BREAK();                                                                 \
            ::cs::impl::perform_abort();                                                           \
        }                                                                                          \
    } while (false)

#if CS_ASSERT_ENABLED
#define CS_IMPL_ASSERT(cond, msg) CS_IMPL_CHECK(::cs::impl::assertion_kind::precondition, cond, msg)
#else
// not evaluated, but still type-checked
#define CS_IMPL_ASSERT(cond, msg) \
    do                            \
    {                             \
        CS_UNUSED(cond);          \
        CS_UNUSED(msg);           \
    } while (false)
#endif
