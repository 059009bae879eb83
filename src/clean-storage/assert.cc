#include "assert.hh"

#include <clean-storage/assert-handler.hh>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <utility>
#include <vector>

#ifdef CS_COMPILER_MSVC
extern "C" __declspec(dllimport) int __stdcall IsDebuggerPresent() noexcept;
#endif

namespace
{
std::vector<cs::impl::assertion_handler>& handler_stack()
{
    static std::vector<cs::impl::assertion_handler> stack;
    return stack;
}

char const* describe(cs::impl::assertion_kind kind)
{
    switch (kind)
    {
    case cs::impl::assertion_kind::precondition:
        return "precondition violated";
    case cs::impl::assertion_kind::fatal:
        return "fatal storage error";
    }
    return "assertion failed";
}

void report_to_stderr(cs::impl::assertion_info const& info)
{
    std::cerr << "clean-storage: " << describe(info.kind) << ": " << info.expression << '\n'
              << "  " << info.message << '\n'
              << "  at " << info.location.file_name() << ':' << info.location.line() << ':' << info.location.column()
              << " in " << info.location.function_name() << '\n';
}
} // namespace

void cs::impl::push_assertion_handler(assertion_handler handler)
{
    handler_stack().push_back(std::move(handler));
}

void cs::impl::pop_assertion_handler()
{
    auto& stack = handler_stack();
    if (!stack.empty())
        stack.pop_back();
}

cs::impl::scoped_assertion_handler::scoped_assertion_handler(assertion_handler handler)
{
    push_assertion_handler(std::move(handler));
}

cs::impl::scoped_assertion_handler::~scoped_assertion_handler()
{
    pop_assertion_handler();
}

CS_COLD_FUNC void cs::impl::handle_assert_failure(assertion_kind kind, char const* expression, char const* message, cs::source_location location)
{
    assertion_info const info{kind, expression, message, location};

    auto& stack = handler_stack();
    if (stack.empty())
        report_to_stderr(info);
    else
        stack.back()(info);
}

bool cs::impl::is_debugger_connected() noexcept
{
#if defined(CS_COMPILER_MSVC)
    return ::IsDebuggerPresent() != 0;
#elif defined(CS_OS_LINUX)
    // a traced process has a non-zero "TracerPid:" line
    std::ifstream status("/proc/self/status");
    std::string key;
    while (status >> key)
    {
        if (key == "TracerPid:")
        {
            int pid = 0;
            status >> pid;
            return pid != 0;
        }
        status.ignore(1 << 16, '\n');
    }
    return false;
#else
    return false;
#endif
}

[[noreturn]] void cs::impl::perform_abort() noexcept
{
    std::abort();
}
