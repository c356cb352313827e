#include "assert.hh"

#include <clean-ring/assert-handler.hh>

#include <cstdlib>
#include <exception>
#include <fstream>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#if defined(CR_COMPILER_MSVC)
extern "C" __declspec(dllimport) int __stdcall IsDebuggerPresent() noexcept;
#endif

namespace
{
// innermost handler at the back
std::vector<cr::impl::assertion_handler>& handler_stack()
{
    static std::vector<cr::impl::assertion_handler> handlers;
    return handlers;
}

void print_to_stderr(cr::impl::assertion_info const& info)
{
    std::cerr << info.location.file_name() << ':' << info.location.line() << ": assertion `" << info.expression
              << "` failed\n";
    std::cerr << "  in " << info.location.function_name() << '\n';
    if (!info.message.empty())
        std::cerr << "  " << info.message << '\n';
    std::cerr.flush();
}

#if defined(CR_OS_LINUX)
// a ptrace-attached debugger shows up as a non-zero TracerPid
bool has_tracer()
{
    auto status = std::ifstream("/proc/self/status");
    auto line = std::string();
    while (std::getline(status, line))
    {
        if (line.starts_with("TracerPid:"))
            return std::strtol(line.c_str() + 10, nullptr, 10) != 0;
    }
    return false;
}
#endif
} // namespace

void cr::impl::push_assertion_handler(assertion_handler handler)
{
    handler_stack().push_back(std::move(handler));
}

void cr::impl::pop_assertion_handler()
{
    auto& handlers = handler_stack();
    if (!handlers.empty())
        handlers.pop_back();
}

cr::impl::scoped_assertion_handler::scoped_assertion_handler(assertion_handler handler)
{
    push_assertion_handler(std::move(handler));
}

cr::impl::scoped_assertion_handler::~scoped_assertion_handler() { pop_assertion_handler(); }

void cr::impl::report_assert_failure(std::string_view expression, std::string_view message, std::source_location location)
{
    auto const info = assertion_info{
        .expression = std::string(expression),
        .message = std::string(message),
        .location = location,
    };

    auto& handlers = handler_stack();
    if (handlers.empty())
        print_to_stderr(info);
    else
        handlers.back()(info);
}

bool cr::impl::is_debugger_connected() noexcept
{
#if defined(CR_COMPILER_MSVC)
    return ::IsDebuggerPresent() != 0;
#elif defined(CR_OS_LINUX)
    try
    {
        return has_tracer();
    }
    catch (std::exception const&)
    {
        // unreadable /proc: treat as "no debugger"
        return false;
    }
#else
    return false;
#endif
}

void cr::impl::perform_abort() noexcept { std::abort(); }
