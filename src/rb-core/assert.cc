#include <rb-core/assert-handler.hh>
#include <rb-core/assert.hh>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <vector>

#ifdef RB_OS_WINDOWS
extern "C" __declspec(dllimport) int __stdcall IsDebuggerPresent() noexcept;
#endif

namespace
{
// innermost handler is at the back
std::vector<rb::impl::assertion_handler>& handler_stack()
{
    static std::vector<rb::impl::assertion_handler> handlers;
    return handlers;
}

void print_to_stderr(rb::impl::assertion_info const& info)
{
    auto const& loc = info.location;
    std::cerr << loc.file_name() << ':' << loc.line() << ": assertion `" << info.expression << "` failed: " << info.message
              << "\n    in " << loc.function_name() << std::endl;
}
} // namespace

rb::impl::scoped_assertion_handler::scoped_assertion_handler(assertion_handler handler)
{
    handler_stack().push_back(std::move(handler));
}

rb::impl::scoped_assertion_handler::~scoped_assertion_handler()
{
    RB_ASSERT(!handler_stack().empty(), "assertion handler stack is unbalanced");
    handler_stack().pop_back();
}

void rb::impl::handle_assert_failure(char const* expression, char const* message, rb::source_location location)
{
    auto const info = assertion_info{expression, message, location};

    auto& handlers = handler_stack();
    if (handlers.empty())
        print_to_stderr(info);
    else
        handlers.back()(info); // may throw

    // returning means the caller aborts
}

bool rb::impl::is_debugger_connected() noexcept
{
#if defined(RB_OS_WINDOWS)
    return ::IsDebuggerPresent() != 0;
#elif defined(RB_OS_LINUX)
    // "TracerPid:\t<pid>", 0 when nobody is attached
    std::ifstream status("/proc/self/status");
    std::string line;
    while (std::getline(status, line))
    {
        if (line.starts_with("TracerPid:"))
            return std::atoi(line.c_str() + 10) != 0;
    }
    return false;
#else
    return false;
#endif
}

void rb::impl::perform_abort() noexcept
{
    std::abort();
}
