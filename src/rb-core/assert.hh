#pragma once

#include <rb-core/macros.hh>

#include <source_location>

// =========================================================================================================
// Assertions
// =========================================================================================================
//
// rb-core reports two kinds of problems differently:
//   - a missing key on get/remove/first/... is expected and comes back as rb::nullopt
//   - a broken contract is a programmer error and fails an assertion:
//     map::operator[] on a missing key, optional::value() on an empty optional,
//     dereferencing an exhausted map iterator, engine invariants in tree.cc
//
// A failed assertion goes through rb::impl::handle_assert_failure, which calls the topmost handler
// installed via assert-handler.hh (or prints to stderr), then breaks into an attached debugger and aborts.
// A handler that throws unwinds out of the failing operation instead; the map is left unchanged.
//
//   RB_ASSERT(cond, "msg")         debug and relwithdebinfo; in release only with RB_ENABLE_ASSERT_IN_RELEASE
//   RB_ASSERT_ALWAYS(cond, "msg")  every build mode
//
// msg must be a string literal (or at least outlive the handler call).

#define RB_ASSERT(cond, msg) RB_IMPL_ASSERT(cond, msg)
#define RB_ASSERT_ALWAYS(cond, msg) RB_IMPL_ASSERT_ALWAYS(cond, msg)

namespace rb
{
using source_location = std::source_location;
}

namespace rb::impl
{
/// Dispatches a failed assertion to the current handler. Returns if the handler returns.
RB_COLD_FUNC void handle_assert_failure(char const* expression, char const* message, rb::source_location location);

/// True if a debugger is attached (Linux: TracerPid in /proc/self/status, Windows: IsDebuggerPresent)
[[nodiscard]] bool is_debugger_connected() noexcept;

[[noreturn]] void perform_abort() noexcept;
} // namespace rb::impl

// the break has to happen inside the macro so the debugger stops at the failing line

#ifdef RB_COMPILER_MSVC
#define RB_IMPL_DEBUG_BREAK() (::rb::impl::is_debugger_connected() ? __debugbreak() : void(0))
#else
// SIGTRAP (5), declared by hand to keep <csignal> out of every header
extern "C" int raise(int) noexcept;
#define RB_IMPL_DEBUG_BREAK() (::rb::impl::is_debugger_connected() ? (void)::raise(5) : void(0))
#endif

#define RB_IMPL_ASSERT_ALWAYS(cond, msg)                                                     \
    do                                                                                       \
    {                                                                                        \
        if (!(cond)) [[unlikely]]                                                            \
        {                                                                                    \
            ::rb::impl::handle_assert_failure(#cond, msg, ::rb::source_location::current()); \
            RB_IMPL_DEBUG_BREAK();                                                           \
            ::rb::impl::perform_abort();                                                     \
        }                                                                                    \
    } while (false)

#if RB_ASSERT_ENABLED
#define RB_IMPL_ASSERT(cond, msg) RB_IMPL_ASSERT_ALWAYS(cond, msg)
#else
// compiled out, but cond and msg still have to compile
#define RB_IMPL_ASSERT(cond, msg) \
    do                            \
    {                             \
        RB_UNUSED(cond);          \
        RB_UNUSED(msg);           \
    } while (false)
#endif
