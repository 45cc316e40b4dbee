#pragma once

#include <rb-core/assert.hh>

#include <functional>
#include <string>

namespace rb::impl
{
/// What a handler gets to see about a failed RB_ASSERT / RB_ASSERT_ALWAYS.
struct assertion_info
{
    std::string expression; ///< stringified condition, e.g. "n != nullptr"
    std::string message;    ///< e.g. "key not found"
    rb::source_location location;
};

using assertion_handler = std::move_only_function<void(assertion_info const&)>;

/// Installs a handler for the lifetime of this object.
/// Handlers form a stack, only the innermost one is called.
/// A handler may throw to turn a failed contract into an exception (tests do this to observe
/// map::operator[] on a missing key); if it returns, the program aborts as usual.
/// The handler stack is process-global and not synchronized.
///
///   auto guard = rb::impl::scoped_assertion_handler([](rb::impl::assertion_info const& info) {
///       throw my_contract_error(info.message);
///   });
struct scoped_assertion_handler
{
    explicit scoped_assertion_handler(assertion_handler handler);
    ~scoped_assertion_handler();

    scoped_assertion_handler(scoped_assertion_handler const&) = delete;
    scoped_assertion_handler& operator=(scoped_assertion_handler const&) = delete;
};
} // namespace rb::impl
