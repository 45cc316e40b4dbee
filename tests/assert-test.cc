#include <rb-core/assert-handler.hh>
#include <rb-core/map.hh>

#include <nexus/test.hh>

#include <string>
#include <vector>

namespace
{
// turns a failed assertion into an exception carrying what the handler saw
struct assertion_failed
{
    rb::impl::assertion_info info;
};

rb::impl::scoped_assertion_handler throwing_handler()
{
    return rb::impl::scoped_assertion_handler([](rb::impl::assertion_info const& info) { throw assertion_failed{info}; });
}
} // namespace

TEST("assertions - indexing a missing key")
{
    rb::map<std::string, int> m;
    m.insert("one", 1);
    m.insert("two", 2);

    auto handler = throwing_handler();

    auto fired = false;
    try
    {
        (void)m["three"];
    }
    catch (assertion_failed const& e)
    {
        fired = true;
        CHECK(e.info.message == "key not found");
        CHECK(e.info.expression.find("nullptr") != std::string::npos);
        CHECK(std::string(e.info.location.file_name()).ends_with("map.hh"));
        CHECK(e.info.location.line() > 0);
    }
    CHECK(fired);

    // present keys pass through without calling the handler
    CHECK(m["one"] == 1);
    auto const& cm = m;
    CHECK(cm["two"] == 2);

    // the failed lookup changed nothing
    CHECK(m.size() == 2);
    CHECK(m.is_valid_red_black_tree());
}

TEST("assertions - const indexing a missing key")
{
    rb::map<int, int> m;
    auto const& cm = m;

    auto handler = throwing_handler();

    auto fired = false;
    try
    {
        (void)cm[0];
    }
    catch (assertion_failed const& e)
    {
        fired = e.info.message == "key not found";
    }
    CHECK(fired);
}

TEST("assertions - nested handlers")
{
    rb::map<int, int> m;
    std::vector<int> calls;

    auto outer = rb::impl::scoped_assertion_handler(
        [&](rb::impl::assertion_info const&)
        {
            calls.push_back(1);
            throw 1;
        });

    {
        auto inner = rb::impl::scoped_assertion_handler(
            [&](rb::impl::assertion_info const&)
            {
                calls.push_back(2);
                throw 2;
            });

        try
        {
            (void)m[5];
        }
        catch (int i)
        {
            CHECK(i == 2);
        }
    }

    // inner is gone, the outer one is active again
    try
    {
        (void)m[5];
    }
    catch (int i)
    {
        CHECK(i == 1);
    }

    CHECK(calls == (std::vector<int>{2, 1}));
}

TEST("assertions - debug checks on iterators and lookups")
{
    // RB_ASSERT is compiled out when assertions are disabled, the accesses below would be UB then
    if constexpr (RB_ASSERT_ENABLED)
    {
        rb::map<int, int> m;
        m.insert(1, 10);

        auto handler = throwing_handler();

        SECTION("dereferencing an exhausted iterator")
        {
            auto it = m.begin();
            ++it;
            REQUIRE(it == m.end());

            std::string message;
            try
            {
                (void)*it;
            }
            catch (assertion_failed const& e)
            {
                message = e.info.message;
            }
            CHECK(message == "dereferencing an iterator past the end");
        }

        SECTION("advancing an exhausted reverse iterator")
        {
            auto it = m.reversed().begin();
            ++it;
            REQUIRE(it == m.reversed().end());

            std::string message;
            try
            {
                ++it;
            }
            catch (assertion_failed const& e)
            {
                message = e.info.message;
            }
            CHECK(message == "incrementing an iterator past the end");
        }

        SECTION("value of a missing lookup")
        {
            auto const found = m.get(2);
            REQUIRE(found == rb::nullopt);

            std::string message;
            try
            {
                (void)found.value();
            }
            catch (assertion_failed const& e)
            {
                message = e.info.message;
            }
            CHECK(message == "accessing the value of an empty optional");
        }

        SECTION("value of removing a missing key")
        {
            auto removed = m.remove(2);

            std::string message;
            try
            {
                (void)removed.value();
            }
            catch (assertion_failed const& e)
            {
                message = e.info.message;
            }
            CHECK(message == "accessing the value of an empty optional");
            CHECK(m.size() == 1);
        }
    }
}
