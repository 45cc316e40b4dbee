#include <rb-core/map.hh>
#include <rb-core/pair.hh>

#include <nexus/test.hh>

#include <string>
#include <type_traits>
#include <utility>
#include <vector>

// iterating a mutable map yields borrowed keys (read-only) and values (writable)
static_assert(std::is_same_v<decltype(*std::declval<rb::map<int, std::string>&>().begin()), rb::pair<int const&, std::string&>>);
static_assert(std::is_same_v<decltype(*std::declval<rb::map<int, std::string> const&>().begin()), rb::pair<int const&, std::string const&>>);
static_assert(std::tuple_size_v<rb::pair<int, float>> == 2);
static_assert(std::is_same_v<std::tuple_element_t<1, rb::pair<int const&, float&>>, float&>);

TEST("pair - structured bindings refer into the map")
{
    rb::map<int, std::string> m;
    m.insert(3, "c");
    m.insert(1, "a");
    m.insert(2, "b");

    SECTION("const iteration")
    {
        auto const& cm = m;
        for (auto const& [key, value] : cm)
        {
            CHECK(&value == &m.get(key).value());
            CHECK(&key == &m.get_key_value(key).value().first);
        }
    }

    SECTION("values are writable through the binding")
    {
        for (auto [key, value] : m)
            value += std::to_string(key);

        CHECK(m[1] == "a1");
        CHECK(m[2] == "b2");
        CHECK(m[3] == "c3");
    }

    SECTION("reversed")
    {
        std::vector<int> keys;
        for (auto [key, value] : m.reversed())
        {
            keys.push_back(key);
            value.clear();
        }
        CHECK(keys == (std::vector<int>{3, 2, 1}));
        CHECK(m[2].empty());
    }

    SECTION("first and last")
    {
        auto const [k0, v0] = m.first().value();
        CHECK(k0 == 1);
        CHECK(&v0 == &m[1]);

        auto const entry = m.last().value();
        CHECK(entry.get<0>() == 3);
        CHECK(entry.get<1>() == "c");
        CHECK(&entry.second == &m[3]);
    }
}

TEST("pair - owning entries")
{
    rb::map<std::string, std::vector<int>> m;
    m.insert("x", {1, 2, 3});
    m.insert("y", {4});

    auto popped = m.pop_first();
    REQUIRE(popped.has_value());

    auto [key, value] = rb::move(popped).value();
    CHECK(key == "x");
    CHECK(value == (std::vector<int>{1, 2, 3}));
    CHECK(!m.contains_key("x"));

    auto entry = m.remove_entry("y").value();
    CHECK(entry == (rb::pair<std::string, std::vector<int>>{"y", {4}}));
    CHECK(m.empty());
}
