#include <linear-core/map.hh>
#include <linear-core/vector.hh>

#include <nexus/test.hh>

#include <string>
#include <utility>
#include <vector>

namespace
{
// Key whose equality only looks at `id`; `tag` tells apart equal keys
struct TaggedKey
{
    int id = 0;
    int tag = 0;

    bool operator==(TaggedKey const& rhs) const { return id == rhs.id; }
    bool operator==(int rhs) const { return id == rhs; }
};

// Value that counts live instances
struct Counted
{
    int value = 0;
    static inline int alive = 0;

    Counted() { ++alive; }
    explicit Counted(int v) : value(v) { ++alive; }
    Counted(Counted const& rhs) : value(rhs.value) { ++alive; }
    Counted(Counted&& rhs) noexcept : value(rhs.value) { ++alive; }
    Counted& operator=(Counted const&) = default;
    Counted& operator=(Counted&&) noexcept = default;
    ~Counted() { --alive; }

    bool operator==(Counted const& rhs) const { return value == rhs.value; }
};

struct MoveOnly
{
    int value = 0;

    explicit MoveOnly(int v) : value(v) {}
    MoveOnly(MoveOnly&&) = default;
    MoveOnly& operator=(MoveOnly&&) = default;
    MoveOnly(MoveOnly const&) = delete;
    MoveOnly& operator=(MoveOnly const&) = delete;
};

template <class T>
std::vector<T> seq(std::initializer_list<T> values)
{
    return std::vector<T>(values);
}

template <class K, class V>
std::vector<K> keys_in_order(lc::map<K, V> const& m)
{
    std::vector<K> r;
    for (auto const& k : m.keys())
        r.push_back(k);
    return r;
}
} // namespace

TEST("map - default construction invariants")
{
    lc::map<int, int> m;

    CHECK(m.size() == 0);
    CHECK(m.empty());
    CHECK(m.capacity() == 0);
    CHECK(m.resource() == nullptr);
    CHECK(m.keys().empty());
    CHECK(!m.get(1).has_value());
    CHECK(!m.contains_key(1));
}

TEST("map - create_with_capacity reserves without adding pairs")
{
    SECTION("capacity 0")
    {
        auto m = lc::map<int, int>::create_with_capacity(0);
        CHECK(m.empty());
        CHECK(m.capacity() == 0);
    }

    SECTION("capacity 16")
    {
        auto m = lc::map<int, int>::create_with_capacity(16);
        CHECK(m.empty());
        CHECK(m.capacity() >= 16);

        for (auto i = 0; i < 16; ++i)
            m.insert(i, i * i);

        CHECK(m.size() == 16);
        CHECK(m.capacity() >= 16);
    }
}

TEST("map - insert and get")
{
    lc::map<std::string, int> m;

    SECTION("insert new key returns empty")
    {
        auto const prev = m.insert("a", 1);
        CHECK(!prev.has_value());
        CHECK(m.size() == 1);
        REQUIRE(m.get("a").has_value());
        CHECK(m.get("a").value() == 1);
    }

    SECTION("insert replaces and returns previous value")
    {
        m.insert("a", 1);
        m.insert("b", 2);

        auto const prev = m.insert("a", 10);
        REQUIRE(prev.has_value());
        CHECK(prev.value() == 1);
        CHECK(m.size() == 2);
        CHECK(m.get("a").value() == 10);
    }

    SECTION("replacing keeps the position")
    {
        m.insert("a", 1);
        m.insert("b", 2);
        m.insert("c", 3);
        m.insert("a", 4);

        CHECK(keys_in_order(m) == seq<std::string>({"a", "b", "c"}));
    }

    SECTION("get on missing key is empty")
    {
        m.insert("a", 1);
        CHECK(!m.get("z").has_value());
        CHECK(!m.get("").has_value());
    }

    SECTION("mutable get writes through")
    {
        m.insert("a", 1);
        m.get("a").value() += 41;
        CHECK(m.get("a").value() == 42);
    }
}

TEST("map - no duplicates after many inserts")
{
    lc::map<int, int> m;
    for (auto round = 0; round < 4; ++round)
        for (auto k = 0; k < 25; ++k)
            m.insert(k % 10, round);

    CHECK(m.size() == 10);
    for (auto k = 0; k < 10; ++k)
        CHECK(m.get(k).value() == 3);
}

TEST("map - insert keeps the stored key")
{
    lc::map<TaggedKey, int> m;
    m.insert(TaggedKey{1, 100}, 1);
    m.insert(TaggedKey{1, 200}, 2);

    REQUIRE(m.size() == 1);
    auto const kv = m.get_key_value(1);
    REQUIRE(kv.has_value());
    CHECK(kv.value().first.tag == 100);
    CHECK(kv.value().second == 2);
}

TEST("map - heterogeneous lookup")
{
    lc::map<std::string, int> m;
    m.insert("hello", 1);

    char const* literal = "hello";
    CHECK(m.contains_key(literal));
    CHECK(m.contains_key(std::string_view("hello")));
    CHECK(m.get("hello").value() == 1);
    CHECK(m.remove(std::string_view("hello")).value() == 1);
    CHECK(m.empty());
}

TEST("map - contains_key")
{
    lc::map<int, std::string> m = {{1, "one"}, {2, "two"}};

    CHECK(m.contains_key(1));
    CHECK(m.contains_key(2));
    CHECK(!m.contains_key(3));
}

TEST("map - remove")
{
    lc::map<int, std::string> m;
    m.insert(1, "one");
    m.insert(2, "two");
    m.insert(3, "three");
    m.insert(4, "four");

    SECTION("remove then get is empty")
    {
        auto const v = m.remove(2);
        REQUIRE(v.has_value());
        CHECK(v.value() == "two");
        CHECK(!m.get(2).has_value());
        CHECK(m.size() == 3);
    }

    SECTION("remove missing key changes nothing")
    {
        auto const v = m.remove(7);
        CHECK(!v.has_value());
        CHECK(m.size() == 4);
        CHECK(keys_in_order(m) == seq({1, 2, 3, 4}));
    }

    SECTION("remove moves the last pair into the hole")
    {
        m.remove(1);
        // 4 took the first slot: order is not preserved
        CHECK(keys_in_order(m) == seq({4, 2, 3}));
        CHECK(keys_in_order(m) != seq({2, 3, 4}));
    }

    SECTION("remove last pair keeps the rest in place")
    {
        m.remove(4);
        CHECK(keys_in_order(m) == seq({1, 2, 3}));
    }

    SECTION("remove_entry returns the stored key")
    {
        auto const e = m.remove_entry(3);
        REQUIRE(e.has_value());
        CHECK(e.value().first == 3);
        CHECK(e.value().second == "three");
        CHECK(!m.remove_entry(3).has_value());
    }

    SECTION("remove everything")
    {
        for (auto k = 1; k <= 4; ++k)
            CHECK(m.remove(k).has_value());
        CHECK(m.empty());
    }
}

TEST("map - retain")
{
    lc::map<int, int> m;
    for (auto i = 0; i < 10; ++i)
        m.insert(i, i * 10);

    SECTION("keeps matching pairs in order")
    {
        m.retain([](int const& k, int&) { return k % 3 == 0; });
        CHECK(keys_in_order(m) == seq({0, 3, 6, 9}));
    }

    SECTION("visits every pair once and may modify values")
    {
        auto calls = 0;
        m.retain(
            [&](int const&, int& v)
            {
                ++calls;
                v += 1;
                return v > 50;
            });
        CHECK(calls == 10);
        CHECK(keys_in_order(m) == seq({5, 6, 7, 8, 9}));
        CHECK(m.get(5).value() == 51);
    }

    SECTION("retain all and retain none")
    {
        m.retain([](int const&, int&) { return true; });
        CHECK(m.size() == 10);

        m.retain([](int const&, int&) { return false; });
        CHECK(m.empty());
    }
}

TEST("map - retain destroys removed values")
{
    Counted::alive = 0;
    {
        lc::map<int, Counted> m;
        for (auto i = 0; i < 6; ++i)
            m.insert(i, Counted(i));
        CHECK(Counted::alive == 6);

        m.retain([](int const& k, Counted&) { return k < 2; });
        CHECK(Counted::alive == 2);

        m.remove(0);
        CHECK(Counted::alive == 1);

        m.clear();
        CHECK(Counted::alive == 0);
        CHECK(m.capacity() > 0);
    }
    CHECK(Counted::alive == 0);
}

TEST("map - equality is order independent")
{
    lc::map<int, std::string> a;
    a.insert(1, "one");
    a.insert(2, "two");
    a.insert(3, "three");

    lc::map<int, std::string> b;
    b.insert(3, "three");
    b.insert(1, "one");
    b.insert(2, "two");

    CHECK(a == b);
    CHECK(b == a);

    SECTION("different value")
    {
        b.insert(2, "TWO");
        CHECK(a != b);
    }

    SECTION("different size")
    {
        b.insert(4, "four");
        CHECK(a != b);
    }

    SECTION("same size, different key")
    {
        b.remove(3);
        b.insert(5, "three");
        CHECK(a != b);
    }

    SECTION("empty maps")
    {
        CHECK(lc::map<int, std::string>() == lc::map<int, std::string>());
        CHECK(a != lc::map<int, std::string>());
    }
}

TEST("map - iteration")
{
    lc::map<std::string, int> m;
    m.insert("x", 1);
    m.insert("y", 2);
    m.insert("z", 3);

    SECTION("pairs in storage order")
    {
        std::vector<std::pair<std::string, int>> seen;
        for (auto&& [k, v] : m)
            seen.emplace_back(k, v);

        using kv = std::pair<std::string, int>;
        CHECK(seen == seq<kv>({{"x", 1}, {"y", 2}, {"z", 3}}));
    }

    SECTION("values are mutable through iteration")
    {
        for (auto&& [k, v] : m)
            v *= 10;

        CHECK(m.get("y").value() == 20);
    }

    SECTION("iteration is restartable")
    {
        auto count = 0;
        for (auto&& kv : m)
        {
            (void)kv;
            ++count;
        }
        for (auto&& kv : m)
        {
            (void)kv;
            ++count;
        }
        CHECK(count == 6);
    }

    SECTION("keys and values views")
    {
        auto const& cm = m;
        CHECK(cm.keys().size() == 3);
        CHECK(cm.values().size() == 3);

        auto sum = 0;
        for (auto v : cm.values())
            sum += v;
        CHECK(sum == 6);

        for (auto& v : m.values())
            v = 0;
        CHECK(m.get("z").value() == 0);
    }

    SECTION("entries span")
    {
        auto const e = m.entries();
        REQUIRE(e.size() == 3);
        CHECK(e[0].first == "x");
        CHECK(e[2].second == 3);
    }
}

TEST("map - conversions")
{
    SECTION("initializer list: last write wins")
    {
        lc::map<int, int> m = {{1, 1}, {2, 2}, {1, 3}};
        CHECK(m.size() == 2);
        CHECK(m.get(1).value() == 3);
        CHECK(keys_in_order(m) == seq({1, 2}));
    }

    SECTION("create_from std::vector of std::pair")
    {
        std::vector<std::pair<std::string, int>> src = {{"a", 1}, {"b", 2}, {"a", 5}};
        auto m = lc::map<std::string, int>::create_from(src);

        CHECK(m.size() == 2);
        CHECK(m.get("a").value() == 5);
        CHECK(m.capacity() == 2);
        CHECK(src[0].first == "a"); // lvalue source is copied
    }

    SECTION("create_from rvalue moves elements")
    {
        std::vector<std::pair<int, MoveOnly>> src;
        src.emplace_back(1, MoveOnly(10));
        src.emplace_back(2, MoveOnly(20));

        auto m = lc::map<int, MoveOnly>::create_from(std::move(src));
        CHECK(m.size() == 2);
        CHECK(m.get(2).value().value == 20);
    }

    SECTION("extend")
    {
        lc::map<int, int> m = {{1, 1}};
        m.extend(std::vector<std::pair<int, int>>{{2, 2}, {1, 10}});
        CHECK(m.size() == 2);
        CHECK(m.get(1).value() == 10);
    }

    SECTION("extract_entries in storage order")
    {
        lc::map<int, std::string> m = {{3, "c"}, {1, "a"}, {2, "b"}};
        auto entries = std::move(m).extract_entries();

        REQUIRE(entries.size() == 3);
        CHECK(entries[0].first == 3);
        CHECK(entries[1].second == "a");
        CHECK(entries[2].first == 2);
        CHECK(m.empty()); // NOLINT(bugprone-use-after-move)
    }
}

TEST("map - capacity management")
{
    lc::map<int, int> m;

    m.reserve(10);
    CHECK(m.capacity() >= 10);
    CHECK(m.empty());

    m.insert(1, 1);
    m.insert(2, 2);
    m.shrink_to_fit();
    CHECK(m.capacity() == 2);
    CHECK(m.get(2).value() == 2);

    m.clear();
    CHECK(m.empty());
    m.shrink_to_fit();
    CHECK(m.capacity() == 0);
}

TEST("map - copy and move semantics")
{
    lc::map<int, std::string> a = {{1, "one"}, {2, "two"}};

    SECTION("copy is deep")
    {
        auto b = a;
        b.insert(1, "uno");
        CHECK(a.get(1).value() == "one");
        CHECK(b.get(1).value() == "uno");
    }

    SECTION("move leaves source empty")
    {
        auto b = std::move(a);
        CHECK(b.size() == 2);
        CHECK(a.empty()); // NOLINT(bugprone-use-after-move)
    }

    SECTION("nested maps")
    {
        lc::map<int, lc::map<int, int>> outer;
        outer.insert(1, lc::map<int, int>{{10, 100}});
        outer.insert(2, lc::map<int, int>{{20, 200}});

        // assign from a value that lives inside the same map
        outer.get(1).value() = std::move(outer.get(2).value());
        CHECK(outer.get(1).value().get(20).value() == 200);
    }
}

TEST("map - const operator[]")
{
    lc::map<std::string, int> const m = {{"a", 1}, {"b", 2}};

    CHECK(m["a"] == 1);
    CHECK(m["b"] == 2);
}
