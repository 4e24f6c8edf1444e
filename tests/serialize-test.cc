#include <linear-core/serialize.hh>

#include <nexus/test.hh>

#include <any>
#include <string>
#include <vector>

namespace
{
// In-memory sequence archive storing type-erased elements
struct AnyArchive
{
    std::vector<std::any> elements;
    lc::isize announced_count = -1;
    int open_sequences = 0;
    bool report_count = true;

    // writer
    void begin_sequence(lc::isize count)
    {
        announced_count = count;
        ++open_sequences;
    }

    template <class E>
    void write_element(E const& e)
    {
        elements.emplace_back(e);
    }

    void end_sequence() { --open_sequences; }

    // reader
    lc::optional<lc::isize> begin_sequence()
    {
        ++open_sequences;
        if (!report_count)
            return {};
        return lc::isize(elements.size());
    }

    template <class E>
    lc::optional<E> read_element()
    {
        if (read_pos >= elements.size())
            return {};
        return std::any_cast<E>(elements[read_pos++]);
    }

    size_t read_pos = 0;
};
} // namespace

TEST("serialize - map writes pairs in storage order")
{
    lc::map<std::string, int> m;
    m.insert("b", 2);
    m.insert("a", 1);
    m.insert("c", 3);

    AnyArchive ar;
    lc::serialize(ar, m);

    CHECK(ar.announced_count == 3);
    CHECK(ar.open_sequences == 0);
    REQUIRE(ar.elements.size() == 3);

    auto const first = std::any_cast<lc::pair<std::string, int>>(ar.elements[0]);
    CHECK(first.first == "b");
    CHECK(first.second == 2);

    auto const last = std::any_cast<lc::pair<std::string, int>>(ar.elements[2]);
    CHECK(last.first == "c");
}

TEST("serialize - map round-trip")
{
    SECTION("empty")
    {
        lc::map<int, std::string> m;

        AnyArchive ar;
        lc::serialize(ar, m);
        auto const back = lc::deserialize<lc::map<int, std::string>>(ar);

        CHECK(back.empty());
        CHECK(back == m);
        CHECK(ar.open_sequences == 0);
    }

    SECTION("non-empty after removals")
    {
        lc::map<int, std::string> m;
        for (auto i = 0; i < 20; ++i)
            m.insert(i, std::to_string(i));
        for (auto i = 0; i < 20; i += 3)
            m.remove(i);

        AnyArchive ar;
        lc::serialize(ar, m);
        auto const back = lc::deserialize<lc::map<int, std::string>>(ar);

        CHECK(back == m);
        CHECK(back.capacity() >= back.size());
    }
}

TEST("serialize - map deserialization applies last write wins")
{
    AnyArchive ar;
    ar.elements.emplace_back(lc::pair<int, int>{1, 10});
    ar.elements.emplace_back(lc::pair<int, int>{2, 20});
    ar.elements.emplace_back(lc::pair<int, int>{1, 30});

    auto const m = lc::deserialize<lc::map<int, int>>(ar);

    CHECK(m.size() == 2);
    CHECK(m.get(1).value() == 30);
    CHECK(m.entries()[0].first == 1);
}

TEST("serialize - reader without size hint")
{
    AnyArchive ar;
    ar.report_count = false;
    ar.elements.emplace_back(std::string("x"));
    ar.elements.emplace_back(std::string("y"));

    auto const s = lc::deserialize<lc::set<std::string>>(ar);

    CHECK(s.size() == 2);
    CHECK(s.contains("x"));
    CHECK(s.contains("y"));
}

TEST("serialize - set round-trip")
{
    SECTION("empty")
    {
        lc::set<int> s;

        AnyArchive ar;
        lc::serialize(ar, s);
        CHECK(ar.announced_count == 0);
        CHECK(ar.elements.empty());

        auto const back = lc::deserialize<lc::set<int>>(ar);
        CHECK(back.empty());
        CHECK(back == s);
        CHECK(ar.open_sequences == 0);
    }

    SECTION("non-empty after removals")
    {
        lc::set<int> s = {4, 8, 15, 16, 23, 42};
        s.remove(15);

        AnyArchive ar;
        lc::serialize(ar, s);

        CHECK(ar.announced_count == 5);
        REQUIRE(ar.elements.size() == 5);
        CHECK(std::any_cast<int>(ar.elements[0]) == 4);

        auto const back = lc::deserialize<lc::set<int>>(ar);
        CHECK(back == s);
        CHECK(ar.open_sequences == 0);
    }
}

TEST("serialize - set deserialization drops duplicates")
{
    AnyArchive ar;
    for (auto v : {3, 1, 3, 2, 1})
        ar.elements.emplace_back(v);

    auto const s = lc::deserialize<lc::set<int>>(ar);

    CHECK(s.size() == 3);
    CHECK(s == lc::set<int>({1, 2, 3}));
}

TEST("serialize - archive errors propagate out of deserialize")
{
    AnyArchive ar;
    ar.elements.emplace_back(lc::pair<std::string, int>{"ok", 1});
    ar.elements.emplace_back(42); // wrong element type, the archive throws

    auto threw = false;
    try
    {
        auto const m = lc::deserialize<lc::map<std::string, int>>(ar);
        CHECK(m.empty()); // unreachable
    }
    catch (std::bad_any_cast const&)
    {
        threw = true;
    }

    CHECK(threw);
    CHECK(ar.read_pos == 2);
}
