#include <linear-core/assert-handler.hh>
#include <linear-core/assertf.hh>
#include <linear-core/map.hh>
#include <linear-core/optional.hh>
#include <linear-core/vector.hh>

#include <nexus/test.hh>

#include <optional>
#include <string>
#include <vector>

namespace
{
// runs f and swallows the int thrown by the capturing handlers below
template <class F>
void expect_failure(F&& f)
{
    try
    {
        f();
    }
    catch (int) // NOLINT(bugprone-empty-catch)
    {
    }
}

// formats the missing key like a lookup helper of a user would
int const& lookup_or_fail(lc::map<int, int> const& m, int key)
{
    auto const v = m.get(key);
    LC_ASSERTF_ALWAYS(v.has_value(), "key {} not in a map of {} entries", key, m.size());
    return v.value();
}
} // namespace

TEST("assertions - report carries expression, formatted message, and call site")
{
    lc::map<int, int> const m = {{1, 10}, {2, 20}};
    std::optional<lc::impl::assertion_info> captured;

    {
        auto handler = lc::impl::scoped_assertion_handler(
            [&](lc::impl::assertion_info const& info)
            {
                captured = info;
                throw 0; // Must throw to prevent abort
            });

        CHECK(lookup_or_fail(m, 2) == 20);
        CHECK(!captured.has_value());

        expect_failure([&] { (void)lookup_or_fail(m, 7); });
    }

    REQUIRE(captured.has_value());
    CHECK(captured->expression.find("has_value") != std::string::npos);
    CHECK(captured->message == "key 7 not in a map of 2 entries");
    CHECK(std::string(captured->location.file_name()).ends_with("assert-test.cc"));
    CHECK(std::string(captured->location.function_name()).find("lookup_or_fail") != std::string::npos);
}

TEST("assertions - message arguments are only evaluated on failure")
{
    auto evaluated = 0;
    auto describe = [&]
    {
        ++evaluated;
        return std::string("expensive");
    };

    auto failures = 0;
    auto handler = lc::impl::scoped_assertion_handler(
        [&](lc::impl::assertion_info const&)
        {
            ++failures;
            throw 0;
        });

    LC_ASSERTF_ALWAYS(1 < 2, "{}", describe());
    CHECK(evaluated == 0);

    expect_failure([&] { LC_ASSERTF_ALWAYS(2 < 1, "{}", describe()); });
    CHECK(evaluated == 1);
    CHECK(failures == 1);
}

TEST("assertions - innermost handler wins and is popped on scope exit")
{
    std::vector<std::string> seen;

    auto outer = lc::impl::scoped_assertion_handler(
        [&](lc::impl::assertion_info const& info)
        {
            seen.push_back("outer: " + info.message);
            throw 0;
        });

    struct inner_failure
    {
    };

    try
    {
        auto inner = lc::impl::scoped_assertion_handler(
            [&](lc::impl::assertion_info const& info)
            {
                seen.push_back("inner: " + info.message);
                throw inner_failure{};
            });

        LC_ASSERT_ALWAYS(false, "first");
        CHECK(false); // unreachable
    }
    catch (inner_failure const&) // NOLINT(bugprone-empty-catch)
    {
    }

    // the inner handler left the stack while unwinding
    expect_failure([] { LC_ASSERT_ALWAYS(false, "second"); });

    REQUIRE(seen.size() == 2);
    CHECK(seen[0] == "inner: first");
    CHECK(seen[1] == "outer: second");
}

TEST("assertions - container precondition violations reach the handler")
{
    std::vector<std::string> messages;

    auto handler = lc::impl::scoped_assertion_handler(
        [&](lc::impl::assertion_info const& info)
        {
            messages.push_back(info.message);
            throw 0;
        });

#if LC_ASSERT_ENABLED
    lc::map<int, int> m = {{1, 10}};
    lc::map<int, int> const& cm = m;
    expect_failure([&] { (void)cm[2]; });

    lc::optional<int> empty;
    expect_failure([&] { (void)empty.value(); });

    lc::vector<int> v;
    expect_failure([&] { (void)v[0]; });

    expect_failure([&] { (void)m.entry(1).vacant(); });

    REQUIRE(messages.size() == 4);
    CHECK(messages[0] == "no entry found for key");
    CHECK(messages[1] == "attempted to access value of empty optional");
    CHECK(messages[2] == "index out of bounds");
    CHECK(messages[3] == "vacant() called on an occupied entry");

    // the failed calls left everything intact and released the cursor
    CHECK(cm[1] == 10);
    m.insert(2, 20);
    CHECK(m.size() == 2);
#endif

    // always-on assertions fire regardless of the build type
    expect_failure([] { LC_ASSERT_ALWAYS(1 + 1 == 3, "arithmetic"); });
    CHECK(messages.back() == "arithmetic");
}
