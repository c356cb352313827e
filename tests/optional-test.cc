#include <clean-ring/optional.hh>

#include <nexus/test.hh>

#include <memory>
#include <string>

// optional stays trivial
static_assert(std::is_constructible_v<cr::optional<int>>);
static_assert(std::is_constructible_v<cr::optional<int>, int>);
static_assert(std::is_constructible_v<cr::optional<int>, cr::nullopt_t>);
static_assert(std::is_trivially_copyable_v<cr::optional<int>>);
static_assert(std::is_trivially_destructible_v<cr::optional<int>>);

// optional references are pointer-like
static_assert(std::is_trivially_copyable_v<cr::optional<int&>>);
static_assert(sizeof(cr::optional<std::string const&>) == sizeof(void*));
static_assert(std::is_constructible_v<cr::optional<int const&>, cr::optional<int&>>);
static_assert(!std::is_constructible_v<cr::optional<int&>, cr::optional<int const&>>);
static_assert(!std::is_constructible_v<cr::optional<int const&>, int&&>);

namespace
{
// counting type to track special member function calls
struct counting_type
{
    int value = 0;

    static inline int value_ctor_count = 0;
    static inline int copy_ctor_count = 0;
    static inline int move_ctor_count = 0;
    static inline int dtor_count = 0;

    static void reset_counters()
    {
        value_ctor_count = 0;
        copy_ctor_count = 0;
        move_ctor_count = 0;
        dtor_count = 0;
    }

    explicit counting_type(int v) : value(v) { ++value_ctor_count; }

    counting_type(counting_type const& rhs) : value(rhs.value) { ++copy_ctor_count; }
    counting_type(counting_type&& rhs) noexcept : value(rhs.value) { ++move_ctor_count; }

    counting_type& operator=(counting_type const& rhs) = default;
    counting_type& operator=(counting_type&& rhs) noexcept = default;

    ~counting_type() { ++dtor_count; }

    friend bool operator==(counting_type const&, counting_type const&) = default;
};

// move-only type for testing
struct move_only
{
    int value = 0;

    explicit move_only(int v) : value(v) {}

    move_only(move_only const&) = delete;
    move_only(move_only&& rhs) noexcept : value(rhs.value) { rhs.value = -1; }
    move_only& operator=(move_only const&) = delete;
    move_only& operator=(move_only&& rhs) noexcept
    {
        value = rhs.value;
        rhs.value = -1;
        return *this;
    }
};
} // namespace

TEST("optional - trivial types")
{
    SECTION("default and nullopt are empty")
    {
        CHECK(!cr::optional<int>{}.has_value());
        CHECK(!cr::optional<int>{cr::nullopt}.has_value());
        CHECK(cr::optional<int>{} == cr::nullopt);
    }

    SECTION("value construction and assignment")
    {
        auto opt = cr::optional<int>{42};
        CHECK(opt.has_value());
        CHECK(opt.value() == 42);

        opt = 7;
        CHECK(opt.value() == 7);

        opt = cr::nullopt;
        CHECK(!opt.has_value());
    }

    SECTION("trivial types remain engaged after move")
    {
        auto opt1 = cr::optional<int>{42};
        auto const opt2 = cr::move(opt1);
        CHECK(opt2.value() == 42);
        CHECK(opt1.has_value());
    }

    SECTION("value_or")
    {
        CHECK(cr::optional<int>{}.value_or(5) == 5);
        CHECK(cr::optional<int>{3}.value_or(5) == 3);
    }

    SECTION("reset")
    {
        auto opt = cr::optional<int>{1};
        opt.reset();
        CHECK(!opt.has_value());
    }
}

TEST("optional - special member functions of non-trivial types")
{
    SECTION("empty optional constructs nothing")
    {
        counting_type::reset_counters();
        {
            auto const opt = cr::optional<counting_type>{};
            CHECK(!opt.has_value());
        }
        CHECK(counting_type::value_ctor_count == 0);
        CHECK(counting_type::dtor_count == 0);
    }

    SECTION("value construction moves the temporary in")
    {
        counting_type::reset_counters();
        {
            auto const opt = cr::optional<counting_type>{counting_type{42}};
            CHECK(opt.value().value == 42);
        }
        CHECK(counting_type::value_ctor_count == 1);
        CHECK(counting_type::move_ctor_count == 1);
        CHECK(counting_type::copy_ctor_count == 0);
        CHECK(counting_type::dtor_count == 2);
    }

    SECTION("copy construction copies once")
    {
        auto const opt1 = cr::optional<counting_type>{counting_type{1}};
        counting_type::reset_counters();
        {
            auto const opt2 = opt1;
            CHECK(opt2 == opt1);
        }
        CHECK(counting_type::copy_ctor_count == 1);
        CHECK(counting_type::dtor_count == 1);
    }

    SECTION("move construction empties the source")
    {
        auto opt1 = cr::optional<counting_type>{counting_type{1}};
        counting_type::reset_counters();
        auto const opt2 = cr::move(opt1);
        CHECK(opt2.value().value == 1);
        CHECK(!opt1.has_value());
        CHECK(counting_type::move_ctor_count == 1);
        CHECK(counting_type::dtor_count == 1);
    }

    SECTION("move assignment empties the source")
    {
        auto opt1 = cr::optional<counting_type>{counting_type{1}};
        auto opt2 = cr::optional<counting_type>{counting_type{2}};
        opt2 = cr::move(opt1);
        CHECK(opt2.value().value == 1);
        CHECK(!opt1.has_value());

        opt2 = cr::optional<counting_type>{};
        CHECK(!opt2.has_value());
    }

    SECTION("emplace replaces the value in place")
    {
        auto opt = cr::optional<counting_type>{counting_type{1}};
        counting_type::reset_counters();
        auto& v = opt.emplace(5);
        CHECK(&v == &opt.value());
        CHECK(v.value == 5);
        CHECK(counting_type::dtor_count == 1);
        CHECK(counting_type::value_ctor_count == 1);
        CHECK(counting_type::move_ctor_count == 0);
    }

    SECTION("reset destroys the value")
    {
        auto opt = cr::optional<counting_type>{counting_type{1}};
        counting_type::reset_counters();
        opt.reset();
        CHECK(counting_type::dtor_count == 1);
        opt.reset();
        CHECK(counting_type::dtor_count == 1);
    }
}

TEST("optional - move-only types")
{
    SECTION("move out via rvalue value()")
    {
        auto opt = cr::optional<move_only>{move_only{42}};
        auto moved = cr::move(opt).value();
        CHECK(moved.value == 42);
        CHECK(opt.value().value == -1);
    }

    SECTION("unique_ptr")
    {
        auto opt = cr::optional<std::unique_ptr<int>>{std::make_unique<int>(42)};
        CHECK(*opt.value() == 42);

        auto opt2 = cr::move(opt);
        CHECK(*opt2.value() == 42);
        CHECK(!opt.has_value());
    }

    SECTION("value_or on rvalue moves")
    {
        auto opt = cr::optional<std::string>{std::string(64, 'x')};
        auto s = cr::move(opt).value_or("fallback");
        CHECK(s.size() == 64);
    }
}

TEST("optional - equality")
{
    auto const empty = cr::optional<std::string>{};
    auto const a = cr::optional<std::string>{"a"};
    auto const a2 = cr::optional<std::string>{"a"};
    auto const b = cr::optional<std::string>{"b"};

    CHECK(empty == cr::optional<std::string>{});
    CHECK(empty != a);
    CHECK(a != empty);
    CHECK(a == a2);
    CHECK(a != b);

    CHECK(a == std::string("a"));
    CHECK(empty != std::string("a"));
    CHECK(empty == cr::nullopt);
    CHECK(a != cr::nullopt);
}

TEST("optional - references")
{
    SECTION("empty reference")
    {
        auto const opt = cr::optional<int&>{};
        CHECK(!opt.has_value());
        CHECK(opt == cr::nullopt);
        CHECK(opt.value_or(3) == 3);
    }

    SECTION("refers to the original object")
    {
        int x = 1;
        auto const opt = cr::optional<int&>{x};
        REQUIRE(opt.has_value());
        CHECK(&opt.value() == &x);

        opt.value() = 5;
        CHECK(x == 5);
    }

    SECTION("assignment rebinds")
    {
        int x = 1;
        int y = 2;
        auto opt = cr::optional<int&>{x};
        opt = cr::optional<int&>{y};
        CHECK(&opt.value() == &y);
        CHECK(x == 1);
    }

    SECTION("mutable converts to const")
    {
        auto s = std::string("ring");
        auto const mut = cr::optional<std::string&>{s};
        cr::optional<std::string const&> const view = mut;
        CHECK(&view.value() == &s);

        cr::optional<std::string const&> const none = cr::optional<std::string&>{};
        CHECK(!none.has_value());
    }

    SECTION("equality compares referenced values")
    {
        int x = 4;
        int y = 4;
        int z = 5;
        CHECK(cr::optional<int&>{x} == cr::optional<int&>{y});
        CHECK(cr::optional<int&>{x} != cr::optional<int&>{z});
        CHECK(cr::optional<int&>{x} == 4);
        CHECK(cr::optional<int const&>{z} == 5);
        CHECK(cr::optional<int&>{} != 4);
        CHECK(cr::optional<int&>{} == cr::optional<int&>{});
    }

    SECTION("reset unbinds")
    {
        int x = 1;
        auto opt = cr::optional<int&>{x};
        opt.reset();
        CHECK(!opt.has_value());
        CHECK(x == 1);
    }
}
