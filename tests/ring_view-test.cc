#include <clean-ring/assert-handler.hh>
#include <clean-ring/ring_zipper.hh>

#include <nexus/test.hh>

#include <string>
#include <vector>

TEST("ring_view - iterates every element once starting at the focus")
{
    auto z = cr::ring_zipper<int>{0, 1, 2, 3, 4};
    z.step_forwards().step_forwards();

    SECTION("original direction")
    {
        auto seen = std::vector<int>();
        for (auto const& v : z.iter())
            seen.push_back(v);
        CHECK(seen == std::vector<int>{2, 3, 4, 0, 1});
    }

    SECTION("reverse direction")
    {
        auto seen = std::vector<int>();
        for (auto const& v : z.reverse_iter())
            seen.push_back(v);
        CHECK(seen == std::vector<int>{2, 1, 0, 4, 3});
    }

    SECTION("view metadata")
    {
        auto const fw = z.iter();
        auto const bw = z.reverse_iter();
        CHECK(fw.size() == 5);
        CHECK(!fw.empty());
        CHECK(fw.direction() == cr::sequence_direction::original);
        CHECK(bw.direction() == cr::sequence_direction::reverse);
    }

    // iteration never moves the focus
    CHECK(z.focus() == 2);
}

TEST("ring_view - elements alias the zipper storage")
{
    auto z = cr::ring_zipper<std::string>{"a", "b", "c"};
    auto it = z.iter().begin();
    CHECK(&*it == &z.focus().value());
    ++it;
    CHECK(&*it == &z.ith(1).value());
}

TEST("ring_view - views are restartable and independent")
{
    auto z = cr::ring_zipper<int>{1, 2, 3};
    auto const view = z.iter();

    auto first = std::vector<int>();
    view.collect_into(first);
    auto second = std::vector<int>();
    view.collect_into(second);

    CHECK(first == std::vector<int>{1, 2, 3});
    CHECK(first == second);

    auto reversed = std::vector<int>();
    z.reverse_iter().collect_into(reversed);
    CHECK(reversed == std::vector<int>{1, 3, 2});
    CHECK(first == std::vector<int>{1, 2, 3});
}

TEST("ring_view - empty zipper yields nothing")
{
    auto const z = cr::ring_zipper<int>();
    auto const view = z.iter();
    CHECK(view.empty());
    CHECK(view.size() == 0);
    CHECK(view.begin() == view.end());

    auto count = 0;
    for (auto const& v : z.reverse_iter())
    {
        CR_UNUSED(v);
        ++count;
    }
    CHECK(count == 0);
}

TEST("ring_view - single element is yielded exactly once")
{
    auto const z = cr::ring_zipper<int>{9};

    auto fw = std::vector<int>();
    z.iter().collect_into(fw);
    auto bw = std::vector<int>();
    z.reverse_iter().collect_into(bw);

    CHECK(fw == std::vector<int>{9});
    CHECK(bw == std::vector<int>{9});
}

TEST("ring_view - iterator steps manually")
{
    auto const z = cr::ring_zipper<int>{5, 6, 7};
    auto it = z.reverse_iter().begin();

    CHECK(*it == 5);
    auto const old = it++;
    CHECK(*old == 5);
    CHECK(*it == 7);
    ++it;
    CHECK(*it == 6);
    CHECK(it != cr::sentinel{});
    ++it;
    CHECK(it == cr::sentinel{});
}

TEST("ring_view - mutating the zipper invalidates live views")
{
    auto failures = std::vector<std::string>();
    auto handler = cr::impl::scoped_assertion_handler(
        [&](cr::impl::assertion_info const& info)
        {
            failures.push_back(info.message);
            throw 0;
        });

    auto check_invalidated_by = [&](auto&& mutate)
    {
        failures.clear();

        auto z = cr::ring_zipper<int>{0, 1, 2, 3};
        auto const view = z.iter();
        auto it = view.begin();
        CHECK(*it == 0);

        mutate(z);

        try
        {
            auto const& v = *it;
            CHECK(v == -1); // unreachable
        }
        catch (int) // NOLINT(bugprone-empty-catch)
        {
        }

        REQUIRE(failures.size() == 1);
        CHECK(failures[0] == "ring_zipper was mutated while a ring_view is alive");

        // a fresh view after the mutation is valid again
        auto fresh = std::vector<int>();
        z.iter().collect_into(fresh);
        CHECK(!fresh.empty());
        CHECK(failures.size() == 1);
    };

    check_invalidated_by([](cr::ring_zipper<int>& z) { z.step_forwards(); });
    check_invalidated_by([](cr::ring_zipper<int>& z) { z.push_focus(-1); });
    check_invalidated_by([](cr::ring_zipper<int>& z) { z.reset_end(); });
    check_invalidated_by(
        [](cr::ring_zipper<int>& z)
        {
            auto const taken = z.take_current_focus();
            CHECK(taken == 0);
        });
}

TEST("ring_view - a view outliving a drain reports staleness")
{
    auto failures = std::vector<std::string>();
    auto handler = cr::impl::scoped_assertion_handler(
        [&](cr::impl::assertion_info const& info)
        {
            failures.push_back(info.message);
            throw 0;
        });

    auto z = cr::ring_zipper<int>{0, 1, 2};
    auto const view = z.iter();
    auto it = view.begin();

    auto drained = std::vector<int>();
    z.drain_into(drained);
    REQUIRE(z.empty());

    try
    {
        auto const& v = *it;
        CHECK(v == -1); // unreachable
    }
    catch (int) // NOLINT(bugprone-empty-catch)
    {
    }

    REQUIRE(failures.size() == 1);
    CHECK(failures[0] == "ring_zipper was mutated while a ring_view is alive");
}

TEST("ring_view - no-op mutations of an empty zipper keep views valid")
{
    auto z = cr::ring_zipper<int>();
    auto const view = z.iter();
    auto const generation = z.generation();

    z.reset_start();
    z.reset_end();
    z.clear();
    z.step_forwards();
    z.step_backwards();
    CHECK(!z.take_current_focus().has_value());
    CHECK(!z.take_previous_focus().has_value());

    CHECK(z.generation() == generation);
    CHECK(view.empty());
    CHECK(view.begin() == view.end());
}

TEST("ring_view - read-only operations keep views valid")
{
    auto failures = 0;
    auto handler = cr::impl::scoped_assertion_handler(
        [&](cr::impl::assertion_info const&)
        {
            ++failures;
            throw 0;
        });

    auto z = cr::ring_zipper<int>{0, 1, 2};
    auto const view = z.iter();

    auto const prev = z.ith(-1);
    auto const f = z.focus();
    auto const s = z.to_string();
    auto inner = std::vector<int>();
    z.reverse_iter().collect_into(inner);

    auto seen = std::vector<int>();
    view.collect_into(seen);

    CHECK(prev == 2);
    CHECK(f == 0);
    CHECK(s == "[0, 1, 2]");
    CHECK(seen == std::vector<int>{0, 1, 2});
    CHECK(failures == 0);
}
