#include <catch2/catch.hpp>
#include "arena.hpp"

#include <string>
#include <unordered_set>

struct test_ht : handle_t<test_ht> {};
DEF_HANDLE_HASH(test_ht)

struct test_t
{
    test_ht self;
    std::string name;
};

TEST_CASE("arena_alloc", "[arena]")
{
    arena_t<test_t, test_ht> arena;
    REQUIRE(arena.size() == 0);
    REQUIRE(arena.array_size() == 1);

    test_ht const a = arena.alloc_with([](test_ht h) { return test_t{ h, "a" }; });
    test_ht const b = arena.alloc_with([](test_ht h) { return test_t{ h, "b" }; });

    REQUIRE(a);
    REQUIRE(b);
    REQUIRE(a != b);
    REQUIRE(arena.size() == 2);

    // Values see their own handle.
    REQUIRE(arena.get(a).self == a);
    REQUIRE(arena.get(b).self == b);
    REQUIRE(arena.get(a).name == "a");
    REQUIRE(arena.get(b).name == "b");
}

TEST_CASE("arena_stable_references", "[arena]")
{
    arena_t<test_t, test_ht> arena;
    test_ht const a = arena.alloc_with([](test_ht h) { return test_t{ h, "first" }; });
    test_t const* ptr = &arena.get(a);

    for(unsigned i = 0; i < 1000; ++i)
        arena.alloc_with([](test_ht h) { return test_t{ h, "filler" }; });

    REQUIRE(ptr == &arena.get(a));
    REQUIRE(ptr->name == "first");
}

TEST_CASE("arena_null_handle", "[arena]")
{
    arena_t<test_t, test_ht> arena;
    test_ht const null = {};

    REQUIRE(!null);
    REQUIRE(!arena.valid(null));
    REQUIRE(arena.try_get(null) == nullptr);
    REQUIRE(!arena.dealloc(null));
    REQUIRE_THROWS_AS(arena.get(null), ir_error_t);
}

TEST_CASE("arena_dealloc_twice", "[arena]")
{
    arena_t<test_t, test_ht> arena;
    test_ht const a = arena.alloc_with([](test_ht h) { return test_t{ h, "a" }; });

    std::optional<test_t> freed = arena.dealloc(a);
    REQUIRE(freed);
    REQUIRE(freed->name == "a");
    REQUIRE(arena.size() == 0);

    // Every further call reports absence.
    for(unsigned i = 0; i < 3; ++i)
        REQUIRE(!arena.dealloc(a));
    REQUIRE(arena.size() == 0);
}

TEST_CASE("arena_stale_handle", "[arena]")
{
    arena_t<test_t, test_ht> arena;
    test_ht const a = arena.alloc_with([](test_ht h) { return test_t{ h, "a" }; });
    REQUIRE(arena.dealloc(a));

    // The slot gets reused, but with a new generation.
    test_ht const b = arena.alloc_with([](test_ht h) { return test_t{ h, "b" }; });
    REQUIRE(b.index == a.index);
    REQUIRE(b.gen != a.gen);

    REQUIRE(!arena.valid(a));
    REQUIRE(arena.try_get(a) == nullptr);
    REQUIRE(!arena.dealloc(a));
    REQUIRE(arena.get(b).name == "b");

    try
    {
        arena.get(a);
        FAIL("expected an error");
    }
    catch(ir_error_t const& e)
    {
        REQUIRE(e.kind == IR_ERROR_INVALID_POINTER);
    }
}

TEST_CASE("arena_alloc_throws", "[arena]")
{
    arena_t<test_t, test_ht> arena;

    REQUIRE_THROWS(arena.alloc_with([](test_ht h) -> test_t { throw std::runtime_error("no"); }));
    REQUIRE(arena.size() == 0);
    REQUIRE(arena.array_size() == 1);

    test_ht const a = arena.alloc_with([](test_ht h) { return test_t{ h, "a" }; });
    REQUIRE(arena.get(a).self == a);
}

TEST_CASE("arena_for_each_handle", "[arena]")
{
    arena_t<test_t, test_ht> arena;
    std::unordered_set<test_ht> live;

    for(unsigned i = 0; i < 10; ++i)
        live.insert(arena.alloc_with([](test_ht h) { return test_t{ h, "" }; }));

    unsigned n = 0;
    for(test_ht h : std::unordered_set<test_ht>(live))
    {
        if(n++ % 3 != 0)
            continue;
        REQUIRE(arena.dealloc(h));
        live.erase(h);
    }

    std::unordered_set<test_ht> seen;
    arena.for_each_handle([&](test_ht h) { seen.insert(h); });
    REQUIRE(seen == live);
    REQUIRE(arena.size() == live.size());
}
