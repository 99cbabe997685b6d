#include <catch2/catch.hpp>
#include "intrusive.hpp"

#include <algorithm>
#include <cstdlib>
#include <vector>

#include "arena.hpp"

// A minimal context, to check the list algorithms don't depend on the IR.

struct bag_ht : handle_t<bag_ht> {};
struct item_ht : handle_t<item_ht> { using container_type = bag_ht; };

struct item_t : list_node_t<item_ht, bag_ht> 
{
    int value = 0;
};

struct bag_t : list_container_t<item_ht> {};

struct ctx_t
{
    arena_t<item_t, item_ht> items;
    arena_t<bag_t, bag_ht> bags;

    item_t& operator[](item_ht h) { return items.get(h); }
    item_t const& operator[](item_ht h) const { return items.get(h); }
    bag_t& operator[](bag_ht h) { return bags.get(h); }
    bag_t const& operator[](bag_ht h) const { return bags.get(h); }

    item_ht new_item(int value)
    {
        return items.alloc_with([value](item_ht) { item_t item; item.value = value; return item; });
    }

    bag_ht new_bag() { return bags.alloc_with([](bag_ht) { return bag_t(); }); }
};

// Walks both directions, checking that they agree.
std::vector<item_ht> walk(ctx_t const& ctx, bag_ht bag)
{
    std::vector<item_ht> forward;
    for(item_ht h = ctx[bag].head; h; h = ctx[h].next)
    {
        REQUIRE(ctx[h].container == bag);
        REQUIRE(std::find(forward.begin(), forward.end(), h) == forward.end());
        forward.push_back(h);
    }

    std::vector<item_ht> backward;
    for(item_ht h = ctx[bag].tail; h; h = ctx[h].prev)
    {
        REQUIRE(ctx[h].container == bag);
        backward.push_back(h);
    }

    std::reverse(backward.begin(), backward.end());
    REQUIRE(forward == backward);
    REQUIRE(forward.size() == list_size<item_ht>(ctx, bag));
    return forward;
}

void require_unlinked(ctx_t const& ctx, item_ht h)
{
    REQUIRE(!ctx[h].next);
    REQUIRE(!ctx[h].prev);
    REQUIRE(!ctx[h].container);
    REQUIRE(!ctx[h].linked());
}

TEST_CASE("list_insert", "[intrusive]")
{
    ctx_t ctx;
    bag_ht const bag = ctx.new_bag();
    REQUIRE(ctx[bag].empty());
    REQUIRE(walk(ctx, bag).empty());

    item_ht const a = ctx.new_item(1);
    item_ht const b = ctx.new_item(2);
    item_ht const c = ctx.new_item(3);
    item_ht const d = ctx.new_item(4);
    item_ht const e = ctx.new_item(5);

    list_append(ctx, bag, b);
    REQUIRE(ctx[bag].head == b);
    REQUIRE(ctx[bag].tail == b);

    list_prepend(ctx, bag, a);
    list_append(ctx, bag, d);
    list_insert_after(ctx, b, c);
    list_insert_after(ctx, d, e);

    REQUIRE(walk(ctx, bag) == std::vector<item_ht>{ a, b, c, d, e });
    REQUIRE(ctx[bag].head == a);
    REQUIRE(ctx[bag].tail == e);

    item_ht const f = ctx.new_item(6);
    item_ht const g = ctx.new_item(7);
    list_insert_before(ctx, a, f);
    list_insert_before(ctx, d, g);
    REQUIRE(walk(ctx, bag) == std::vector<item_ht>{ f, a, b, c, g, d, e });
    REQUIRE(ctx[bag].head == f);
}

TEST_CASE("list_unlink", "[intrusive]")
{
    ctx_t ctx;
    bag_ht const bag = ctx.new_bag();

    std::vector<item_ht> items;
    for(int i = 0; i < 5; ++i)
    {
        items.push_back(ctx.new_item(i));
        list_append(ctx, bag, items.back());
    }

    // Middle
    REQUIRE(list_unlink(ctx, items[2]) == items[3]);
    require_unlinked(ctx, items[2]);
    REQUIRE(walk(ctx, bag) == std::vector<item_ht>{ items[0], items[1], items[3], items[4] });

    // Head
    REQUIRE(list_unlink(ctx, items[0]) == items[1]);
    require_unlinked(ctx, items[0]);
    REQUIRE(ctx[bag].head == items[1]);
    REQUIRE(!ctx[items[1]].prev);

    // Tail
    REQUIRE(!list_unlink(ctx, items[4]));
    require_unlinked(ctx, items[4]);
    REQUIRE(ctx[bag].tail == items[3]);
    REQUIRE(!ctx[items[3]].next);

    REQUIRE(list_unlink(ctx, items[1]) == items[3]);
    REQUIRE(!list_unlink(ctx, items[3]));
    REQUIRE(ctx[bag].empty());
    REQUIRE(!ctx[bag].tail);

    // Unlinked nodes can be linked again.
    list_append(ctx, bag, items[3]);
    list_append(ctx, bag, items[1]);
    REQUIRE(walk(ctx, bag) == std::vector<item_ht>{ items[3], items[1] });
}

TEST_CASE("list_preconditions", "[intrusive]")
{
    ctx_t ctx;
    bag_ht const bag = ctx.new_bag();
    bag_ht const other = ctx.new_bag();

    item_ht const a = ctx.new_item(1);
    item_ht const b = ctx.new_item(2);
    list_append(ctx, bag, a);

    auto const require_structural = [](auto&& fn)
    {
        try
        {
            fn();
            FAIL("expected an error");
        }
        catch(ir_error_t const& e)
        {
            REQUIRE(e.kind == IR_ERROR_STRUCTURAL);
        }
    };

    // Already linked
    require_structural([&]{ list_append(ctx, other, a); });
    require_structural([&]{ list_prepend(ctx, bag, a); });
    require_structural([&]{ list_insert_after(ctx, a, a); });

    // Relative to an unlinked node
    require_structural([&]{ list_insert_after(ctx, b, ctx.new_item(3)); });
    require_structural([&]{ list_insert_before(ctx, b, ctx.new_item(3)); });

    // Not linked
    require_structural([&]{ list_unlink(ctx, b); });

    // Nothing changed.
    REQUIRE(walk(ctx, bag) == std::vector<item_ht>{ a });
    REQUIRE(walk(ctx, other).empty());
    require_unlinked(ctx, b);
}

TEST_CASE("list_range", "[intrusive]")
{
    ctx_t ctx;
    bag_ht const bag = ctx.new_bag();

    std::vector<item_ht> items;
    for(int i = 0; i < 4; ++i)
    {
        items.push_back(ctx.new_item(i));
        list_append(ctx, bag, items.back());
    }

    auto const range = list_range<item_ht>(ctx, bag);

    // Restartable
    for(unsigned pass = 0; pass < 2; ++pass)
    {
        std::vector<item_ht> seen;
        for(item_ht h : range)
            seen.push_back(h);
        REQUIRE(seen == items);
    }

    std::vector<item_ht> reversed;
    for(item_ht h : list_reverse_range<item_ht>(ctx, bag))
        reversed.push_back(h);
    REQUIRE(reversed == std::vector<item_ht>(items.rbegin(), items.rend()));

    // Lazy: sees nodes added after the range was made.
    item_ht const extra = ctx.new_item(4);
    list_append(ctx, bag, extra);
    std::size_t n = 0;
    for(item_ht h : range)
        ++n, (void)h;
    REQUIRE(n == 5);
}

TEST_CASE("list_unlink_while_iterating", "[intrusive]")
{
    ctx_t ctx;
    bag_ht const bag = ctx.new_bag();

    for(int i = 0; i < 10; ++i)
        list_append(ctx, bag, ctx.new_item(i));

    // Remove and free the odd ones as they're visited.
    std::vector<int> visited;
    for(item_ht h : list_range<item_ht>(ctx, bag))
    {
        visited.push_back(ctx[h].value);
        if(ctx[h].value % 2)
        {
            list_unlink(ctx, h);
            REQUIRE(ctx.items.dealloc(h));
        }
    }

    REQUIRE(visited == std::vector<int>{ 0, 1, 2, 3, 4, 5, 6, 7, 8, 9 });

    std::vector<int> left;
    for(item_ht h : walk(ctx, bag))
        left.push_back(ctx[h].value);
    REQUIRE(left == std::vector<int>{ 0, 2, 4, 6, 8 });

    // Now remove everything, backwards.
    for(item_ht h : list_reverse_range<item_ht>(ctx, bag))
        list_unlink(ctx, h);
    REQUIRE(ctx[bag].empty());
    REQUIRE(!ctx[bag].tail);
}

TEST_CASE("list_random_edits", "[intrusive]")
{
    ctx_t ctx;
    bag_ht const bag = ctx.new_bag();
    std::vector<item_ht> model;

    std::srand(12345);
    for(unsigned iter = 0; iter < 2000; ++iter)
    {
        int const choice = std::rand() % 5;

        if(model.empty() || choice == 0)
        {
            item_ht const h = ctx.new_item(iter);
            if(std::rand() % 2)
            {
                list_append(ctx, bag, h);
                model.push_back(h);
            }
            else
            {
                list_prepend(ctx, bag, h);
                model.insert(model.begin(), h);
            }
        }
        else if(choice == 1 || choice == 2)
        {
            std::size_t const i = std::rand() % model.size();
            item_ht const h = ctx.new_item(iter);
            if(choice == 1)
            {
                list_insert_after(ctx, model[i], h);
                model.insert(model.begin() + i + 1, h);
            }
            else
            {
                list_insert_before(ctx, model[i], h);
                model.insert(model.begin() + i, h);
            }
        }
        else
        {
            std::size_t const i = std::rand() % model.size();
            item_ht const h = model[i];
            item_ht const next = list_unlink(ctx, h);
            REQUIRE(next == (i + 1 < model.size() ? model[i + 1] : item_ht{}));
            require_unlinked(ctx, h);
            model.erase(model.begin() + i);
            REQUIRE(ctx.items.dealloc(h));
        }

        if(iter % 50 == 0)
            REQUIRE(walk(ctx, bag) == model);
    }

    REQUIRE(walk(ctx, bag) == model);
}
