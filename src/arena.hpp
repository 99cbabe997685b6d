#ifndef ARENA_HPP
#define ARENA_HPP

#include <cstdint>
#include <optional>
#include <utility>

#include <boost/container/deque.hpp>

#include "handle.hpp"
#include "ir_error.hpp"
#include "format.hpp"

namespace bc = boost::container;

// A pool providing generational handles instead of pointers.
// Slots live in a deque, so references to live values are not invalidated
// when other values are allocated. Freed slots are chained into a free list
// and reused, with their generation bumped so that old handles stop
// resolving.
// 'H' must derive from 'handle_t<H>'.
template<typename T, typename H>
class arena_t
{
public:
    using value_type = T;
    using handle_type = H;

    arena_t() = default;
    arena_t(arena_t const&) = delete;
    arena_t& operator=(arena_t const&) = delete;

private:
    struct slot_t
    {
        std::optional<T> value;
        std::uint32_t gen = 0;
        std::uint32_t next_free = 0;
    };

    bc::deque<slot_t> storage = bc::deque<slot_t>(1); // Slot 0 is the null handle.
    std::uint32_t free_head = 0;
    std::size_t used_size = 0;

public:
    // 'fn' receives the handle the new value will live at,
    // letting values hold their own handle.
    template<typename Fn>
    H alloc_with(Fn&& fn)
    {
        H h = {};
        if(free_head)
        {
            h.index = free_head;
            h.gen = storage[free_head].gen;
        }
        else
            h.index = storage.size();

        // Construct before committing, in case 'fn' throws.
        T value = fn(h);

        if(free_head)
        {
            slot_t& slot = storage[free_head];
            free_head = slot.next_free;
            slot.next_free = 0;
            slot.value.emplace(std::move(value));
        }
        else
            storage.emplace_back().value.emplace(std::move(value));

        ++used_size;
        return h;
    }

    T const* try_get(H h) const
    {
        if(!valid(h))
            return nullptr;
        return &*storage[h.index].value;
    }

    T* try_get(H h)
    {
        if(!valid(h))
            return nullptr;
        return &*storage[h.index].value;
    }

    T const& get(H h) const
    {
        if(T const* ptr = try_get(h))
            return *ptr;
        ir_error(IR_ERROR_INVALID_POINTER, fmt("Invalid pointer %.", h));
    }

    T& get(H h)
    {
        if(T* ptr = try_get(h))
            return *ptr;
        ir_error(IR_ERROR_INVALID_POINTER, fmt("Invalid pointer %.", h));
    }

    // Returns the freed value, or nullopt if 'h' didn't point to anything.
    std::optional<T> dealloc(H h)
    {
        if(!valid(h))
            return std::nullopt;

        slot_t& slot = storage[h.index];
        std::optional<T> ret = std::move(slot.value);
        slot.value.reset();
        ++slot.gen;
        slot.next_free = free_head;
        free_head = h.index;
        --used_size;
        return ret;
    }

    bool valid(H h) const
    {
        if(!h || h.index >= storage.size())
            return false;
        slot_t const& slot = storage[h.index];
        return slot.value && slot.gen == h.gen;
    }

    // Calls 'fn' with the handle of every live value, in slot order.
    template<typename Fn>
    void for_each_handle(Fn const& fn) const
    {
        for(std::uint32_t i = 1; i < storage.size(); ++i)
        {
            if(!storage[i].value)
                continue;
            H h = {};
            h.index = i;
            h.gen = storage[i].gen;
            fn(h);
        }
    }

    std::size_t size() const { return used_size; }
    std::size_t array_size() const { return storage.size(); }
};

#endif
