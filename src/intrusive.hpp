#ifndef INTRUSIVE_HPP
#define INTRUSIVE_HPP

// A generic intrusive doubly-linked list, built on handles rather than
// pointers. The same code links instructions inside blocks and blocks
// inside functions.
//
// Node data derives from 'list_node_t<H, C>', where 'H' is the node's
// handle type and 'C' is the handle type of its container.
// Container data derives from 'list_container_t<H>'.
// The algorithms below work on any context where 'ctx[handle]' returns the
// data for that handle.

#include <cstddef>
#include <iterator>
#include <type_traits>
#include <utility>

#include "assert.hpp"
#include "format.hpp"
#include "ir_error.hpp"

template<typename H, typename C>
class list_node_t
{
public:
    using node_handle = H;
    using container_handle = C;

    H next = {};
    H prev = {};
    C container = {};

    bool linked() const { return (bool)container; }
};

template<typename H>
class list_container_t
{
public:
    H head = {};
    H tail = {};

    bool empty() const { return !head; }
};

// 'H::container_type' names the container handle type of node handles.
template<typename H>
using list_container_handle_t = typename H::container_type;

template<typename Ctx, typename H>
auto& list_node(Ctx& ctx, H h)
{
    using node_t = list_node_t<H, list_container_handle_t<H>>;
    if constexpr(std::is_const_v<Ctx>)
        return static_cast<node_t const&>(ctx[h]);
    else
        return static_cast<node_t&>(ctx[h]);
}

template<typename H, typename Ctx>
auto& list_container(Ctx& ctx, list_container_handle_t<H> c)
{
    if constexpr(std::is_const_v<Ctx>)
        return static_cast<list_container_t<H> const&>(ctx[c]);
    else
        return static_cast<list_container_t<H>&>(ctx[c]);
}

template<typename Ctx, typename H>
void list_require_unlinked(Ctx& ctx, H node)
{
    auto const& n = list_node(std::as_const(ctx), node);
    if(n.container || n.next || n.prev)
        ir_error(IR_ERROR_STRUCTURAL, fmt("Node % is already linked into %.", node, n.container));
}

template<typename Ctx, typename H>
void list_require_linked(Ctx& ctx, H node)
{
    if(!list_node(std::as_const(ctx), node).container)
        ir_error(IR_ERROR_STRUCTURAL, fmt("Node % is not linked into any container.", node));
}

// Links 'node' after 'it', which must already be linked.
template<typename Ctx, typename H>
void list_insert_after(Ctx& ctx, H it, H node)
{
    list_require_linked(ctx, it);
    list_require_unlinked(ctx, node);

    auto const c = list_node(ctx, it).container;
    H const next = list_node(ctx, it).next;

    auto& n = list_node(ctx, node);
    n.container = c;
    n.prev = it;
    n.next = next;

    list_node(ctx, it).next = node;
    if(next)
        list_node(ctx, next).prev = node;
    else
        list_container<H>(ctx, c).tail = node;
}

// Links 'node' before 'it', which must already be linked.
template<typename Ctx, typename H>
void list_insert_before(Ctx& ctx, H it, H node)
{
    list_require_linked(ctx, it);
    list_require_unlinked(ctx, node);

    auto const c = list_node(ctx, it).container;
    H const prev = list_node(ctx, it).prev;

    auto& n = list_node(ctx, node);
    n.container = c;
    n.prev = prev;
    n.next = it;

    list_node(ctx, it).prev = node;
    if(prev)
        list_node(ctx, prev).next = node;
    else
        list_container<H>(ctx, c).head = node;
}

template<typename Ctx, typename H>
void list_append(Ctx& ctx, list_container_handle_t<H> c, H node)
{
    list_require_unlinked(ctx, node);

    auto& container = list_container<H>(ctx, c);
    if(H const tail = container.tail)
        return list_insert_after(ctx, tail, node);

    passert(!container.head, c, container.head);
    auto& n = list_node(ctx, node);
    n.container = c;
    container.head = container.tail = node;
}

template<typename Ctx, typename H>
void list_prepend(Ctx& ctx, list_container_handle_t<H> c, H node)
{
    list_require_unlinked(ctx, node);

    auto& container = list_container<H>(ctx, c);
    if(H const head = container.head)
        return list_insert_before(ctx, head, node);

    passert(!container.tail, c, container.tail);
    auto& n = list_node(ctx, node);
    n.container = c;
    container.head = container.tail = node;
}

// Removes 'node' from its container, clearing its links.
// Returns the node that followed it.
template<typename Ctx, typename H>
H list_unlink(Ctx& ctx, H node)
{
    list_require_linked(ctx, node);

    auto& n = list_node(ctx, node);
    auto& container = list_container<H>(ctx, n.container);

    passert(n.next != node, node);
    passert(n.prev != node, node);

    if(n.next)
        list_node(ctx, n.next).prev = n.prev;
    else
        container.tail = n.prev;

    if(n.prev)
        list_node(ctx, n.prev).next = n.next;
    else
        container.head = n.next;

    H const ret = n.next;

    n.next = {};
    n.prev = {};
    n.container = {};

    return ret;
}

////////////////////////////////////////
// iteration                          //
////////////////////////////////////////

// Yields node handles. The following node is fetched before the current
// one is yielded, so the current node may be unlinked or freed mid-loop.
template<typename Ctx, typename H, bool Reverse = false>
class list_iterator_t
{
public:
    using value_type = H;
    using reference = H;
    using pointer = void;
    using difference_type = std::ptrdiff_t;
    using iterator_category = std::input_iterator_tag;

    list_iterator_t() = default;
    list_iterator_t(Ctx& ctx, H start) : m_ctx(&ctx), m_cur(start), m_next(step(start)) {}

    H operator*() const { return m_cur; }

    list_iterator_t& operator++() 
    { 
        m_cur = m_next; 
        m_next = step(m_cur); 
        return *this; 
    }

    list_iterator_t operator++(int) { list_iterator_t ret = *this; operator++(); return ret; }

    bool operator==(list_iterator_t const& o) const { return m_cur == o.m_cur; }
    bool operator!=(list_iterator_t const& o) const { return m_cur != o.m_cur; }

private:
    H step(H h) const
    {
        if(!h)
            return {};
        auto const& n = list_node(std::as_const(*m_ctx), h);
        return Reverse ? n.prev : n.next;
    }

    Ctx* m_ctx = nullptr;
    H m_cur = {};
    H m_next = {};
};

// A lazy view over a container. Each call to 'begin' restarts iteration.
template<typename Ctx, typename H, bool Reverse = false>
class list_range_t
{
public:
    using iterator = list_iterator_t<Ctx, H, Reverse>;

    list_range_t(Ctx& ctx, list_container_handle_t<H> c) : m_ctx(&ctx), m_container(c) {}

    iterator begin() const 
    { 
        auto const& container = list_container<H>(std::as_const(*m_ctx), m_container);
        return iterator(*m_ctx, Reverse ? container.tail : container.head); 
    }

    iterator end() const { return iterator(); }

private:
    Ctx* m_ctx;
    list_container_handle_t<H> m_container;
};

template<typename H, typename Ctx>
list_range_t<Ctx, H> list_range(Ctx& ctx, list_container_handle_t<H> c)
    { return list_range_t<Ctx, H>(ctx, c); }

template<typename H, typename Ctx>
list_range_t<Ctx, H, true> list_reverse_range(Ctx& ctx, list_container_handle_t<H> c)
    { return list_range_t<Ctx, H, true>(ctx, c); }

template<typename H, typename Ctx>
std::size_t list_size(Ctx const& ctx, list_container_handle_t<H> c)
{
    std::size_t size = 0;
    for(H h = list_container<H>(ctx, c).head; h; h = list_node(ctx, h).next)
        ++size;
    return size;
}

#endif
