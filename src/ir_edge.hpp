#ifndef IR_EDGE_HPP
#define IR_EDGE_HPP

#include <compare>
#include <cstddef>
#include <ostream>

#include "ir_decl.hpp"

// A control-flow edge: (target, terminator, arm).
// Both arms of a 'cond_br' are distinct edges, even when they share a target.
// Unconditional branches always use 'true_arm = false'.
class block_edge_t
{
public:
    constexpr block_edge_t() = default;
    constexpr block_edge_t(block_ht to, inst_ht inst, bool true_arm)
    : m_to(to)
    , m_inst(inst)
    , m_true_arm(true_arm)
    {}

    constexpr block_ht to() const { return m_to; }
    constexpr inst_ht inst() const { return m_inst; }
    constexpr bool is_true_arm() const { return m_true_arm; }

    constexpr auto operator<=>(block_edge_t const&) const = default;

    std::size_t hash() const 
    { 
        return hash_combine(hash_combine(m_to.hash(), m_inst.hash()), m_true_arm); 
    }

private:
    block_ht m_to = {};
    inst_ht m_inst = {};
    bool m_true_arm = false;
};

template<> 
struct std::hash<block_edge_t>
{
    std::size_t operator()(block_edge_t const& edge) const noexcept { return edge.hash(); }
};

std::ostream& operator<<(std::ostream& o, block_edge_t const& edge);

#endif
