#ifndef INST_OP_HPP
#define INST_OP_HPP

#include <array>
#include <ostream>
#include <string_view>

// Instruction flags:
constexpr unsigned INSTF_VALUE       = 1 << 0; // Produces a value
constexpr unsigned INSTF_COMMUTATIVE = 1 << 1; // First two args can be swapped
constexpr unsigned INSTF_TERMINATOR  = 1 << 2; // Must be last in its block
constexpr unsigned INSTF_CONDITIONAL = 1 << 3; // Picks between two successors

enum inst_op_t : short
{
#define INST_DEF(x, ...) INST_##x,
#include "inst_op.inc"
    NUM_INST_OPS,
};

constexpr std::array<signed char, NUM_INST_OPS> const inst_argn_table =
{{
#define INST_DEF(x, argn, flags) argn,
#include "inst_op.inc"
}};

constexpr std::array<unsigned, NUM_INST_OPS> const inst_flags_table =
{{
#define INST_DEF(x, argn, flags) flags,
#include "inst_op.inc"
}};

// Returns -1 for ops taking any number of operands.
constexpr int inst_argn(inst_op_t op) { return inst_argn_table[op]; }
constexpr unsigned inst_flags(inst_op_t op) { return inst_flags_table[op]; }

constexpr bool is_terminator(inst_op_t op) { return inst_flags(op) & INSTF_TERMINATOR; }

// The only ops that create CFG edges.
enum branch_kind_t
{
    BRANCH_NONE,
    BRANCH_UNCOND,
    BRANCH_COND,
};

constexpr branch_kind_t branch_kind(inst_op_t op)
{
    switch(op)
    {
    case INST_br:      return BRANCH_UNCOND;
    case INST_cond_br: return BRANCH_COND;
    default:           return BRANCH_NONE;
    }
}

// Operand index holding the block of a branch arm.
constexpr unsigned branch_target_i(inst_op_t op, bool true_arm)
{
    if(op == INST_cond_br)
        return true_arm ? 1 : 2;
    return 0;
}

std::string_view to_string(inst_op_t op);
std::ostream& operator<<(std::ostream& o, inst_op_t op);

#endif
