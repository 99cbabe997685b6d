#ifndef IR_DECL_HPP
#define IR_DECL_HPP

#include <cstdint>
#include <functional>
#include <iosfwd>
#include <string>
#include <vector>

#include <boost/container/flat_set.hpp>
#include <boost/container/small_vector.hpp>

#include "handle.hpp"
#include "intrusive.hpp"

namespace bc = boost::container;

////////////////////////////////////////
// Main types
////////////////////////////////////////

class ir_t;
class func_t;
class block_t;
class inst_t;
class value_t;
class block_edge_t;

enum inst_op_t : short;

struct func_ht;
struct block_ht;
struct inst_ht;

// Successors of a block. Blocks rarely have more than two.
using edge_set_t = bc::flat_set<block_edge_t, std::less<block_edge_t>, 
                                bc::small_vector<block_edge_t, 2>>;

////////////////////////////////////////
// Handles
////////////////////////////////////////

// Handles are plain values; every operation takes the owning 'ir_t'.

struct inst_ht : public handle_t<inst_ht>
{
    using container_type = block_ht;

    inst_op_t op(ir_t const& ir) const;
    block_ht block(ir_t const& ir) const;
    inst_ht next(ir_t const& ir) const;
    inst_ht prev(ir_t const& ir) const;

    std::size_t operand_count(ir_t const& ir) const;
    value_t operand(ir_t const& ir, unsigned i) const;

    // These keep the user sets of the referenced values up to date.
    void set_operand(ir_t& ir, unsigned i, value_t value) const;
    void append_operand(ir_t& ir, value_t value) const;
    void drop_operands(ir_t& ir) const;

    // Block operands, in order. For 'cond_br', 0 is the true arm.
    block_ht successor(ir_t const& ir, unsigned i) const;
    unsigned successor_count(ir_t const& ir) const;

    void insert_after(ir_t& ir, inst_ht inst) const;
    void insert_before(ir_t& ir, inst_ht inst) const;

    // Removes and frees this instruction. Returns the next instruction.
    inst_ht remove(ir_t& ir) const;

    // Every operand that references this instruction now references 'value'.
    // Returns the number of operands changed.
    unsigned replace_uses(ir_t& ir, value_t value) const;

    std::string name() const;
    void print(std::ostream& o, ir_t const& ir) const;
    std::string to_string(ir_t const& ir) const;
};

struct block_ht : public handle_t<block_ht>
{
    using container_type = func_ht;

    // A debugging label based on the slot index.
    // Slots get reused, so never use this to identify blocks.
    std::string name() const;

    func_ht func(ir_t const& ir) const;
    block_ht next(ir_t const& ir) const;
    block_ht prev(ir_t const& ir) const;

    inst_ht first_inst(ir_t const& ir) const;
    inst_ht last_inst(ir_t const& ir) const;
    list_range_t<ir_t, inst_ht> insts(ir_t& ir) const;
    list_range_t<ir_t const, inst_ht> insts(ir_t const& ir) const;
    std::size_t inst_count(ir_t const& ir) const;

    // Returns the last instruction if it's a terminator.
    inst_ht terminator(ir_t const& ir) const;

    void append_inst(ir_t& ir, inst_ht inst) const;
    void prepend_inst(ir_t& ir, inst_ht inst) const;

    // Has the owning function detach and free this block.
    void remove(ir_t& ir) const;
    void remove_inst(ir_t& ir, inst_ht inst) const;

    void add_successor(ir_t& ir, block_ht target, inst_ht terminator, bool true_arm) const;
    void remove_successor(ir_t& ir, block_ht target, inst_ht terminator, bool true_arm) const;
    void clear_successors(ir_t& ir) const;
    void copy_successors(ir_t& ir, edge_set_t edges) const;
    edge_set_t const& successors(ir_t const& ir) const;

    // Computed by scanning the blocks of the owning function.
    std::vector<block_ht> predecessors(ir_t const& ir) const;

    // Every operand that references this block now references 'block'.
    // Successor edges created by redirected branch operands follow along.
    unsigned replace_uses(ir_t& ir, block_ht block) const;

    void print(std::ostream& o, ir_t const& ir) const;
    std::string to_string(ir_t const& ir) const;
};

struct func_ht : public handle_t<func_ht>
{
    std::string const& name(ir_t const& ir) const;

    block_ht entry(ir_t const& ir) const;
    list_range_t<ir_t, block_ht> blocks(ir_t& ir) const;
    list_range_t<ir_t const, block_ht> blocks(ir_t const& ir) const;
    std::size_t block_count(ir_t const& ir) const;

    void append_block(ir_t& ir, block_ht block) const;
    void prepend_block(ir_t& ir, block_ht block) const;
    void insert_block_after(ir_t& ir, block_ht it, block_ht block) const;

    // The block must be unreferenced: no users, and no edges into it.
    void remove_block(ir_t& ir, block_ht block) const;

    void print(std::ostream& o, ir_t const& ir) const;
    std::string to_string(ir_t const& ir) const;
};

DEF_HANDLE_HASH(func_ht)
DEF_HANDLE_HASH(block_ht)
DEF_HANDLE_HASH(inst_ht)

std::ostream& operator<<(std::ostream& o, block_ht h);
std::ostream& operator<<(std::ostream& o, inst_ht h);

#endif
