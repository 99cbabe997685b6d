#ifndef IR_HPP
#define IR_HPP

#include <initializer_list>
#include <optional>
#include <string>

#include <boost/container/small_vector.hpp>

#include "arena.hpp"
#include "debug_print.hpp"
#include "def_use.hpp"
#include "inst_op.hpp"
#include "intrusive.hpp"
#include "ir_decl.hpp"
#include "ir_edge.hpp"
#include "value.hpp"

////////////////////////////////////////
// inst_t                             //
////////////////////////////////////////

class inst_t : public list_node_t<inst_ht, block_ht>, public usable_t<inst_ht>
{
    friend struct inst_ht;
    friend class ir_t;
public:
    inst_t(inst_ht handle, inst_op_t op) : m_handle(handle), m_op(op) {}

    inst_ht handle() const { return m_handle; }
    inst_op_t op() const { return m_op; }

    value_t operand(unsigned i) const 
        { passert(i < m_operands.size(), i, m_operands.size()); return m_operands[i]; }
    std::size_t operand_count() const { return m_operands.size(); }

private:
    inst_ht m_handle = {};
    inst_op_t m_op = INST_null;
    bc::small_vector<value_t, 3> m_operands;
};

////////////////////////////////////////
// block_t                            //
////////////////////////////////////////

class block_t 
: public list_node_t<block_ht, func_ht>
, public list_container_t<inst_ht>
, public usable_t<block_ht>
{
    friend struct block_ht;
    friend class ir_t;
public:
    explicit block_t(block_ht handle) : m_handle(handle) {}

    block_ht handle() const { return m_handle; }
    edge_set_t const& successors() const { return m_successors; }

private:
    block_ht m_handle = {};
    edge_set_t m_successors;
};

////////////////////////////////////////
// func_t                             //
////////////////////////////////////////

class func_t : public list_container_t<block_ht>
{
public:
    func_t(func_ht handle, std::string name) : m_handle(handle), m_name(std::move(name)) {}

    func_ht handle() const { return m_handle; }
    std::string const& name() const { return m_name; }

private:
    func_ht m_handle = {};
    std::string m_name;
};

////////////////////////////////////////
// ir_t                               //
////////////////////////////////////////

// Owns every node of one compilation unit.
// All mutation of one 'ir_t' must come from a single thread; separate
// 'ir_t' objects are independent.
class ir_t
{
public:
    ir_t() = default;
    ir_t(ir_t const&) = delete;
    ir_t(ir_t&&) = delete;
    ir_t& operator=(ir_t const&) = delete;
    ir_t& operator=(ir_t&&) = delete;

    // Receives a trace of CFG mutations, if set.
    log_t* log = nullptr;

    // These throw 'ir_error_t' on invalid handles.
    func_t& operator[](func_ht h) { return m_funcs.get(h); }
    func_t const& operator[](func_ht h) const { return m_funcs.get(h); }
    block_t& operator[](block_ht h) { return m_blocks.get(h); }
    block_t const& operator[](block_ht h) const { return m_blocks.get(h); }
    inst_t& operator[](inst_ht h) { return m_insts.get(h); }
    inst_t const& operator[](inst_ht h) const { return m_insts.get(h); }

    bool valid(func_ht h) const { return m_funcs.valid(h); }
    bool valid(block_ht h) const { return m_blocks.valid(h); }
    bool valid(inst_ht h) const { return m_insts.valid(h); }

    // New nodes are unattached.
    func_ht emplace_func(std::string name);
    block_ht emplace_block();
    inst_ht emplace_inst(inst_op_t op, std::initializer_list<value_t> operands = {});

    inst_ht emplace_br(block_ht target) { return emplace_inst(INST_br, { target }); }
    inst_ht emplace_cond_br(value_t condition, block_ht true_target, block_ht false_target)
        { return emplace_inst(INST_cond_br, { condition, true_target, false_target }); }
    inst_ht emplace_ret(value_t value = {});

    // Releases a slot. The node must be fully unlinked and unused first.
    // Returns nullopt if the handle was already absent.
    std::optional<func_t> free(func_ht h);
    std::optional<block_t> free(block_ht h);
    std::optional<inst_t> free(inst_ht h);

    std::size_t func_count() const { return m_funcs.size(); }
    std::size_t block_count() const { return m_blocks.size(); }
    std::size_t inst_count() const { return m_insts.size(); }

    template<typename Fn>
    void for_each_func(Fn const& fn) const { m_funcs.for_each_handle(fn); }

    // Checks every structural and def-use invariant, throwing on the first 
    // broken one.
    void verify() const;

    // Calls 'verify' when enabled by the options.
    void assert_valid() const;

private:
    void verify(func_ht func) const;

    arena_t<func_t, func_ht> m_funcs;
    arena_t<block_t, block_ht> m_blocks;
    arena_t<inst_t, inst_ht> m_insts;
};

#endif
