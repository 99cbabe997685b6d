#include "ir.hpp"

#include <unordered_set>

#include "options.hpp"

namespace
{
    [[gnu::noreturn]]
    void broken(std::string const& what)
    {
        ir_error(IR_ERROR_INVARIANT, what);
    }

    // Walks the list forwards, checking every link along the way.
    template<typename H>
    std::size_t verify_list(ir_t const& ir, list_container_handle_t<H> c)
    {
        auto const& container = list_container<H>(ir, c);

        std::unordered_set<H> visited;
        H prev = {};
        for(H h = container.head; h; h = list_node(ir, h).next)
        {
            if(!ir.valid(h))
                broken(fmt("% links to dead node %.", c, h));
            if(!visited.insert(h).second)
                broken(fmt("% has a cycle at %.", c, h));

            auto const& node = list_node(ir, h);
            if(node.container != c)
                broken(fmt("% is in the list of % but claims %.", h, c, node.container));
            if(node.prev != prev)
                broken(fmt("% has prev % instead of %.", h, node.prev, prev));
            prev = h;
        }

        if(container.tail != prev)
            broken(fmt("% has tail % instead of %.", c, container.tail, prev));

        return visited.size();
    }

    // Must pass before any branch target is read.
    void verify_operands(ir_t const& ir, inst_ht h)
    {
        inst_t const& inst = ir[h];
        int const argn = inst_argn(inst.op());
        if(argn >= 0 && inst.operand_count() != (unsigned)argn)
            broken(fmt("% (%) has % operands, expected %.", h, inst.op(), inst.operand_count(), argn));

        for(unsigned i = 0; i < h.successor_count(ir); ++i)
            if(!inst.operand(branch_target_i(inst.op(), i == 0)).is_block())
                broken(fmt("% (%) has a non-block target.", h, inst.op()));
    }

    template<typename E, typename H>
    void verify_users(ir_t const& ir, H h)
    {
        for(user_t<E> const& user : ir[h].users())
        {
            if(!ir.valid(user.inst))
                broken(fmt("% is used by dead %.", h, user.inst));
            if(user.operand >= ir[user.inst].operand_count() 
               || ir[user.inst].operand(user.operand) != value_t(h))
            {
                broken(fmt("% lists user % which doesn't reference it.", h, user));
            }
        }
    }
}

////////////////////////////////////////
// freeing                            //
////////////////////////////////////////

std::optional<func_t> ir_t::free(func_ht h)
{
    func_t const* func = m_funcs.try_get(h);
    if(!func)
        return std::nullopt;
    if(func->head)
        broken(fmt("Freeing function % while it holds %.", func->name(), func->head));
    return m_funcs.dealloc(h);
}

std::optional<block_t> ir_t::free(block_ht h)
{
    block_t const* block = m_blocks.try_get(h);
    if(!block)
        return std::nullopt;
    if(block->linked() || block->next || block->prev)
        broken(fmt("Freeing % while it's still linked.", h));
    if(block->head)
        broken(fmt("Freeing % while it holds %.", h, block->head));
    if(block->has_users())
        broken(fmt("Freeing % while % still uses it.", h, *block->users().begin()));
    if(!block->successors().empty())
        broken(fmt("Freeing % while it has edge %.", h, *block->successors().begin()));
    dprint(log, "FREE", h);
    return m_blocks.dealloc(h);
}

std::optional<inst_t> ir_t::free(inst_ht h)
{
    inst_t const* inst = m_insts.try_get(h);
    if(!inst)
        return std::nullopt;
    if(inst->linked() || inst->next || inst->prev)
        broken(fmt("Freeing % while it's still linked.", h));
    if(inst->has_users())
        broken(fmt("Freeing % while % still uses it.", h, *inst->users().begin()));
    for(value_t v : inst->m_operands)
        if(v.is_inst() || v.is_block())
            broken(fmt("Freeing % while it still references %.", h, v));
    return m_insts.dealloc(h);
}

////////////////////////////////////////
// verification                       //
////////////////////////////////////////

void ir_t::verify() const
{
    m_funcs.for_each_handle([this](func_ht func) { verify(func); });

    m_blocks.for_each_handle([this](block_ht block_h)
    {
        block_t const& block = (*this)[block_h];

        if(block.container && !valid(block.container))
            broken(fmt("% belongs to a dead function.", block_h));

        verify_list<inst_ht>(*this, block_h);
        verify_users<block_ht>(*this, block_h);

        for(inst_ht inst : block_h.insts(*this))
        {
            verify_operands(*this, inst);
            if(is_terminator((*this)[inst].op()) && inst != block.tail)
                broken(fmt("Terminator % isn't last in %.", inst, block_h));
        }

        // Every edge belongs to a branch in this block.
        for(block_edge_t const& edge : block.successors())
        {
            if(!valid(edge.to()))
                broken(fmt("% has edge % to a dead block.", block_h, edge));
            if(!valid(edge.inst()) || (*this)[edge.inst()].container != block_h)
                broken(fmt("% has edge % whose branch isn't in the block.", block_h, edge));

            inst_op_t const op = (*this)[edge.inst()].op();
            if(branch_kind(op) == BRANCH_NONE)
                broken(fmt("% has edge % from non-branch %.", block_h, edge, op));
            if(op == INST_br && edge.is_true_arm())
                broken(fmt("% has edge % with an arm on an unconditional branch.", block_h, edge));
            if((*this)[edge.inst()].operand(branch_target_i(op, edge.is_true_arm())) != value_t(edge.to()))
                broken(fmt("% has edge % that disagrees with its branch.", block_h, edge));
        }

        // Every branch has one edge per arm.
        for(inst_ht inst : block_h.insts(*this))
        {
            unsigned const expected = inst.successor_count(*this);
            unsigned found = 0;
            for(block_edge_t const& edge : block.successors())
                found += edge.inst() == inst;
            if(found != expected)
                broken(fmt("% has % edges for %, expected %.", block_h, found, inst, expected));
        }
    });

    m_insts.for_each_handle([this](inst_ht inst_h)
    {
        inst_t const& inst = (*this)[inst_h];

        if(inst.container && !valid(inst.container))
            broken(fmt("% belongs to a dead block.", inst_h));

        verify_operands(*this, inst_h);
        verify_users<inst_ht>(*this, inst_h);

        // Every operand is registered with what it references.
        for(unsigned i = 0; i < inst.operand_count(); ++i)
        {
            value_t const v = inst.operand(i);
            user_t<inst_ht> const as_inst_user = { inst_h, i };
            user_t<block_ht> const as_block_user = { inst_h, i };

            if(v.is_inst() && (!valid(v.inst()) || !(*this)[v.inst()].users().count(as_inst_user)))
                broken(fmt("% operand % isn't registered with %.", inst_h, i, v));
            if(v.is_block() && (!valid(v.block()) || !(*this)[v.block()].users().count(as_block_user)))
                broken(fmt("% operand % isn't registered with %.", inst_h, i, v));
        }
    });
}

void ir_t::verify(func_ht func) const
{
    verify_list<block_ht>(*this, func);
}

void ir_t::assert_valid() const
{
    if(!compiler_options().assert_valid)
        return;
    verify();
}
