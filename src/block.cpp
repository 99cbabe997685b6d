#include "ir.hpp"

namespace
{
    void require_member(ir_t const& ir, block_ht block, inst_ht inst)
    {
        block_ht const owner = ir[inst].container;
        if(owner != block)
        {
            ir_error(IR_ERROR_STRUCTURAL, 
                     fmt("% belongs to %, not %.", inst, owner ? owner.name() : "no block", block));
        }
    }

    // The arm of 'branch' whose target operand is 'operand'.
    bool operand_arm(inst_op_t op, unsigned operand)
    {
        return op == INST_cond_br && operand == branch_target_i(INST_cond_br, true);
    }
}

////////////////////////////////////////
// ir_t                               //
////////////////////////////////////////

block_ht ir_t::emplace_block()
{
    return m_blocks.alloc_with([](block_ht h) { return block_t(h); });
}

////////////////////////////////////////
// block_ht                           //
////////////////////////////////////////

func_ht block_ht::func(ir_t const& ir) const { return ir[*this].container; }
block_ht block_ht::next(ir_t const& ir) const { return ir[*this].next; }
block_ht block_ht::prev(ir_t const& ir) const { return ir[*this].prev; }

inst_ht block_ht::first_inst(ir_t const& ir) const { return ir[*this].head; }
inst_ht block_ht::last_inst(ir_t const& ir) const { return ir[*this].tail; }

list_range_t<ir_t, inst_ht> block_ht::insts(ir_t& ir) const 
    { return list_range<inst_ht>(ir, *this); }
list_range_t<ir_t const, inst_ht> block_ht::insts(ir_t const& ir) const 
    { return list_range<inst_ht>(ir, *this); }

std::size_t block_ht::inst_count(ir_t const& ir) const { return list_size<inst_ht>(ir, *this); }

inst_ht block_ht::terminator(ir_t const& ir) const
{
    inst_ht const tail = ir[*this].tail;
    if(tail && is_terminator(ir[tail].op()))
        return tail;
    return {};
}

void block_ht::append_inst(ir_t& ir, inst_ht inst) const
{
    if(inst_ht const term = terminator(ir))
        ir_error(IR_ERROR_STRUCTURAL, fmt("% is already terminated by %.", *this, term));
    list_append(ir, *this, inst);
}

void block_ht::prepend_inst(ir_t& ir, inst_ht inst) const
{
    if(is_terminator(ir[inst].op()) && ir[*this].head)
        ir_error(IR_ERROR_STRUCTURAL, fmt("Terminator % must be last in %.", inst, *this));
    list_prepend(ir, *this, inst);
}

void block_ht::remove(ir_t& ir) const
{
    func_ht const func = ir[*this].container;
    if(!func)
        ir_error(IR_ERROR_STRUCTURAL, fmt("% is not in a function.", *this));
    func.remove_block(ir, *this);
}

void block_ht::remove_inst(ir_t& ir, inst_ht inst) const
{
    require_member(ir, *this, inst);

    // Check before modifying anything.
    for(auto const& user : ir[inst].users())
        if(user.inst != inst)
            ir_error(IR_ERROR_INVARIANT, fmt("Removing % while % still uses it.", inst, user));

    dprint(ir.log, "REMOVE_INST", inst, "FROM", *this);

    inst.drop_operands(ir);

    // Edges must always refer to instructions in this block.
    block_t& block = ir[*this];
    for(auto it = block.m_successors.begin(); it != block.m_successors.end();)
    {
        if(it->inst() == inst)
            it = block.m_successors.erase(it);
        else
            ++it;
    }

    list_unlink(ir, inst);
    ir.free(inst);
}

void block_ht::add_successor(ir_t& ir, block_ht target, inst_ht terminator, bool true_arm) const
{
    require_member(ir, *this, terminator);
    if(!ir.valid(target))
        ir_error(IR_ERROR_INVALID_POINTER, fmt("Edge target % is not a live block.", target));

    inst_op_t const op = ir[terminator].op();
    block_edge_t edge;

    switch(branch_kind(op))
    {
    case BRANCH_UNCOND:
        edge = block_edge_t(target, terminator, false);
        break;
    case BRANCH_COND:
        edge = block_edge_t(target, terminator, true_arm);
        break;
    default:
        ir_error(IR_ERROR_STRUCTURAL, fmt("% (%) doesn't create control-flow edges.", terminator, op));
    }

    if(terminator.operand(ir, branch_target_i(op, edge.is_true_arm())) != value_t(target))
        ir_error(IR_ERROR_STRUCTURAL, fmt("% doesn't branch to % on that arm.", terminator, target));

    ir[*this].m_successors.insert(edge);
    dprint(ir.log, "ADD_SUCCESSOR", *this, edge);
}

void block_ht::remove_successor(ir_t& ir, block_ht target, inst_ht terminator, bool true_arm) const
{
    require_member(ir, *this, terminator);

    inst_op_t const op = ir[terminator].op();
    if(branch_kind(op) == BRANCH_NONE)
        ir_error(IR_ERROR_STRUCTURAL, fmt("% (%) doesn't create control-flow edges.", terminator, op));

    // Check before modifying anything.
    for(auto const& user : ir[terminator].users())
        if(user.inst != terminator)
            ir_error(IR_ERROR_INVARIANT, fmt("Removing % while % still uses it.", terminator, user));

    switch(branch_kind(op))
    {
    case BRANCH_UNCOND:
        if(terminator.operand(ir, 0) != value_t(target))
            ir_error(IR_ERROR_STRUCTURAL, fmt("% doesn't branch to %.", terminator, target));

        dprint(ir.log, "REMOVE_SUCCESSOR", *this, target);

        // The block is left unterminated.
        ir[*this].m_successors.erase(block_edge_t(target, terminator, false));
        remove_inst(ir, terminator);
        break;

    case BRANCH_COND:
        {
            if(terminator.operand(ir, branch_target_i(op, true_arm)) != value_t(target))
                ir_error(IR_ERROR_STRUCTURAL, fmt("% doesn't branch to % on that arm.", terminator, target));

            value_t const other = terminator.operand(ir, branch_target_i(op, !true_arm));
            if(!other.is_block())
                ir_error(IR_ERROR_STRUCTURAL, fmt("% has no block on its other arm.", terminator));
            block_ht const survivor = other.block();

            dprint(ir.log, "DOWNGRADE_BRANCH", *this, "PRUNE", target, "KEEP", survivor);

            // The old terminator is retiring, so both of its edges go.
            edge_set_t& successors = ir[*this].m_successors;
            successors.erase(block_edge_t(target, terminator, true_arm));
            successors.erase(block_edge_t(survivor, terminator, !true_arm));

            // Insert the replacement before removing the original,
            // so that the block always ends in a terminator.
            inst_ht const br = ir.emplace_br(survivor);
            list_insert_after(ir, terminator, br);
            remove_inst(ir, terminator);

            add_successor(ir, survivor, br, false);
        }
        break;

    default:
        passert(false, op);
    }
}

void block_ht::clear_successors(ir_t& ir) const 
{ 
    dprint(ir.log, "CLEAR_SUCCESSORS", *this);
    ir[*this].m_successors.clear(); 
}

void block_ht::copy_successors(ir_t& ir, edge_set_t edges) const 
{ 
    dprint(ir.log, "COPY_SUCCESSORS", *this, edges.size());
    ir[*this].m_successors = std::move(edges); 
}

edge_set_t const& block_ht::successors(ir_t const& ir) const { return ir[*this].m_successors; }

std::vector<block_ht> block_ht::predecessors(ir_t const& ir) const
{
    std::vector<block_ht> ret;

    func_ht const func = ir[*this].container;
    if(!func)
        return ret;

    for(block_ht block : func.blocks(ir))
    {
        for(block_edge_t const& edge : ir[block].successors())
        {
            if(edge.to() == *this)
            {
                ret.push_back(block);
                break;
            }
        }
    }

    return ret;
}

unsigned block_ht::replace_uses(ir_t& ir, block_ht block) const
{
    if(block == *this)
        return 0;
    if(!ir.valid(block))
        ir_error(IR_ERROR_INVALID_POINTER, fmt("Replacement % is not a live block.", block));

    // Copy, as 'set_operand' modifies the set.
    auto const users = ir[*this].users();
    for(auto const& user : users)
    {
        inst_op_t const op = ir[user.inst].op();
        block_ht const from = ir[user.inst].container;

        user.inst.set_operand(ir, user.operand, block);

        if(!from || branch_kind(op) == BRANCH_NONE)
            continue;

        // Move the edge along with the operand.
        bool const true_arm = operand_arm(op, user.operand);
        edge_set_t& successors = ir[from].m_successors;
        if(successors.erase(block_edge_t(*this, user.inst, true_arm)))
            successors.insert(block_edge_t(block, user.inst, true_arm));
    }

    dprint(ir.log, "REPLACE_BLOCK_USES", *this, "WITH", block, users.size());
    return users.size();
}
