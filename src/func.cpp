#include "ir.hpp"

////////////////////////////////////////
// ir_t                               //
////////////////////////////////////////

func_ht ir_t::emplace_func(std::string name)
{
    return m_funcs.alloc_with([&](func_ht h) { return func_t(h, std::move(name)); });
}

////////////////////////////////////////
// func_ht                            //
////////////////////////////////////////

std::string const& func_ht::name(ir_t const& ir) const { return ir[*this].name(); }

block_ht func_ht::entry(ir_t const& ir) const { return ir[*this].head; }

list_range_t<ir_t, block_ht> func_ht::blocks(ir_t& ir) const 
    { return list_range<block_ht>(ir, *this); }
list_range_t<ir_t const, block_ht> func_ht::blocks(ir_t const& ir) const 
    { return list_range<block_ht>(ir, *this); }

std::size_t func_ht::block_count(ir_t const& ir) const { return list_size<block_ht>(ir, *this); }

void func_ht::append_block(ir_t& ir, block_ht block) const { list_append(ir, *this, block); }
void func_ht::prepend_block(ir_t& ir, block_ht block) const { list_prepend(ir, *this, block); }

void func_ht::insert_block_after(ir_t& ir, block_ht it, block_ht block) const
{
    if(ir[it].container != *this)
        ir_error(IR_ERROR_STRUCTURAL, fmt("% is not in function %.", it, name(ir)));
    list_insert_after(ir, it, block);
}

// Callers must redirect or prune every reference to 'block' first.
// Only references from inside 'block' itself are cleaned up here.
void func_ht::remove_block(ir_t& ir, block_ht block) const
{
    if(ir[block].container != *this)
        ir_error(IR_ERROR_STRUCTURAL, fmt("% is not in function %.", block, name(ir)));

    // Verify everything up front, so that failure leaves the IR untouched.

    for(auto const& user : ir[block].users())
    {
        if(ir[user.inst].container != block)
        {
            ir_error(IR_ERROR_INVARIANT, 
                     fmt("Removing % while % (in %) still uses it.", 
                         block, user, ir[user.inst].container.name()));
        }
    }

    for(block_ht pred : blocks(ir))
    {
        if(pred == block)
            continue;
        for(block_edge_t const& edge : ir[pred].successors())
            if(edge.to() == block)
                ir_error(IR_ERROR_INVARIANT, fmt("Removing % while % has edge %.", block, pred, edge));
    }

    for(inst_ht inst : block.insts(ir))
    {
        for(auto const& user : ir[inst].users())
        {
            if(ir[user.inst].container != block)
            {
                ir_error(IR_ERROR_INVARIANT, 
                         fmt("Removing % while % in another block uses %.", block, user, inst));
            }
        }
    }

    dprint(ir.log, "REMOVE_BLOCK", block, "FROM", name(ir));

    // Drop every operand first, so instructions referencing each other
    // (and the block itself) can go in any order.
    for(inst_ht inst : block.insts(ir))
        inst.drop_operands(ir);
    for(inst_ht inst : block.insts(ir))
        block.remove_inst(ir, inst);

    block.clear_successors(ir);
    list_unlink(ir, block);
    ir.free(block);
}
