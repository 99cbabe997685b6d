#include "ir.hpp"

namespace
{
    void check_operand(ir_t const& ir, value_t value)
    {
        if(value.is_inst() && !ir.valid(value.inst()))
            ir_error(IR_ERROR_INVALID_POINTER, fmt("Operand % is not a live instruction.", value));
        if(value.is_inst() && !(inst_flags(ir[value.inst()].op()) & INSTF_VALUE))
            ir_error(IR_ERROR_STRUCTURAL, fmt("Operand % (%) doesn't produce a value.", value, ir[value.inst()].op()));
        if(value.is_block() && !ir.valid(value.block()))
            ir_error(IR_ERROR_INVALID_POINTER, fmt("Operand % is not a live block.", value));
    }

    // Registers 'user' as referencing 'value'.
    void link_use(ir_t& ir, inst_ht user, unsigned i, value_t value)
    {
        if(value.is_inst())
            ir[value.inst()].insert_user({ user, i });
        else if(value.is_block())
            ir[value.block()].insert_user({ user, i });
    }

    void unlink_use(ir_t& ir, inst_ht user, unsigned i, value_t value)
    {
        if(value.is_inst())
            ir[value.inst()].remove_user({ user, i });
        else if(value.is_block())
            ir[value.block()].remove_user({ user, i });
    }
}

////////////////////////////////////////
// ir_t                               //
////////////////////////////////////////

inst_ht ir_t::emplace_inst(inst_op_t op, std::initializer_list<value_t> operands)
{
    int const argn = inst_argn(op);
    if(argn >= 0 && operands.size() != (unsigned)argn)
    {
        ir_error(IR_ERROR_STRUCTURAL, 
                 fmt("% takes % operands, not %.", op, argn, operands.size()));
    }

    for(value_t v : operands)
        check_operand(*this, v);

    for(bool const true_arm : { true, false })
    {
        if(branch_kind(op) == BRANCH_NONE || (op == INST_br && true_arm))
            continue;
        if(!operands.begin()[branch_target_i(op, true_arm)].is_block())
            ir_error(IR_ERROR_STRUCTURAL, fmt("% requires block targets.", op));
    }

    inst_ht const h = m_insts.alloc_with([op](inst_ht h) { return inst_t(h, op); });
    inst_t& inst = m_insts.get(h);

    unsigned i = 0;
    for(value_t v : operands)
    {
        link_use(*this, h, i++, v);
        inst.m_operands.push_back(v);
    }

    return h;
}

inst_ht ir_t::emplace_ret(value_t value)
{
    if(value)
        return emplace_inst(INST_ret, { value });
    return emplace_inst(INST_ret);
}

////////////////////////////////////////
// inst_ht                            //
////////////////////////////////////////

inst_op_t inst_ht::op(ir_t const& ir) const { return ir[*this].op(); }
block_ht inst_ht::block(ir_t const& ir) const { return ir[*this].container; }
inst_ht inst_ht::next(ir_t const& ir) const { return ir[*this].next; }
inst_ht inst_ht::prev(ir_t const& ir) const { return ir[*this].prev; }

std::size_t inst_ht::operand_count(ir_t const& ir) const { return ir[*this].operand_count(); }

value_t inst_ht::operand(ir_t const& ir, unsigned i) const 
{ 
    inst_t const& inst = ir[*this];
    if(i >= inst.operand_count())
        ir_error(IR_ERROR_STRUCTURAL, fmt("% has no operand %.", *this, i));
    return inst.operand(i);
}

void inst_ht::set_operand(ir_t& ir, unsigned i, value_t value) const
{
    inst_t& inst = ir[*this];
    if(i >= inst.operand_count())
        ir_error(IR_ERROR_STRUCTURAL, fmt("% has no operand %.", *this, i));

    value_t const old = inst.m_operands[i];
    if(old == value)
        return;

    check_operand(ir, value);
    if(old.is_block() && branch_kind(inst.op()) != BRANCH_NONE && !value.is_block())
        ir_error(IR_ERROR_STRUCTURAL, fmt("% requires block targets.", inst.op()));

    unlink_use(ir, *this, i, old);
    link_use(ir, *this, i, value);
    inst.m_operands[i] = value;
}

void inst_ht::append_operand(ir_t& ir, value_t value) const
{
    inst_t& inst = ir[*this];
    if(inst_argn(inst.op()) >= 0)
        ir_error(IR_ERROR_STRUCTURAL, fmt("% takes a fixed number of operands.", inst.op()));

    check_operand(ir, value);
    link_use(ir, *this, inst.m_operands.size(), value);
    inst.m_operands.push_back(value);
}

void inst_ht::drop_operands(ir_t& ir) const
{
    inst_t& inst = ir[*this];
    for(unsigned i = 0; i < inst.m_operands.size(); ++i)
        unlink_use(ir, *this, i, inst.m_operands[i]);
    inst.m_operands.clear();
}

block_ht inst_ht::successor(ir_t const& ir, unsigned i) const
{
    inst_t const& inst = ir[*this];
    if(i >= successor_count(ir))
        ir_error(IR_ERROR_STRUCTURAL, fmt("% has no successor %.", *this, i));
    return operand(ir, branch_target_i(inst.op(), i == 0)).block();
}

unsigned inst_ht::successor_count(ir_t const& ir) const
{
    switch(branch_kind(ir[*this].op()))
    {
    case BRANCH_UNCOND: return 1;
    case BRANCH_COND:   return 2;
    default:            return 0;
    }
}

// Terminators stay last in their block.
void inst_ht::insert_after(ir_t& ir, inst_ht inst) const 
{ 
    if(is_terminator(op(ir)))
        ir_error(IR_ERROR_STRUCTURAL, fmt("Nothing can follow terminator %.", *this));
    if(is_terminator(inst.op(ir)) && next(ir))
        ir_error(IR_ERROR_STRUCTURAL, fmt("Terminator % must be last in %.", inst, block(ir)));
    list_insert_after(ir, *this, inst); 
}

void inst_ht::insert_before(ir_t& ir, inst_ht inst) const 
{ 
    if(is_terminator(inst.op(ir)))
        ir_error(IR_ERROR_STRUCTURAL, fmt("Terminator % must be last in %.", inst, block(ir)));
    list_insert_before(ir, *this, inst); 
}

inst_ht inst_ht::remove(ir_t& ir) const
{
    inst_t& inst = ir[*this];
    inst_ht const next = inst.next;

    if(block_ht const block = inst.container)
    {
        block.remove_inst(ir, *this);
        return next;
    }

    // Detached; there's no block to fix up.
    for(auto const& user : inst.users())
        if(user.inst != *this)
            ir_error(IR_ERROR_INVARIANT, fmt("Removing % while % still uses it.", *this, user));

    drop_operands(ir);
    ir.free(*this);
    return next;
}

unsigned inst_ht::replace_uses(ir_t& ir, value_t value) const
{
    if(value == value_t(*this))
        return 0;

    // Copy, as 'set_operand' modifies the set.
    auto const users = ir[*this].users();
    for(auto const& user : users)
        user.inst.set_operand(ir, user.operand, value);

    dprint(ir.log, "REPLACE_USES", *this, "WITH", value, users.size());
    return users.size();
}
