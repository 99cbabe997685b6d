#include "ir.hpp"

#include <ostream>
#include <sstream>

std::string block_ht::name() const { return fmt("bb_%", index); }
std::string inst_ht::name() const { return "%" + std::to_string(index); }

std::ostream& operator<<(std::ostream& o, block_ht h)
{
    o << h.name();
    return o;
}

std::ostream& operator<<(std::ostream& o, inst_ht h)
{
    o << h.name();
    return o;
}

std::ostream& operator<<(std::ostream& o, value_t v)
{
    switch(v.kind())
    {
    case VALUE_NUM:   o << v.whole(); break;
    case VALUE_INST:  o << v.inst(); break;
    case VALUE_BLOCK: o << v.block(); break;
    default:          o << '_'; break;
    }
    return o;
}

std::ostream& operator<<(std::ostream& o, block_edge_t const& edge)
{
    o << '(' << edge.to() << ", " << edge.inst() << ", " << (edge.is_true_arm() ? "true" : "false") << ')';
    return o;
}

void inst_ht::print(std::ostream& o, ir_t const& ir) const
{
    inst_t const& inst = ir[*this];

    if(inst_flags(inst.op()) & INSTF_VALUE)
        o << *this << " = ";
    o << inst.op();

    if(!inst.m_operands.empty())
        o << ' ' << join(", ", inst.m_operands);
}

std::string inst_ht::to_string(ir_t const& ir) const
{
    std::ostringstream ss;
    print(ss, ir);
    return ss.str();
}

void block_ht::print(std::ostream& o, ir_t const& ir) const
{
    o << *this << ':';
    for(inst_ht inst : insts(ir))
    {
        o << "\n\t";
        inst.print(o, ir);
    }
}

std::string block_ht::to_string(ir_t const& ir) const
{
    std::ostringstream ss;
    print(ss, ir);
    return ss.str();
}

void func_ht::print(std::ostream& o, ir_t const& ir) const
{
    o << "fn " << name(ir) << ":\n";
    for(block_ht block : blocks(ir))
    {
        block.print(o, ir);
        o << '\n';
    }
}

std::string func_ht::to_string(ir_t const& ir) const
{
    std::ostringstream ss;
    print(ss, ir);
    return ss.str();
}
