#include "inst_op.hpp"

std::string_view to_string(inst_op_t op)
{
    using namespace std::literals;
    switch(op)
    {
#define INST_DEF(x, ...) case INST_##x: return std::string_view(#x);
#include "inst_op.inc"
    default: return "???"sv;
    }
}

std::ostream& operator<<(std::ostream& o, inst_op_t op)
{
    o << to_string(op);
    return o;
}
