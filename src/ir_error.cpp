#include "ir_error.hpp"

#include "format.hpp"

#define CONSOLE_RED   "\x1B[31m"
#define CONSOLE_BOLD  "\x1B[1m"
#define CONSOLE_RESET "\x1B[0m"

std::string_view to_string(ir_error_kind_t kind)
{
    using namespace std::literals;
    switch(kind)
    {
    case IR_ERROR_INVALID_POINTER: return "invalid pointer"sv;
    case IR_ERROR_STRUCTURAL:      return "structural precondition"sv;
    case IR_ERROR_INVARIANT:       return "invariant violation"sv;
    default: return "???"sv;
    }
}

void ir_error(ir_error_kind_t kind, std::string const& what)
{
    throw ir_error_t(kind, what);
}

std::string fmt_ir_error(ir_error_t const& error, bool color)
{
    if(color)
        return fmt(CONSOLE_RED CONSOLE_BOLD "internal compiler error" CONSOLE_RESET 
                   CONSOLE_BOLD " (%): " CONSOLE_RESET "%", 
                   to_string(error.kind), error.what());
    return fmt("internal compiler error (%): %", to_string(error.kind), error.what());
}
