#ifndef IR_ERROR_HPP
#define IR_ERROR_HPP

// Errors raised by the IR layer.
// These always indicate malformed IR produced by a bug in some pass,
// never a problem with the user's program.

#include <stdexcept>
#include <string>
#include <string_view>

enum ir_error_kind_t
{
    IR_ERROR_INVALID_POINTER, // Dereferenced an absent or freed slot.
    IR_ERROR_STRUCTURAL,      // An operation's structural precondition failed.
    IR_ERROR_INVARIANT,       // Freeing or verifying found a broken invariant.
};

std::string_view to_string(ir_error_kind_t kind);

class ir_error_t : public std::runtime_error
{
public:
    ir_error_t(ir_error_kind_t kind, char const* what) 
    : std::runtime_error(what)
    , kind(kind)
    {}

    ir_error_t(ir_error_kind_t kind, std::string const& what) 
    : std::runtime_error(what)
    , kind(kind)
    {}

    ir_error_kind_t kind;
};

[[gnu::noreturn]] 
void ir_error(ir_error_kind_t kind, std::string const& what);

// Formats an 'ir_error_t' the way the driver reports it.
std::string fmt_ir_error(ir_error_t const& error, bool color = true);

#endif
