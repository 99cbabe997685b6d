#ifndef OPTIONS_HPP
#define OPTIONS_HPP

// Compiler options.

#include <string>

struct options_t
{
    bool assert_valid = true; // Run 'ir_t::verify' at checkpoints.
    bool log_ir = false;      // Trace CFG mutations to stderr.
    bool print_ir = true;     // Dump the IR before and after rewriting.
};

extern options_t _options;
inline options_t const& compiler_options() { return _options; }

#endif
