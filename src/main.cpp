// This project is licensed under the Boost Software License.
// See license.txt for details.

#include <cstdlib>
#include <cstdio>
#include <iostream>
#include <fstream>
#include <vector>

#include <boost/program_options.hpp>

#include "ir.hpp"
#include "ir_error.hpp"
#include "options.hpp"

#ifndef VERSION
#define VERSION "unknown"
#endif

namespace po = boost::program_options;

void handle_options(po::options_description const& cfg_desc, po::variables_map const& vm, int depth = 0)
{
    if(depth > 16)
        throw std::runtime_error("Configuration files nested too deeply.");

    if(vm.count("config"))
    {
        std::string const name = vm["config"].as<std::string>();
        std::ifstream ifs(name, std::ios::in);
        if(!ifs)
            throw std::runtime_error(fmt("Unable to open configuration file: %", name));

        po::variables_map cfg_vm;
        po::store(po::parse_config_file(ifs, cfg_desc), cfg_vm);
        po::notify(cfg_vm);

        handle_options(cfg_desc, cfg_vm, depth + 1);
    }

    if(vm.count("assert-valid"))
        _options.assert_valid = vm["assert-valid"].as<bool>();

    if(vm.count("log"))
        _options.log_ir = vm["log"].as<bool>();

    if(vm.count("print"))
        _options.print_ir = vm["print"].as<bool>();
}

// Builds:
//
//   bb_entry: cond_br 1, bb_then, bb_else
//   bb_then:  %x = add 2, 3 ; br bb_exit
//   bb_else:  %y = sub 2, 3 ; br bb_exit
//   bb_exit:  %z = phi %x, bb_then, %y, bb_else ; ret %z
func_ht build_demo(ir_t& ir)
{
    func_ht const fn = ir.emplace_func("demo");

    block_ht const entry = ir.emplace_block();
    block_ht const then_block = ir.emplace_block();
    block_ht const else_block = ir.emplace_block();
    block_ht const exit_block = ir.emplace_block();

    for(block_ht block : { entry, then_block, else_block, exit_block })
        fn.append_block(ir, block);

    inst_ht const branch = ir.emplace_cond_br(value_t::num(1), then_block, else_block);
    entry.append_inst(ir, branch);
    entry.add_successor(ir, then_block, branch, true);
    entry.add_successor(ir, else_block, branch, false);

    inst_ht const x = ir.emplace_inst(INST_add, { value_t::num(2), value_t::num(3) });
    then_block.append_inst(ir, x);
    inst_ht const then_br = ir.emplace_br(exit_block);
    then_block.append_inst(ir, then_br);
    then_block.add_successor(ir, exit_block, then_br, false);

    inst_ht const y = ir.emplace_inst(INST_sub, { value_t::num(2), value_t::num(3) });
    else_block.append_inst(ir, y);
    inst_ht const else_br = ir.emplace_br(exit_block);
    else_block.append_inst(ir, else_br);
    else_block.add_successor(ir, exit_block, else_br, false);

    inst_ht const z = ir.emplace_inst(INST_phi, { x, then_block, y, else_block });
    exit_block.append_inst(ir, z);
    exit_block.append_inst(ir, ir.emplace_ret(z));

    return fn;
}

// Turns conditional branches on constants into unconditional ones.
unsigned fold_branches(ir_t& ir, func_ht fn)
{
    unsigned folded = 0;

    for(block_ht block : fn.blocks(ir))
    {
        inst_ht const branch = block.terminator(ir);
        if(!branch || branch.op(ir) != INST_cond_br)
            continue;

        value_t const condition = branch.operand(ir, 0);
        if(!condition.is_num())
            continue;

        bool const taken = condition.whole() != 0;
        block.remove_successor(ir, branch.successor(ir, taken ? 1 : 0), branch, !taken);
        ++folded;
    }

    return folded;
}

// Removes blocks that no branch can reach, along with the phi inputs 
// that mention them.
unsigned prune_unreachable(ir_t& ir, func_ht fn)
{
    unsigned pruned = 0;

    for(bool changed = true; changed;)
    {
        changed = false;

        for(block_ht block : fn.blocks(ir))
        {
            if(block == fn.entry(ir) || !block.predecessors(ir).empty())
                continue;

            // Only phis can still refer to an unreachable block.
            // Rebuild them without the dead input.
            auto const users = ir[block].users();
            for(auto const& user : users)
            {
                inst_ht const phi = user.inst;
                if(phi.op(ir) != INST_phi || phi.block(ir) == block)
                    continue;

                std::vector<value_t> kept;
                for(unsigned i = 0; i + 1 < phi.operand_count(ir); i += 2)
                {
                    if(phi.operand(ir, i + 1) == value_t(block))
                        continue;
                    kept.push_back(phi.operand(ir, i));
                    kept.push_back(phi.operand(ir, i + 1));
                }

                phi.drop_operands(ir);
                for(value_t v : kept)
                    phi.append_operand(ir, v);
            }

            // Throws if a value defined here is still used elsewhere.
            fn.remove_block(ir, block);
            ++pruned;
            changed = true;
        }
    }

    return pruned;
}

int main(int argc, char** argv)
{
    try
    {
        /////////////////////////////
        // Handle program options: //
        /////////////////////////////
        {
            po::options_description cmdline("Instructional Flags");
            cmdline.add_options()
                ("help,h", "produce help message")
                ("version,v", "version")
                ("config,c", po::value<std::string>(), "read options from a configuration file")
            ;

            po::options_description basic("Options");
            basic.add_options()
                ("assert-valid", po::value<bool>()->implicit_value(true), "verify the IR after every rewrite")
                ("log", po::value<bool>()->implicit_value(true), "trace CFG mutations to stderr")
                ("print", po::value<bool>()->implicit_value(true), "print the IR before and after rewriting")
            ;

            po::options_description cmdline_full;
            cmdline_full.add(cmdline).add(basic);

            po::variables_map vm;
            po::store(po::command_line_parser(argc, argv).options(cmdline_full).run(), vm);
            po::notify(vm);

            if(vm.count("help"))
            {
                std::cout << cmdline_full << std::endl;
                return EXIT_SUCCESS;
            }

            if(vm.count("version"))
            {
                std::cout << "cfgir " << VERSION << " (" << __DATE__ << ")\n";
                std::cout << 
                    "This is free software. "
                    "There is no warranty.\n";
                return EXIT_SUCCESS;
            }

            handle_options(basic, vm);
        }

        ////////////////////////////////////
        // OK! Now to do the actual work: //
        ////////////////////////////////////

        ir_t ir;
        if(compiler_options().log_ir)
            ir.log = &stderr_log;

        func_ht const fn = build_demo(ir);
        ir.assert_valid();

        if(compiler_options().print_ir)
            std::cout << fn.to_string(ir) << '\n';

        unsigned const folded = fold_branches(ir, fn);
        ir.assert_valid();

        unsigned const pruned = prune_unreachable(ir, fn);
        ir.assert_valid();

        if(compiler_options().print_ir)
        {
            std::cout << "; folded " << folded << " branches, pruned " << pruned << " blocks\n";
            std::cout << fn.to_string(ir);
        }
    }
    catch(ir_error_t& e)
    {
        std::fprintf(stderr, "%s\n", fmt_ir_error(e).c_str());
        return EXIT_FAILURE;
    }
    catch(std::exception& e)
    {
        std::fprintf(stderr, "%s\n", e.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
