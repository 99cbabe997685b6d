#ifndef VALUE_HPP
#define VALUE_HPP

#include <cstdint>
#include <ostream>

#include "assert.hpp"
#include "ir_decl.hpp"

enum value_kind_t : std::uint8_t
{
    VALUE_NONE,
    VALUE_NUM,
    VALUE_INST,
    VALUE_BLOCK,
};

// An instruction operand: an immediate, an instruction's result, or a block.
class value_t
{
public:
    constexpr value_t() = default;
    constexpr value_t(inst_ht inst) : m_kind(inst ? VALUE_INST : VALUE_NONE), m_inst(inst) {}
    constexpr value_t(block_ht block) : m_kind(block ? VALUE_BLOCK : VALUE_NONE), m_block(block) {}

    static constexpr value_t num(std::int64_t n) 
    { 
        value_t v;
        v.m_kind = VALUE_NUM;
        v.m_num = n;
        return v;
    }

    constexpr value_kind_t kind() const { return m_kind; }
    constexpr bool is_num() const { return m_kind == VALUE_NUM; }
    constexpr bool is_inst() const { return m_kind == VALUE_INST; }
    constexpr bool is_block() const { return m_kind == VALUE_BLOCK; }

    std::int64_t whole() const { passert(is_num(), (int)m_kind); return m_num; }
    inst_ht inst() const { passert(is_inst(), (int)m_kind); return m_inst; }
    block_ht block() const { passert(is_block(), (int)m_kind); return m_block; }

    explicit operator bool() const { return m_kind != VALUE_NONE; }
    bool operator!() const { return m_kind == VALUE_NONE; }

    bool operator==(value_t const& o) const
    {
        if(m_kind != o.m_kind)
            return false;
        switch(m_kind)
        {
        case VALUE_NUM:   return m_num == o.m_num;
        case VALUE_INST:  return m_inst == o.m_inst;
        case VALUE_BLOCK: return m_block == o.m_block;
        default:          return true;
        }
    }

    bool operator!=(value_t const& o) const { return !operator==(o); }

private:
    value_kind_t m_kind = VALUE_NONE;
    std::int64_t m_num = 0;
    inst_ht m_inst = {};
    block_ht m_block = {};
};

std::ostream& operator<<(std::ostream& o, value_t v);

#endif
