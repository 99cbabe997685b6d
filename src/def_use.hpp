#ifndef DEF_USE_HPP
#define DEF_USE_HPP

// Def-use bookkeeping.
// Anything that operands can reference keeps the set of operand slots
// currently referencing it. Instructions write these sets when their
// operands change; nothing else should.

#include <compare>
#include <cstdint>
#include <functional>
#include <ostream>

#include <boost/container/flat_set.hpp>

#include "format.hpp"
#include "ir_decl.hpp"
#include "ir_error.hpp"

namespace bc = boost::container;

// Names operand 'operand' of instruction 'inst', which references an 'E'.
template<typename E>
struct user_t
{
    inst_ht inst = {};
    std::uint32_t operand = 0;

    constexpr auto operator<=>(user_t const&) const = default;

    std::size_t hash() const { return hash_combine(inst.hash(), operand); }
};

template<typename E>
struct std::hash<user_t<E>>
{
    std::size_t operator()(user_t<E> const& user) const noexcept { return user.hash(); }
};

template<typename E>
std::ostream& operator<<(std::ostream& o, user_t<E> const& user)
{
    o << user.inst << '#' << user.operand;
    return o;
}

template<typename E>
class usable_t
{
public:
    using user_type = user_t<E>;
    using user_set_t = bc::flat_set<user_type>;

    user_set_t const& users() const { return m_users; }
    bool has_users() const { return !m_users.empty(); }
    std::size_t user_count() const { return m_users.size(); }

    void insert_user(user_type user) { m_users.insert(user); }

    void remove_user(user_type user)
    {
        if(!m_users.erase(user))
            ir_error(IR_ERROR_STRUCTURAL, fmt("Operand % is not a registered user.", user));
    }

private:
    user_set_t m_users;
};

#endif
