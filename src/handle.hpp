#ifndef HANDLE_HPP
#define HANDLE_HPP

// handle_t is a 'strong typedef' for arena indexes.
// Each handle remembers the generation of the slot it was allocated in,
// which lets arenas detect handles to freed (or reused) slots.

// EXAMPLE
//   struct my_ht : handle_t<my_ht> {};

#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <ostream>
#include <type_traits>

constexpr std::size_t hash_combine(std::size_t a, std::size_t b)
{
    return a ^ (b + 0x9e3779b9 + (a << 6) + (a >> 2));
}

template<typename Derived>
struct handle_t
{
    using is_handle_tag = void;
    using int_type = std::uint32_t;

    // Index 0 is never allocated; it represents the null handle.
    int_type index = 0;
    int_type gen = 0;

    constexpr explicit operator bool() const { return index != 0; }
    constexpr bool operator!() const { return index == 0; }
    constexpr auto operator<=>(handle_t const&) const = default;

    std::size_t hash() const { return hash_combine(index, gen); }

    constexpr Derived const& as_derived() const { return static_cast<Derived const&>(*this); }
    constexpr Derived& as_derived() { return static_cast<Derived&>(*this); }
};

template<typename Derived>
std::ostream& operator<<(std::ostream& os, handle_t<Derived> const& handle)
{
    os << "{" << handle.index << ":" << handle.gen << "}";
    return os;
}

template<typename T>
struct handle_hash_t
{
    using argument_type = T;
    using result_type = std::size_t;
    result_type operator()(argument_type const& handle) const noexcept { return handle.hash(); }
};

#define DEF_HANDLE_HASH(name) template<> struct std::hash<name> : handle_hash_t<name> {};

template<typename, typename = void>
struct is_handle : std::false_type {};

template<typename t>
struct is_handle<t, std::void_t<typename t::is_handle_tag>> : std::true_type {};

#endif
