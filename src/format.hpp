#ifndef FORMAT_HPP
#define FORMAT_HPP

// Functions for formatting strings.

#include <sstream>
#include <string>

template<char F>
void fmt_impl(std::ostringstream& ss, char const* str)
{
    while(*str)
        ss.rdbuf()->sputc(*str++);
}

template<char F, typename T, typename... Ts>
void fmt_impl(std::ostringstream& ss, char const* str, T const& t, Ts const&... ts)
{
    while(*str)
    {
        char const c = *str++;
        if(c == F)
        {
            ss << t;
            fmt_impl<F>(ss, str, ts...);
            return;
        }
        else
            ss.rdbuf()->sputc(c);
    }
}

// A really basic wrapper around ostringstream.
// Example use: fmt("edge % -> %", from, to)
template<char F = '%', typename... Ts>
std::string fmt(char const* str, Ts const&... ts)
{
    std::ostringstream ss;
    fmt_impl<F>(ss, str, ts...);
    return ss.str();
}

template<typename P>
void ezcat_impl(std::ostringstream& ss, P const& sep) {}

template<typename P, typename T, typename... Ts>
void ezcat_impl(std::ostringstream& ss, P const& sep, T const& t, Ts const&... ts)
{
    ss << t;
    if(sizeof...(Ts) > 0)
        ss << sep;
    ezcat_impl(ss, sep, ts...);
}

// Joins the string representations together, separated by 'sep'.
template<typename P, typename... Ts>
std::string ezcat(P const& sep, Ts const&... ts)
{
    std::ostringstream ss;
    ezcat_impl(ss, sep, ts...);
    return ss.str();
}

// Joins a range, separated by 'sep'.
template<typename P, typename Range>
std::string join(P const& sep, Range const& range)
{
    std::ostringstream ss;
    bool first = true;
    for(auto const& x : range)
    {
        if(!first)
            ss << sep;
        ss << x;
        first = false;
    }
    return ss.str();
}

#endif
