#ifndef ASSERT_HPP
#define ASSERT_HPP

#include <cstdio>
#include <cstdlib>

#include "format.hpp"

// passert is like assert, but prints whatever extra values it's given.
// Use it for conditions only a bug inside the IR layer can break.
// Bad input from callers gets an 'ir_error_t' instead.
#ifdef NDEBUG
#define passert(C, ...) ((void) 0)
#else
#define passert(C, ...) (void)((C) || (_passert_impl(#C, __FILE__, __LINE__, __PRETTY_FUNCTION__, __VA_ARGS__), 0))
#endif

template<typename... Args>
[[gnu::noreturn]]
void _passert_impl(char const* expr, char const* file, long long line, char const* fn, Args const&... args)
{
    std::fflush(stdout);
    std::fputs(fmt("%:%: %: Assertion `%' failed.\n", file, line, fn, expr).c_str(), stderr);
    std::fputs(fmt("  with: %\n", ezcat(", ", args...)).c_str(), stderr);
    std::fflush(stderr);
    std::abort();
}

#endif
