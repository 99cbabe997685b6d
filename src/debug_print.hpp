#ifndef DEBUG_PRINT_HPP
#define DEBUG_PRINT_HPP

// Logging, used to trace IR mutations.

#include <cstdio>
#include <mutex>
#include <string>

#include "format.hpp"

struct log_t
{
    FILE* stream;
    std::mutex mutex;

    void write(std::string const& msg)
    {
        std::lock_guard<std::mutex> lock(mutex);
        std::fputs(msg.c_str(), stream);
        std::fputc('\n', stream);
        std::fflush(stream);
    }
};

inline log_t stdout_log = { stdout };
inline log_t stderr_log = { stderr };

// Writes a space-separated line to 'log', if 'log' isn't null.
#ifdef CFGIR_NO_DEBUG_PRINT
#define dprint(...) ((void)0)
#else
#define dprint(log, ...) ((void)((log) ? ((log)->write(::ezcat(" ", __VA_ARGS__)), 0) : 0))
#endif

#endif
