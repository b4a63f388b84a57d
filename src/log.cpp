#include "mbuckets/log.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdio>

namespace mbuckets {

namespace {
std::atomic<bool> g_verbose{false};
}  // namespace

void set_verbose(bool verbose) {
    g_verbose = verbose;
}

bool is_verbose() {
    return g_verbose;
}

void log_info(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vfprintf(stdout, fmt, args);
    va_end(args);
    fputc('\n', stdout);
    fflush(stdout);
}

void log_error(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    fprintf(stderr, "ERROR: ");
    vfprintf(stderr, fmt, args);
    va_end(args);
    fputc('\n', stderr);
}

// stderr keeps stdout clean for payloads written by the CLI
void log_debug(const char* fmt, ...) {
    if (!g_verbose) return;
    va_list args;
    va_start(args, fmt);
    fprintf(stderr, "DEBUG: ");
    vfprintf(stderr, fmt, args);
    va_end(args);
    fputc('\n', stderr);
}

}  // namespace mbuckets
