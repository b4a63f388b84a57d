#pragma once

namespace mbuckets {

/// Enable or disable debug output (off by default).
void set_verbose(bool verbose);
bool is_verbose();

/// printf-style logging. Info goes to stdout; errors and debug to stderr.
void log_info(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_error(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_debug(const char* fmt, ...) __attribute__((format(printf, 1, 2)));

}  // namespace mbuckets
