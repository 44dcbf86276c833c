#pragma once

#include <rosid/result.hpp>
#include <string>
#include <cstdio>

namespace rosid::log {

enum Level { Trace, Debug, Info, Warn, Error };

void set_level(Level lvl);
Level get_level();

void set_color_enabled(bool enabled);
bool is_color_enabled();

// Generic entry point; the named helpers below forward to it
void logf(Level lvl, const char* fmt, ...)
#if defined(__GNUC__)
    __attribute__((format(printf, 2, 3)))
#endif
    ;

void trace(const char* fmt, ...);
void debug(const char* fmt, ...);
void info(const char* fmt, ...);
void warn(const char* fmt, ...);
void error(const char* fmt, ...);

const char* level_name(Level lvl);

// "trace", "debug", "info", "warn"/"warning", "error" (case-insensitive)
Result<Level> parse_level(const std::string& name);

} // namespace rosid::log
