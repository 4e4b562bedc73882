#pragma once

#include <weft/result.hpp>
#include <string>
#include <cstdio>

namespace weft::log {

enum Level { Trace, Debug, Info, Warn, Error };

void set_level(Level lvl);
Level get_level();

void set_color_enabled(bool enabled);
bool is_color_enabled();

// Destination for log lines; stderr until changed. Color detection follows
// the stream unless set_color_enabled() was called explicitly.
void set_stream(std::FILE* stream);
std::FILE* get_stream();

void trace(const char* fmt, ...);
void debug(const char* fmt, ...);
void info(const char* fmt, ...);
void warn(const char* fmt, ...);
void error(const char* fmt, ...);

// Emit at a level chosen at runtime
void write(Level lvl, const char* fmt, ...);

const char* level_name(Level lvl);

// Case-insensitive inverse of level_name()
Result<Level> parse_level(const std::string& name);

} // namespace weft::log
