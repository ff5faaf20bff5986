#pragma once

#include <lode/result.hpp>
#include <string>
#include <cstdio>

namespace lode::log {

enum Level { Trace, Debug, Info, Warn, Error };

void set_level(Level lvl);
Level get_level();

// Parse a level name as written in config files ("trace" .. "error").
Result<Level> parse_level(const std::string& name);

void set_color_enabled(bool enabled);
bool is_color_enabled();

// Destination stream; defaults to stderr. Passing nullptr restores stderr.
void set_sink(std::FILE* sink);

void trace(const char* fmt, ...);
void debug(const char* fmt, ...);
void info(const char* fmt, ...);
void warn(const char* fmt, ...);
void error(const char* fmt, ...);

// Returns the name string for a level
const char* level_name(Level lvl);

} // namespace lode::log
