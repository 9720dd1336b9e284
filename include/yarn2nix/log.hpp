#pragma once

#include <string>
#include <cstdio>

namespace yarn2nix::log {

enum Level { Trace, Debug, Info, Warn, Error };

void set_level(Level lvl);
Level get_level();

void set_color_enabled(bool enabled);
bool is_color_enabled();

void trace(const char* fmt, ...);
void debug(const char* fmt, ...);
void info(const char* fmt, ...);
void warn(const char* fmt, ...);
void error(const char* fmt, ...);

// Returns the name string for a level
const char* level_name(Level lvl);

// Parse "trace", "debug", "info", "warn" or "error". Returns false on
// anything else and leaves `out` untouched.
bool parse_level(const std::string& name, Level& out);

} // namespace yarn2nix::log
