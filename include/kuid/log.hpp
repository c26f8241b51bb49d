#pragma once

#include <kuid/result.hpp>
#include <string>
#include <cstdio>

namespace kuid::log {

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

const char* level_name(Level lvl);

// Inverse of level_name(); accepts "warning" as an alias for "warn"
Result<Level> parse_level(const std::string& name);

} // namespace kuid::log
