#pragma once

#include <uuidb64/result.hpp>
#include <string_view>

namespace uuidb64::log {

enum Level { Trace, Debug, Info, Warn, Error };

void set_level(Level lvl);
Level get_level();

// True when a message at lvl would be written; lets callers skip
// building arguments for suppressed messages.
bool enabled(Level lvl);

void set_color_enabled(bool enabled);
bool is_color_enabled();

void trace(const char* fmt, ...);
void debug(const char* fmt, ...);
void info(const char* fmt, ...);
void warn(const char* fmt, ...);
void error(const char* fmt, ...);

const char* level_name(Level lvl);

// Case-insensitive inverse of level_name()
Result<Level> parse_level(std::string_view name);

} // namespace uuidb64::log
