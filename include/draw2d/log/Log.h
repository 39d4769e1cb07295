#pragma once

#include <SDL3/SDL_log.h>
#include <optional>
#include <string>

namespace draw2d {
namespace log {

// Name used in the record header, e.g. "INFO".
const char* priorityName(SDL_LogPriority priority);

// Short name for an SDL log category, e.g. "app" or "gpu".
const char* categoryName(int category);

// Accepts trace, verbose, debug, info, warn, error and critical (any case).
std::optional<SDL_LogPriority> parsePriority(const std::string& name);

// DRAW2D_LOG wins over the config value. Both fall back to info.
SDL_LogPriority resolvePriority(const char* envValue, const std::string& configLevel);

// Word wrap to `width` columns. The first line is prefixed with "┏ ", every
// following line with "┃ ". Words longer than a line are split.
std::string wrap(const std::string& text, size_t width);

/**
 * Full multiline record:
 *
 *   ┏ INFO [12:03:55.123456] [app]
 *   ┃ message text wrapped to width
 */
std::string formatRecord(SDL_LogPriority priority, int category,
                         const std::string& timestamp, const std::string& message,
                         size_t width);

// HH:MM:SS.ffffff, local time.
std::string currentTimestamp();

// min(terminal width, 74). The terminal width comes from COLUMNS, or 80.
size_t outputWidth();

// Route all SDL logging through formatRecord and set every category's priority.
void install(SDL_LogPriority priority);

} // namespace log
} // namespace draw2d
