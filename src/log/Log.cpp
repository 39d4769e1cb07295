#include "draw2d/log/Log.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <sstream>
#include <vector>

namespace draw2d {
namespace log {

namespace {

const char* FIRST_INDENT = "┏ ";
const char* NEXT_INDENT = "┃ ";
constexpr size_t INDENT_COLUMNS = 2;
constexpr size_t MAX_WIDTH = 74;

// Column count of a UTF-8 string, one column per code point.
size_t columns(const std::string& text) {
    size_t count = 0;
    for (unsigned char c : text) {
        if ((c & 0xC0) != 0x80) ++count;
    }
    return count;
}

// Byte length of the first `count` code points.
size_t prefixBytes(const std::string& text, size_t count) {
    size_t seen = 0;
    for (size_t i = 0; i < text.size(); ++i) {
        if ((static_cast<unsigned char>(text[i]) & 0xC0) != 0x80) {
            if (seen == count) return i;
            ++seen;
        }
    }
    return text.size();
}

std::vector<std::string> splitWords(const std::string& line) {
    std::vector<std::string> words;
    std::istringstream stream(line);
    std::string word;
    while (stream >> word) {
        words.push_back(word);
    }
    return words;
}

void logOutput(void* /*userdata*/, int category, SDL_LogPriority priority, const char* message) {
    const std::string record = formatRecord(priority, category, currentTimestamp(),
                                            message ? message : "", outputWidth());
    std::fputs(record.c_str(), stderr);
    std::fputc('\n', stderr);
}

} // namespace

const char* priorityName(SDL_LogPriority priority) {
    switch (priority) {
        case SDL_LOG_PRIORITY_TRACE:    return "TRACE";
        case SDL_LOG_PRIORITY_VERBOSE:  return "VERBOSE";
        case SDL_LOG_PRIORITY_DEBUG:    return "DEBUG";
        case SDL_LOG_PRIORITY_INFO:     return "INFO";
        case SDL_LOG_PRIORITY_WARN:     return "WARN";
        case SDL_LOG_PRIORITY_ERROR:    return "ERROR";
        case SDL_LOG_PRIORITY_CRITICAL: return "CRITICAL";
        default:                        return "LOG";
    }
}

const char* categoryName(int category) {
    switch (category) {
        case SDL_LOG_CATEGORY_APPLICATION: return "app";
        case SDL_LOG_CATEGORY_ERROR:       return "error";
        case SDL_LOG_CATEGORY_ASSERT:      return "assert";
        case SDL_LOG_CATEGORY_SYSTEM:      return "system";
        case SDL_LOG_CATEGORY_AUDIO:       return "audio";
        case SDL_LOG_CATEGORY_VIDEO:       return "video";
        case SDL_LOG_CATEGORY_RENDER:      return "render";
        case SDL_LOG_CATEGORY_INPUT:       return "input";
        case SDL_LOG_CATEGORY_TEST:        return "test";
        case SDL_LOG_CATEGORY_GPU:         return "gpu";
        default:                           return "custom";
    }
}

std::optional<SDL_LogPriority> parsePriority(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "trace") return SDL_LOG_PRIORITY_TRACE;
    if (lower == "verbose") return SDL_LOG_PRIORITY_VERBOSE;
    if (lower == "debug") return SDL_LOG_PRIORITY_DEBUG;
    if (lower == "info") return SDL_LOG_PRIORITY_INFO;
    if (lower == "warn" || lower == "warning") return SDL_LOG_PRIORITY_WARN;
    if (lower == "error") return SDL_LOG_PRIORITY_ERROR;
    if (lower == "critical") return SDL_LOG_PRIORITY_CRITICAL;
    return std::nullopt;
}

SDL_LogPriority resolvePriority(const char* envValue, const std::string& configLevel) {
    if (envValue && *envValue) {
        if (auto priority = parsePriority(envValue)) return *priority;
    }
    if (auto priority = parsePriority(configLevel)) return *priority;
    return SDL_LOG_PRIORITY_INFO;
}

std::string wrap(const std::string& text, size_t width) {
    // Always leave room for at least one character after the indent
    const size_t available = std::max<size_t>(width, INDENT_COLUMNS + 1) - INDENT_COLUMNS;

    std::vector<std::string> lines;
    std::istringstream input(text);
    std::string paragraph;
    while (std::getline(input, paragraph)) {
        // Lines that fit keep their spacing, so tables survive
        if (columns(paragraph) <= available) {
            lines.push_back(paragraph);
            continue;
        }

        std::string current;
        size_t currentColumns = 0;
        bool wroteLine = false;

        for (std::string word : splitWords(paragraph)) {
            size_t wordColumns = columns(word);
            const size_t needed = currentColumns == 0 ? wordColumns : currentColumns + 1 + wordColumns;
            if (needed <= available) {
                if (currentColumns != 0) current += ' ';
                current += word;
                currentColumns = needed;
                continue;
            }

            if (currentColumns != 0) {
                lines.push_back(current);
                wroteLine = true;
                current.clear();
                currentColumns = 0;
            }
            while (wordColumns > available) {
                const size_t cut = prefixBytes(word, available);
                lines.push_back(word.substr(0, cut));
                wroteLine = true;
                word.erase(0, cut);
                wordColumns -= available;
            }
            current = word;
            currentColumns = wordColumns;
        }

        if (currentColumns != 0 || !wroteLine) {
            lines.push_back(current);
        }
    }
    if (lines.empty()) {
        lines.emplace_back();
    }

    std::string result;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i != 0) result += '\n';
        result += i == 0 ? FIRST_INDENT : NEXT_INDENT;
        result += lines[i];
    }
    return result;
}

std::string formatRecord(SDL_LogPriority priority, int category,
                         const std::string& timestamp, const std::string& message,
                         size_t width) {
    std::string full = std::string(priorityName(priority)) + " [" + timestamp + "] [" +
                       categoryName(category) + "]\n" + message;
    return wrap(full, width);
}

std::string currentTimestamp() {
    using namespace std::chrono;
    const auto now = system_clock::now();
    const auto micros = duration_cast<microseconds>(now.time_since_epoch()).count() % 1000000;
    const std::time_t seconds = system_clock::to_time_t(now);

    std::tm local{};
#ifdef _WIN32
    localtime_s(&local, &seconds);
#else
    localtime_r(&seconds, &local);
#endif

    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%02d:%02d:%02d.%06lld",
                  local.tm_hour, local.tm_min, local.tm_sec, static_cast<long long>(micros));
    return buffer;
}

size_t outputWidth() {
    size_t terminal = 80;
    if (const char* env = std::getenv("COLUMNS")) {
        const long parsed = std::strtol(env, nullptr, 10);
        if (parsed > 0) terminal = static_cast<size_t>(parsed);
    }
    return std::min(terminal, MAX_WIDTH);
}

void install(SDL_LogPriority priority) {
    SDL_SetLogPriorities(priority);
    SDL_SetLogOutputFunction(logOutput, nullptr);
}

} // namespace log
} // namespace draw2d
