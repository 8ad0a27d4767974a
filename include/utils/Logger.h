#pragma once

#include <functional>
#include <mutex>
#include <string>

#ifdef ERROR
#undef ERROR
#endif

namespace Logger {
enum class Level { DEBUG = 0, INFO = 1, WARN = 2, ERROR = 3, NONE = 4 };

using Sink = std::function<void(Level level, const std::string &line)>;

void setLevel(Level level);
Level getLevel();

/**
 * @brief Redirect formatted log lines away from stdout
 * @param sink Receives the level and the uncoloured line; an empty sink restores stdout
 */
void setSink(Sink sink);

void debug(const std::string &message);
void info(const std::string &message);
void warn(const std::string &message);
void error(const std::string &message);

void log(Level level, const std::string &prefix, const std::string &message);
} // namespace Logger
