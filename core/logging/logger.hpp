#pragma once

#include <functional>
#include <mutex>
#include <sstream>
#include <string>

namespace hearth {
namespace logging {

enum class Level { LVL_DEBUG, LVL_INFO, LVL_WARN, LVL_ERROR, LVL_NONE };

class Logger {
public:
    // Optional secondary sink, receives every message that passes the threshold
    using Sink = std::function<void(Level level, const std::string &message)>;

    static void init(Level threshold);
    static void log(Level level, const char *file, int line, const std::string &message);
    static void set_level(Level level);
    static Level level();

    // Install (or clear with nullptr) the secondary sink. Used by tests to capture output.
    static void set_sink(Sink sink);

private:
    static Level threshold_;
    static std::mutex mutex_;
    static Sink sink_;
};

// Helper to convert level names from config ("debug", "INFO", ...)
Level string_to_level(const std::string &level_str);
const char *level_to_string(Level level);

}  // namespace logging
}  // namespace hearth

#define LOG_INTERNAL(level, msg)                                                \
    do {                                                                        \
        std::stringstream log_ss_;                                              \
        log_ss_ << msg;                                                         \
        hearth::logging::Logger::log(level, __FILE__, __LINE__, log_ss_.str()); \
    } while (0)

#define LOG_DEBUG(msg) LOG_INTERNAL(hearth::logging::Level::LVL_DEBUG, msg)
#define LOG_INFO(msg) LOG_INTERNAL(hearth::logging::Level::LVL_INFO, msg)
#define LOG_WARN(msg) LOG_INTERNAL(hearth::logging::Level::LVL_WARN, msg)
#define LOG_ERROR(msg) LOG_INTERNAL(hearth::logging::Level::LVL_ERROR, msg)
