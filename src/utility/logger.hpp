#pragma once

#include <atomic>
#include <chrono>
#include <ctime>
#include <iostream>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/format.h>

namespace cadhistory {

/**
 * Thread-safe logging system for DEBUG builds only
 * Zero overhead in release builds (NDEBUG defined)
 */
class Logger {
  public:
    enum Level {
        DEBUG_LEVEL = 0,
        INFO_LEVEL = 1,
        WARN_LEVEL = 2,
        ERROR_LEVEL = 3
    };

    /**
     * @brief Set the minimum level that is written.
     * @param level Messages below this level are dropped
     */
    static void set_level(Level level) {
        min_level().store(level, std::memory_order_relaxed);
    }

    /**
     * @brief Get the minimum level that is written.
     * @return Current minimum level
     */
    static Level level() { return min_level().load(std::memory_order_relaxed); }

    /**
     * @brief Parse a level name ("debug", "info", "warn", "error").
     * @param name Level name
     * @param out Parsed level
     * @return False if the name is not a known level
     */
    static bool parse_level(std::string_view name, Level &out) {
        if (name == "debug") {
            out = DEBUG_LEVEL;
        } else if (name == "info") {
            out = INFO_LEVEL;
        } else if (name == "warn") {
            out = WARN_LEVEL;
        } else if (name == "error") {
            out = ERROR_LEVEL;
        } else {
            return false;
        }
        return true;
    }

    static void log(Level level, std::string_view file, int line,
                    const std::string &message) {
        if (level < Logger::level())
            return;

        static std::mutex log_mutex;
        std::lock_guard<std::mutex> lock(log_mutex);

        auto now = std::chrono::system_clock::now();
        auto time_t = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                      now.time_since_epoch()) %
                  1000;

        std::tm local{};
#ifdef _WIN32
        localtime_s(&local, &time_t);
#else
        localtime_r(&time_t, &local);
#endif

        // Extract filename from full path
        size_t last_slash = file.find_last_of("/\\");
        if (last_slash != std::string_view::npos) {
            file = file.substr(last_slash + 1);
        }

        std::cerr << fmt::format("[{}][{:02}:{:02}:{:02}.{:03}][{}:{}] {}\n",
                                 level_to_string(level), local.tm_hour,
                                 local.tm_min, local.tm_sec, ms.count(), file,
                                 line, message);
    }

    template <typename... Args>
    static void logf(Level level, std::string_view file, int line,
                     fmt::format_string<Args...> format, Args &&...args) {
        if (level < Logger::level())
            return;
        log(level, file, line,
            fmt::format(format, std::forward<Args>(args)...));
    }

  private:
    static std::atomic<Level> &min_level() {
        static std::atomic<Level> current{INFO_LEVEL};
        return current;
    }

    static const char *level_to_string(Level level) {
        switch (level) {
        case DEBUG_LEVEL:
            return "DEBUG";
        case INFO_LEVEL:
            return "INFO ";
        case WARN_LEVEL:
            return "WARN ";
        case ERROR_LEVEL:
            return "ERROR";
        default:
            return "UNKNOWN";
        }
    }
};

} // namespace cadhistory

// Logging macros - compile to nothing in release builds
#ifdef DEBUG
#define LOG_DEBUG(...)                                                         \
    cadhistory::Logger::logf(cadhistory::Logger::DEBUG_LEVEL, __FILE__,        \
                             __LINE__, __VA_ARGS__)
#define LOG_INFO(...)                                                          \
    cadhistory::Logger::logf(cadhistory::Logger::INFO_LEVEL, __FILE__,         \
                             __LINE__, __VA_ARGS__)
#define LOG_WARN(...)                                                          \
    cadhistory::Logger::logf(cadhistory::Logger::WARN_LEVEL, __FILE__,         \
                             __LINE__, __VA_ARGS__)
#define LOG_ERROR(...)                                                         \
    cadhistory::Logger::logf(cadhistory::Logger::ERROR_LEVEL, __FILE__,        \
                             __LINE__, __VA_ARGS__)
#else
#define LOG_DEBUG(...)                                                         \
    do {                                                                       \
    } while (0)
#define LOG_INFO(...)                                                          \
    do {                                                                       \
    } while (0)
#define LOG_WARN(...)                                                          \
    do {                                                                       \
    } while (0)
#define LOG_ERROR(...)                                                         \
    do {                                                                       \
    } while (0)
#endif
