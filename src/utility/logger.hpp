#pragma once

#include <atomic>
#include <chrono>
#include <ctime>
#include <iostream>
#include <mutex>
#include <string>
#include <string_view>

#include <fmt/format.h>

namespace celleste {

/**
 * Thread-safe stderr logger, active only when DEBUG is defined.
 * Release builds compile every LOG_* call away, arguments included.
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
     * @brief Drops every message below the given level.
     */
    static void set_min_level(Level level) noexcept {
        min_level().store(level, std::memory_order_relaxed);
    }

    static bool enabled(Level level) noexcept {
        return level >= min_level().load(std::memory_order_relaxed);
    }

    static void log(Level level, std::string_view file, int line,
                    const std::string &message) {
#ifdef DEBUG
        if (!enabled(level)) {
            return;
        }

        static std::mutex log_mutex;
        std::lock_guard<std::mutex> lock(log_mutex);

        auto now = std::chrono::system_clock::now();
        auto time_t = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                      now.time_since_epoch()) %
                  1000;

        const std::tm local = *std::localtime(&time_t);

        // basename only
        const auto last_slash = file.find_last_of("/\\");
        if (last_slash != std::string_view::npos) {
            file.remove_prefix(last_slash + 1);
        }

        std::cerr << fmt::format("[{}][{:02}:{:02}:{:02}.{:03}][{}:{}] {}\n",
                                 level_to_string(level), local.tm_hour,
                                 local.tm_min, local.tm_sec, ms.count(), file,
                                 line, message);
#else
        (void)level;
        (void)file;
        (void)line;
        (void)message;
#endif
    }

  private:
    static std::atomic<int> &min_level() noexcept {
        static std::atomic<int> level{DEBUG_LEVEL};
        return level;
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

} // namespace celleste

// Logging macros take a fmt format string plus arguments
#ifdef DEBUG
#define CELLESTE_LOG(level, ...)                                               \
    celleste::Logger::log(level, __FILE__, __LINE__, fmt::format(__VA_ARGS__))
#define LOG_DEBUG(...) CELLESTE_LOG(celleste::Logger::DEBUG_LEVEL, __VA_ARGS__)
#define LOG_INFO(...) CELLESTE_LOG(celleste::Logger::INFO_LEVEL, __VA_ARGS__)
#define LOG_WARN(...) CELLESTE_LOG(celleste::Logger::WARN_LEVEL, __VA_ARGS__)
#define LOG_ERROR(...) CELLESTE_LOG(celleste::Logger::ERROR_LEVEL, __VA_ARGS__)
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
