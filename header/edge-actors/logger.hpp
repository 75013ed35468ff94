#pragma once

/// @file logger.hpp
/// @brief Thread-safe logger shared by the runtime, the schedulers and the message boxes.
///
/// Usage:
///   edge_actors::logger().info("Runtime", "Running %", name);  // % is placeholder

#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>

namespace edge_actors {

    enum class log_level : std::uint8_t {
        trace,
        debug,
        info,
        warn,
        error,
        off
    };

    std::ostream& operator<<(std::ostream& os, log_level level);

    /// @brief Parses "trace", "debug", "info", "warn", "error" or "off"; falls back to @p fallback.
    log_level parse_log_level(std::string_view text, log_level fallback) noexcept;

    class logger_t final {
    public:
        using sink_type = std::function<void(log_level, std::string_view target, std::string_view message)>;

        logger_t();

        logger_t(const logger_t&) = delete;
        logger_t& operator=(const logger_t&) = delete;

        void set_level(log_level level) noexcept {
            level_.store(level, std::memory_order_relaxed);
        }

        log_level level() const noexcept {
            return level_.load(std::memory_order_relaxed);
        }

        bool enabled(log_level level) const noexcept {
            return level != log_level::off && level >= this->level();
        }

        /// @brief Replaces the output; an empty sink restores std::cerr.
        void set_sink(sink_type sink);

        void write(log_level level, std::string_view target, std::string_view message);

        /// @example log(log_level::info, "Runtime", "Actor % has finished: %", name, reason);
        template<typename... Args>
        void log(log_level level, std::string_view target, const char* fmt, Args&&... args) {
            if (!enabled(level)) {
                return;
            }
            std::ostringstream oss;
            format_impl(oss, fmt, std::forward<Args>(args)...);
            write(level, target, oss.str());
        }

        template<typename... Args>
        void trace(std::string_view target, const char* fmt, Args&&... args) {
            log(log_level::trace, target, fmt, std::forward<Args>(args)...);
        }

        template<typename... Args>
        void debug(std::string_view target, const char* fmt, Args&&... args) {
            log(log_level::debug, target, fmt, std::forward<Args>(args)...);
        }

        template<typename... Args>
        void info(std::string_view target, const char* fmt, Args&&... args) {
            log(log_level::info, target, fmt, std::forward<Args>(args)...);
        }

        template<typename... Args>
        void warn(std::string_view target, const char* fmt, Args&&... args) {
            log(log_level::warn, target, fmt, std::forward<Args>(args)...);
        }

        template<typename... Args>
        void error(std::string_view target, const char* fmt, Args&&... args) {
            log(log_level::error, target, fmt, std::forward<Args>(args)...);
        }

    private:
        void format_impl(std::ostringstream& oss, const char* fmt) {
            oss << fmt;
        }

        template<typename T, typename... Args>
        void format_impl(std::ostringstream& oss, const char* fmt, T&& val, Args&&... args) {
            while (*fmt) {
                if (*fmt == '%') {
                    oss << std::forward<T>(val);
                    format_impl(oss, fmt + 1, std::forward<Args>(args)...);
                    return;
                }
                oss << *fmt++;
            }
        }

        std::atomic<log_level> level_;
        std::mutex mutex_;
        sink_type sink_;
    };

    /// Sets the level of @p target from EDGE_ACTORS_LOG when it names a level; otherwise leaves it alone.
    void configure_from_environment(logger_t& target);

    /// @brief Process-wide logger. Its initial level comes from EDGE_ACTORS_LOG (default info).
    logger_t& logger();

} // namespace edge_actors
