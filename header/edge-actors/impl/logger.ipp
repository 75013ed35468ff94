#pragma once

#include <edge-actors/logger.hpp>

#include <cstdlib>
#include <iostream>

namespace edge_actors {

    std::ostream& operator<<(std::ostream& os, log_level level) {
        switch (level) {
            case log_level::trace:
                return os << "trace";
            case log_level::debug:
                return os << "debug";
            case log_level::info:
                return os << "info";
            case log_level::warn:
                return os << "warn";
            case log_level::error:
                return os << "error";
            case log_level::off:
                return os << "off";
        }
        return os << "unknown";
    }

    log_level parse_log_level(std::string_view text, log_level fallback) noexcept {
        if (text == "trace") {
            return log_level::trace;
        }
        if (text == "debug") {
            return log_level::debug;
        }
        if (text == "info") {
            return log_level::info;
        }
        if (text == "warn") {
            return log_level::warn;
        }
        if (text == "error") {
            return log_level::error;
        }
        if (text == "off") {
            return log_level::off;
        }
        return fallback;
    }

    logger_t::logger_t()
        : level_(log_level::info) {
    }

    void logger_t::set_sink(sink_type sink) {
        std::lock_guard<std::mutex> guard(mutex_);
        sink_ = std::move(sink);
    }

    void logger_t::write(log_level level, std::string_view target, std::string_view message) {
        std::lock_guard<std::mutex> guard(mutex_);
        if (sink_) {
            sink_(level, target, message);
            return;
        }
        std::cerr << '[' << level << "] " << target << ": " << message << std::endl;
    }

    void configure_from_environment(logger_t& target) {
        if (const char* env = std::getenv("EDGE_ACTORS_LOG")) {
            target.set_level(parse_log_level(env, target.level()));
        }
    }

    logger_t& logger() {
        static logger_t instance;
        static std::once_flag configured;
        std::call_once(configured, [] { configure_from_environment(instance); });
        return instance;
    }

} // namespace edge_actors
