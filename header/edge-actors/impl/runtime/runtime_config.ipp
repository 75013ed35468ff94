#pragma once

#include <edge-actors/logger.hpp>
#include <edge-actors/runtime/runtime_config.hpp>

#include <charconv>
#include <cstdlib>
#include <string_view>

namespace edge_actors {

    namespace {

        std::optional<std::size_t> read_positive(const char* variable) {
            const char* env = std::getenv(variable);
            if (env == nullptr) {
                return std::nullopt;
            }
            std::string_view text(env);
            std::size_t value = 0;
            auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
            if (ec != std::errc() || end != text.data() + text.size() || value == 0) {
                logger().warn("Runtime", "ignoring %=%: expected a positive integer", variable, text);
                return std::nullopt;
            }
            return value;
        }

    } // namespace

    runtime_config runtime_config::from_environment() {
        runtime_config config;
        if (auto workers = read_positive("EDGE_ACTORS_WORKERS")) {
            config.num_workers = *workers;
        }
        if (auto timeout = read_positive("EDGE_ACTORS_CLEANUP_TIMEOUT_MS")) {
            config.cleanup_timeout = std::chrono::milliseconds(*timeout);
        }
        return config;
    }

} // namespace edge_actors
