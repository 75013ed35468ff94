#pragma once

#include <cstdint>
#include <ostream>
#include <string>
#include <utility>

#include <edge-actors/errors.hpp>

namespace edge_actors {

    /// @brief Lifecycle notification published by the runtime for each actor.
    struct runtime_event final {
        enum class kind : std::uint8_t {
            started,
            stopped,
            aborted
        };

        kind type;
        std::string task; ///< running name, "<actor>-<n>"
        runtime_error_t error; ///< set for aborted

        static runtime_event started(std::string task) {
            return runtime_event{kind::started, std::move(task), {}};
        }

        static runtime_event stopped(std::string task) {
            return runtime_event{kind::stopped, std::move(task), {}};
        }

        static runtime_event aborted(std::string task, runtime_error_t error) {
            return runtime_event{kind::aborted, std::move(task), std::move(error)};
        }

        friend std::ostream& operator<<(std::ostream& os, const runtime_event& event) {
            switch (event.type) {
                case kind::started:
                    return os << "Started(" << event.task << ')';
                case kind::stopped:
                    return os << "Stopped(" << event.task << ')';
                case kind::aborted:
                    return os << "Aborted(" << event.task << ", " << event.error << ')';
            }
            return os;
        }
    };

} // namespace edge_actors
