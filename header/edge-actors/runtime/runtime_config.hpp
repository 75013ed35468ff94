#pragma once

#include <chrono>
#include <cstddef>
#include <optional>

#include <edge-actors/config.hpp>
#include <edge-actors/mailbox/recipient.hpp>
#include <edge-actors/runtime/runtime_event.hpp>

namespace edge_actors {

    struct runtime_config final {
        /// worker threads resuming actors
        std::size_t num_workers = default_num_workers;

        /// after a shutdown, the actors still running are reported at this interval
        std::chrono::milliseconds cleanup_timeout = default_cleanup_timeout;

        /// receives a runtime_event per actor start and stop, when set
        std::optional<mailbox::recipient<runtime_event>> events;

        /// Defaults overridden by EDGE_ACTORS_WORKERS and EDGE_ACTORS_CLEANUP_TIMEOUT_MS.
        static runtime_config from_environment();
    };

} // namespace edge_actors
