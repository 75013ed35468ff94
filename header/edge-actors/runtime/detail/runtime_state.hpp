#pragma once

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include <edge-actors/detail/ref_counted.hpp>
#include <edge-actors/errors.hpp>
#include <edge-actors/mailbox/signal_sender.hpp>
#include <edge-actors/runtime/detail/run_actor.hpp>
#include <edge-actors/runtime/runtime_config.hpp>
#include <edge-actors/runtime/runtime_event.hpp>
#include <edge-actors/scheduler/executor.hpp>

namespace edge_actors { namespace detail {

    /// @brief Bookkeeping shared by the runtime, its handles and the running actors.
    class runtime_state_t final : public ref_counted {
    public:
        enum class phase : std::uint8_t {
            idle,
            running,
            shutting_down,
            stopped
        };

        explicit runtime_state_t(runtime_config config);

        runtime_error_t spawn(std::unique_ptr<run_actor_base> actor);

        void shutdown();

        /// Launches everything registered so far and waits until no actor is left.
        runtime_error_t run(scheduler::executor_t& executor);

        void on_finished(const std::string& running_name, std::exception_ptr failure, std::error_code result);

        std::size_t running() const;

    private:
        void start_locked(std::string running_name, std::unique_ptr<run_actor_base> actor);
        void broadcast_shutdown_locked();
        void publish(runtime_event event);

        const runtime_config config_;
        mutable std::mutex mutex_;
        std::condition_variable finished_;
        phase phase_ = phase::idle;
        bool ran_ = false;
        std::size_t spawned_ = 0;
        scheduler::executor_t* executor_ = nullptr;
        std::vector<std::pair<std::string, std::unique_ptr<run_actor_base>>> pending_;
        std::map<std::string, mailbox::signal_sender_t> running_;
        runtime_error_t first_error_;
    };

}} // namespace edge_actors::detail
