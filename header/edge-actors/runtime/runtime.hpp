#pragma once

#include <memory>
#include <utility>

#include <edge-actors/actor.hpp>
#include <edge-actors/detail/intrusive_ptr.hpp>
#include <edge-actors/errors.hpp>
#include <edge-actors/runtime/detail/runtime_state.hpp>
#include <edge-actors/runtime/runtime_config.hpp>
#include <edge-actors/runtime/runtime_handle.hpp>
#include <edge-actors/scheduler/sharing_scheduler.hpp>

namespace edge_actors {

    /// @brief Owns the worker pool and supervises every spawned actor.
    ///
    /// run() launches the actors and blocks until all of them terminated. The first
    /// failure makes the runtime ask all the others to shut down; run() then
    /// returns that failure once everybody stopped. Actors are never killed.
    class runtime_t final {
    public:
        explicit runtime_t(runtime_config config = {});

        runtime_t(const runtime_t&) = delete;
        runtime_t& operator=(const runtime_t&) = delete;

        ~runtime_t();

        runtime_handle_t handle() const {
            return runtime_handle_t(state_);
        }

        /// Registers several actors; stops at the first failure.
        template<actor_builder... Builders>
        runtime_error_t spawn(Builders&&... builders) {
            static_assert((!std::is_lvalue_reference_v<Builders> && ...), "builders are consumed by spawn");
            auto runtime = handle();
            runtime_error_t error;
            ((error ? void() : void(error = runtime.spawn(std::move(builders)))), ...);
            return error;
        }

        void shutdown() {
            state_->shutdown();
        }

        runtime_error_t run();

    private:
        std::unique_ptr<scheduler::sharing_scheduler> scheduler_;
        intrusive_ptr<detail::runtime_state_t> state_;
    };

} // namespace edge_actors
