#pragma once

#include <memory>
#include <string>
#include <type_traits>
#include <utility>

#include <edge-actors/actor.hpp>
#include <edge-actors/detail/intrusive_ptr.hpp>
#include <edge-actors/errors.hpp>
#include <edge-actors/logger.hpp>
#include <edge-actors/runtime/detail/run_actor.hpp>
#include <edge-actors/runtime/detail/runtime_state.hpp>

namespace edge_actors {

    class runtime_t;

    /// @brief Lets actors and external threads register new actors or stop the runtime.
    ///
    /// Cheap to copy and safe to use from any thread. It gives no way to send
    /// application messages.
    class runtime_handle_t final {
    public:
        /// Consumes @p builder. Fails with runtime_errc::spawn_failed when the builder
        /// cannot produce its actor and with runtime_errc::runtime_stopped after a shutdown.
        template<actor_builder Builder>
            requires(!std::is_lvalue_reference_v<Builder>)
        runtime_error_t spawn(Builder&& builder) {
            std::string name(builder.name());
            auto signal = builder.signal_sender();
            auto built = std::move(builder).build();
            if (!built) {
                logger().error("Runtime", "Failed to build %: %", name, built.error().message());
                return runtime_error_t(runtime_errc::spawn_failed, name, built.error());
            }
            using actor_type = typename std::remove_cvref_t<Builder>::actor_type;
            return state_->spawn(std::make_unique<detail::run_actor<actor_type>>(
                std::move(name), std::move(signal), std::move(built).value()));
        }

        /// Asks every running actor to stop; run() returns once they all did.
        void shutdown() const {
            state_->shutdown();
        }

        /// number of actors currently running
        std::size_t running() const {
            return state_->running();
        }

    private:
        friend class runtime_t;

        explicit runtime_handle_t(intrusive_ptr<detail::runtime_state_t> state) noexcept
            : state_(std::move(state)) {
        }

        intrusive_ptr<detail::runtime_state_t> state_;
    };

} // namespace edge_actors
