#pragma once

#include <cstddef>
#include <memory_resource>
#include <string>
#include <system_error>
#include <tuple>
#include <type_traits>
#include <utility>

#include <edge-actors/actor.hpp>
#include <edge-actors/builder/message_box_builder.hpp>
#include <edge-actors/builder/peer_linker.hpp>
#include <edge-actors/config.hpp>
#include <edge-actors/result.hpp>
#include <edge-actors/runtime/runtime_handle.hpp>

namespace edge_actors { namespace builder {

    /// @brief Builder of an actor constructed from a simple_message_box.
    ///
    /// The actor declares input_type and output_type and is constructible from
    /// (simple_message_box<input_type, output_type>&&, Args&&...). Its input must
    /// accept a runtime_request so the runtime can always stop it.
    template<class Actor, class... Args>
    class actor_builder_t final : public peer_linker<typename Actor::input_type, typename Actor::output_type> {
    public:
        using actor_type = Actor;
        using input_type = typename Actor::input_type;
        using output_type = typename Actor::output_type;
        using box_builder_type = message_box_builder<input_type, output_type>;

        static_assert(accepts_runtime_request<input_type>,
                      "an actor input must accept runtime_request, e.g. by being a fan_in_message");
        static_assert(std::is_constructible_v<Actor, simple_message_box<input_type, output_type>&&, Args&&...>,
                      "Actor must be constructible from its message box and the builder arguments");

        actor_builder_t(std::string name, std::size_t capacity, std::pmr::memory_resource* resource, Args... args)
            : box_(std::move(name), capacity, resource)
            , args_(std::move(args)...) {
        }

        actor_builder_t(actor_builder_t&&) noexcept = default;

        const std::string& name() const noexcept {
            return box_.name();
        }

        link_state state() const noexcept {
            return box_.state();
        }

        result<mailbox::recipient<input_type>> connect(mailbox::recipient<output_type> output) override {
            return box_.connect(std::move(output));
        }

        std::error_code set_output(mailbox::recipient<output_type> output) {
            return box_.set_output(std::move(output));
        }

        result<mailbox::recipient<input_type>> input_recipient() {
            return box_.input_recipient();
        }

        mailbox::signal_sender_t signal_sender() const {
            return box_.signal_sender();
        }

        result<Actor> build() && {
            auto box = std::move(box_).build();
            if (!box) {
                return box.error();
            }
            return std::apply(
                [&box](Args&... args) {
                    return Actor(std::move(box).value(), std::move(args)...);
                },
                args_);
        }

        /// Consumes the builder and registers the actor with @p runtime.
        runtime_error_t spawn(runtime_handle_t& runtime) && {
            return runtime.spawn(std::move(*this));
        }

    private:
        box_builder_type box_;
        std::tuple<Args...> args_;
    };

    /// @brief actor_builder_t for @p Actor with a mailbox of @p capacity messages.
    template<class Actor, class... Args>
    actor_builder_t<Actor, std::decay_t<Args>...> make_actor_builder(std::string name, std::size_t capacity, Args&&... args) {
        return actor_builder_t<Actor, std::decay_t<Args>...>(
            std::move(name), capacity, std::pmr::get_default_resource(), std::forward<Args>(args)...);
    }

    /// @brief Sends the output of @p producer to the input of @p consumer,
    /// adapting the message type when it converts.
    template<class Producer, class Consumer>
    std::error_code link(Producer& producer, Consumer& consumer) {
        using produced = typename Producer::output_type;
        using consumed = typename Consumer::input_type;
        static_assert(std::is_constructible_v<consumed, produced&&>, "the producer output does not convert into the consumer input");
        auto input = consumer.input_recipient();
        if (!input) {
            return input.error();
        }
        if constexpr (std::is_same_v<produced, consumed>) {
            return producer.set_output(std::move(input).value());
        } else {
            return producer.set_output(input->template adapt<produced>());
        }
    }

}} // namespace edge_actors::builder
