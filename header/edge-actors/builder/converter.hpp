#pragma once

#include <concepts>
#include <cstddef>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include <edge-actors/builder/actor_builder.hpp>
#include <edge-actors/builder/message_box.hpp>
#include <edge-actors/errors.hpp>
#include <edge-actors/fan_in.hpp>
#include <edge-actors/logger.hpp>
#include <edge-actors/result.hpp>
#include <edge-actors/task.hpp>

namespace edge_actors { namespace builder {

    /// @brief Stateless-looking translation of each input into zero or more outputs.
    ///
    /// Optional members: init_messages() sent before the first input and
    /// shutdown_messages() sent after the last one, both returning std::vector<output_type>.
    template<class C>
    concept converter = requires(C& c, const typename C::input_type& input) {
        typename C::input_type;
        typename C::output_type;
        { c.convert(input) } -> std::same_as<result<std::vector<typename C::output_type>>>;
    } && message<typename C::input_type> && message<typename C::output_type>;

    template<converter C>
    class converting_actor final {
    public:
        using input_type = fan_in_message<typename C::input_type>;
        using output_type = typename C::output_type;
        using message_box_type = simple_message_box<input_type, output_type>;

        converting_actor(message_box_type&& box, C converter)
            : box_(std::move(box))
            , converter_(std::move(converter)) {
        }

        const std::string& name() const noexcept {
            return box_.name();
        }

        task<std::error_code> run() {
            if constexpr (requires(C& c) { { c.init_messages() } -> std::same_as<std::vector<output_type>>; }) {
                if (!co_await send_all(converter_.init_messages())) {
                    co_return std::error_code{};
                }
            }

            while (auto message = co_await box_.receive()) {
                if (message->is_runtime_request()) {
                    break;
                }
                auto converted = converter_.convert(message->template get<typename C::input_type>());
                if (!converted) {
                    logger().error(name(), "conversion failed: %", converted.error().message());
                    co_return converted.error();
                }
                if (!co_await send_all(std::move(converted).value())) {
                    co_return std::error_code{};
                }
            }

            if constexpr (requires(C& c) { { c.shutdown_messages() } -> std::same_as<std::vector<output_type>>; }) {
                co_await send_all(converter_.shutdown_messages());
            }
            co_return std::error_code{};
        }

    private:
        /// false once the output is closed
        task<bool> send_all(std::vector<output_type> messages) {
            for (auto& output : messages) {
                if (auto error = co_await box_.send(std::move(output))) {
                    logger().info(name(), "output closed, stopping: %", error.message());
                    co_return false;
                }
            }
            co_return true;
        }

        message_box_type box_;
        C converter_;
    };

    template<converter C>
    actor_builder_t<converting_actor<C>, C> make_converter_builder(std::string name,
                                                                   C converter,
                                                                   std::size_t capacity = default_mailbox_capacity) {
        return make_actor_builder<converting_actor<C>>(std::move(name), capacity, std::move(converter));
    }

}} // namespace edge_actors::builder
