#pragma once

#include <optional>
#include <string>
#include <utility>

#include <edge-actors/logger.hpp>
#include <edge-actors/mailbox/mailbox.hpp>
#include <edge-actors/mailbox/recipient.hpp>
#include <edge-actors/message.hpp>

namespace edge_actors { namespace builder {

    template<message Input, message Output>
    class simple_message_box;

    namespace detail {

        template<message Input, message Output>
        class logged_receive final {
        public:
            logged_receive(simple_message_box<Input, Output>* box, mailbox::detail::channel_t<Input>* channel)
                : box_(box)
                , inner_(channel) {
            }

            bool await_ready() {
                return inner_.await_ready();
            }

            template<class Promise>
            bool await_suspend(edge_actors::detail::coroutine_handle<Promise> handle) {
                return inner_.await_suspend(handle);
            }

            std::optional<Input> await_resume() {
                auto message = inner_.await_resume();
                if (message) {
                    box_->log_input(*message);
                }
                return message;
            }

        private:
            simple_message_box<Input, Output>* box_;
            mailbox::detail::receive_awaitable<Input> inner_;
        };

    } // namespace detail

    /// @brief What a spawned actor talks through: its own mailbox plus the recipient of its output.
    template<message Input, message Output>
    class simple_message_box final {
    public:
        using input_type = Input;
        using output_type = Output;

        /// @p idle_source keeps an input nobody was linked to open for as long as the box lives
        simple_message_box(std::string name,
                           mailbox::mailbox_t<Input> input,
                           mailbox::recipient<Output> output,
                           std::optional<mailbox::recipient<Input>> idle_source = std::nullopt)
            : name_(std::move(name))
            , input_(std::move(input))
            , output_(std::move(output))
            , idle_source_(std::move(idle_source)) {
        }

        simple_message_box(simple_message_box&&) noexcept = default;
        simple_message_box& operator=(simple_message_box&&) noexcept = default;

        const std::string& name() const noexcept {
            return name_;
        }

        [[nodiscard]] detail::logged_receive<Input, Output> receive() {
            return detail::logged_receive<Input, Output>(this, input_.channel().get());
        }

        std::optional<Input> try_receive() {
            auto message = input_.try_receive();
            if (message) {
                log_input(*message);
            }
            return message;
        }

        template<class N>
            requires std::constructible_from<Output, N&&>
        [[nodiscard]] auto send(N&& value) {
            Output message(std::forward<N>(value));
            log_output(message);
            return output_.send(std::move(message));
        }

        /// end-of-stream for the peers reading our output
        void close_output() {
            output_ = mailbox::null_recipient<Output>();
        }

        void close_input() noexcept {
            input_.close();
        }

        mailbox::mailbox_t<Input>& input() noexcept {
            return input_;
        }

        const mailbox::recipient<Output>& output() const noexcept {
            return output_;
        }

        void set_logging(bool enabled) noexcept {
            logging_ = enabled;
        }

        void log_input(const Input& message) const {
            if (logging_) {
                logger().debug(name_, "recv %", message);
            }
        }

        void log_output(const Output& message) const {
            if (logging_) {
                logger().trace(name_, "send %", message);
            }
        }

    private:
        std::string name_;
        mailbox::mailbox_t<Input> input_;
        mailbox::recipient<Output> output_;
        std::optional<mailbox::recipient<Input>> idle_source_;
        bool logging_ = true;
    };

}} // namespace edge_actors::builder
