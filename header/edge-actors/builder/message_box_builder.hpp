#pragma once

#include <cstddef>
#include <memory_resource>
#include <optional>
#include <string>
#include <system_error>
#include <utility>

#include <edge-actors/builder/message_box.hpp>
#include <edge-actors/builder/peer_linker.hpp>
#include <edge-actors/config.hpp>
#include <edge-actors/detail/intrusive_ptr.hpp>
#include <edge-actors/errors.hpp>
#include <edge-actors/mailbox/detail/channel.hpp>
#include <edge-actors/mailbox/mailbox.hpp>
#include <edge-actors/mailbox/recipient.hpp>
#include <edge-actors/mailbox/signal_sender.hpp>
#include <edge-actors/result.hpp>

namespace edge_actors { namespace builder {

    /// @brief Collects the links of one actor and turns them into a simple_message_box.
    ///
    /// The input mailbox exists from construction on, so recipients can be handed
    /// out before the actor is spawned. The builder holds a producer of its own on
    /// the input until build(): a recipient dropped early never closes the mailbox.
    /// An input nobody asked for stays open after build. The single output defaults to a
    /// null_recipient. Once built (or moved from) every link operation fails
    /// with link_errc::already_spawned.
    template<message Input, message Output>
    class message_box_builder final : public peer_linker<Input, Output> {
    public:
        using box_type = simple_message_box<Input, Output>;

        explicit message_box_builder(std::string name,
                                     std::size_t capacity = default_mailbox_capacity,
                                     std::pmr::memory_resource* resource = std::pmr::get_default_resource())
            : name_(std::move(name))
            , channel_(make_counted<mailbox::detail::channel_t<Input>>(capacity, resource)) {
            self_.emplace(channel_);
        }

        message_box_builder(message_box_builder&& other) noexcept
            : name_(std::move(other.name_))
            , channel_(std::move(other.channel_))
            , self_(std::move(other.self_))
            , output_(std::move(other.output_))
            , state_(std::exchange(other.state_, link_state::spawned))
            , inputs_handed_out_(other.inputs_handed_out_) {
            other.self_.reset();
            other.output_.reset();
        }

        message_box_builder& operator=(message_box_builder&&) = delete;
        message_box_builder(const message_box_builder&) = delete;
        message_box_builder& operator=(const message_box_builder&) = delete;

        const std::string& name() const noexcept {
            return name_;
        }

        link_state state() const noexcept {
            return state_;
        }

        result<mailbox::recipient<Input>> connect(mailbox::recipient<Output> output) override {
            if (auto error = set_output(std::move(output))) {
                return error;
            }
            return input_recipient();
        }

        /// Where the actor sends its output. A builder has a single output.
        std::error_code set_output(mailbox::recipient<Output> output) {
            if (state_ == link_state::spawned) {
                return make_error_code(link_errc::already_spawned);
            }
            if (output_) {
                return make_error_code(link_errc::already_linked);
            }
            output_.emplace(std::move(output));
            state_ = link_state::linked;
            return {};
        }

        /// A new producer handle on the actor's input.
        result<mailbox::recipient<Input>> input_recipient() {
            if (state_ == link_state::spawned) {
                return link_errc::already_spawned;
            }
            state_ = link_state::linked;
            inputs_handed_out_ = true;
            return mailbox::recipient<Input>(channel_);
        }

        /// A control handle on the actor's input, valid after the actor is spawned.
        mailbox::signal_sender_t signal_sender() const
            requires accepts_runtime_request<Input>
        {
            if (!channel_) {
                return mailbox::signal_sender_t();
            }
            return mailbox::signal_sender_t(channel_);
        }

        result<box_type> build() && {
            if (state_ == link_state::spawned) {
                return link_errc::already_spawned;
            }
            state_ = link_state::spawned;
            auto output = output_ ? std::move(*output_) : mailbox::null_recipient<Output>();
            output_.reset();
            std::optional<mailbox::recipient<Input>> idle_source;
            if (!inputs_handed_out_) {
                idle_source = std::move(self_);
            }
            self_.reset();
            return box_type(name_, mailbox::mailbox_t<Input>(std::move(channel_)), std::move(output), std::move(idle_source));
        }

    private:
        std::string name_;
        intrusive_ptr<mailbox::detail::channel_t<Input>> channel_;
        std::optional<mailbox::recipient<Input>> self_;
        std::optional<mailbox::recipient<Output>> output_;
        link_state state_ = link_state::building;
        bool inputs_handed_out_ = false;
    };

}} // namespace edge_actors::builder
