#pragma once

#include <system_error>
#include <utility>

#include <edge-actors/detail/intrusive_ptr.hpp>
#include <edge-actors/errors.hpp>
#include <edge-actors/mailbox/detail/channel.hpp>
#include <edge-actors/message.hpp>

namespace edge_actors { namespace mailbox {

    namespace detail {

        class signal_target_t : public ref_counted {
        public:
            virtual std::error_code signal(runtime_request request) = 0;
            virtual void close() noexcept = 0;
            virtual bool closed() const noexcept = 0;
        };

        template<accepts_runtime_request M>
        class channel_signal_target final : public signal_target_t {
        public:
            explicit channel_signal_target(intrusive_ptr<channel_t<M>> channel) noexcept
                : channel_(std::move(channel)) {
            }

            std::error_code signal(runtime_request request) override {
                return channel_->push_urgent(M(request));
            }

            void close() noexcept override {
                channel_->close();
            }

            bool closed() const noexcept override {
                return channel_->closed();
            }

        private:
            intrusive_ptr<channel_t<M>> channel_;
        };

    } // namespace detail

    /// @brief Control handle the runtime keeps on each actor's mailbox.
    ///
    /// It does not count as a producer, so it never keeps a mailbox open, and its
    /// requests skip the capacity limit and the queue of normal messages.
    class signal_sender_t final {
    public:
        signal_sender_t() noexcept = default;

        template<accepts_runtime_request M>
        explicit signal_sender_t(intrusive_ptr<detail::channel_t<M>> channel)
            : target_(make_counted<detail::channel_signal_target<M>>(std::move(channel))) {
        }

        std::error_code send(runtime_request request) const {
            if (!target_) {
                return make_error_code(channel_errc::closed);
            }
            return target_->signal(request);
        }

        void close() const noexcept {
            if (target_) {
                target_->close();
            }
        }

        bool closed() const noexcept {
            return !target_ || target_->closed();
        }

    private:
        intrusive_ptr<detail::signal_target_t> target_;
    };

}} // namespace edge_actors::mailbox
