#pragma once

#include <cassert>
#include <chrono>
#include <cstddef>
#include <memory_resource>
#include <optional>
#include <utility>

#include <edge-actors/config.hpp>
#include <edge-actors/detail/intrusive_ptr.hpp>
#include <edge-actors/mailbox/detail/channel.hpp>
#include <edge-actors/mailbox/recipient.hpp>
#include <edge-actors/message.hpp>
#include <edge-actors/task.hpp>

namespace edge_actors { namespace mailbox {

    namespace detail {

        template<message M>
        class receive_awaitable final : private receive_waiter_t<M> {
        public:
            explicit receive_awaitable(channel_t<M>* channel) noexcept
                : channel_(channel) {
            }

            receive_awaitable(const receive_awaitable&) = delete;
            receive_awaitable& operator=(const receive_awaitable&) = delete;

            bool await_ready() {
                return channel_->try_pop(this->value);
            }

            template<edge_actors::detail::scheduled_promise Promise>
            bool await_suspend(edge_actors::detail::coroutine_handle<Promise> handle) {
                assert(handle.promise().executor() != nullptr && "receive from a coroutine without executor");
                wakeup_.arm(handle, handle.promise().executor());
                intrusive_ptr<channel_t<M>> channel(channel_);
                return channel->pop_or_park(this) == pop_result::parked;
            }

            std::optional<M> await_resume() {
                return std::move(this->value);
            }

        private:
            void notify() noexcept override {
                wakeup_.fire();
            }

            channel_t<M>* channel_;
            coroutine_wakeup wakeup_;
        };

    } // namespace detail

    /// @brief Receive half of a bounded channel, owned by exclusively one actor.
    ///
    /// receive() yields std::nullopt once the mailbox is closed and drained.
    /// Destroying the mailbox closes it and drops what is still buffered.
    template<message M>
    class mailbox_t final {
    public:
        using value_type = M;

        explicit mailbox_t(intrusive_ptr<detail::channel_t<M>> channel) noexcept
            : channel_(std::move(channel)) {
        }

        mailbox_t(mailbox_t&& other) noexcept = default;

        mailbox_t& operator=(mailbox_t&& other) noexcept {
            if (this != &other) {
                release();
                channel_ = std::move(other.channel_);
            }
            return *this;
        }

        mailbox_t(const mailbox_t&) = delete;
        mailbox_t& operator=(const mailbox_t&) = delete;

        ~mailbox_t() {
            release();
        }

        [[nodiscard]] detail::receive_awaitable<M> receive() {
            assert(channel_ && "receive on a moved-from mailbox");
            return detail::receive_awaitable<M>(channel_.get());
        }

        std::optional<M> try_receive() {
            std::optional<M> result;
            channel_->try_pop(result);
            return result;
        }

        /// For threads outside the runtime.
        std::optional<M> blocking_receive() {
            detail::blocking_receive_waiter<M> waiter;
            if (channel_->pop_or_park(&waiter) == detail::pop_result::parked) {
                waiter.wakeup().wait();
            }
            return std::move(waiter.value);
        }

        /// For threads outside the runtime. std::nullopt on timeout or once closed and drained.
        template<class Rep, class Period>
        std::optional<M> receive_for(std::chrono::duration<Rep, Period> timeout) {
            detail::blocking_receive_waiter<M> waiter;
            if (channel_->pop_or_park(&waiter) == detail::pop_result::parked) {
                if (!waiter.wakeup().wait_for(timeout) && !channel_->cancel_receive(&waiter)) {
                    // lost the race against a sender, the notification is on its way
                    waiter.wakeup().wait();
                }
            }
            return std::move(waiter.value);
        }

        /// Stops accepting messages; what is buffered can still be received.
        void close() noexcept {
            channel_->close();
        }

        bool closed() const noexcept {
            return channel_->closed();
        }

        std::size_t size() const {
            return channel_->size();
        }

        std::size_t capacity() const noexcept {
            return channel_->capacity();
        }

        const intrusive_ptr<detail::channel_t<M>>& channel() const noexcept {
            return channel_;
        }

    private:
        void release() noexcept {
            if (channel_) {
                channel_->close_receiver();
                channel_.reset();
            }
        }

        intrusive_ptr<detail::channel_t<M>> channel_;
    };

    template<message M>
    struct channel_pair {
        recipient<M> sender;
        mailbox_t<M> receiver;
    };

    /// @brief A new bounded channel. The capacity is at least one message.
    template<message M>
    channel_pair<M> make_channel(std::size_t capacity = default_mailbox_capacity,
                                 std::pmr::memory_resource* resource = std::pmr::get_default_resource()) {
        auto channel = make_counted<detail::channel_t<M>>(capacity, resource);
        recipient<M> sender(channel);
        return channel_pair<M>{std::move(sender), mailbox_t<M>(std::move(channel))};
    }

}} // namespace edge_actors::mailbox
