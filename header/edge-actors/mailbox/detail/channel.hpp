#pragma once

#include <algorithm>
#include <cassert>
#include <cstddef>
#include <deque>
#include <memory_resource>
#include <mutex>
#include <optional>
#include <utility>

#include <edge-actors/mailbox/detail/waiter.hpp>
#include <edge-actors/mailbox/sink.hpp>
#include <edge-actors/message.hpp>

namespace edge_actors { namespace mailbox { namespace detail {

    enum class pop_result : std::uint8_t {
        received,
        parked,
        closed
    };

    /// @brief Bounded multi-producer single-consumer queue shared by a mailbox and its recipients.
    ///
    /// Normal messages go through a buffer of at most capacity() entries; once it is full,
    /// senders park in FIFO order and are admitted one at a time as the consumer makes room.
    /// Control messages use an urgent lane that ignores the capacity and is drained first.
    /// The channel closes when the owner closes it or when the last counted producer detaches.
    template<message M>
    class channel_t final : public sink_t<M> {
    public:
        channel_t(std::size_t capacity, std::pmr::memory_resource* resource)
            : capacity_(std::max<std::size_t>(capacity, 1))
            , urgent_(resource)
            , buffer_(resource)
            , pending_(resource) {
        }

        ~channel_t() override {
            assert(receiver_ == nullptr && pending_.empty());
        }

        push_result push(M& value, send_waiter_t* waiter) override {
            std::lock_guard<std::mutex> guard(mutex_);
            if (closed_) {
                return push_result::closed;
            }
            if (receiver_) {
                hand_over(std::move(value));
                return push_result::accepted;
            }
            if (buffer_.size() < capacity_) {
                buffer_.push_back(std::move(value));
                return push_result::accepted;
            }
            if (!waiter) {
                return push_result::full;
            }
            pending_.push_back(pending_send{std::move(value), waiter});
            return push_result::pending;
        }

        /// control lane, never suspends
        std::error_code push_urgent(M value) {
            std::lock_guard<std::mutex> guard(mutex_);
            if (closed_) {
                return make_error_code(channel_errc::closed);
            }
            if (receiver_) {
                hand_over(std::move(value));
            } else {
                urgent_.push_back(std::move(value));
            }
            return {};
        }

        bool try_pop(std::optional<M>& out) {
            std::lock_guard<std::mutex> guard(mutex_);
            return pop_locked(out);
        }

        /// Either fills waiter->value, reports the channel closed and drained, or parks the waiter.
        pop_result pop_or_park(receive_waiter_t<M>* waiter) {
            std::lock_guard<std::mutex> guard(mutex_);
            if (pop_locked(waiter->value)) {
                return pop_result::received;
            }
            if (closed_) {
                return pop_result::closed;
            }
            assert(receiver_ == nullptr && "a mailbox has a single consumer");
            receiver_ = waiter;
            return pop_result::parked;
        }

        /// Withdraws a parked receiver. False when it was already notified.
        bool cancel_receive(receive_waiter_t<M>* waiter) {
            std::lock_guard<std::mutex> guard(mutex_);
            if (receiver_ != waiter) {
                return false;
            }
            receiver_ = nullptr;
            return true;
        }

        /// Stops accepting messages; buffered ones stay receivable.
        void close() noexcept {
            std::lock_guard<std::mutex> guard(mutex_);
            close_locked();
        }

        /// The consumer is gone: close and drop everything buffered.
        void close_receiver() noexcept {
            std::pmr::deque<M> urgent(urgent_.get_allocator());
            std::pmr::deque<M> buffer(buffer_.get_allocator());
            {
                std::lock_guard<std::mutex> guard(mutex_);
                close_locked();
                urgent.swap(urgent_);
                buffer.swap(buffer_);
            }
        }

        bool closed() const noexcept override {
            std::lock_guard<std::mutex> guard(mutex_);
            return closed_;
        }

        void attach() noexcept override {
            std::lock_guard<std::mutex> guard(mutex_);
            ++senders_;
        }

        void detach() noexcept override {
            std::lock_guard<std::mutex> guard(mutex_);
            assert(senders_ > 0);
            if (--senders_ == 0) {
                close_locked();
            }
        }

        std::size_t size() const {
            std::lock_guard<std::mutex> guard(mutex_);
            return urgent_.size() + buffer_.size();
        }

        std::size_t capacity() const noexcept {
            return capacity_;
        }

        std::size_t senders() const {
            std::lock_guard<std::mutex> guard(mutex_);
            return senders_;
        }

    private:
        struct pending_send {
            M value;
            send_waiter_t* waiter;
        };

        bool pop_locked(std::optional<M>& out) {
            if (!urgent_.empty()) {
                out.emplace(std::move(urgent_.front()));
                urgent_.pop_front();
                return true;
            }
            if (buffer_.empty()) {
                return false;
            }
            out.emplace(std::move(buffer_.front()));
            buffer_.pop_front();
            if (!pending_.empty()) {
                auto& next = pending_.front();
                buffer_.push_back(std::move(next.value));
                auto* waiter = next.waiter;
                pending_.pop_front();
                waiter->notify({});
            }
            return true;
        }

        // the parked receiver implies empty lanes
        void hand_over(M&& value) {
            auto* receiver = std::exchange(receiver_, nullptr);
            receiver->value.emplace(std::move(value));
            receiver->notify();
        }

        void close_locked() noexcept {
            if (closed_) {
                return;
            }
            closed_ = true;
            if (auto* receiver = std::exchange(receiver_, nullptr)) {
                receiver->notify();
            }
            while (!pending_.empty()) {
                auto* waiter = pending_.front().waiter;
                pending_.pop_front();
                waiter->notify(make_error_code(channel_errc::closed));
            }
        }

        mutable std::mutex mutex_;
        const std::size_t capacity_;
        std::pmr::deque<M> urgent_;
        std::pmr::deque<M> buffer_;
        std::pmr::deque<pending_send> pending_;
        receive_waiter_t<M>* receiver_ = nullptr;
        std::size_t senders_ = 0;
        bool closed_ = false;
    };

}}} // namespace edge_actors::mailbox::detail
