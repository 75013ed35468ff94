#pragma once

#include <cassert>
#include <concepts>
#include <functional>
#include <optional>
#include <ostream>
#include <system_error>
#include <type_traits>
#include <utility>

#include <edge-actors/detail/intrusive_ptr.hpp>
#include <edge-actors/mailbox/detail/waiter.hpp>
#include <edge-actors/mailbox/sink.hpp>
#include <edge-actors/message.hpp>
#include <edge-actors/task.hpp>

namespace edge_actors { namespace mailbox {

    template<message M>
    class recipient;

    namespace detail {

        template<message M>
        class send_awaitable final : private send_waiter_t {
        public:
            send_awaitable(intrusive_ptr<sink_t<M>> sink, M value)
                : sink_(std::move(sink))
                , value_(std::move(value)) {
            }

            send_awaitable(const send_awaitable&) = delete;
            send_awaitable& operator=(const send_awaitable&) = delete;

            bool await_ready() const noexcept {
                return false;
            }

            template<edge_actors::detail::scheduled_promise Promise>
            bool await_suspend(edge_actors::detail::coroutine_handle<Promise> handle) {
                assert(handle.promise().executor() != nullptr && "send from a coroutine without executor");
                wakeup_.arm(handle, handle.promise().executor());
                auto sink = sink_;
                auto status = sink->push(value_, this);
                if (status == push_result::pending) {
                    return true;
                }
                result_ = to_error_code(status);
                return false;
            }

            std::error_code await_resume() const noexcept {
                return result_;
            }

        private:
            void notify(std::error_code result) noexcept override {
                result_ = result;
                wakeup_.fire();
            }

            intrusive_ptr<sink_t<M>> sink_;
            M value_;
            std::error_code result_;
            coroutine_wakeup wakeup_;
        };

        /// accepts everything and keeps nothing
        template<message M>
        class null_sink final : public sink_t<M> {
        public:
            push_result push(M& value, send_waiter_t*) override {
                M dropped(std::move(value));
                return push_result::accepted;
            }

            bool closed() const noexcept override {
                return false;
            }
        };

        /// converts each N into an M before pushing it to the wrapped recipient
        template<message N, message M, class F>
        class mapping_sink final : public sink_t<N> {
        public:
            mapping_sink(recipient<M> target, F mapping)
                : target_(std::move(target))
                , mapping_(std::move(mapping)) {
            }

            push_result push(N& value, send_waiter_t* waiter) override {
                M mapped(std::invoke(mapping_, std::move(value)));
                return target_.sink()->push(mapped, waiter);
            }

            bool closed() const noexcept override {
                return target_.closed();
            }

        private:
            recipient<M> target_;
            F mapping_;
        };

    } // namespace detail

    /// @brief Send half of a mailbox.
    ///
    /// Every copy is an independent producer; the mailbox sees end-of-stream once
    /// the last copy is gone.
    template<message M>
    class recipient final {
    public:
        using value_type = M;

        explicit recipient(intrusive_ptr<sink_t<M>> sink) noexcept
            : sink_(std::move(sink)) {
            assert(sink_ && "recipient needs a sink");
            sink_->attach();
        }

        recipient(const recipient& other) noexcept
            : sink_(other.sink_) {
            if (sink_) {
                sink_->attach();
            }
        }

        recipient(recipient&& other) noexcept = default;

        recipient& operator=(recipient other) noexcept {
            release();
            sink_ = std::move(other.sink_);
            return *this;
        }

        ~recipient() {
            release();
        }

        /// Suspends while the mailbox is full. Resumes with channel_errc::closed
        /// if the mailbox is gone.
        template<class N>
            requires std::constructible_from<M, N&&>
        [[nodiscard]] detail::send_awaitable<M> send(N&& value) const {
            assert(sink_ && "send on a moved-from recipient");
            return detail::send_awaitable<M>(sink_, M(std::forward<N>(value)));
        }

        /// Never suspends. channel_errc::full or channel_errc::closed on failure, and the value is dropped.
        template<class N>
            requires std::constructible_from<M, N&&>
        std::error_code try_send(N&& value) const {
            assert(sink_ && "try_send on a moved-from recipient");
            M message(std::forward<N>(value));
            return to_error_code(sink_->push(message, nullptr));
        }

        /// For threads outside the runtime: blocks the calling thread while the mailbox is full.
        template<class N>
            requires std::constructible_from<M, N&&>
        std::error_code blocking_send(N&& value) const {
            assert(sink_ && "blocking_send on a moved-from recipient");
            M message(std::forward<N>(value));
            detail::blocking_send_waiter waiter;
            auto status = sink_->push(message, &waiter);
            if (status == push_result::pending) {
                return waiter.wait();
            }
            return to_error_code(status);
        }

        bool closed() const noexcept {
            return !sink_ || sink_->closed();
        }

        /// @brief A recipient of N feeding this one through @p mapping.
        template<message N, class F>
            requires std::invocable<F&, N&&> && std::constructible_from<M, std::invoke_result_t<F&, N&&>>
        recipient<N> map(F mapping) const {
            return recipient<N>(make_counted<detail::mapping_sink<N, M, F>>(*this, std::move(mapping)));
        }

        /// @brief A recipient of N for any N that converts into M, e.g. one kind of a fan_in_message.
        template<message N>
            requires std::constructible_from<M, N&&>
        recipient<N> adapt() const {
            return map<N>([](N&& value) { return M(std::move(value)); });
        }

        const intrusive_ptr<sink_t<M>>& sink() const noexcept {
            return sink_;
        }

    private:
        void release() noexcept {
            if (sink_) {
                sink_->detach();
                sink_.reset();
            }
        }

        intrusive_ptr<sink_t<M>> sink_;
    };

    /// @brief A recipient that accepts and discards everything; the default output of builders.
    template<message M>
    recipient<M> null_recipient() {
        return recipient<M>(make_counted<detail::null_sink<M>>());
    }

}} // namespace edge_actors::mailbox
