#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <system_error>

#include <edge-actors/detail/coroutine.hpp>
#include <edge-actors/scheduler/executor.hpp>

namespace edge_actors { namespace mailbox { namespace detail {

    /// A sender parked on a full channel. notify() is called exactly once, under the channel lock.
    class send_waiter_t {
    public:
        virtual void notify(std::error_code result) noexcept = 0;

    protected:
        ~send_waiter_t() = default;
    };

    /// The receiver parked on an empty channel. The channel fills value before notify(),
    /// or leaves it empty when the channel closed.
    template<class M>
    class receive_waiter_t {
    public:
        std::optional<M> value;

        virtual void notify() noexcept = 0;

    protected:
        ~receive_waiter_t() = default;
    };

    /// hands a suspended coroutine back to its executor
    class coroutine_wakeup final {
    public:
        void arm(edge_actors::detail::coroutine_handle<> handle, scheduler::executor_t* executor) noexcept {
            handle_ = handle;
            executor_ = executor;
        }

        // the coroutine may be running (and its frame gone) as soon as execute() returns
        void fire() const noexcept {
            auto* executor = executor_;
            auto handle = handle_;
            executor->execute(scheduler::job_ptr(handle));
        }

    private:
        edge_actors::detail::coroutine_handle<> handle_;
        scheduler::executor_t* executor_ = nullptr;
    };

    /// parks an OS thread outside the runtime
    class thread_wakeup final {
    public:
        void fire() noexcept {
            std::lock_guard<std::mutex> guard(mutex_);
            fired_ = true;
            cv_.notify_one();
        }

        void wait() {
            std::unique_lock<std::mutex> guard(mutex_);
            cv_.wait(guard, [this] { return fired_; });
        }

        template<class Rep, class Period>
        bool wait_for(std::chrono::duration<Rep, Period> timeout) {
            std::unique_lock<std::mutex> guard(mutex_);
            return cv_.wait_for(guard, timeout, [this] { return fired_; });
        }

    private:
        std::mutex mutex_;
        std::condition_variable cv_;
        bool fired_ = false;
    };

    class blocking_send_waiter final : public send_waiter_t {
    public:
        void notify(std::error_code result) noexcept override {
            result_ = result;
            wakeup_.fire();
        }

        std::error_code wait() {
            wakeup_.wait();
            return result_;
        }

    private:
        std::error_code result_;
        thread_wakeup wakeup_;
    };

    template<class M>
    class blocking_receive_waiter final : public receive_waiter_t<M> {
    public:
        void notify() noexcept override {
            wakeup_.fire();
        }

        thread_wakeup& wakeup() noexcept {
            return wakeup_;
        }

    private:
        thread_wakeup wakeup_;
    };

}}} // namespace edge_actors::mailbox::detail
