#pragma once

#include <cassert>
#include <concepts>
#include <exception>
#include <optional>
#include <type_traits>
#include <utility>

#include <edge-actors/detail/coroutine.hpp>
#include <edge-actors/scheduler/executor.hpp>

namespace edge_actors {

    template<class T = void>
    class task;

    namespace detail {

        /// promises whose coroutines can wait on a mailbox or a recipient
        template<class Promise>
        concept scheduled_promise = requires(const Promise& promise) {
            { promise.executor() } -> std::convertible_to<scheduler::executor_t*>;
        };

        class task_promise_base {
        public:
            struct final_awaiter {
                bool await_ready() const noexcept {
                    return false;
                }

                template<class Promise>
                coroutine_handle<> await_suspend(coroutine_handle<Promise> handle) noexcept {
                    task_promise_base& promise = handle.promise();
                    if (promise.continuation_) {
                        return promise.continuation_;
                    }
                    return noop_coroutine();
                }

                void await_resume() const noexcept {}
            };

            suspend_always initial_suspend() const noexcept {
                return {};
            }

            final_awaiter final_suspend() const noexcept {
                return {};
            }

            void unhandled_exception() noexcept {
                exception_ = std::current_exception();
            }

            scheduler::executor_t* executor() const noexcept {
                return executor_;
            }

            void set_executor(scheduler::executor_t* executor) noexcept {
                executor_ = executor;
            }

            void set_continuation(coroutine_handle<> continuation) noexcept {
                continuation_ = continuation;
            }

        protected:
            void rethrow_if_failed() const {
                if (exception_) {
                    std::rethrow_exception(exception_);
                }
            }

        private:
            coroutine_handle<> continuation_;
            scheduler::executor_t* executor_ = nullptr;
            std::exception_ptr exception_;
        };

        template<class T>
        class task_promise final : public task_promise_base {
        public:
            task<T> get_return_object() noexcept;

            void return_value(T value) {
                value_.emplace(std::move(value));
            }

            T result() && {
                rethrow_if_failed();
                assert(value_.has_value() && "task finished without a value");
                return std::move(*value_);
            }

        private:
            std::optional<T> value_;
        };

        template<>
        class task_promise<void> final : public task_promise_base {
        public:
            task<void> get_return_object() noexcept;

            void return_void() const noexcept {}

            void result() {
                rethrow_if_failed();
            }
        };

    } // namespace detail

    /// @brief Lazily started coroutine. It runs when awaited and inherits the awaiting coroutine's executor.
    template<class T>
    class [[nodiscard]] task final {
    public:
        using promise_type = detail::task_promise<T>;
        using handle_type = detail::coroutine_handle<promise_type>;
        using value_type = T;

        task() noexcept = default;

        explicit task(handle_type handle) noexcept
            : handle_(handle) {
        }

        task(task&& other) noexcept
            : handle_(std::exchange(other.handle_, {})) {
        }

        task& operator=(task&& other) noexcept {
            if (this != &other) {
                destroy();
                handle_ = std::exchange(other.handle_, {});
            }
            return *this;
        }

        task(const task&) = delete;
        task& operator=(const task&) = delete;

        ~task() {
            destroy();
        }

        bool valid() const noexcept {
            return static_cast<bool>(handle_);
        }

        bool done() const noexcept {
            return handle_ && handle_.done();
        }

        class awaiter final {
        public:
            explicit awaiter(handle_type handle) noexcept
                : handle_(handle) {
            }

            bool await_ready() const noexcept {
                return handle_.done();
            }

            template<detail::scheduled_promise Promise>
            detail::coroutine_handle<> await_suspend(detail::coroutine_handle<Promise> caller) noexcept {
                handle_.promise().set_executor(caller.promise().executor());
                handle_.promise().set_continuation(caller);
                return handle_;
            }

            T await_resume() {
                return std::move(handle_.promise()).result();
            }

        private:
            handle_type handle_;
        };

        awaiter operator co_await() && noexcept {
            assert(valid() && "co_await on an empty task");
            return awaiter{handle_};
        }

    private:
        void destroy() noexcept {
            if (handle_) {
                handle_.destroy();
                handle_ = {};
            }
        }

        handle_type handle_;
    };

    namespace detail {

        template<class T>
        task<T> task_promise<T>::get_return_object() noexcept {
            return task<T>{coroutine_handle<task_promise<T>>::from_promise(*this)};
        }

        inline task<void> task_promise<void>::get_return_object() noexcept {
            return task<void>{coroutine_handle<task_promise<void>>::from_promise(*this)};
        }

        /// root of a coroutine chain, destroys itself once its body finishes
        class detached_task final {
        public:
            struct promise_type {
                detached_task get_return_object() noexcept {
                    return detached_task{coroutine_handle<promise_type>::from_promise(*this)};
                }

                suspend_always initial_suspend() const noexcept {
                    return {};
                }

                suspend_never final_suspend() const noexcept {
                    return {};
                }

                void return_void() const noexcept {}

                // run_detached catches everything the awaited task throws
                void unhandled_exception() const noexcept {
                    std::terminate();
                }

                scheduler::executor_t* executor() const noexcept {
                    return executor_;
                }

                scheduler::executor_t* executor_ = nullptr;
            };

            explicit detached_task(coroutine_handle<promise_type> root) noexcept
                : handle(root) {
            }

            coroutine_handle<promise_type> handle;
        };

        template<class T, class Callback>
        detached_task run_detached(task<T> work, Callback on_complete) {
            std::exception_ptr failure;
            if constexpr (std::is_void_v<T>) {
                try {
                    co_await std::move(work);
                } catch (...) {
                    failure = std::current_exception();
                }
                on_complete(failure);
            } else {
                std::optional<T> value;
                try {
                    value.emplace(co_await std::move(work));
                } catch (...) {
                    failure = std::current_exception();
                }
                on_complete(failure, std::move(value));
            }
        }

    } // namespace detail

    /// @brief Awaitable yielding the executor the awaiting coroutine runs on, without suspending it.
    class this_executor final {
    public:
        bool await_ready() const noexcept {
            return false;
        }

        template<detail::scheduled_promise Promise>
        bool await_suspend(detail::coroutine_handle<Promise> caller) noexcept {
            executor_ = caller.promise().executor();
            return false;
        }

        scheduler::executor_t* await_resume() const noexcept {
            return executor_;
        }

    private:
        scheduler::executor_t* executor_ = nullptr;
    };

    /// @brief Starts @p work on @p executor without anyone awaiting it.
    ///
    /// @p on_complete is called on the thread that finishes the task with the
    /// exception that escaped it (if any) and, unless T is void, the value it returned:
    ///   on_complete(std::exception_ptr)                       for task<void>
    ///   on_complete(std::exception_ptr, std::optional<T>)     otherwise
    template<class T, class Callback>
    void launch(scheduler::executor_t& executor, task<T> work, Callback on_complete) {
        auto root = detail::run_detached(std::move(work), std::move(on_complete));
        root.handle.promise().executor_ = &executor;
        executor.execute(scheduler::job_ptr(root.handle));
    }

} // namespace edge_actors
