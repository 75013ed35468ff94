#pragma once

#include <exception>
#include <optional>
#include <string>
#include <system_error>
#include <utility>

#include <edge-actors/actor.hpp>
#include <edge-actors/detail/intrusive_ptr.hpp>
#include <edge-actors/mailbox/signal_sender.hpp>
#include <edge-actors/scheduler/executor.hpp>
#include <edge-actors/task.hpp>

namespace edge_actors { namespace detail {

    class runtime_state_t;

    /// called by the worker that finishes an actor
    void report_finished(const intrusive_ptr<runtime_state_t>& state,
                         const std::string& running_name,
                         std::exception_ptr failure,
                         std::error_code result);

    /// A built actor waiting to be launched, erased to its name and control handle.
    class run_actor_base {
    public:
        virtual ~run_actor_base() = default;

        const std::string& name() const noexcept {
            return name_;
        }

        const mailbox::signal_sender_t& signal() const noexcept {
            return signal_;
        }

        virtual void launch(scheduler::executor_t& executor,
                            intrusive_ptr<runtime_state_t> state,
                            std::string running_name) = 0;

    protected:
        run_actor_base(std::string name, mailbox::signal_sender_t signal)
            : name_(std::move(name))
            , signal_(std::move(signal)) {
        }

    private:
        std::string name_;
        mailbox::signal_sender_t signal_;
    };

    template<actor Actor>
    class run_actor final : public run_actor_base {
    public:
        run_actor(std::string name, mailbox::signal_sender_t signal, Actor&& actor)
            : run_actor_base(std::move(name), std::move(signal))
            , actor_(std::move(actor)) {
        }

        void launch(scheduler::executor_t& executor,
                    intrusive_ptr<runtime_state_t> state,
                    std::string running_name) override {
            edge_actors::launch(
                executor,
                body(std::move(actor_)),
                [state = std::move(state), running_name = std::move(running_name)](
                    std::exception_ptr failure, std::optional<std::error_code> result) {
                    report_finished(state, running_name, failure, result.value_or(std::error_code{}));
                });
        }

    private:
        // the actor lives in this frame until run() is over
        static task<std::error_code> body(Actor actor) {
            co_return co_await actor.run();
        }

        Actor actor_;
    };

}} // namespace edge_actors::detail
