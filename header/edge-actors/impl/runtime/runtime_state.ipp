#pragma once

#include <edge-actors/logger.hpp>
#include <edge-actors/runtime/detail/runtime_state.hpp>

#include <exception>
#include <stdexcept>

namespace edge_actors { namespace detail {

    namespace {

        constexpr const char* log_target = "Runtime";

        std::string describe(std::exception_ptr failure) {
            try {
                std::rethrow_exception(failure);
            } catch (const std::exception& e) {
                return e.what();
            } catch (...) {
                return "unknown exception";
            }
        }

    } // namespace

    void report_finished(const intrusive_ptr<runtime_state_t>& state,
                         const std::string& running_name,
                         std::exception_ptr failure,
                         std::error_code result) {
        state->on_finished(running_name, failure, result);
    }

    runtime_state_t::runtime_state_t(runtime_config config)
        : config_(std::move(config)) {
    }

    runtime_error_t runtime_state_t::spawn(std::unique_ptr<run_actor_base> actor) {
        std::lock_guard<std::mutex> guard(mutex_);
        if (phase_ == phase::shutting_down || phase_ == phase::stopped) {
            logger().warn(log_target, "Cannot spawn % after shutdown", actor->name());
            return runtime_error_t(runtime_errc::runtime_stopped, actor->name(), make_error_code(runtime_errc::runtime_stopped));
        }
        auto running_name = actor->name() + "-" + std::to_string(spawned_++);
        if (phase_ == phase::idle) {
            logger().debug(log_target, "Scheduling %", running_name);
            pending_.emplace_back(std::move(running_name), std::move(actor));
        } else {
            start_locked(std::move(running_name), std::move(actor));
        }
        return {};
    }

    void runtime_state_t::shutdown() {
        std::lock_guard<std::mutex> guard(mutex_);
        switch (phase_) {
            case phase::idle:
                logger().info(log_target, "Shutdown requested before start");
                phase_ = phase::shutting_down;
                break;
            case phase::running:
                logger().info(log_target, "Shutting down");
                phase_ = phase::shutting_down;
                broadcast_shutdown_locked();
                break;
            case phase::shutting_down:
            case phase::stopped:
                break;
        }
    }

    runtime_error_t runtime_state_t::run(scheduler::executor_t& executor) {
        std::unique_lock<std::mutex> guard(mutex_);
        if (ran_) {
            return runtime_error_t(runtime_errc::runtime_stopped, {}, make_error_code(runtime_errc::runtime_stopped));
        }
        ran_ = true;
        executor_ = &executor;
        // a shutdown requested before run() reaches each actor as it starts
        if (phase_ == phase::idle) {
            phase_ = phase::running;
        }
        auto pending = std::move(pending_);
        pending_.clear();
        for (auto& [running_name, actor] : pending) {
            start_locked(std::move(running_name), std::move(actor));
        }
        logger().info(log_target, "Started with % actors", running_.size());

        // actors get one cleanup timeout to finish once the shutdown is under way
        bool timed_out = false;
        while (!running_.empty()) {
            if (finished_.wait_for(guard, config_.cleanup_timeout, [this] { return running_.empty(); })) {
                break;
            }
            if (phase_ == phase::shutting_down) {
                logger().warn(log_target, "Timeout waiting for all actors to shutdown");
                for (const auto& entry : running_) {
                    logger().warn(log_target, "Still running: %", entry.first);
                }
                timed_out = true;
                break;
            }
        }

        phase_ = phase::stopped;
        executor_ = nullptr;
        if (!timed_out) {
            logger().info(log_target, "All actors have finished");
        } else if (!first_error_) {
            first_error_ = runtime_error_t(runtime_errc::shutdown_timeout,
                                           running_.begin()->first,
                                           make_error_code(runtime_errc::shutdown_timeout));
        }
        return first_error_;
    }

    void runtime_state_t::on_finished(const std::string& running_name, std::exception_ptr failure, std::error_code result) {
        std::lock_guard<std::mutex> guard(mutex_);
        auto it = running_.find(running_name);
        if (it != running_.end()) {
            // later sends to this actor fail instead of piling up
            it->second.close();
            running_.erase(it);
        }

        runtime_error_t error;
        if (failure) {
            logger().error(log_target, "Actor % has panicked: %", running_name, describe(failure));
            error = runtime_error_t(runtime_errc::actor_panic, running_name, make_error_code(runtime_errc::actor_panic));
        } else if (result) {
            logger().error(log_target, "Actor % has finished unsuccessfully: %", running_name, result.message());
            error = runtime_error_t::actor_error(running_name, result);
        } else {
            logger().info(log_target, "Actor has finished: %", running_name);
        }

        if (error) {
            publish(runtime_event::aborted(running_name, error));
            if (!first_error_) {
                first_error_ = error;
                if (phase_ == phase::running) {
                    logger().info(log_target, "Shutting down on error");
                    phase_ = phase::shutting_down;
                    broadcast_shutdown_locked();
                }
            } else {
                logger().warn(log_target, "Additional failure while shutting down: %", error);
            }
        } else {
            publish(runtime_event::stopped(running_name));
        }
        finished_.notify_all();
    }

    std::size_t runtime_state_t::running() const {
        std::lock_guard<std::mutex> guard(mutex_);
        return running_.size();
    }

    void runtime_state_t::start_locked(std::string running_name, std::unique_ptr<run_actor_base> actor) {
        logger().info(log_target, "Running %", running_name);
        running_.emplace(running_name, actor->signal());
        publish(runtime_event::started(running_name));
        actor->launch(*executor_, intrusive_ptr<runtime_state_t>(this), running_name);
        if (phase_ == phase::shutting_down) {
            auto error = actor->signal().send(runtime_request::shutdown);
            if (error) {
                logger().warn(log_target, "Failed to send shutdown request to %: %", running_name, error.message());
            }
        }
    }

    void runtime_state_t::broadcast_shutdown_locked() {
        for (const auto& [running_name, signal] : running_) {
            if (auto error = signal.send(runtime_request::shutdown)) {
                logger().warn(log_target, "Failed to send shutdown request to %: %", running_name, error.message());
            } else {
                logger().debug(log_target, "Sent shutdown request to %", running_name);
            }
        }
    }

    void runtime_state_t::publish(runtime_event event) {
        if (!config_.events) {
            return;
        }
        if (auto error = config_.events->try_send(std::move(event))) {
            logger().error(log_target, "Failed to send runtime event: %", error.message());
        }
    }

}} // namespace edge_actors::detail
