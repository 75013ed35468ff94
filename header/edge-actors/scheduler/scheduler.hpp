#pragma once

#include <cassert>
#include <cstddef>
#include <memory>
#include <vector>

#include <edge-actors/logger.hpp>
#include <edge-actors/scheduler/executor.hpp>
#include <edge-actors/scheduler/job_ptr.hpp>
#include <edge-actors/scheduler/worker.hpp>

namespace edge_actors { namespace scheduler {

    /// @brief Fixed pool of worker threads resuming the jobs handed to execute().
    template<class Policy>
    class scheduler_t final : public executor_t {
    public:
        using policy_data = typename Policy::coordinator_data;
        using worker_type = worker<Policy>;

        explicit scheduler_t(std::size_t num_worker_threads)
            : num_workers_(num_worker_threads == 0 ? 1 : num_worker_threads)
            , data_(this) {
        }

        ~scheduler_t() override {
            if (!workers_.empty()) {
                stop();
            } else {
                drop_pending();
            }
        }

        inline std::size_t num_workers() const {
            return num_workers_;
        }

        policy_data& data() {
            return data_;
        }

        Policy& policy() {
            return policy_;
        }

        void start() {
            assert(workers_.empty() && "scheduler_t::start() called twice");
            workers_.reserve(num_workers_);
            for (std::size_t i = 0; i < num_workers_; ++i) {
                workers_.emplace_back(new worker_type(this));
            }
            for (auto& w : workers_) {
                w->start();
            }
            logger().debug("Scheduler", "started % workers", num_workers_);
        }

        /// Lets every worker finish its current job, then joins them.
        /// Jobs still queued are never resumed and their coroutine frames leak;
        /// returns how many were dropped.
        std::size_t stop() {
            for (std::size_t i = 0; i < workers_.size(); ++i) {
                policy_.central_enqueue(this, job_ptr());
            }
            for (auto& w : workers_) {
                w->get_thread().join();
            }
            workers_.clear();
            auto dropped = drop_pending();
            logger().debug("Scheduler", "stopped");
            return dropped;
        }

        void execute(job_ptr job) override {
            assert(job && "scheduler_t::execute() with a null job");
            policy_.central_enqueue(this, job);
        }

    private:
        std::size_t drop_pending() {
            std::size_t dropped = 0;
            policy_.foreach_central_resumable(this, [&dropped](job_ptr) { ++dropped; });
            if (dropped > 0) {
                logger().warn("Scheduler", "dropped % pending jobs, their coroutine frames are leaked", dropped);
            }
            return dropped;
        }

        std::size_t num_workers_;
        std::vector<std::unique_ptr<worker_type>> workers_;
        policy_data data_;
        Policy policy_;
    };

}} // namespace edge_actors::scheduler
