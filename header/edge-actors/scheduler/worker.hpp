#pragma once

#include <cstddef>
#include <thread>

#include <edge-actors/scheduler/job_ptr.hpp>

namespace edge_actors { namespace scheduler {

    template<class Policy>
    class scheduler_t;

    template<class Policy>
    class worker final {
    public:
        using coordinator_type = scheduler_t<Policy>;

        explicit worker(coordinator_type* parent)
            : parent_(parent) {
        }

        worker(const worker&) = delete;
        worker& operator=(const worker&) = delete;

        void start() {
            thread_ = std::thread([this] { run(); });
        }

        std::thread& get_thread() {
            return thread_;
        }

        coordinator_type* parent() const noexcept {
            return parent_;
        }

    private:
        void run() {
            for (;;) {
                auto job = parent_->policy().dequeue(this);
                if (!job) {
                    return;
                }
                job.resume();
            }
        }

        coordinator_type* parent_;
        std::thread thread_;
    };

}} // namespace edge_actors::scheduler
