#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>

#include <edge-actors/scheduler/job_ptr.hpp>

namespace edge_actors { namespace scheduler {

    /// @brief All workers pull from one central queue.
    class work_sharing {
    public:
        using queue_type = std::deque<job_ptr>;

        struct coordinator_data {
            template<typename Scheduler>
            explicit coordinator_data(Scheduler*) {}
            queue_type queue;
            std::mutex lock;
            std::condition_variable cv;
        };

        /// a null job tells one worker to leave its loop
        template<class Coordinator>
        void central_enqueue(Coordinator* self, job_ptr job) {
            auto& data = self->data();
            std::unique_lock<std::mutex> guard(data.lock);
            data.queue.push_back(job);
            guard.unlock();
            data.cv.notify_one();
        }

        template<class Worker>
        job_ptr dequeue(Worker* self) {
            auto& data = self->parent()->data();
            std::unique_lock<std::mutex> guard(data.lock);
            data.cv.wait(guard, [&] { return !data.queue.empty(); });
            auto job = data.queue.front();
            data.queue.pop_front();
            return job;
        }

        template<class Coordinator, class UnaryFunction>
        void foreach_central_resumable(Coordinator* self, UnaryFunction f) {
            auto& data = self->data();
            std::unique_lock<std::mutex> guard(data.lock);
            while (!data.queue.empty()) {
                auto job = data.queue.front();
                data.queue.pop_front();
                if (job) {
                    f(job);
                }
            }
        }
    };

}} // namespace edge_actors::scheduler
