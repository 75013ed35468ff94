#pragma once

#include <cstddef>
#include <deque>
#include <limits>

#include <edge-actors/scheduler/executor.hpp>
#include <edge-actors/scheduler/job_ptr.hpp>

namespace edge_actors { namespace test {

    /// Executor driven by the test itself: nothing runs until run_once() or run().
    class scheduler_test_t final : public scheduler::executor_t {
    public:
        std::deque<scheduler::job_ptr> jobs;

        bool run_once();
        std::size_t run(std::size_t max_count = std::numeric_limits<std::size_t>::max());

        void execute(scheduler::job_ptr job) override;
    };

}} // namespace edge_actors::test
