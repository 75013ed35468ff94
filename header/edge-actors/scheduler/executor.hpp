#pragma once

#include <edge-actors/scheduler/job_ptr.hpp>

namespace edge_actors { namespace scheduler {

    /// @brief Where suspended coroutines are sent to be resumed.
    class executor_t {
    public:
        virtual ~executor_t();

        /// must not resume the job inline
        virtual void execute(job_ptr job) = 0;
    };

}} // namespace edge_actors::scheduler
