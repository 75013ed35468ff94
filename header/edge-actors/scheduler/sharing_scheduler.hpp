#pragma once

#include <edge-actors/scheduler/policy/work_sharing.hpp>
#include <edge-actors/scheduler/scheduler.hpp>

namespace edge_actors { namespace scheduler {

    using sharing_scheduler = scheduler_t<work_sharing>;

}} // namespace edge_actors::scheduler
