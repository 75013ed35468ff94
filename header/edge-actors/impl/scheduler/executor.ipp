#pragma once

#include <edge-actors/scheduler/executor.hpp>

namespace edge_actors { namespace scheduler {

    executor_t::~executor_t() = default;

}} // namespace edge_actors::scheduler
