#pragma once

#include <edge-actors/detail/ref_counted.hpp>

namespace edge_actors {

    ref_counted::~ref_counted() = default;

    ref_counted::ref_counted()
        : rc_(1) {
    }

} // namespace edge_actors
