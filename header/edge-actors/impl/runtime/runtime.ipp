#pragma once

#include <edge-actors/runtime/runtime.hpp>

namespace edge_actors {

    runtime_t::runtime_t(runtime_config config)
        : scheduler_(std::make_unique<scheduler::sharing_scheduler>(config.num_workers))
        , state_(make_counted<detail::runtime_state_t>(std::move(config))) {
    }

    runtime_t::~runtime_t() = default;

    runtime_error_t runtime_t::run() {
        scheduler_->start();
        auto error = state_->run(*scheduler_);
        // joins the workers; actors still parked after a cleanup timeout are never resumed
        scheduler_->stop();
        return error;
    }

} // namespace edge_actors
