#pragma once

// clang-format off
#include <edge-actors.hpp>

#include <edge-actors/impl/detail/ref_counted.ipp>
#include <edge-actors/impl/errors.ipp>
#include <edge-actors/impl/logger.ipp>

#include <edge-actors/impl/scheduler/executor.ipp>

#include <edge-actors/impl/runtime/runtime_config.ipp>
#include <edge-actors/impl/runtime/runtime_state.ipp>
#include <edge-actors/impl/runtime/runtime.ipp>

// clang-format on
