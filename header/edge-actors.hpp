#pragma once

#include <edge-actors/core.hpp>

#include <edge-actors/actor.hpp>
#include <edge-actors/builder/actor_builder.hpp>
#include <edge-actors/builder/converter.hpp>
#include <edge-actors/builder/message_box.hpp>
#include <edge-actors/builder/message_box_builder.hpp>
#include <edge-actors/builder/peer_linker.hpp>
#include <edge-actors/builder/server.hpp>
#include <edge-actors/runtime/runtime.hpp>
#include <edge-actors/runtime/runtime_handle.hpp>
#include <edge-actors/scheduler/sharing_scheduler.hpp>
