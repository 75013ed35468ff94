#pragma once

// clang-format off
#include <edge-actors/config.hpp>
#include <edge-actors/errors.hpp>
#include <edge-actors/message.hpp>
// clang-format on

#include <edge-actors/fan_in.hpp>
#include <edge-actors/logger.hpp>
#include <edge-actors/mailbox/mailbox.hpp>
#include <edge-actors/mailbox/recipient.hpp>
#include <edge-actors/mailbox/signal_sender.hpp>
#include <edge-actors/result.hpp>
#include <edge-actors/task.hpp>

namespace edge_actors {

    using mailbox::make_channel;
    using mailbox::mailbox_t;
    using mailbox::null_recipient;
    using mailbox::recipient;
    using mailbox::signal_sender_t;

} // namespace edge_actors
