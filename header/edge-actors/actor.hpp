#pragma once

#include <concepts>
#include <string_view>
#include <system_error>
#include <utility>

#include <edge-actors/mailbox/signal_sender.hpp>
#include <edge-actors/result.hpp>
#include <edge-actors/task.hpp>

namespace edge_actors {

    /// @brief An actor owns its message box and runs until it returns.
    ///
    /// run() returning a non-zero error code (or throwing) is a failure the
    /// runtime escalates; returning success is a normal termination.
    template<class A>
    concept actor = std::move_constructible<A> && requires(A& a) {
        { a.name() } -> std::convertible_to<std::string_view>;
        { a.run() } -> std::same_as<task<std::error_code>>;
    };

    /// @brief What the runtime consumes to spawn an actor.
    template<class B>
    concept actor_builder = requires(B& b) {
        typename B::actor_type;
        { b.name() } -> std::convertible_to<std::string_view>;
        { b.signal_sender() } -> std::same_as<mailbox::signal_sender_t>;
        { std::move(b).build() } -> std::same_as<result<typename B::actor_type>>;
    } && actor<typename B::actor_type>;

} // namespace edge_actors
