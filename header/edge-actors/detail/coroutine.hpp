#pragma once

#include <edge-actors/config.hpp>

#include <coroutine>

namespace edge_actors { namespace detail {

    template<typename Promise = void>
    using coroutine_handle = std::coroutine_handle<Promise>;

    using suspend_always = std::suspend_always;
    using suspend_never = std::suspend_never;

    inline coroutine_handle<> noop_coroutine() noexcept {
        return std::noop_coroutine();
    }

}} // namespace edge_actors::detail
