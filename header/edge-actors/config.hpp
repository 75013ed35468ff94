#pragma once

#include <chrono>
#include <cstddef>

// Coroutine support detection
#if defined(__has_include)
#if __has_include(<coroutine>) && defined(__cpp_impl_coroutine)
#define EDGE_ACTORS_HAVE_COROUTINES 1
#else
#define EDGE_ACTORS_HAVE_COROUTINES 0
#endif
#else
#define EDGE_ACTORS_HAVE_COROUTINES 0
#endif

#if !EDGE_ACTORS_HAVE_COROUTINES
namespace edge_actors_config_check {
    static_assert(
        EDGE_ACTORS_HAVE_COROUTINES,
        "\n"
        "edge-actors REQUIRES C++20 Coroutines Support\n"
        "\n"
        "Required: <coroutine>\n"
        "Minimum: GCC 10+, Clang 14+, MSVC 2019 16.8+\n"
        "\n"
        "Fix: Update compiler or add -std=c++20\n");
}
#endif

namespace edge_actors {

    /// number of messages a mailbox buffers before senders are suspended
    inline constexpr std::size_t default_mailbox_capacity = 16;

    inline constexpr std::size_t default_num_workers = 2;

    /// how long the runtime waits for actors to stop before it reports the stragglers
    inline constexpr std::chrono::milliseconds default_cleanup_timeout{std::chrono::seconds(60)};

} // namespace edge_actors
