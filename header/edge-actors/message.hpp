#pragma once

#include <concepts>
#include <cstdint>
#include <ostream>
#include <sstream>
#include <string>
#include <type_traits>

namespace edge_actors {

    /// @brief Anything an actor can exchange: a movable object that can be printed for diagnostics.
    template<class T>
    concept message = std::is_object_v<T> && std::move_constructible<T> && std::destructible<T> &&
                      requires(std::ostream& os, const T& value) {
                          { os << value } -> std::convertible_to<std::ostream&>;
                      };

    /// @brief Control message the runtime sends to every running actor.
    enum class runtime_request : std::uint8_t {
        shutdown
    };

    inline std::ostream& operator<<(std::ostream& os, runtime_request request) {
        switch (request) {
            case runtime_request::shutdown:
                return os << "Shutdown";
        }
        return os << "RuntimeRequest(" << static_cast<int>(request) << ')';
    }

    /// actors spawned by the runtime must be able to receive a runtime_request
    template<class M>
    concept accepts_runtime_request = message<M> && std::constructible_from<M, runtime_request>;

    template<message M>
    std::string to_string(const M& value) {
        std::ostringstream oss;
        oss << value;
        return oss.str();
    }

} // namespace edge_actors
