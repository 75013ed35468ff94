#pragma once

#include <ostream>
#include <string>
#include <system_error>
#include <utility>

namespace edge_actors {

    /// failures of a single send or receive
    enum class channel_errc {
        closed = 1, ///< the receiving mailbox is gone or closed
        full        ///< only returned by try_send
    };

    /// wiring mistakes detected while the graph is being assembled
    enum class link_errc {
        already_spawned = 1,
        type_mismatch,
        already_linked
    };

    enum class runtime_errc {
        actor_error = 1, ///< an actor returned an error
        actor_panic,     ///< an exception escaped an actor
        spawn_failed,
        runtime_stopped,
        shutdown_timeout ///< actors still running one cleanup timeout after the shutdown
    };

    const std::error_category& channel_category() noexcept;
    const std::error_category& link_category() noexcept;
    const std::error_category& runtime_category() noexcept;

    inline std::error_code make_error_code(channel_errc e) noexcept {
        return {static_cast<int>(e), channel_category()};
    }

    inline std::error_code make_error_code(link_errc e) noexcept {
        return {static_cast<int>(e), link_category()};
    }

    inline std::error_code make_error_code(runtime_errc e) noexcept {
        return {static_cast<int>(e), runtime_category()};
    }

    /// @brief Outcome of a runtime operation: success, or a kind plus the actor and cause.
    class runtime_error_t final {
    public:
        runtime_error_t() noexcept = default;

        runtime_error_t(runtime_errc kind, std::string actor, std::error_code cause)
            : kind_(make_error_code(kind))
            , actor_(std::move(actor))
            , cause_(cause) {
        }

        static runtime_error_t actor_error(std::string actor, std::error_code cause) {
            return runtime_error_t(runtime_errc::actor_error, std::move(actor), cause);
        }

        /// true when this holds an error, as for std::error_code
        explicit operator bool() const noexcept {
            return static_cast<bool>(kind_);
        }

        std::error_code code() const noexcept {
            return kind_;
        }

        bool is(runtime_errc kind) const noexcept {
            return kind_ == make_error_code(kind);
        }

        const std::string& actor() const noexcept {
            return actor_;
        }

        std::error_code cause() const noexcept {
            return cause_;
        }

        std::string message() const;

        friend std::ostream& operator<<(std::ostream& os, const runtime_error_t& error) {
            return os << error.message();
        }

    private:
        std::error_code kind_;
        std::string actor_;
        std::error_code cause_;
    };

} // namespace edge_actors

namespace std {
    template<>
    struct is_error_code_enum<edge_actors::channel_errc> : true_type {};

    template<>
    struct is_error_code_enum<edge_actors::link_errc> : true_type {};

    template<>
    struct is_error_code_enum<edge_actors::runtime_errc> : true_type {};
} // namespace std
