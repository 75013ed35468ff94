#pragma once

#include <cstdint>
#include <system_error>

#include <edge-actors/detail/ref_counted.hpp>
#include <edge-actors/errors.hpp>
#include <edge-actors/mailbox/detail/waiter.hpp>

namespace edge_actors { namespace mailbox {

    enum class push_result : std::uint8_t {
        accepted,
        pending, ///< parked, the waiter is notified later
        full,    ///< only without a waiter
        closed
    };

    inline std::error_code to_error_code(push_result result) noexcept {
        switch (result) {
            case push_result::full:
                return make_error_code(channel_errc::full);
            case push_result::closed:
                return make_error_code(channel_errc::closed);
            case push_result::accepted:
            case push_result::pending:
                break;
        }
        return {};
    }

    /// @brief What a recipient<M> writes into: a channel, or an adapter in front of one.
    template<class M>
    class sink_t : public ref_counted {
    public:
        /// Takes @p value (moves from it) unless the result is full.
        /// With a null @p waiter a full sink returns push_result::full instead of parking.
        virtual push_result push(M& value, detail::send_waiter_t* waiter) = 0;

        virtual bool closed() const noexcept = 0;

        /// a new counted producer handle refers to this sink
        virtual void attach() noexcept {}

        /// a counted producer handle was dropped
        virtual void detach() noexcept {}
    };

}} // namespace edge_actors::mailbox
