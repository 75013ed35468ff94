#pragma once

#include <any>
#include <cstdint>
#include <ostream>

#include <edge-actors/errors.hpp>
#include <edge-actors/mailbox/recipient.hpp>
#include <edge-actors/message.hpp>
#include <edge-actors/result.hpp>

namespace edge_actors { namespace builder {

    enum class link_state : std::uint8_t {
        building,
        linked,
        spawned
    };

    inline std::ostream& operator<<(std::ostream& os, link_state state) {
        switch (state) {
            case link_state::building:
                return os << "building";
            case link_state::linked:
                return os << "linked";
            case link_state::spawned:
                return os << "spawned";
        }
        return os;
    }

    /// @brief A builder another actor can be wired to before anything is spawned.
    ///
    /// connect() hands over where our output goes and returns where the peer
    /// should send our input.
    template<message Input, message Output>
    class peer_linker {
    public:
        using input_type = Input;
        using output_type = Output;

        virtual ~peer_linker() = default;

        virtual result<mailbox::recipient<Input>> connect(mailbox::recipient<Output> output) = 0;

        /// For graphs assembled at run time. @p output must hold a recipient<Output>;
        /// on success the result holds a recipient<Input>.
        result<std::any> connect_any(const std::any& output) {
            const auto* typed = std::any_cast<mailbox::recipient<Output>>(&output);
            if (typed == nullptr) {
                return link_errc::type_mismatch;
            }
            auto linked = connect(*typed);
            if (!linked) {
                return linked.error();
            }
            return std::any(std::move(linked).value());
        }
    };

}} // namespace edge_actors::builder
