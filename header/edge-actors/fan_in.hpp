#pragma once

#include <concepts>
#include <cstddef>
#include <ostream>
#include <type_traits>
#include <utility>
#include <variant>

#include <edge-actors/detail/type_traits.hpp>
#include <edge-actors/message.hpp>

namespace edge_actors {

    /// @brief Closed sum of the message kinds an actor accepts.
    ///
    /// runtime_request is always one of the alternatives, so any actor whose input
    /// is a fan_in_message can be asked to shut down. Each listed kind converts
    /// implicitly into the sum, which lets a recipient of the sum be handed to a
    /// producer of a single kind (see recipient::adapt).
    template<message... Messages>
    class fan_in_message final {
        static_assert(sizeof...(Messages) > 0, "fan_in_message needs at least one message kind");
        static_assert(!type_traits::contains_v<runtime_request, Messages...>,
                      "runtime_request is part of every fan_in_message and must not be listed");
        static_assert(type_traits::is_unique_v<Messages...>, "fan_in_message kinds must be distinct");

    public:
        using variant_type = std::variant<runtime_request, Messages...>;

        template<class M>
        static constexpr bool accepts = type_traits::contains_v<type_traits::remove_cvref_t<M>, runtime_request, Messages...>;

        fan_in_message(runtime_request request) noexcept
            : value_(request) {
        }

        template<class M>
            requires(accepts<M> && !std::is_same_v<type_traits::remove_cvref_t<M>, runtime_request>)
        fan_in_message(M&& value)
            : value_(std::in_place_type<type_traits::remove_cvref_t<M>>, std::forward<M>(value)) {
        }

        template<class M>
            requires accepts<M>
        bool is() const noexcept {
            return std::holds_alternative<M>(value_);
        }

        bool is_runtime_request() const noexcept {
            return is<runtime_request>();
        }

        template<class M>
            requires accepts<M>
        M* get_if() noexcept {
            return std::get_if<M>(&value_);
        }

        template<class M>
            requires accepts<M>
        const M* get_if() const noexcept {
            return std::get_if<M>(&value_);
        }

        template<class M>
            requires accepts<M>
        M& get() & {
            return std::get<M>(value_);
        }

        template<class M>
            requires accepts<M>
        const M& get() const& {
            return std::get<M>(value_);
        }

        template<class M>
            requires accepts<M>
        M&& get() && {
            return std::get<M>(std::move(value_));
        }

        template<class Visitor>
        decltype(auto) visit(Visitor&& visitor) & {
            return std::visit(std::forward<Visitor>(visitor), value_);
        }

        template<class Visitor>
        decltype(auto) visit(Visitor&& visitor) const& {
            return std::visit(std::forward<Visitor>(visitor), value_);
        }

        template<class Visitor>
        decltype(auto) visit(Visitor&& visitor) && {
            return std::visit(std::forward<Visitor>(visitor), std::move(value_));
        }

        /// position of the active kind; 0 is runtime_request
        std::size_t index() const noexcept {
            return value_.index();
        }

        friend bool operator==(const fan_in_message& lhs, const fan_in_message& rhs)
            requires(std::equality_comparable<Messages> && ...)
        {
            return lhs.value_ == rhs.value_;
        }

        friend std::ostream& operator<<(std::ostream& os, const fan_in_message& message) {
            std::visit([&os](const auto& value) { os << value; }, message.value_);
            return os;
        }

    private:
        variant_type value_;
    };

} // namespace edge_actors
