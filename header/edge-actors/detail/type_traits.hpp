#pragma once

#include <concepts>
#include <type_traits>

namespace edge_actors { namespace type_traits {

    using std::remove_cvref_t;

    template<class T, class... Ts>
    inline constexpr bool contains_v = (std::is_same_v<T, Ts> || ...);

    template<class... Ts>
    struct is_unique : std::true_type {};

    template<class T, class... Ts>
    struct is_unique<T, Ts...> : std::bool_constant<!contains_v<T, Ts...> && is_unique<Ts...>::value> {};

    template<class... Ts>
    inline constexpr bool is_unique_v = is_unique<Ts...>::value;

    /// overload set built from lambdas, for visiting fan-in messages
    template<class... Fs>
    struct overloaded : Fs... {
        using Fs::operator()...;
    };

    template<class... Fs>
    overloaded(Fs...) -> overloaded<Fs...>;

}} // namespace edge_actors::type_traits
