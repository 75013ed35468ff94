#pragma once

#include <cassert>
#include <optional>
#include <system_error>
#include <type_traits>
#include <utility>

namespace edge_actors {

    /// @brief Either a value or the std::error_code explaining why there is none.
    template<class T>
    class result final {
    public:
        using value_type = T;

        result(T value)
            : value_(std::move(value)) {
        }

        result(std::error_code error) noexcept
            : error_(error) {
            assert(error && "result: an error result needs a non-zero error code");
        }

        template<class E>
            requires std::is_error_code_enum_v<E>
        result(E error) noexcept
            : result(make_error_code(error)) {
        }

        bool has_value() const noexcept {
            return value_.has_value();
        }

        explicit operator bool() const noexcept {
            return has_value();
        }

        std::error_code error() const noexcept {
            return error_;
        }

        T& value() & {
            assert(has_value());
            return *value_;
        }

        const T& value() const& {
            assert(has_value());
            return *value_;
        }

        T&& value() && {
            assert(has_value());
            return std::move(*value_);
        }

        T* operator->() {
            return &value();
        }

        const T* operator->() const {
            return &value();
        }

        T& operator*() & {
            return value();
        }

        T&& operator*() && {
            return std::move(*this).value();
        }

    private:
        std::optional<T> value_;
        std::error_code error_;
    };

} // namespace edge_actors
