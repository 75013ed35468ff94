#pragma once

#include <cassert>
#include <concepts>
#include <cstddef>
#include <utility>

#include <edge-actors/detail/ref_counted.hpp>

namespace edge_actors {

    template<class T>
    class intrusive_ptr final {
    public:
        using pointer = T*;
        using element_type = T;
        using reference = T&;

        constexpr intrusive_ptr() noexcept
            : ptr_(nullptr) {
        }

        constexpr intrusive_ptr(std::nullptr_t) noexcept
            : intrusive_ptr() {
        }

        intrusive_ptr(pointer raw_ptr, bool add_ref = true) noexcept {
            set_ptr(raw_ptr, add_ref);
        }

        intrusive_ptr(intrusive_ptr&& other) noexcept
            : ptr_(other.detach()) {
        }

        intrusive_ptr(const intrusive_ptr& other) noexcept {
            set_ptr(other.get(), true);
        }

        template<class Y>
            requires std::convertible_to<Y*, T*>
        intrusive_ptr(intrusive_ptr<Y> other) noexcept
            : ptr_(other.detach()) {
        }

        intrusive_ptr& operator=(intrusive_ptr other) noexcept {
            swap(other);
            return *this;
        }

        ~intrusive_ptr() {
            if (ptr_) {
                intrusive_ptr_release(ptr_);
            }
        }

        void swap(intrusive_ptr& other) noexcept {
            std::swap(ptr_, other.ptr_);
        }

        pointer detach() noexcept {
            return std::exchange(ptr_, nullptr);
        }

        void reset(pointer new_value = nullptr, bool add_ref = true) noexcept {
            auto old = ptr_;
            set_ptr(new_value, add_ref);
            if (old) {
                intrusive_ptr_release(old);
            }
        }

        pointer get() const noexcept {
            return ptr_;
        }

        pointer operator->() const noexcept {
            assert(ptr_ != nullptr && "operator->(): dereferencing null intrusive_ptr!");
            return ptr_;
        }

        reference operator*() const noexcept {
            assert(ptr_ != nullptr && "operator*(): dereferencing null intrusive_ptr!");
            return *ptr_;
        }

        explicit operator bool() const noexcept {
            return ptr_ != nullptr;
        }

    private:
        void set_ptr(pointer raw_ptr, bool add_ref) noexcept {
            ptr_ = raw_ptr;
            if (raw_ptr && add_ref) {
                intrusive_ptr_add_ref(raw_ptr);
            }
        }

        pointer ptr_;
    };

    template<class T>
    bool operator==(const intrusive_ptr<T>& x, std::nullptr_t) noexcept {
        return !x;
    }

    template<class T, class U>
    bool operator==(const intrusive_ptr<T>& x, const intrusive_ptr<U>& y) noexcept {
        return x.get() == y.get();
    }

    template<class T, class... Args>
    intrusive_ptr<T> make_counted(Args&&... args) {
        return intrusive_ptr<T>(new T(std::forward<Args>(args)...), false);
    }

} // namespace edge_actors
