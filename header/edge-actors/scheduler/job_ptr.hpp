#pragma once

#include <cassert>

#include <edge-actors/detail/coroutine.hpp>

namespace edge_actors { namespace scheduler {

    namespace detail {
        inline void resume_coroutine(void* address) {
            edge_actors::detail::coroutine_handle<>::from_address(address).resume();
        }
    } // namespace detail

    // Type-erased job pointer using function pointers instead of virtual functions
    struct job_ptr {
        void* ptr;
        void (*resume_fn)(void*);

        job_ptr() noexcept
            : ptr(nullptr)
            , resume_fn(nullptr) {}

        job_ptr(void* p, void (*fn)(void*)) noexcept
            : ptr(p)
            , resume_fn(fn) {
            assert((p != nullptr || fn == nullptr) && "Non-null function requires non-null pointer");
            assert((fn != nullptr || p == nullptr) && "Non-null pointer requires non-null function");
        }

        explicit job_ptr(edge_actors::detail::coroutine_handle<> handle) noexcept
            : job_ptr(handle.address(), &detail::resume_coroutine) {}

        void resume() const {
            assert(ptr != nullptr && "Cannot resume null job");
            resume_fn(ptr);
        }

        explicit operator bool() const noexcept {
            return ptr != nullptr;
        }
    };

}} // namespace edge_actors::scheduler
