#pragma once

#include <atomic>
#include <cassert>
#include <cstddef>

namespace edge_actors {

    /// @brief Base of objects shared between actors, mailboxes and the runtime.
    /// The count starts at one; use make_counted to adopt that reference.
    class ref_counted {
    public:
        virtual ~ref_counted();

        ref_counted();

        ref_counted(const ref_counted&) = delete;
        ref_counted& operator=(const ref_counted&) = delete;

        void ref() const noexcept {
            assert(rc_.load(std::memory_order_acquire) > 0 && "ref(): use-after-free");
            rc_.fetch_add(1, std::memory_order_relaxed);
        }

        void deref() const noexcept {
            assert(rc_.load(std::memory_order_acquire) > 0 && "deref(): refcount underflow");
            if (rc_.fetch_sub(1, std::memory_order_acq_rel) == 1) {
                delete this;
            }
        }

    private:
        mutable std::atomic<std::size_t> rc_;
    };

    inline void intrusive_ptr_add_ref(const ref_counted* p) {
        p->ref();
    }

    inline void intrusive_ptr_release(const ref_counted* p) {
        p->deref();
    }

} // namespace edge_actors
