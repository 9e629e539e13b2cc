#pragma once

#include <atomic>
#include <cassert>
#include <cstddef>

namespace serial_actor { namespace detail {

    /// @brief Atomic reference count for heap objects shared through intrusive_ptr
    ///
    /// Starts at one, so make_counted() adopts the first reference. The last
    /// release deletes the object as Derived, no virtual destructor needed.
    template<class Derived>
    class ref_counted {
    public:
        ref_counted(const ref_counted&) = delete;
        ref_counted& operator=(const ref_counted&) = delete;

        void add_ref() const noexcept {
            [[maybe_unused]] auto previous = count_.fetch_add(1, std::memory_order_relaxed);
            assert(previous > 0 && "add_ref(): object already released");
        }

        void release() const noexcept {
            auto previous = count_.fetch_sub(1, std::memory_order_acq_rel);
            assert(previous > 0 && "release(): more releases than references");
            if (previous == 1) {
                delete static_cast<const Derived*>(this);
            }
        }

        std::size_t use_count() const noexcept {
            return count_.load(std::memory_order_acquire);
        }

    protected:
        ref_counted() noexcept = default;
        ~ref_counted() = default;

    private:
        mutable std::atomic<std::size_t> count_{1};
    };

    template<class Derived>
    void intrusive_ptr_add_ref(const ref_counted<Derived>* p) noexcept {
        p->add_ref();
    }

    template<class Derived>
    void intrusive_ptr_release(const ref_counted<Derived>* p) noexcept {
        p->release();
    }

}} // namespace serial_actor::detail
