#pragma once

#include <cassert>
#include <cstddef>
#include <utility>

namespace serial_actor {

    /// Passed to intrusive_ptr to take over a reference the caller already owns.
    struct adopt_ref_t {
        explicit adopt_ref_t() = default;
    };

    inline constexpr adopt_ref_t adopt_ref{};

    /// @brief Owning pointer to an object that counts its own references
    ///
    /// The pointee is found through ADL-visible intrusive_ptr_add_ref and
    /// intrusive_ptr_release.
    template<class T>
    class intrusive_ptr final {
    public:
        using element_type = T;

        constexpr intrusive_ptr() noexcept = default;

        constexpr intrusive_ptr(std::nullptr_t) noexcept {}

        explicit intrusive_ptr(T* raw) noexcept
            : ptr_(raw) {
            if (ptr_) {
                intrusive_ptr_add_ref(ptr_);
            }
        }

        intrusive_ptr(T* raw, adopt_ref_t) noexcept
            : ptr_(raw) {}

        intrusive_ptr(const intrusive_ptr& other) noexcept
            : intrusive_ptr(other.ptr_) {}

        intrusive_ptr(intrusive_ptr&& other) noexcept
            : ptr_(std::exchange(other.ptr_, nullptr)) {}

        intrusive_ptr& operator=(const intrusive_ptr& other) noexcept {
            intrusive_ptr(other).swap(*this);
            return *this;
        }

        intrusive_ptr& operator=(intrusive_ptr&& other) noexcept {
            intrusive_ptr(std::move(other)).swap(*this);
            return *this;
        }

        intrusive_ptr& operator=(std::nullptr_t) noexcept {
            reset();
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

        void reset() noexcept {
            if (auto* old = std::exchange(ptr_, nullptr)) {
                intrusive_ptr_release(old);
            }
        }

        T* get() const noexcept {
            return ptr_;
        }

        T* operator->() const noexcept {
            assert(ptr_ && "dereferencing an empty intrusive_ptr");
            return ptr_;
        }

        T& operator*() const noexcept {
            assert(ptr_ && "dereferencing an empty intrusive_ptr");
            return *ptr_;
        }

        explicit operator bool() const noexcept {
            return ptr_ != nullptr;
        }

        friend bool operator==(const intrusive_ptr& lhs, const intrusive_ptr& rhs) noexcept {
            return lhs.ptr_ == rhs.ptr_;
        }

        friend bool operator==(const intrusive_ptr& lhs, std::nullptr_t) noexcept {
            return lhs.ptr_ == nullptr;
        }

    private:
        T* ptr_ = nullptr;
    };

    /// Heap-allocates a T whose counter starts at one and adopts that reference.
    template<class T, class... Args>
    intrusive_ptr<T> make_counted(Args&&... args) {
        return intrusive_ptr<T>(new T(std::forward<Args>(args)...), adopt_ref);
    }

} // namespace serial_actor
