#pragma once

#include <cassert>
#include <cstddef>
#include <functional>
#include <memory_resource>
#include <new>
#include <type_traits>
#include <utility>

#include <serial-actor/detail/memory.hpp>

namespace serial_actor { namespace detail {

    template<class Signature>
    class unique_function;

    /// @brief Move-only type-erased callable with small buffer optimization
    ///
    /// Callables that fit the inline buffer (and are nothrow movable) never
    /// allocate. Larger ones are placed in the memory_resource given at
    /// construction and released back to it.
    template<class R, class... Args>
    class unique_function<R(Args...)> final {
    public:
        static constexpr std::size_t small_buffer_size = 4 * sizeof(void*);
        static constexpr std::size_t small_buffer_align = alignof(std::max_align_t);

        unique_function() noexcept
            : unique_function(std::pmr::get_default_resource()) {}

        explicit unique_function(std::pmr::memory_resource* resource) noexcept
            : resource_(resource)
            , vtable_(nullptr) {
            assert(resource_);
        }

        template<class F>
            requires(!std::is_same_v<std::decay_t<F>, unique_function> &&
                     std::is_invocable_r_v<R, std::decay_t<F>&, Args...>)
        unique_function(std::pmr::memory_resource* resource, F&& f)
            : resource_(resource)
            , vtable_(nullptr) {
            assert(resource_);
            using functor = std::decay_t<F>;
            if constexpr (std::is_pointer_v<functor>) {
                if (f == nullptr) {
                    return;
                }
            }
            emplace<functor>(std::forward<F>(f));
        }

        /// Allocator-extended move: rehomes a heap-stored callable when the
        /// resources differ.
        unique_function(std::pmr::memory_resource* resource, unique_function&& other)
            : resource_(resource)
            , vtable_(nullptr) {
            assert(resource_);
            if (other.vtable_ != nullptr) {
                other.vtable_->relocate(buffer_, resource_, other.buffer_, other.resource_);
                vtable_ = std::exchange(other.vtable_, nullptr);
            }
        }

        unique_function(unique_function&& other) noexcept
            : resource_(other.resource_)
            , vtable_(nullptr) {
            if (other.vtable_ != nullptr) {
                other.vtable_->relocate(buffer_, resource_, other.buffer_, other.resource_);
                vtable_ = std::exchange(other.vtable_, nullptr);
            }
        }

        unique_function& operator=(unique_function&& other) noexcept {
            if (this != &other) {
                reset();
                resource_ = other.resource_;
                if (other.vtable_ != nullptr) {
                    other.vtable_->relocate(buffer_, resource_, other.buffer_, other.resource_);
                    vtable_ = std::exchange(other.vtable_, nullptr);
                }
            }
            return *this;
        }

        unique_function& operator=(std::nullptr_t) noexcept {
            reset();
            return *this;
        }

        unique_function(const unique_function&) = delete;
        unique_function& operator=(const unique_function&) = delete;

        ~unique_function() {
            reset();
        }

        R operator()(Args... args) {
            assert(vtable_ != nullptr && "calling an empty unique_function");
            return vtable_->invoke(buffer_, std::forward<Args>(args)...);
        }

        void reset() noexcept {
            if (vtable_ != nullptr) {
                vtable_->destroy(buffer_, resource_);
                vtable_ = nullptr;
            }
        }

        void swap(unique_function& other) noexcept {
            if (this == &other) {
                return;
            }
            unique_function tmp(std::move(other));
            other = std::move(*this);
            *this = std::move(tmp);
        }

        [[nodiscard]] bool empty() const noexcept {
            return vtable_ == nullptr;
        }

        explicit operator bool() const noexcept {
            return vtable_ != nullptr;
        }

        [[nodiscard]] bool uses_small_buffer() const noexcept {
            return vtable_ != nullptr && vtable_->small;
        }

        [[nodiscard]] std::pmr::memory_resource* resource() const noexcept {
            return resource_;
        }

        friend bool operator==(const unique_function& f, std::nullptr_t) noexcept {
            return f.empty();
        }

    private:
        struct vtable_t {
            R (*invoke)(void*, Args&&...);
            void (*relocate)(void* dst, std::pmr::memory_resource* dst_resource,
                             void* src, std::pmr::memory_resource* src_resource);
            void (*destroy)(void*, std::pmr::memory_resource*) noexcept;
            bool small;
        };

        template<class F>
        static constexpr bool fits_small_buffer =
            sizeof(F) <= small_buffer_size &&
            alignof(F) <= small_buffer_align &&
            std::is_nothrow_move_constructible_v<F>;

        template<class F>
        static R call(F& f, Args&&... args) {
            if constexpr (std::is_void_v<R>) {
                std::invoke(f, std::forward<Args>(args)...);
            } else {
                return std::invoke(f, std::forward<Args>(args)...);
            }
        }

        template<class F>
        struct small_ops {
            static F* get(void* buffer) noexcept {
                return std::launder(static_cast<F*>(buffer));
            }

            static R invoke(void* buffer, Args&&... args) {
                return call(*get(buffer), std::forward<Args>(args)...);
            }

            static void relocate(void* dst, std::pmr::memory_resource*, void* src, std::pmr::memory_resource*) {
                auto* from = get(src);
                ::new (dst) F(std::move(*from));
                from->~F();
            }

            static void destroy(void* buffer, std::pmr::memory_resource*) noexcept {
                get(buffer)->~F();
            }

            static constexpr vtable_t table{&invoke, &relocate, &destroy, true};
        };

        template<class F>
        struct heap_ops {
            static F*& get(void* buffer) noexcept {
                return *std::launder(static_cast<F**>(buffer));
            }

            static R invoke(void* buffer, Args&&... args) {
                return call(*get(buffer), std::forward<Args>(args)...);
            }

            static void relocate(void* dst, std::pmr::memory_resource* dst_resource,
                                 void* src, std::pmr::memory_resource* src_resource) {
                if (*dst_resource == *src_resource) {
                    ::new (dst) F*(get(src));
                    return;
                }
                auto* moved = pmr::allocate_ptr<F>(dst_resource, std::move(*get(src)));
                destroy(src, src_resource);
                ::new (dst) F*(moved);
            }

            static void destroy(void* buffer, std::pmr::memory_resource* resource) noexcept {
                pmr::deallocate_ptr(resource, get(buffer));
            }

            static constexpr vtable_t table{&invoke, &relocate, &destroy, false};
        };

        template<class F, class T>
        void emplace(T&& f) {
            if constexpr (fits_small_buffer<F>) {
                ::new (static_cast<void*>(buffer_)) F(std::forward<T>(f));
                vtable_ = &small_ops<F>::table;
            } else {
                ::new (static_cast<void*>(buffer_)) F*(pmr::allocate_ptr<F>(resource_, std::forward<T>(f)));
                vtable_ = &heap_ops<F>::table;
            }
        }

        std::pmr::memory_resource* resource_;
        const vtable_t* vtable_;
        alignas(small_buffer_align) unsigned char buffer_[small_buffer_size];
    };

}} // namespace serial_actor::detail
