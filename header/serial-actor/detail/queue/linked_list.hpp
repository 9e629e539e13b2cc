#pragma once

#include <cassert>
#include <cstddef>
#include <memory>

namespace serial_actor { namespace detail {

    /// @brief Intrusive FIFO of nodes that expose a `T* next` member
    ///
    /// Not synchronized. Owns its nodes and frees the leftovers with Deleter.
    template<class T, class Deleter = std::default_delete<T>>
    class linked_list final {
    public:
        using pointer = T*;
        using unique_pointer = std::unique_ptr<T, Deleter>;

        linked_list() noexcept = default;

        linked_list(linked_list&& other) noexcept
            : head_(other.head_)
            , tail_(other.tail_)
            , size_(other.size_) {
            other.head_ = nullptr;
            other.tail_ = nullptr;
            other.size_ = 0;
        }

        linked_list& operator=(linked_list&& other) noexcept {
            if (this != &other) {
                clear();
                head_ = other.head_;
                tail_ = other.tail_;
                size_ = other.size_;
                other.head_ = nullptr;
                other.tail_ = nullptr;
                other.size_ = 0;
            }
            return *this;
        }

        linked_list(const linked_list&) = delete;
        linked_list& operator=(const linked_list&) = delete;

        ~linked_list() {
            clear();
        }

        bool empty() const noexcept {
            return head_ == nullptr;
        }

        std::size_t size() const noexcept {
            return size_;
        }

        pointer front() const noexcept {
            return head_;
        }

        void push_back(pointer ptr) noexcept {
            assert(ptr != nullptr);
            ptr->next = nullptr;
            if (tail_ == nullptr) {
                head_ = ptr;
            } else {
                tail_->next = ptr;
            }
            tail_ = ptr;
            ++size_;
        }

        unique_pointer pop_front() noexcept {
            if (head_ == nullptr) {
                return unique_pointer{};
            }
            auto* result = head_;
            head_ = head_->next;
            if (head_ == nullptr) {
                tail_ = nullptr;
            }
            --size_;
            result->next = nullptr;
            return unique_pointer(result);
        }

        void clear() noexcept {
            while (!empty()) {
                pop_front();
            }
        }

    private:
        pointer head_ = nullptr;
        pointer tail_ = nullptr;
        std::size_t size_ = 0;
    };

}} // namespace serial_actor::detail
