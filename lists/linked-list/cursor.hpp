#pragma once

#include "linked_list.hpp"

#include <internal_assert.hpp>

#include <cstddef>
#include <memory>
#include <optional>
#include <utility>

// Mutable cursor over a LinkedList. It sits either on a node or on the
// "ghost" between the back and the front of the list; the ghost has no index.
// Holds the exclusive borrow of the list for its whole lifetime.
template <class T>
class ListCursor {
    using Node = detail::ListNode<T>;

  public:
    ListCursor(const ListCursor&) = delete;
    ListCursor& operator=(const ListCursor&) = delete;

    // A moved-from cursor is detached: it no longer reaches the list
    ListCursor(ListCursor&& other) noexcept
        : list_(std::exchange(other.list_, nullptr)),
          cur_(std::exchange(other.cur_, nullptr)),
          index_(std::exchange(other.index_, std::nullopt)),
          borrow_(std::move(other.borrow_)) {
    }

    ListCursor& operator=(ListCursor&& other) noexcept {
        if (this != &other) {
            borrow_ = std::move(other.borrow_);
            list_ = std::exchange(other.list_, nullptr);
            cur_ = std::exchange(other.cur_, nullptr);
            index_ = std::exchange(other.index_, std::nullopt);
        }
        return *this;
    }

    std::optional<size_t> Index() const {
        return index_;
    }

    void MoveNext() {
        CheckAttached();
        if (cur_ != nullptr) {
            cur_ = cur_->back;
            if (cur_ != nullptr) {
                *index_ += 1;
            } else {
                index_.reset();
            }
        } else if (list_->front_ != nullptr) {
            cur_ = list_->front_;
            index_ = 0;
        }
    }

    void MovePrev() {
        CheckAttached();
        if (cur_ != nullptr) {
            cur_ = cur_->front;
            if (cur_ != nullptr) {
                *index_ -= 1;
            } else {
                index_.reset();
            }
        } else if (list_->back_ != nullptr) {
            cur_ = list_->back_;
            index_ = list_->len_ - 1;
        }
    }

    T* Current() {
        return cur_ != nullptr ? &cur_->elem : nullptr;
    }

    // From the ghost the next element is the front of the list
    T* PeekNext() {
        CheckAttached();
        Node* next = cur_ != nullptr ? cur_->back : list_->front_;
        return next != nullptr ? &next->elem : nullptr;
    }

    // From the ghost the previous element is the back of the list
    T* PeekPrev() {
        CheckAttached();
        Node* prev = cur_ != nullptr ? cur_->front : list_->back_;
        return prev != nullptr ? &prev->elem : nullptr;
    }

    // Detaches everything before the current node. The current node becomes
    // the front, so the index drops to 0. At the ghost the whole list is taken.
    LinkedList<T> SplitBefore() {
        CheckAttached();
        if (cur_ == nullptr) {
            return TakeAll();
        }

        Node* prev = cur_->front;
        Node* output_front = nullptr;
        Node* output_back = nullptr;
        if (prev != nullptr) {
            output_front = list_->front_;
            output_back = prev;
            prev->back = nullptr;
            cur_->front = nullptr;
        }
        list_->front_ = cur_;

        size_t output_len = *index_;
        list_->len_ = detail::LenSub(list_->len_, output_len);
        index_ = 0;
        return LinkedList<T>::FromChain(output_front, output_back, output_len);
    }

    // Detaches everything after the current node, the index is unchanged
    LinkedList<T> SplitAfter() {
        CheckAttached();
        if (cur_ == nullptr) {
            return TakeAll();
        }

        Node* next = cur_->back;
        Node* output_front = nullptr;
        Node* output_back = nullptr;
        if (next != nullptr) {
            output_front = next;
            output_back = list_->back_;
            next->front = nullptr;
            cur_->back = nullptr;
        }
        list_->back_ = cur_;

        size_t new_len = detail::LenAdd(*index_, 1);
        size_t output_len = detail::LenSub(list_->len_, new_len);
        list_->len_ = new_len;
        return LinkedList<T>::FromChain(output_front, output_back, output_len);
    }

    // Moves all nodes of `input` in front of the current node in O(1).
    // At the ghost they go to the back of the list.
    void SpliceBefore(LinkedList<T>&& input) {
        CheckAttached();
        input.borrow_.CheckWritable();
        if (input.IsEmpty()) {
            return;
        }
        Node* in_front = std::exchange(input.front_, nullptr);
        Node* in_back = std::exchange(input.back_, nullptr);
        size_t in_len = std::exchange(input.len_, 0);

        if (cur_ != nullptr) {
            if (Node* prev = cur_->front; prev != nullptr) {
                prev->back = in_front;
                in_front->front = prev;
            } else {
                list_->front_ = in_front;
            }
            cur_->front = in_back;
            in_back->back = cur_;
        } else if (list_->back_ != nullptr) {
            list_->back_->back = in_front;
            in_front->front = list_->back_;
            list_->back_ = in_back;
        } else {
            list_->front_ = in_front;
            list_->back_ = in_back;
        }

        list_->len_ = detail::LenAdd(list_->len_, in_len);
        if (index_) {
            *index_ = detail::LenAdd(*index_, in_len);
        }
    }

    // Moves all nodes of `input` after the current node in O(1).
    // At the ghost they go to the front of the list.
    void SpliceAfter(LinkedList<T>&& input) {
        CheckAttached();
        input.borrow_.CheckWritable();
        if (input.IsEmpty()) {
            return;
        }
        Node* in_front = std::exchange(input.front_, nullptr);
        Node* in_back = std::exchange(input.back_, nullptr);
        size_t in_len = std::exchange(input.len_, 0);

        if (cur_ != nullptr) {
            if (Node* next = cur_->back; next != nullptr) {
                next->front = in_back;
                in_back->back = next;
            } else {
                list_->back_ = in_back;
            }
            cur_->back = in_front;
            in_front->front = cur_;
        } else if (list_->front_ != nullptr) {
            list_->front_->front = in_back;
            in_back->back = list_->front_;
            list_->front_ = in_front;
        } else {
            list_->front_ = in_front;
            list_->back_ = in_back;
        }

        list_->len_ = detail::LenAdd(list_->len_, in_len);
    }

    void InsertBefore(T elem) {
        LinkedList<T> single;
        single.PushBack(std::move(elem));
        SpliceBefore(std::move(single));
    }

    void InsertAfter(T elem) {
        LinkedList<T> single;
        single.PushBack(std::move(elem));
        SpliceAfter(std::move(single));
    }

    // Unlinks the current node and moves onto its successor, which inherits
    // the index. Removing the back node leaves the cursor at the ghost.
    std::optional<T> RemoveCurrent() {
        CheckAttached();
        if (cur_ == nullptr) {
            return std::nullopt;
        }

        std::unique_ptr<Node> node{cur_};
        Node* prev = node->front;
        Node* next = node->back;
        if (prev != nullptr) {
            prev->back = next;
        } else {
            list_->front_ = next;
        }
        if (next != nullptr) {
            next->front = prev;
        } else {
            list_->back_ = prev;
        }

        cur_ = next;
        if (cur_ == nullptr) {
            index_.reset();
        }
        list_->len_ = detail::LenSub(list_->len_, 1);
        return std::move(node->elem);
    }

  private:
    friend class LinkedList<T>;

    explicit ListCursor(LinkedList<T>& list)
        : list_(&list), borrow_(list.borrow_) {
    }

    void CheckAttached() const {
        INTERNAL_ASSERT_MSG(list_ != nullptr,
                            "cursor is used after being moved from");
    }

    LinkedList<T> TakeAll() {
        Node* front = std::exchange(list_->front_, nullptr);
        Node* back = std::exchange(list_->back_, nullptr);
        size_t len = std::exchange(list_->len_, 0);
        return LinkedList<T>::FromChain(front, back, len);
    }

    LinkedList<T>* list_;
    Node* cur_ = nullptr;
    std::optional<size_t> index_;
    detail::ExclusiveBorrow borrow_;
};
