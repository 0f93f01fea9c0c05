#pragma once

#include <internal_assert.hpp>

#include <atomic>
#include <cstddef>
#include <utility>

#ifndef LISTS_BORROW_CHECK
#define LISTS_BORROW_CHECK 1
#endif

namespace detail {

inline constexpr bool kBorrowCheck = LISTS_BORROW_CHECK != 0;

// Tracks the views currently alive over one list. Any number of shared
// borrows, or exactly one exclusive borrow, never both.
class BorrowState {
  public:
    BorrowState() = default;

    BorrowState(const BorrowState&) = delete;
    BorrowState& operator=(const BorrowState&) = delete;

    void AcquireShared() {
        if constexpr (kBorrowCheck) {
            INTERNAL_ASSERT_MSG(!exclusive_,
                                "list is already mutably borrowed");
            shared_.fetch_add(1, std::memory_order_relaxed);
        }
    }

    void ReleaseShared() {
        if constexpr (kBorrowCheck) {
            shared_.fetch_sub(1, std::memory_order_relaxed);
        }
    }

    void AcquireExclusive() {
        if constexpr (kBorrowCheck) {
            INTERNAL_ASSERT_MSG(!exclusive_,
                                "list is already mutably borrowed");
            INTERNAL_ASSERT_MSG(shared_.load(std::memory_order_relaxed) == 0,
                                "list is borrowed by a shared iterator");
            exclusive_ = true;
        }
    }

    void ReleaseExclusive() {
        if constexpr (kBorrowCheck) {
            exclusive_ = false;
        }
    }

    // Called before handing out a shared reference to an element
    void CheckReadable() const {
        if constexpr (kBorrowCheck) {
            INTERNAL_ASSERT_MSG(!exclusive_,
                                "list is read while a cursor or mutable "
                                "iterator is alive");
        }
    }

    // Called before any structural change made through the list itself, and
    // before handing out a mutable reference to an element
    void CheckWritable() const {
        if constexpr (kBorrowCheck) {
            INTERNAL_ASSERT_MSG(!exclusive_,
                                "list is modified while a cursor or mutable "
                                "iterator is alive");
            INTERNAL_ASSERT_MSG(shared_.load(std::memory_order_relaxed) == 0,
                                "list is modified while an iterator is alive");
        }
    }

  private:
    std::atomic<size_t> shared_{0};
    bool exclusive_ = false;
};

class SharedBorrow {
  public:
    explicit SharedBorrow(BorrowState& state) : state_(&state) {
        state_->AcquireShared();
    }

    SharedBorrow(const SharedBorrow& other) : state_(other.state_) {
        if (state_ != nullptr) {
            state_->AcquireShared();
        }
    }

    SharedBorrow(SharedBorrow&& other) noexcept
        : state_(std::exchange(other.state_, nullptr)) {
    }

    SharedBorrow& operator=(SharedBorrow other) noexcept {
        std::swap(state_, other.state_);
        return *this;
    }

    ~SharedBorrow() {
        if (state_ != nullptr) {
            state_->ReleaseShared();
        }
    }

  private:
    BorrowState* state_;
};

class ExclusiveBorrow {
  public:
    explicit ExclusiveBorrow(BorrowState& state) : state_(&state) {
        state_->AcquireExclusive();
    }

    ExclusiveBorrow(const ExclusiveBorrow&) = delete;
    ExclusiveBorrow& operator=(const ExclusiveBorrow&) = delete;

    ExclusiveBorrow(ExclusiveBorrow&& other) noexcept
        : state_(std::exchange(other.state_, nullptr)) {
    }

    ExclusiveBorrow& operator=(ExclusiveBorrow&& other) noexcept {
        ExclusiveBorrow tmp{std::move(other)};
        std::swap(state_, tmp.state_);
        return *this;
    }

    ~ExclusiveBorrow() {
        if (state_ != nullptr) {
            state_->ReleaseExclusive();
        }
    }

  private:
    BorrowState* state_;
};

}  // namespace detail
