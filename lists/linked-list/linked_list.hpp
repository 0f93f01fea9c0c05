#pragma once

#include "borrow.hpp"

#include <internal_assert.hpp>

#include <algorithm>
#include <compare>
#include <concepts>
#include <cstddef>
#include <functional>
#include <initializer_list>
#include <iterator>
#include <limits>
#include <memory>
#include <optional>
#include <ostream>
#include <type_traits>
#include <utility>
#include <vector>

template <class T>
class LinkedList;

template <class T>
class ListCursor;

template <class T>
class ListIntoIter;

namespace detail {

// Links are plain pointers. Only the list header that reaches a node owns it.
template <class T>
struct ListNode {
    ListNode* front;
    ListNode* back;
    T elem;
};

inline size_t LenAdd(size_t len, size_t count) {
    INTERNAL_ASSERT_MSG(count <= std::numeric_limits<size_t>::max() - len,
                        "list length overflow");
    return len + count;
}

inline size_t LenSub(size_t len, size_t count) {
    INTERNAL_ASSERT_MSG(count <= len, "list length underflow");
    return len - count;
}

inline size_t HashCombine(size_t seed, size_t value) {
    return seed ^ (value + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2));
}

template <class R>
concept Iterable = requires(R& range) {
    range.begin();
    range.end();
};

template <class T>
T& Take(T* item) {
    return *item;
}

template <class T>
T&& Take(std::optional<T>& item) {
    return std::move(*item);
}

struct IterSentinel {};

// Drives Next() so that list iterators can be consumed by range-for
template <class It>
class IterInput {
  public:
    explicit IterInput(It& iter) : iter_(&iter), item_(iter.Next()) {
    }

    decltype(auto) operator*() {
        return Take(item_);
    }

    IterInput& operator++() {
        item_ = iter_->Next();
        return *this;
    }

    bool operator==(IterSentinel) const {
        return !item_;
    }

  private:
    It* iter_;
    decltype(std::declval<It&>().Next()) item_;
};

template <class Derived>
class IterBase {
  public:
    IterInput<Derived> begin() {
        return IterInput<Derived>{Self()};
    }

    IterSentinel end() {
        return {};
    }

    // Drains the remaining items
    auto Collect() {
        std::vector<typename Derived::value_type> items;
        items.reserve(Self().Len());
        for (auto&& item : *this) {
            items.push_back(std::forward<decltype(item)>(item));
        }
        return items;
    }

  private:
    Derived& Self() {
        return static_cast<Derived&>(*this);
    }
};

// Standard bidirectional iterator over the chain, end() is the null link
template <class T, bool kConst>
class ListStlIterator {
    using Node = ListNode<T>;

  public:
    using iterator_category = std::bidirectional_iterator_tag;
    using value_type = T;
    using difference_type = std::ptrdiff_t;
    using pointer = std::conditional_t<kConst, const T*, T*>;
    using reference = std::conditional_t<kConst, const T&, T&>;

    ListStlIterator() = default;

    ListStlIterator(Node* node, Node* const* tail) : node_(node), tail_(tail) {
    }

    template <bool kOtherConst>
        requires(kConst && !kOtherConst)
    ListStlIterator(const ListStlIterator<T, kOtherConst>& other)
        : node_(other.node_), tail_(other.tail_) {
    }

    reference operator*() const {
        return node_->elem;
    }

    pointer operator->() const {
        return &node_->elem;
    }

    ListStlIterator& operator++() {
        node_ = node_->back;
        return *this;
    }

    ListStlIterator operator++(int) {
        auto tmp = *this;
        ++*this;
        return tmp;
    }

    ListStlIterator& operator--() {
        node_ = node_ == nullptr ? *tail_ : node_->front;
        return *this;
    }

    ListStlIterator operator--(int) {
        auto tmp = *this;
        --*this;
        return tmp;
    }

    bool operator==(const ListStlIterator& other) const {
        return node_ == other.node_;
    }

  private:
    template <class, bool>
    friend class ListStlIterator;

    Node* node_ = nullptr;
    Node* const* tail_ = nullptr;
};

}  // namespace detail

// Shared view. Holds a shared borrow of the list while alive.
template <class T>
class ListIter : public detail::IterBase<ListIter<T>> {
    using Node = detail::ListNode<T>;

  public:
    using value_type = T;

    const T* Next() {
        if (len_ == 0) {
            return nullptr;
        }
        const Node* node = front_;
        front_ = node->back;
        --len_;
        return &node->elem;
    }

    const T* NextBack() {
        if (len_ == 0) {
            return nullptr;
        }
        const Node* node = back_;
        back_ = node->front;
        --len_;
        return &node->elem;
    }

    size_t Len() const {
        return len_;
    }

  private:
    friend class LinkedList<T>;

    ListIter(const Node* front, const Node* back, size_t len,
             detail::BorrowState& borrow)
        : front_(front), back_(back), len_(len), borrow_(borrow) {
    }

    const Node* front_;
    const Node* back_;
    size_t len_;
    detail::SharedBorrow borrow_;
};

// Exclusive view: move-only, no other view of the list may coexist with it
template <class T>
class ListIterMut : public detail::IterBase<ListIterMut<T>> {
    using Node = detail::ListNode<T>;

  public:
    using value_type = T;

    T* Next() {
        if (len_ == 0) {
            return nullptr;
        }
        Node* node = front_;
        front_ = node->back;
        --len_;
        return &node->elem;
    }

    T* NextBack() {
        if (len_ == 0) {
            return nullptr;
        }
        Node* node = back_;
        back_ = node->front;
        --len_;
        return &node->elem;
    }

    size_t Len() const {
        return len_;
    }

  private:
    friend class LinkedList<T>;

    ListIterMut(Node* front, Node* back, size_t len,
                detail::BorrowState& borrow)
        : front_(front), back_(back), len_(len), borrow_(borrow) {
    }

    Node* front_;
    Node* back_;
    size_t len_;
    detail::ExclusiveBorrow borrow_;
};

template <class It>
class RevIter : public detail::IterBase<RevIter<It>> {
  public:
    using value_type = typename It::value_type;

    explicit RevIter(It iter) : iter_(std::move(iter)) {
    }

    decltype(auto) Next() {
        return iter_.NextBack();
    }

    decltype(auto) NextBack() {
        return iter_.Next();
    }

    size_t Len() const {
        return iter_.Len();
    }

  private:
    It iter_;
};

template <class It>
RevIter<std::remove_cvref_t<It>> Rev(It&& iter) {
    return RevIter<std::remove_cvref_t<It>>{std::forward<It>(iter)};
}

template <class T>
class LinkedList {
    using Node = detail::ListNode<T>;

  public:
    using value_type = T;
    using size_type = size_t;
    using reference = T&;
    using const_reference = const T&;
    using iterator = detail::ListStlIterator<T, false>;
    using const_iterator = detail::ListStlIterator<T, true>;

    LinkedList() = default;

    LinkedList(std::initializer_list<T> init) : LinkedList() {
        Extend(init);
    }

    template <std::input_iterator It, std::sentinel_for<It> S>
    LinkedList(It first, S last) : LinkedList() {
        for (; first != last; ++first) {
            PushBack(*first);
        }
    }

    template <detail::Iterable Range>
        requires(!std::is_same_v<std::remove_cvref_t<Range>, LinkedList>)
    explicit LinkedList(Range&& range) : LinkedList() {
        Extend(std::forward<Range>(range));
    }

    LinkedList(const LinkedList& other) : LinkedList() {
        for (const T& elem : other) {
            PushBack(elem);
        }
    }

    LinkedList(LinkedList&& other) noexcept : LinkedList() {
        Swap(other);
    }

    LinkedList& operator=(const LinkedList& other) {
        if (this != &other) {
            LinkedList tmp(other);
            Swap(tmp);
        }
        return *this;
    }

    LinkedList& operator=(LinkedList&& other) noexcept {
        LinkedList tmp(std::move(other));
        Swap(tmp);
        return *this;
    }

    // Iterative: a recursive teardown would overflow the stack on long lists
    ~LinkedList() {
        Clear();
    }

    void PushFront(T elem) {
        EmplaceFront(std::move(elem));
    }

    void PushBack(T elem) {
        EmplaceBack(std::move(elem));
    }

    template <class... Args>
    T& EmplaceFront(Args&&... args) {
        borrow_.CheckWritable();
        auto* node = new Node{nullptr, nullptr, T(std::forward<Args>(args)...)};
        if (front_ != nullptr) {
            front_->front = node;
            node->back = front_;
        } else {
            back_ = node;
        }
        front_ = node;
        len_ = detail::LenAdd(len_, 1);
        return node->elem;
    }

    template <class... Args>
    T& EmplaceBack(Args&&... args) {
        borrow_.CheckWritable();
        auto* node = new Node{nullptr, nullptr, T(std::forward<Args>(args)...)};
        if (back_ != nullptr) {
            back_->back = node;
            node->front = back_;
        } else {
            front_ = node;
        }
        back_ = node;
        len_ = detail::LenAdd(len_, 1);
        return node->elem;
    }

    std::optional<T> PopFront() {
        borrow_.CheckWritable();
        std::unique_ptr<Node> node = UnlinkFront();
        if (!node) {
            return std::nullopt;
        }
        return std::move(node->elem);
    }

    std::optional<T> PopBack() {
        borrow_.CheckWritable();
        std::unique_ptr<Node> node = UnlinkBack();
        if (!node) {
            return std::nullopt;
        }
        return std::move(node->elem);
    }

    // Element access counts as a borrow of its own: a mutable peek needs the
    // list unborrowed, a shared one only needs no mutable view alive
    T* Front() {
        borrow_.CheckWritable();
        return front_ != nullptr ? &front_->elem : nullptr;
    }

    const T* Front() const {
        borrow_.CheckReadable();
        return front_ != nullptr ? &front_->elem : nullptr;
    }

    T* Back() {
        borrow_.CheckWritable();
        return back_ != nullptr ? &back_->elem : nullptr;
    }

    const T* Back() const {
        borrow_.CheckReadable();
        return back_ != nullptr ? &back_->elem : nullptr;
    }

    size_t Len() const {
        return len_;
    }

    bool IsEmpty() const {
        return len_ == 0;
    }

    void Clear() {
        borrow_.CheckWritable();
        while (UnlinkFront()) {
        }
    }

    void Swap(LinkedList& other) noexcept {
        borrow_.CheckWritable();
        other.borrow_.CheckWritable();
        std::swap(front_, other.front_);
        std::swap(back_, other.back_);
        std::swap(len_, other.len_);
    }

    // Moves every node of `other` to the back of this list in O(1)
    // Expected behavior:
    // l1 = {1, 2, 3};
    // l1.Splice({4, 5, 6});
    // l1 == {1, 2, 3, 4, 5, 6};
    void Splice(LinkedList& other) {
        CursorMut().SpliceBefore(std::move(other));
    }

    template <detail::Iterable Range>
    void Extend(Range&& range) {
        for (auto&& elem : range) {
            PushBack(std::forward<decltype(elem)>(elem));
        }
    }

    ListIter<T> Iter() const {
        return ListIter<T>{front_, back_, len_, borrow_};
    }

    ListIterMut<T> IterMut() {
        return ListIterMut<T>{front_, back_, len_, borrow_};
    }

    ListIntoIter<T> IntoIter() && {
        return ListIntoIter<T>{std::move(*this)};
    }

    // The cursor starts at the ghost position
    ListCursor<T> CursorMut() {
        return ListCursor<T>{*this};
    }

    iterator begin() {
        borrow_.CheckWritable();
        return iterator{front_, &back_};
    }

    iterator end() {
        borrow_.CheckWritable();
        return iterator{nullptr, &back_};
    }

    const_iterator begin() const {
        borrow_.CheckReadable();
        return const_iterator{front_, &back_};
    }

    const_iterator end() const {
        borrow_.CheckReadable();
        return const_iterator{nullptr, &back_};
    }

    // Checks the header and link invariants by walking the chain both ways
    bool IsConsistent() const {
        if (len_ == 0) {
            return front_ == nullptr && back_ == nullptr;
        }
        if (front_ == nullptr || back_ == nullptr) {
            return false;
        }
        if (front_->front != nullptr || back_->back != nullptr) {
            return false;
        }

        const Node* node = front_;
        for (size_t i = 1; i < len_; ++i) {
            const Node* next = node->back;
            if (next == nullptr || next->front != node) {
                return false;
            }
            node = next;
        }
        if (node != back_) {
            return false;
        }

        node = back_;
        for (size_t i = 1; i < len_; ++i) {
            node = node->front;
            if (node == nullptr) {
                return false;
            }
        }
        return node == front_;
    }

  private:
    friend class ListCursor<T>;

    static LinkedList FromChain(Node* front, Node* back, size_t len) {
        LinkedList list;
        list.front_ = front;
        list.back_ = back;
        list.len_ = len;
        return list;
    }

    // Length is updated only after the links are consistent again
    std::unique_ptr<Node> UnlinkFront() {
        if (front_ == nullptr) {
            return nullptr;
        }
        std::unique_ptr<Node> node{front_};
        front_ = node->back;
        if (front_ != nullptr) {
            front_->front = nullptr;
        } else {
            back_ = nullptr;
        }
        len_ = detail::LenSub(len_, 1);
        return node;
    }

    std::unique_ptr<Node> UnlinkBack() {
        if (back_ == nullptr) {
            return nullptr;
        }
        std::unique_ptr<Node> node{back_};
        back_ = node->front;
        if (back_ != nullptr) {
            back_->back = nullptr;
        } else {
            front_ = nullptr;
        }
        len_ = detail::LenSub(len_, 1);
        return node;
    }

    Node* front_ = nullptr;
    Node* back_ = nullptr;
    size_t len_ = 0;
    mutable detail::BorrowState borrow_;
};

// Owns the list; Next()/NextBack() pop from the ends
template <class T>
class ListIntoIter : public detail::IterBase<ListIntoIter<T>> {
  public:
    using value_type = T;

    explicit ListIntoIter(LinkedList<T>&& list) : list_(std::move(list)) {
    }

    std::optional<T> Next() {
        return list_.PopFront();
    }

    std::optional<T> NextBack() {
        return list_.PopBack();
    }

    size_t Len() const {
        return list_.Len();
    }

  private:
    LinkedList<T> list_;
};

template <class T>
bool operator==(const LinkedList<T>& lhs, const LinkedList<T>& rhs) {
    return lhs.Len() == rhs.Len() &&
           std::equal(lhs.begin(), lhs.end(), rhs.begin());
}

template <std::three_way_comparable T>
std::compare_three_way_result_t<T> operator<=>(const LinkedList<T>& lhs,
                                               const LinkedList<T>& rhs) {
    return std::lexicographical_compare_three_way(lhs.begin(), lhs.end(),
                                                  rhs.begin(), rhs.end());
}

template <class T>
std::ostream& operator<<(std::ostream& out, const LinkedList<T>& list) {
    out << '[';
    bool first = true;
    for (const T& elem : list) {
        if (!std::exchange(first, false)) {
            out << ", ";
        }
        out << elem;
    }
    return out << ']';
}

namespace std {

// The length goes in first, so ["he", "llo"] and ["hello"] differ
template <class T>
struct hash<LinkedList<T>> {
    size_t operator()(const LinkedList<T>& list) const {
        size_t seed = std::hash<size_t>{}(list.Len());
        for (const T& elem : list) {
            seed = ::detail::HashCombine(seed, std::hash<T>{}(elem));
        }
        return seed;
    }
};

}  // namespace std

#include "cursor.hpp"
