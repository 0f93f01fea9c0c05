#include "linked_list.hpp"

#include <catch2/catch_test_macros.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <functional>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

template <class T>
std::vector<T> CollectToVec(const LinkedList<T>& l) {
    return l.Iter().Collect();
}

TEST_CASE("PushFrontPopFront") {
    LinkedList<int> list;
    REQUIRE(list.PopFront() == std::nullopt);
    REQUIRE(list.IsConsistent());

    list.PushFront(1);
    list.PushFront(2);
    list.PushFront(3);
    REQUIRE(list.Len() == 3);
    REQUIRE(CollectToVec(list) == std::vector{3, 2, 1});

    REQUIRE(list.PopFront() == 3);
    REQUIRE(list.PopFront() == 2);

    list.PushFront(4);
    list.PushFront(5);
    REQUIRE(list.IsConsistent());

    REQUIRE(list.PopFront() == 5);
    REQUIRE(list.PopFront() == 4);
    REQUIRE(list.PopFront() == 1);
    REQUIRE(list.PopFront() == std::nullopt);
    REQUIRE(list.IsEmpty());
    REQUIRE(list.IsConsistent());
}

TEST_CASE("PushBackPopBack") {
    LinkedList<int> list;
    REQUIRE(list.PopBack() == std::nullopt);

    list.PushBack(1);
    list.PushBack(2);
    list.PushBack(3);
    REQUIRE(list.PopBack() == 3);
    REQUIRE(list.PopBack() == 2);

    list.PushBack(4);
    list.PushBack(5);
    REQUIRE(list.IsConsistent());

    REQUIRE(list.PopBack() == 5);
    REQUIRE(list.PopBack() == 4);
    REQUIRE(list.PopBack() == 1);
    REQUIRE(list.PopBack() == std::nullopt);
    REQUIRE(list.IsConsistent());
}

TEST_CASE("MixedEnds") {
    LinkedList<int> list;

    list.PushBack(1);
    REQUIRE(list.PopFront() == 1);
    REQUIRE(list.IsEmpty());
    REQUIRE(list.Front() == nullptr);
    REQUIRE(list.Back() == nullptr);

    list.PushFront(2);
    list.PushBack(3);
    list.PushFront(1);
    REQUIRE(CollectToVec(list) == std::vector{1, 2, 3});
    REQUIRE(list.PopBack() == 3);
    REQUIRE(list.PopBack() == 2);
    REQUIRE(list.PopFront() == 1);
    REQUIRE(list.IsConsistent());
}

TEST_CASE("Peek") {
    LinkedList<int> list;
    REQUIRE(list.Front() == nullptr);
    REQUIRE(list.Back() == nullptr);

    list.PushFront(1);
    REQUIRE(*list.Front() == 1);
    REQUIRE(*list.Back() == 1);

    list.PushBack(2);
    list.PushFront(0);
    REQUIRE(*list.Front() == 0);
    REQUIRE(*list.Back() == 2);

    *list.Front() = 10;
    *list.Back() *= 5;
    REQUIRE(CollectToVec(list) == std::vector{10, 1, 10});

    const auto& view = list;
    REQUIRE(*view.Front() == 10);
    REQUIRE(*view.Back() == 10);
}

TEST_CASE("Emplace") {
    LinkedList<std::string> list;
    list.EmplaceBack(3, 'b');
    auto& front = list.EmplaceFront("a");
    front += "a";
    REQUIRE(CollectToVec(list) == std::vector<std::string>{"aa", "bbb"});
}

TEST_CASE("MoveOnlyElements") {
    LinkedList<std::unique_ptr<int>> list;
    list.PushBack(std::make_unique<int>(1));
    list.PushFront(std::make_unique<int>(0));

    auto first = list.PopFront();
    REQUIRE(first.has_value());
    REQUIRE(**first == 0);

    LinkedList<std::unique_ptr<int>> other{std::move(list)};
    REQUIRE(list.IsEmpty());
    REQUIRE(**other.Front() == 1);
}

TEST_CASE("Clear") {
    LinkedList<int> list{1, 2, 3, 4};
    list.Clear();
    REQUIRE(list.IsEmpty());
    REQUIRE(list.Front() == nullptr);
    REQUIRE(list.IsConsistent());

    list.PushBack(5);
    REQUIRE(CollectToVec(list) == std::vector{5});
}

TEST_CASE("LongListTeardown") {
    LinkedList<int> list;
    for (int i = 0; i < 1'000'000; ++i) {
        list.PushBack(i);
    }
    REQUIRE(list.Len() == 1'000'000);
}

TEST_CASE("SwapAndMove") {
    LinkedList<int> l1{1, 2, 3};
    LinkedList<int> l2;

    l1.Swap(l2);
    REQUIRE(l1.IsEmpty());
    REQUIRE(CollectToVec(l2) == std::vector{1, 2, 3});

    LinkedList<int> l3{std::move(l2)};
    REQUIRE(l2.IsEmpty());
    REQUIRE(l2.IsConsistent());
    REQUIRE(CollectToVec(l3) == std::vector{1, 2, 3});

    l1 = std::move(l3);
    REQUIRE(l3.IsEmpty());
    REQUIRE(CollectToVec(l1) == std::vector{1, 2, 3});
}

TEST_CASE("Splice") {
    LinkedList<int> l1{1, 2, 3};
    LinkedList<int> l2{4, 5, 6};

    l1.Splice(l2);
    REQUIRE(CollectToVec(l1) == std::vector{1, 2, 3, 4, 5, 6});
    REQUIRE(l2.IsEmpty());
    REQUIRE(l2.IsConsistent());

    l1.Splice(l2);
    REQUIRE(l1.Len() == 6);

    LinkedList<int> l3;
    l3.Splice(l1);
    REQUIRE(l1.IsEmpty());
    REQUIRE(CollectToVec(l3) == std::vector{1, 2, 3, 4, 5, 6});
    REQUIRE(l3.IsConsistent());
}

TEST_CASE("Iter") {
    LinkedList<int> list{1, 2, 3, 4, 5, 6};

    auto iter = list.Iter();
    REQUIRE(iter.Len() == 6);
    REQUIRE(*iter.Next() == 1);
    REQUIRE(*iter.NextBack() == 6);
    REQUIRE(iter.Len() == 4);
    REQUIRE(*iter.NextBack() == 5);
    REQUIRE(*iter.Next() == 2);
    REQUIRE(*iter.Next() == 3);
    REQUIRE(*iter.NextBack() == 4);
    REQUIRE(iter.Len() == 0);
    REQUIRE(iter.Next() == nullptr);
    REQUIRE(iter.NextBack() == nullptr);
}

TEST_CASE("IterCopiesAreIndependent") {
    LinkedList<int> list{1, 2, 3};

    auto iter = list.Iter();
    iter.Next();
    auto copy = iter;
    REQUIRE(iter.Collect() == std::vector{2, 3});
    REQUIRE(*copy.NextBack() == 3);
    REQUIRE(copy.Len() == 1);
}

TEST_CASE("IterMut") {
    LinkedList<int> list{1, 2, 3, 4, 5, 6};

    {
        auto iter = list.IterMut();
        *iter.Next() *= 10;
        *iter.NextBack() *= 100;
        for (int& value : iter) {
            value = -value;
        }
    }
    REQUIRE(CollectToVec(list) == std::vector{10, -2, -3, -4, -5, 600});
}

TEST_CASE("IntoIter") {
    LinkedList<int> list{1, 2, 3, 4, 5, 6};

    auto iter = std::move(list).IntoIter();
    REQUIRE(iter.Len() == 6);
    REQUIRE(iter.Next() == 1);
    REQUIRE(iter.NextBack() == 6);
    REQUIRE(iter.NextBack() == 5);
    REQUIRE(iter.Next() == 2);
    REQUIRE(iter.Collect() == std::vector{3, 4});
    REQUIRE(iter.Next() == std::nullopt);
    REQUIRE(iter.NextBack() == std::nullopt);
}

TEST_CASE("Reverse") {
    LinkedList<int> list{1, 2, 3, 4};

    REQUIRE(Rev(list.Iter()).Collect() == std::vector{4, 3, 2, 1});
    REQUIRE(Rev(Rev(list.Iter())).Collect() == std::vector{1, 2, 3, 4});

    LinkedList<int> copy{list};
    REQUIRE(Rev(std::move(copy).IntoIter()).Collect() ==
            std::vector{4, 3, 2, 1});

    auto rev = Rev(list.Iter());
    REQUIRE(*rev.NextBack() == 1);
    REQUIRE(*rev.Next() == 4);
    REQUIRE(rev.Len() == 2);
}

TEST_CASE("RangeFor") {
    LinkedList<std::string> list{"a", "b", "c"};

    std::string joined;
    for (const std::string& s : list.Iter()) {
        joined += s;
    }
    for (const std::string& s : list) {
        joined += s;
    }
    REQUIRE(joined == "abcabc");

    std::vector<std::string> moved;
    for (std::string&& s : std::move(list).IntoIter()) {
        moved.push_back(std::move(s));
    }
    REQUIRE(moved == std::vector<std::string>{"a", "b", "c"});
}

TEST_CASE("StlIterators") {
    LinkedList<int> list{1, 2, 3};

    auto it = list.end();
    --it;
    REQUIRE(*it == 3);
    --it;
    REQUIRE(*it == 2);
    *it = 20;

    LinkedList<int>::const_iterator cit = list.begin();
    REQUIRE(*++cit == 20);
    REQUIRE(cit == it);
    REQUIRE(std::distance(list.begin(), list.end()) == 3);
    REQUIRE(std::vector<int>(list.begin(), list.end()) ==
            std::vector{1, 20, 3});
}

TEST_CASE("FromIteratorAndExtend") {
    std::vector<int> values{1, 2, 3};

    LinkedList<int> from_pair(values.begin(), values.end());
    LinkedList<int> from_range{values};
    REQUIRE(from_pair == from_range);
    REQUIRE(CollectToVec(from_range) == values);

    from_range.Extend(std::vector{4, 5});
    from_range.Extend(from_pair.Iter());
    REQUIRE(CollectToVec(from_range) == std::vector{1, 2, 3, 4, 5, 1, 2, 3});

    LinkedList<int> from_iter{Rev(from_pair.Iter())};
    REQUIRE(CollectToVec(from_iter) == std::vector{3, 2, 1});

    LinkedList<std::string> strings{"x", "y"};
    LinkedList<std::string> moved{std::move(strings).IntoIter()};
    REQUIRE(CollectToVec(moved) == std::vector<std::string>{"x", "y"});
}

TEST_CASE("Clone") {
    LinkedList<int> list{1, 2, 3};
    LinkedList<int> copy{list};
    REQUIRE(copy == list);
    REQUIRE(copy.IsConsistent());

    *copy.Front() = 100;
    copy.PushBack(4);
    REQUIRE(CollectToVec(list) == std::vector{1, 2, 3});
    REQUIRE(copy != list);

    copy = list;
    REQUIRE(copy == list);

    LinkedList<int> empty;
    copy = empty;
    REQUIRE(copy.IsEmpty());
    REQUIRE(copy.IsConsistent());
}

TEST_CASE("Equality") {
    LinkedList<int> lhs{1, 2, 3};
    LinkedList<int> rhs{1, 2};
    REQUIRE(lhs != rhs);

    rhs.PushBack(3);
    REQUIRE(lhs == rhs);

    rhs.PushFront(0);
    rhs.PopBack();
    REQUIRE(lhs != rhs);
    REQUIRE(LinkedList<int>{} == LinkedList<int>{});
}

TEST_CASE("Ordering") {
    LinkedList<int> l12{1, 2};
    LinkedList<int> l123{1, 2, 3};
    LinkedList<int> l13{1, 3};
    LinkedList<int> empty;

    REQUIRE(l12 < l123);
    REQUIRE(l123 < l13);
    REQUIRE(empty < l12);
    REQUIRE(l13 > l12);
    REQUIRE((l12 <=> LinkedList<int>{1, 2}) == std::strong_ordering::equal);
    REQUIRE(l12 <= l12);
}

TEST_CASE("Hash") {
    std::hash<LinkedList<int>> hash_ints;
    LinkedList<int> lhs{1, 2, 3};
    LinkedList<int> rhs;
    rhs.PushBack(1);
    rhs.PushBack(2);
    rhs.PushBack(3);
    REQUIRE(hash_ints(lhs) == hash_ints(rhs));

    rhs.PopBack();
    REQUIRE(hash_ints(lhs) != hash_ints(rhs));
}

TEST_CASE("HashMixesInLength") {
    LinkedList<std::string> split;
    split.PushBack("he");
    split.PushBack("llo");

    LinkedList<std::string> joined;
    joined.PushBack("hello");

    std::hash<LinkedList<std::string>> hash;
    REQUIRE(hash(split) != hash(joined));

    LinkedList<std::string> empty_string;
    empty_string.PushBack("");
    REQUIRE(hash(empty_string) != hash(LinkedList<std::string>{}));
}

TEST_CASE("DebugFormatting") {
    LinkedList<int> list{1, 2, 3};

    std::ostringstream out;
    out << list << ' ' << LinkedList<int>{};
    REQUIRE(out.str() == "[1, 2, 3] []");

    REQUIRE(fmt::format("{}", list) == "[1, 2, 3]");
}
