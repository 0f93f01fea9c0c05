#include "linked_list.hpp"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <child_process.hpp>
#include <defer.hpp>
#include <guarded.hpp>
#include <log.hpp>

#include <cstdio>
#include <functional>
#include <numeric>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

using Catch::Matchers::ContainsSubstring;

template <class L>
concept CanIterMut = requires(L& l) { l.IterMut(); };

template <class L>
concept CanCursorMut = requires(L& l) { l.CursorMut(); };

template <class L>
concept CanIntoIter = requires(L&& l) { std::forward<L>(l).IntoIter(); };

// Only one mutable view at a time: mutable views cannot be duplicated and are
// unreachable through a const list
static_assert(!std::is_copy_constructible_v<ListCursor<int>>);
static_assert(!std::is_copy_assignable_v<ListCursor<int>>);
static_assert(!std::is_copy_constructible_v<ListIterMut<int>>);
static_assert(!std::is_copy_assignable_v<ListIterMut<int>>);
static_assert(std::is_copy_constructible_v<ListIter<int>>);
static_assert(std::is_nothrow_move_constructible_v<LinkedList<int>>);

static_assert(CanIterMut<LinkedList<int>>);
static_assert(!CanIterMut<const LinkedList<int>>);
static_assert(CanCursorMut<LinkedList<int>>);
static_assert(!CanCursorMut<const LinkedList<int>>);
static_assert(CanIntoIter<LinkedList<int>>);
static_assert(!CanIntoIter<LinkedList<int>&>);

static_assert(
    std::is_same_v<decltype(std::declval<ListIter<int>&>().Next()), const int*>);
static_assert(
    std::is_same_v<decltype(std::declval<ListIterMut<int>&>().Next()), int*>);
static_assert(
    std::is_same_v<decltype(std::declval<const LinkedList<int>&>().Front()),
                   const int*>);

#if LISTS_BORROW_CHECK

TEST_CASE("TwoCursorsAbort") {
    auto result = RunInChild([] {
        LinkedList<int> list{1, 2, 3};
        auto first = list.CursorMut();
        auto second = list.CursorMut();
        second.MoveNext();
    });
    REQUIRE(result.Aborted());
    REQUIRE_THAT(result.err, ContainsSubstring("already mutably borrowed"));
}

TEST_CASE("IterWhileCursorAborts") {
    auto result = RunInChild([] {
        LinkedList<int> list{1, 2, 3};
        auto cursor = list.CursorMut();
        auto iter = list.Iter();
        iter.Next();
    });
    REQUIRE(result.Aborted());
    REQUIRE_THAT(result.err, ContainsSubstring("already mutably borrowed"));
}

TEST_CASE("IterMutWhileIterAborts") {
    auto result = RunInChild([] {
        LinkedList<int> list{1, 2, 3};
        auto iter = list.Iter();
        auto iter_mut = list.IterMut();
        iter_mut.Next();
    });
    REQUIRE(result.Aborted());
    REQUIRE_THAT(result.err,
                 ContainsSubstring("borrowed by a shared iterator"));
}

TEST_CASE("PushWhileIterAborts") {
    auto result = RunInChild([] {
        LinkedList<int> list{1, 2, 3};
        auto iter = list.Iter();
        list.PushBack(4);
    });
    REQUIRE(result.Aborted());
    REQUIRE_THAT(result.err,
                 ContainsSubstring("modified while an iterator is alive"));
}

TEST_CASE("PopWhileCursorAborts") {
    auto result = RunInChild([] {
        LinkedList<int> list{1, 2, 3};
        auto cursor = list.CursorMut();
        cursor.MoveNext();
        list.PopFront();
    });
    REQUIRE(result.Aborted());
    REQUIRE_THAT(result.err, ContainsSubstring("cursor or mutable iterator"));
}

TEST_CASE("DestroyWhileBorrowedAborts") {
    auto result = RunInChild([] {
        auto* list = new LinkedList<int>{1, 2, 3};
        auto cursor = list->CursorMut();
        delete list;
    });
    REQUIRE(result.Aborted());
}

TEST_CASE("SpliceIntoItselfAborts") {
    auto result = RunInChild([] {
        LinkedList<int> list{1, 2, 3};
        auto cursor = list.CursorMut();
        cursor.SpliceAfter(std::move(list));
    });
    REQUIRE(result.Aborted());
}

TEST_CASE("SpliceBorrowedInputAborts") {
    auto result = RunInChild([] {
        LinkedList<int> host{1};
        LinkedList<int> input{2};
        auto iter = input.Iter();
        auto cursor = host.CursorMut();
        cursor.SpliceBefore(std::move(input));
    });
    REQUIRE(result.Aborted());
}

TEST_CASE("FrontWhileCursorAborts") {
    auto result = RunInChild([] {
        LinkedList<int> list{1, 2, 3};
        auto cursor = list.CursorMut();
        cursor.MoveNext();
        int* front = list.Front();
        cursor.RemoveCurrent();
        std::fprintf(stderr, "%d\n", *front);
    });
    REQUIRE(result.Aborted());
    REQUIRE_THAT(result.err, ContainsSubstring("cursor or mutable iterator"));
}

TEST_CASE("RangeForWhileIterMutAborts") {
    auto result = RunInChild([] {
        LinkedList<int> list{1, 2, 3};
        auto iter = list.IterMut();
        for (int& value : list) {
            value += 100;
        }
        iter.Next();
    });
    REQUIRE(result.Aborted());
    REQUIRE_THAT(result.err, ContainsSubstring("cursor or mutable iterator"));
}

TEST_CASE("ConstReadWhileCursorAborts") {
    auto result = RunInChild([] {
        LinkedList<int> list{1, 2, 3};
        const LinkedList<int>& view = list;
        auto cursor = list.CursorMut();
        cursor.MoveNext();
        std::fprintf(stderr, "%d\n", *view.Back());
    });
    REQUIRE(result.Aborted());
    REQUIRE_THAT(result.err, ContainsSubstring("list is read while a cursor"));
}

TEST_CASE("CompareWhileCursorAborts") {
    auto result = RunInChild([] {
        LinkedList<int> list{1, 2, 3};
        LinkedList<int> other{1, 2, 3};
        auto cursor = list.CursorMut();
        std::fprintf(stderr, "%d\n", static_cast<int>(list == other));
    });
    REQUIRE(result.Aborted());
    REQUIRE_THAT(result.err, ContainsSubstring("list is read while a cursor"));
}

TEST_CASE("MutablePeekWhileIterAborts") {
    auto result = RunInChild([] {
        LinkedList<int> list{1, 2, 3};
        auto iter = list.Iter();
        *list.Back() = 30;
        iter.Next();
    });
    REQUIRE(result.Aborted());
    REQUIRE_THAT(result.err,
                 ContainsSubstring("modified while an iterator is alive"));
}

#endif

TEST_CASE("MovedFromCursorAborts") {
    auto result = RunInChild([] {
        LinkedList<int> list{1, 2, 3};
        auto first = list.CursorMut();
        first.MoveNext();
        auto second = std::move(first);
        first.RemoveCurrent();
        std::fprintf(stderr, "%d\n", *second.Current());
    });
    REQUIRE(result.Aborted());
    REQUIRE_THAT(result.err, ContainsSubstring("used after being moved from"));
}

TEST_CASE("MovedFromCursorIsDetached") {
    LinkedList<int> list{1, 2, 3};
    {
        auto first = list.CursorMut();
        first.MoveNext();
        first.MoveNext();

        auto second = std::move(first);
        REQUIRE(first.Current() == nullptr);
        REQUIRE(first.Index() == std::nullopt);
        REQUIRE(*second.Current() == 2);
        REQUIRE(second.Index() == 1);

        first = std::move(second);
        REQUIRE(second.Current() == nullptr);
        REQUIRE(*first.Current() == 2);
        REQUIRE(first.RemoveCurrent() == 2);
    }
    REQUIRE(list.Iter().Collect() == std::vector{1, 3});
    REQUIRE(list.IsConsistent());
}

TEST_CASE("SharedReadsCoexist") {
    LinkedList<int> list{1, 2, 3};
    const LinkedList<int>& view = list;

    auto iter = list.Iter();
    auto other = view.Iter();
    REQUIRE(*view.Front() == 1);
    REQUIRE(*view.Back() == 3);
    const LinkedList<int> expected{1, 2, 3};
    REQUIRE(view == expected);
    REQUIRE(std::hash<LinkedList<int>>{}(view) ==
            std::hash<LinkedList<int>>{}(expected));

    int sum = 0;
    for (int value : view) {
        sum += value;
    }
    REQUIRE(sum == 6);
    REQUIRE(*iter.Next() == 1);
    REQUIRE(*other.NextBack() == 3);
}

TEST_CASE("BorrowsEndWithScope") {
    LinkedList<int> list{1, 2, 3};

    auto result = RunInChild([&list] {
        {
            auto cursor = list.CursorMut();
            cursor.MoveNext();
        }
        {
            auto iter = list.IterMut();
            *iter.Next() = 10;
        }
        auto a = list.Iter();
        auto b = list.Iter();
        auto c = b;
        a.Next();
        c.Next();
    });
    REQUIRE(result.Exited());
    REQUIRE(result.ExitCode() == 0);

    {
        auto cursor = list.CursorMut();
        cursor.MoveNext();
    }
    {
        auto moved = list.CursorMut();
        auto cursor = std::move(moved);
        cursor.MovePrev();
        REQUIRE(*cursor.Current() == 3);
    }
    list.PushBack(4);
    REQUIRE(list.Len() == 4);
}

TEST_CASE("SendAcrossThreads") {
    LinkedList<std::string> list{"a", "b", "c"};

    std::string joined;
    {
        std::thread worker([list = std::move(list), &joined]() mutable {
            list.PushBack("d");
            for (const std::string& s : list.Iter()) {
                joined += s;
            }
        });
        DEFER {
            worker.join();
        };
    }
    REQUIRE(joined == "abcd");
    REQUIRE(list.IsEmpty());
}

TEST_CASE("ShareReadOnlyAcrossThreads") {
    LinkedList<int> list;
    for (int i = 1; i <= 1000; ++i) {
        list.PushBack(i);
    }
    const LinkedList<int>& shared = list;

    constexpr int kThreads = 4;
    std::vector<long> sums(kThreads);
    {
        std::vector<std::thread> workers;
        DEFER {
            for (auto& worker : workers) {
                worker.join();
            }
        };
        for (int t = 0; t < kThreads; ++t) {
            workers.emplace_back([&shared, &sums, t] {
                for (int round = 0; round < 100; ++round) {
                    long sum = 0;
                    for (int value : shared.Iter()) {
                        sum += value;
                    }
                    sums[t] = sum;
                }
            });
        }
    }

    for (long sum : sums) {
        REQUIRE(sum == 500500);
    }
    list.PushBack(0);
    REQUIRE(list.IsConsistent());
}

TEST_CASE("GuardedList") {
    Guarded<LinkedList<int>> guarded;

    constexpr int kThreads = 4;
    constexpr int kPerThread = 1000;
    {
        std::vector<std::thread> workers;
        DEFER {
            for (auto& worker : workers) {
                worker.join();
            }
        };
        for (int t = 0; t < kThreads; ++t) {
            workers.emplace_back([&guarded, t] {
                for (int i = 0; i < kPerThread; ++i) {
                    if (t % 2 == 0) {
                        guarded.With([&](LinkedList<int>& l) {
                            l.PushBack(i);
                        });
                    } else {
                        guarded.Lock()->PushFront(i);
                    }
                }
            });
        }
    }

    auto locked = guarded.Lock();
    REQUIRE(locked->Len() == kThreads * kPerThread);
    REQUIRE(locked->IsConsistent());

    auto values = locked->Iter().Collect();
    REQUIRE(std::accumulate(values.begin(), values.end(), 0L) ==
            kThreads * (kPerThread * (kPerThread - 1L) / 2));
}

TEST_CASE("LogLevelFiltering") {
    REQUIRE(detail::ParseLogLevel("debug", LogLevel::kInfo) == LogLevel::kDebug);
    REQUIRE(detail::ParseLogLevel("warn", LogLevel::kInfo) ==
            LogLevel::kWarning);
    REQUIRE(detail::ParseLogLevel("loud", LogLevel::kInfo) == LogLevel::kInfo);
    REQUIRE(detail::ParseLogLevel(nullptr, LogLevel::kError) ==
            LogLevel::kError);

    auto result = RunInChild([] {
        SetLogLevel(LogLevel::kWarning);
        Log(LogLevel::kInfo, "hidden {}", 1);
        Log(LogLevel::kWarning, "shown {}", 2);
    });
    REQUIRE(result.ExitCode() == 0);
    REQUIRE_THAT(result.err, ContainsSubstring("shown 2"));
    REQUIRE_THAT(result.err, !ContainsSubstring("hidden"));
}

namespace {

struct ThrowingCopy {
    static inline int copies_left = 0;
    static inline int alive = 0;

    int value;

    explicit ThrowingCopy(int v) : value(v) {
        ++alive;
    }

    ThrowingCopy(const ThrowingCopy& other) : value(other.value) {
        if (copies_left-- == 0) {
            throw std::runtime_error("copy failed");
        }
        ++alive;
    }

    ThrowingCopy(ThrowingCopy&& other) noexcept : value(other.value) {
        ++alive;
    }

    ~ThrowingCopy() {
        --alive;
    }
};

}  // namespace

TEST_CASE("CopyFailureLeavesListsIntact") {
    ThrowingCopy::alive = 0;
    {
        LinkedList<ThrowingCopy> list;
        for (int i = 0; i < 5; ++i) {
            list.EmplaceBack(i);
        }
        REQUIRE(ThrowingCopy::alive == 5);

        ThrowingCopy::copies_left = 2;
        REQUIRE_THROWS_AS(LinkedList<ThrowingCopy>(list), std::runtime_error);
        REQUIRE(ThrowingCopy::alive == 5);

        LinkedList<ThrowingCopy> target;
        target.EmplaceBack(42);
        ThrowingCopy::copies_left = 3;
        REQUIRE_THROWS_AS(target = list, std::runtime_error);
        REQUIRE(target.Len() == 1);
        REQUIRE(target.Front()->value == 42);
        REQUIRE(target.IsConsistent());
        REQUIRE(list.Len() == 5);
        REQUIRE(list.IsConsistent());

        ThrowingCopy::copies_left = 0;
        REQUIRE_THROWS_AS(list.PushBack(*list.Front()), std::runtime_error);
        REQUIRE(list.Len() == 5);
        REQUIRE(list.IsConsistent());
    }
    REQUIRE(ThrowingCopy::alive == 0);
}
