#pragma once

#include <macros.hpp>
#include <utility>

// Runs the stored callable on scope exit
template <class F>
struct Defer {
    Defer(F&& f) : f_(std::forward<F>(f)) {
    }

    Defer(const Defer&) = delete;
    Defer& operator=(const Defer&) = delete;

    ~Defer() {
        f_();
    }

  private:
    F f_;
};

#define DEFER Defer UNIQUE_ID(_defer_guard) = [&]()
