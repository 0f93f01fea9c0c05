#pragma once

#include <mutex>
#include <utility>

// Owns a value that is only reachable while its mutex is held
template <class T, class Mutex = std::mutex>
class Guarded {
  public:
    class Proxy {
      public:
        Proxy(T& value, Mutex& mutex) : lock_(mutex), value_(&value) {
        }

        T& operator*() const {
            return *value_;
        }

        T* operator->() const {
            return value_;
        }

      private:
        std::unique_lock<Mutex> lock_;
        T* value_;
    };

    template <class... Args>
    explicit Guarded(Args&&... args) : value_(std::forward<Args>(args)...) {
    }

    Guarded(const Guarded&) = delete;
    Guarded& operator=(const Guarded&) = delete;

    Proxy Lock() {
        return Proxy{value_, mutex_};
    }

    template <class F>
    decltype(auto) With(F&& f) {
        std::lock_guard lock{mutex_};
        return std::forward<F>(f)(value_);
    }

  private:
    Mutex mutex_;
    T value_;
};
