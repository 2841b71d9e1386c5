//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Task.h
// Purpose: Eager coroutine type whose result is published through a std::future
//==========================================================================================================

#pragma once

#include <concepts>
#include <coroutine>
#include <exception>
#include <future>
#include <utility>

namespace credo {
namespace async {

//==========================================================================================================
// Task
// Purpose: Return type of the private co* coroutines behind credo's std::future APIs.
// Notes:
//   - Starts eagerly and never suspends at the end; the frame is gone once the result is set.
//   - Exceptions escaping the body (AuthException, HttpClientError) are stored in the future.
//   - toFuture() may be called once.
//==========================================================================================================
template <typename T>
class Task {
public:
    using value_type = T;

    struct promise_type {
        std::promise<T> promise;

        Task get_return_object() { return Task{promise.get_future()}; }
        std::suspend_never initial_suspend() noexcept { return {}; }
        std::suspend_never final_suspend() noexcept { return {}; }
        void unhandled_exception() { promise.set_exception(std::current_exception()); }

        template <typename U>
        requires std::convertible_to<U, T>
        void return_value(U&& v) { promise.set_value(std::forward<U>(v)); }
    };

    Task(Task&&) noexcept = default;
    Task& operator=(Task&&) noexcept = default;
    Task(const Task&) = delete;
    Task& operator=(const Task&) = delete;

    std::future<T> toFuture() { return std::move(fut); }

private:
    explicit Task(std::future<T>&& f) : fut(std::move(f)) {}

    std::future<T> fut;
};

// Futures for collaborators that answer synchronously (fakes, in-memory codecs).
template <typename T>
inline std::future<T> makeReadyFuture(T value) {
    std::promise<T> p;
    p.set_value(std::move(value));
    return p.get_future();
}

template <typename T>
inline std::future<T> makeFailedFuture(std::exception_ptr error) {
    std::promise<T> p;
    p.set_exception(std::move(error));
    return p.get_future();
}

} // namespace async
} // namespace credo
