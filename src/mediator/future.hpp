#pragma once
#include <exception>
#include <future>
#include <type_traits>
#include <utility>

namespace conduit::mediator {

// Already-completed future holding `value`.
template <typename T>
std::future<std::decay_t<T>> make_ready_future(T&& value) {
    std::promise<std::decay_t<T>> promise;
    promise.set_value(std::forward<T>(value));
    return promise.get_future();
}

// Already-failed future rethrowing `error` from get().
template <typename T>
std::future<T> make_exceptional_future(std::exception_ptr error) {
    std::promise<T> promise;
    promise.set_exception(std::move(error));
    return promise.get_future();
}

} // namespace conduit::mediator
