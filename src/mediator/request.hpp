#pragma once
#include <type_traits>

namespace conduit::mediator {

// Base of every request. The response type is fixed by the request type;
// the concrete type is recovered at dispatch time via RTTI.
template <typename TResponse>
class Request {
public:
    using response_type = TResponse;

    virtual ~Request() = default;
};

namespace detail {

template <typename R, typename = void>
struct is_request : std::false_type {};

template <typename R>
struct is_request<R, std::void_t<typename R::response_type>>
    : std::bool_constant<std::is_class_v<R> &&
                         std::is_base_of_v<Request<typename R::response_type>, R>> {};

} // namespace detail

template <typename R>
inline constexpr bool is_request_v = detail::is_request<R>::value;

} // namespace conduit::mediator
