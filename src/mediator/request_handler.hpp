#pragma once
#include <future>
#include <memory>
#include <type_traits>
#include <typeindex>
#include "di/service_key.hpp"
#include "di/service_provider.hpp"
#include "mediator/cancellation.hpp"
#include "mediator/request.hpp"

namespace conduit::mediator {

namespace detail {

// Common base of every handler capability, whatever its response type.
struct HandlerTag {};

} // namespace detail

// Handler capability with the request type erased. Everything registered
// under a handler key is stored as a pointer to this sub-object.
template <typename TResponse>
class ResponseHandler : public detail::HandlerTag {
public:
    virtual ~ResponseHandler() = default;

    virtual std::future<TResponse> dispatch(const Request<TResponse>& request,
                                            const CancellationToken& token) = 0;
};

// Handles exactly one request type. A class may derive from several of these
// to serve several request types.
//
// The returned future is handed to the caller as is. Neither the handler nor
// the request is kept alive once send() returns, so work that completes later
// must own what it touches: copy from the request, and capture
// shared_from_this() rather than `this`.
template <typename TRequest, typename TResponse>
class RequestHandler : public ResponseHandler<TResponse> {
    static_assert(std::is_base_of_v<Request<TResponse>, TRequest>,
                  "TRequest must derive from Request<TResponse>");

public:
    virtual std::future<TResponse> handle(const TRequest& request, CancellationToken token) = 0;

    std::future<TResponse> dispatch(const Request<TResponse>& request,
                                    const CancellationToken& token) final {
        return handle(static_cast<const TRequest&>(request), token);
    }
};

// Open definition tag used to build handler keys.
struct HandlerCapability {};

inline di::ServiceKey handler_key(std::type_index request, std::type_index response) {
    return di::ServiceKey::generic(typeid(HandlerCapability), request, response);
}

template <typename TRequest, typename TResponse = typename TRequest::response_type>
di::ServiceKey handler_key() {
    return handler_key(typeid(TRequest), typeid(TResponse));
}

// Typed view of the handler registered for (TRequest, TResponse); nullptr if none.
template <typename TRequest, typename TResponse = typename TRequest::response_type>
std::shared_ptr<RequestHandler<TRequest, TResponse>> get_handler(di::ServiceProvider& provider) {
    auto erased = std::static_pointer_cast<ResponseHandler<TResponse>>(
        provider.resolve(handler_key<TRequest, TResponse>()));
    return std::dynamic_pointer_cast<RequestHandler<TRequest, TResponse>>(erased);
}

} // namespace conduit::mediator
