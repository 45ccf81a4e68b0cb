#pragma once
#include <exception>
#include <future>
#include <string>
#include <spdlog/spdlog.h>
#include "core/type_name.hpp"
#include "di/service_key.hpp"
#include "mediator/cancellation.hpp"
#include "mediator/errors.hpp"
#include "mediator/request.hpp"
#include "mediator/request_handler.hpp"

namespace conduit::mediator::detail {

// Cached entry point for one handler key. Holds what is needed to call the
// capability and to describe it, computed once per key.
class InvokerBase {
public:
    explicit InvokerBase(const di::ServiceKey& key)
        : request_name_(core::type_name(key.first)),
          response_name_(core::type_name(key.second)) {}

    virtual ~InvokerBase() = default;

    const std::string& request_name() const { return request_name_; }
    const std::string& response_name() const { return response_name_; }

private:
    std::string request_name_;
    std::string response_name_;
};

template <typename TResponse>
class ResponseInvoker final : public InvokerBase {
public:
    explicit ResponseInvoker(const di::ServiceKey& key) : InvokerBase(key) {
        spdlog::debug("Cached invoker for {} -> {}", request_name(), response_name());
    }

    // Calls the handler and returns its future untouched. A synchronous throw
    // from the handler leaves here nested inside an InvocationError.
    std::future<TResponse> invoke(ResponseHandler<TResponse>& handler,
                                  const Request<TResponse>& request,
                                  const CancellationToken& token) const {
        std::future<TResponse> pending;
        try {
            pending = handler.dispatch(request, token);
        } catch (...) {
            std::throw_with_nested(InvocationError(request_name()));
        }

        if (!pending.valid()) {
            throw InvalidHandlerResult(request_name());
        }
        return pending;
    }
};

} // namespace conduit::mediator::detail
