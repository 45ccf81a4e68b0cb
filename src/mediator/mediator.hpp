#pragma once
#include <cstddef>
#include <exception>
#include <future>
#include <memory>
#include <type_traits>
#include <typeindex>
#include <spdlog/spdlog.h>
#include "core/type_name.hpp"
#include "di/service_key.hpp"
#include "di/service_provider.hpp"
#include "mediator/cancellation.hpp"
#include "mediator/concurrent_map.hpp"
#include "mediator/errors.hpp"
#include "mediator/future.hpp"
#include "mediator/invoker.hpp"
#include "mediator/request.hpp"
#include "mediator/request_handler.hpp"

namespace conduit::mediator {

// Routes a request to the one handler registered for its runtime type.
//
// Mediators are cheap: they hold a reference to the provider they were
// resolved from and share one process-wide invoker cache. No lock is held
// while a handler runs, so handlers may send further requests.
class Mediator {
public:
    using InvokerCache = ConcurrentMap<di::ServiceKey,
                                       std::shared_ptr<const detail::InvokerBase>,
                                       di::ServiceKeyHash>;

    explicit Mediator(di::ServiceProvider& provider) : provider_(provider) {}

    // Dispatch `request` and return the handler's eventual response.
    //
    // Every failure is delivered through the returned future:
    //   InvalidArgument     request is null
    //   HandlerNotFound     nothing registered for the runtime request type
    //   OperationCancelled  token cancelled before or during the handler
    //   anything else       thrown by the handler, unwrapped
    // On success the future is the handler's own, so wait_for() reports the
    // handler's progress.
    template <typename TRequest,
              typename TResponse = typename std::remove_const_t<TRequest>::response_type>
    std::future<TResponse> send(std::shared_ptr<TRequest> request, CancellationToken token = {}) {
        static_assert(is_request_v<std::remove_const_t<TRequest>>,
                      "send() expects a type deriving from Request<TResponse>");
        try {
            return dispatch<TResponse>(std::shared_ptr<const Request<TResponse>>(std::move(request)), token);
        } catch (...) {
            return make_exceptional_future<TResponse>(std::current_exception());
        }
    }

    di::ServiceProvider& provider() const { return provider_; }

    // Number of handler keys with a cached invoker, process-wide.
    static size_t cached_invoker_count();

private:
    template <typename TResponse>
    std::future<TResponse> dispatch(std::shared_ptr<const Request<TResponse>> request,
                                    const CancellationToken& token) {
        if (!request) {
            throw InvalidArgument("request", "Request must not be null");
        }

        const std::type_index request_type(typeid(*request));
        const di::ServiceKey key = handler_key(request_type, typeid(TResponse));

        auto instance = provider_.resolve(key);
        if (!instance) {
            auto name = core::type_name(request_type);
            spdlog::warn("No handler registered for request type {}", name);
            throw HandlerNotFound(name);
        }
        auto handler = std::static_pointer_cast<ResponseHandler<TResponse>>(instance);

        auto invoker = invoker_for<TResponse>(key);
        spdlog::trace("Dispatching {}", invoker->request_name());

        token.throw_if_cancellation_requested();

        try {
            return invoker->invoke(*handler, *request, token);
        } catch (const InvocationError& envelope) {
            rethrow_cause(envelope);
        }
    }

    template <typename TResponse>
    static std::shared_ptr<const detail::ResponseInvoker<TResponse>> invoker_for(const di::ServiceKey& key) {
        // Keys carry typeid(TResponse), so the entry is always a ResponseInvoker<TResponse>.
        auto entry = invoker_cache().get_or_add(key,
            [](const di::ServiceKey& k) -> std::shared_ptr<const detail::InvokerBase> {
                return std::make_shared<const detail::ResponseInvoker<TResponse>>(k);
            });
        return std::static_pointer_cast<const detail::ResponseInvoker<TResponse>>(entry);
    }

    // Throws the exception nested in `envelope`, or the envelope itself if
    // nothing is nested.
    [[noreturn]] static void rethrow_cause(const InvocationError& envelope);

    static InvokerCache& invoker_cache();

    di::ServiceProvider& provider_;
};

} // namespace conduit::mediator
