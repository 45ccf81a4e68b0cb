#pragma once
#include <cstddef>
#include <memory>
#include <string>
#include <type_traits>
#include <typeindex>
#include <vector>
#include "core/type_name.hpp"
#include "di/service_collection.hpp"
#include "di/service_key.hpp"
#include "mediator/options.hpp"
#include "mediator/request.hpp"
#include "mediator/request_handler.hpp"

namespace conduit::mediator {

// Compile-time list of candidate types: requests, handlers, and anything
// else that happens to live alongside them. Also serves as the marker type
// for add_mediator<...>().
template <typename... Ts>
struct Module {};

// One (request, response) capability found on a concrete handler type.
struct HandlerRegistration {
    di::ServiceKey key;
    std::type_index implementation;
    di::ServiceFactory factory;
};

// Result of scanning one module.
struct HandlerModule {
    std::string name;
    std::vector<HandlerRegistration> registrations;
    // Concrete handlers that served nothing: their request types are missing
    // from the module, or the container cannot construct them.
    std::vector<std::type_index> unmatched;
};

namespace detail {

template <typename H, typename R, typename T>
HandlerRegistration make_registration() {
    return HandlerRegistration{
        handler_key<R, T>(),
        typeid(H),
        [](di::ServiceProvider& provider) -> std::shared_ptr<void> {
            std::shared_ptr<RequestHandler<R, T>> capability = di::detail::construct<H>(provider);
            std::shared_ptr<ResponseHandler<T>> erased = std::move(capability);
            return erased;
        }};
}

// Pairs each candidate handler with every request type of the module.
template <typename... Rs>
struct RequestScan {
    template <typename H>
    static void collect(HandlerModule& out) {
        if constexpr (std::is_class_v<H> && !std::is_abstract_v<H> &&
                      std::is_base_of_v<HandlerTag, H>) {
            const size_t before = out.registrations.size();
            if constexpr (di::detail::is_constructible_service_v<H>) {
                (collect_pair<H, Rs>(out.registrations), ...);
            }
            if (out.registrations.size() == before) {
                out.unmatched.push_back(typeid(H));
            }
        }
    }

private:
    template <typename H, typename R>
    static void collect_pair(std::vector<HandlerRegistration>& out) {
        if constexpr (is_request_v<R>) {
            using T = typename R::response_type;
            if constexpr (std::is_convertible_v<H*, RequestHandler<R, T>*>) {
                out.push_back(make_registration<H, R, T>());
            }
        }
    }
};

} // namespace detail

// Find every concrete handler among Ts and the requests it serves among Ts.
// Abstract classes and non-handlers are skipped; concrete handlers that
// serve nothing are listed in `unmatched`.
template <typename... Ts>
HandlerModule scan_module(std::string name = {}) {
    HandlerModule scanned;
    scanned.name = name.empty() ? core::type_name<Module<Ts...>>() : std::move(name);
    (detail::RequestScan<Ts...>::template collect<Ts>(scanned), ...);
    return scanned;
}

template <typename TModule>
struct module_traits;

template <typename... Ts>
struct module_traits<Module<Ts...>> {
    static HandlerModule scan() { return scan_module<Ts...>(); }
};

// Add a transient descriptor for every registration of every module.
// Throws InvalidArgument when `modules` is empty and DuplicateHandler when a
// pair would get a second, different implementation under REJECT.
void register_handlers(di::ServiceCollection& services,
                       const std::vector<HandlerModule>& modules,
                       DuplicatePolicy policy = DuplicatePolicy::REJECT);

// Register Mediator as a transient service. Idempotent.
void register_mediator_core(di::ServiceCollection& services);

// Composition entry point: mediator core plus every handler in `modules`.
di::ServiceCollection& add_mediator(di::ServiceCollection& services,
                                    const std::vector<HandlerModule>& modules,
                                    const MediatorOptions& options);

di::ServiceCollection& add_mediator(di::ServiceCollection& services,
                                    const std::vector<HandlerModule>& modules);

// Scan the given Module<...> marker types. Options come from the environment.
template <typename... TModules>
di::ServiceCollection& add_mediator(di::ServiceCollection& services) {
    return add_mediator(services, std::vector<HandlerModule>{module_traits<TModules>::scan()...});
}

} // namespace conduit::mediator
