#pragma once
#include <functional>
#include <memory>
#include <string>
#include <type_traits>
#include <typeindex>
#include <vector>
#include <nlohmann/json.hpp>
#include "di/service_key.hpp"

namespace conduit::di {

class ServiceProvider;

enum class ServiceLifetime {
    TRANSIENT,   // new instance on every resolution
    SINGLETON    // one instance per provider
};

std::string lifetime_to_string(ServiceLifetime lifetime);

using ServiceFactory = std::function<std::shared_ptr<void>(ServiceProvider&)>;

struct ServiceDescriptor {
    ServiceKey key;
    ServiceLifetime lifetime;
    ServiceFactory factory;
    std::type_index implementation;
};

namespace detail {

// Services are built either from the provider (to pull their own
// dependencies) or default-constructed.
template <typename T>
inline constexpr bool is_constructible_service_v =
    std::is_constructible_v<T, ServiceProvider&> || std::is_default_constructible_v<T>;

template <typename T>
std::shared_ptr<T> construct(ServiceProvider& provider) {
    if constexpr (std::is_constructible_v<T, ServiceProvider&>) {
        return std::make_shared<T>(provider);
    } else {
        (void)provider;
        return std::make_shared<T>();
    }
}

} // namespace detail

// Mutable registration list. Several descriptors may share a key; the
// provider resolves the last one.
class ServiceCollection {
public:
    ServiceCollection& add(ServiceDescriptor descriptor);

    template <typename TService, typename TImpl = TService>
    ServiceCollection& add_transient() {
        return add(make_descriptor<TService, TImpl>(ServiceLifetime::TRANSIENT));
    }

    template <typename TService, typename TImpl = TService>
    ServiceCollection& add_singleton() {
        return add(make_descriptor<TService, TImpl>(ServiceLifetime::SINGLETON));
    }

    template <typename TService>
    ServiceCollection& add_singleton(std::shared_ptr<TService> instance) {
        std::type_index impl = instance ? std::type_index(typeid(*instance)) : std::type_index(typeid(TService));
        return add(ServiceDescriptor{
            ServiceKey::of<TService>(),
            ServiceLifetime::SINGLETON,
            [instance](ServiceProvider&) -> std::shared_ptr<void> { return instance; },
            impl});
    }

    // Last descriptor registered for `key`, or nullptr.
    const ServiceDescriptor* find(const ServiceKey& key) const;
    bool contains(const ServiceKey& key) const { return find(key) != nullptr; }
    size_t count(const ServiceKey& key) const;

    const std::vector<ServiceDescriptor>& descriptors() const { return descriptors_; }
    size_t size() const { return descriptors_.size(); }
    bool empty() const { return descriptors_.empty(); }

    // [{"service": ..., "implementation": ..., "lifetime": ...}, ...]
    nlohmann::json describe() const;

    std::shared_ptr<ServiceProvider> build_provider() const;

private:
    template <typename TService, typename TImpl>
    static ServiceDescriptor make_descriptor(ServiceLifetime lifetime) {
        static_assert(std::is_base_of_v<TService, TImpl> || std::is_same_v<TService, TImpl>,
                      "implementation must derive from the service type");
        static_assert(!std::is_abstract_v<TImpl>, "implementation must be concrete");
        static_assert(detail::is_constructible_service_v<TImpl>,
                      "implementation needs a default or ServiceProvider& constructor");
        return ServiceDescriptor{
            ServiceKey::of<TService>(),
            lifetime,
            [](ServiceProvider& provider) -> std::shared_ptr<void> {
                std::shared_ptr<TService> service = detail::construct<TImpl>(provider);
                return service;
            },
            typeid(TImpl)};
    }

    std::vector<ServiceDescriptor> descriptors_;
};

} // namespace conduit::di
