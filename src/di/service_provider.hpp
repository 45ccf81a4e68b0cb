#pragma once
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>
#include "di/service_collection.hpp"
#include "di/service_key.hpp"

namespace conduit::di {

class ServiceNotFound : public std::runtime_error {
public:
    explicit ServiceNotFound(const ServiceKey& key)
        : std::runtime_error("No service registered for " + key.name()) {}
};

// Immutable view over a ServiceCollection. Resolution is safe from any
// number of threads: the descriptor table never changes after construction
// and singletons are created exactly once.
class ServiceProvider {
public:
    explicit ServiceProvider(const std::vector<ServiceDescriptor>& descriptors);

    ServiceProvider(const ServiceProvider&) = delete;
    ServiceProvider& operator=(const ServiceProvider&) = delete;

    // Instance registered under `key`, or nullptr when nothing is.
    std::shared_ptr<void> resolve(const ServiceKey& key);

    bool contains(const ServiceKey& key) const;

    template <typename T>
    std::shared_ptr<T> get() {
        return std::static_pointer_cast<T>(resolve(ServiceKey::of<T>()));
    }

    template <typename T>
    std::shared_ptr<T> get_required() {
        auto key = ServiceKey::of<T>();
        auto instance = resolve(key);
        if (!instance) {
            throw ServiceNotFound(key);
        }
        return std::static_pointer_cast<T>(instance);
    }

private:
    struct Entry {
        explicit Entry(ServiceDescriptor d) : descriptor(std::move(d)) {}

        ServiceDescriptor descriptor;
        std::once_flag once;
        std::shared_ptr<void> instance;
    };

    std::unordered_map<ServiceKey, std::unique_ptr<Entry>, ServiceKeyHash> entries_;
};

} // namespace conduit::di
