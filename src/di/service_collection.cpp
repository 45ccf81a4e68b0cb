#include "di/service_collection.hpp"
#include "di/service_provider.hpp"
#include "core/type_name.hpp"

using json = nlohmann::json;

namespace conduit::di {

std::string lifetime_to_string(ServiceLifetime lifetime) {
    switch (lifetime) {
        case ServiceLifetime::TRANSIENT: return "transient";
        case ServiceLifetime::SINGLETON: return "singleton";
        default: return "unknown";
    }
}

ServiceCollection& ServiceCollection::add(ServiceDescriptor descriptor) {
    descriptors_.push_back(std::move(descriptor));
    return *this;
}

const ServiceDescriptor* ServiceCollection::find(const ServiceKey& key) const {
    for (auto it = descriptors_.rbegin(); it != descriptors_.rend(); ++it) {
        if (it->key == key) {
            return &*it;
        }
    }
    return nullptr;
}

size_t ServiceCollection::count(const ServiceKey& key) const {
    size_t n = 0;
    for (const auto& d : descriptors_) {
        if (d.key == key) ++n;
    }
    return n;
}

json ServiceCollection::describe() const {
    json services = json::array();
    for (const auto& d : descriptors_) {
        json entry;
        entry["service"] = d.key.name();
        entry["implementation"] = core::type_name(d.implementation);
        entry["lifetime"] = lifetime_to_string(d.lifetime);
        services.push_back(entry);
    }
    return services;
}

std::shared_ptr<ServiceProvider> ServiceCollection::build_provider() const {
    return std::make_shared<ServiceProvider>(descriptors_);
}

} // namespace conduit::di
