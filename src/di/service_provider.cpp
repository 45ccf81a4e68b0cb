#include "di/service_provider.hpp"

namespace conduit::di {

ServiceProvider::ServiceProvider(const std::vector<ServiceDescriptor>& descriptors) {
    // Later registrations override earlier ones for the same key.
    for (const auto& d : descriptors) {
        entries_[d.key] = std::make_unique<Entry>(d);
    }
}

std::shared_ptr<void> ServiceProvider::resolve(const ServiceKey& key) {
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return nullptr;
    }

    Entry& entry = *it->second;
    if (entry.descriptor.lifetime == ServiceLifetime::TRANSIENT) {
        return entry.descriptor.factory(*this);
    }

    std::call_once(entry.once, [this, &entry]() {
        entry.instance = entry.descriptor.factory(*this);
    });
    return entry.instance;
}

bool ServiceProvider::contains(const ServiceKey& key) const {
    return entries_.find(key) != entries_.end();
}

} // namespace conduit::di
