#include "mediator/handler_registry.hpp"
#include <optional>
#include <unordered_map>
#include <spdlog/spdlog.h>
#include "mediator/errors.hpp"
#include "mediator/mediator.hpp"

namespace conduit::mediator {

namespace {

void require_modules(const std::vector<HandlerModule>& modules) {
    if (modules.empty()) {
        throw InvalidArgument("modules", "At least one module must be provided to scan for handlers");
    }
}

} // namespace

void register_handlers(di::ServiceCollection& services,
                       const std::vector<HandlerModule>& modules,
                       DuplicatePolicy policy) {
    require_modules(modules);

    // Validate everything first so a rejected duplicate leaves `services` untouched.
    std::vector<const HandlerRegistration*> pending;
    std::unordered_map<di::ServiceKey, std::type_index, di::ServiceKeyHash> chosen;

    for (const auto& mod : modules) {
        spdlog::debug("Scanning module {} ({} capabilities)", mod.name, mod.registrations.size());
        for (const auto& handler : mod.unmatched) {
            spdlog::warn("Handler {} in module {} serves no request type listed in the module",
                         core::type_name(handler), mod.name);
        }

        for (const auto& reg : mod.registrations) {
            auto it = chosen.find(reg.key);
            std::optional<std::type_index> existing;
            if (it != chosen.end()) {
                existing = it->second;
            } else if (const auto* d = services.find(reg.key)) {
                existing = d->implementation;
            }

            if (existing && *existing == reg.implementation) {
                spdlog::debug("Handler {} already registered for {}",
                              core::type_name(reg.implementation), core::type_name(reg.key.first));
                continue;
            }

            if (existing) {
                if (policy == DuplicatePolicy::REJECT) {
                    throw DuplicateHandler(core::type_name(reg.key.first),
                                           core::type_name(*existing),
                                           core::type_name(reg.implementation));
                }
                spdlog::warn("Replacing handler {} with {} for request type {}",
                             core::type_name(*existing), core::type_name(reg.implementation),
                             core::type_name(reg.key.first));
            }

            chosen.insert_or_assign(reg.key, reg.implementation);
            pending.push_back(&reg);
        }
    }

    for (const auto* reg : pending) {
        services.add(di::ServiceDescriptor{
            reg->key, di::ServiceLifetime::TRANSIENT, reg->factory, reg->implementation});
        spdlog::debug("Registered {} for {}", core::type_name(reg->implementation), reg->key.name());
    }

    spdlog::info("Registered {} handler capabilities from {} module(s)", pending.size(), modules.size());
}

void register_mediator_core(di::ServiceCollection& services) {
    if (services.contains(di::ServiceKey::of<Mediator>())) {
        return;
    }
    services.add_transient<Mediator>();
}

di::ServiceCollection& add_mediator(di::ServiceCollection& services,
                                    const std::vector<HandlerModule>& modules,
                                    const MediatorOptions& options) {
    require_modules(modules);
    register_mediator_core(services);
    register_handlers(services, modules, options.duplicate_policy);
    return services;
}

di::ServiceCollection& add_mediator(di::ServiceCollection& services,
                                    const std::vector<HandlerModule>& modules) {
    require_modules(modules);
    return add_mediator(services, modules, MediatorOptions::from_env());
}

} // namespace conduit::mediator
