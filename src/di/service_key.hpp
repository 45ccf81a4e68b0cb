#pragma once
#include <cstddef>
#include <functional>
#include <string>
#include <typeindex>
#include <typeinfo>

namespace conduit::di {

// Identity of a registered service. Plain services use only `service`;
// parameterized services (an open definition closed over two argument types)
// also fill `first` and `second`, which lets callers build the key at runtime
// from type_index values they only know dynamically.
struct ServiceKey {
    std::type_index service;
    std::type_index first;
    std::type_index second;

    template <typename T>
    static ServiceKey of() {
        return ServiceKey{typeid(T), typeid(void), typeid(void)};
    }

    static ServiceKey generic(std::type_index definition, std::type_index first, std::type_index second) {
        return ServiceKey{definition, first, second};
    }

    bool is_generic() const { return first != typeid(void) || second != typeid(void); }

    // "Service" or "Definition<First, Second>"
    std::string name() const;

    bool operator==(const ServiceKey& other) const {
        return service == other.service && first == other.first && second == other.second;
    }
    bool operator!=(const ServiceKey& other) const { return !(*this == other); }
};

struct ServiceKeyHash {
    std::size_t operator()(const ServiceKey& key) const noexcept {
        std::size_t h = std::hash<std::type_index>{}(key.service);
        h ^= std::hash<std::type_index>{}(key.first) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
        h ^= std::hash<std::type_index>{}(key.second) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
        return h;
    }
};

} // namespace conduit::di
