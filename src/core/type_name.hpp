#pragma once
#include <string>
#include <typeindex>
#include <typeinfo>

namespace conduit::core {

// Human-readable (demangled) name of a runtime type.
std::string type_name(const std::type_info& info);
std::string type_name(std::type_index index);

template <typename T>
std::string type_name() {
    return type_name(typeid(T));
}

} // namespace conduit::core
