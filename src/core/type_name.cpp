#include "core/type_name.hpp"
#include <cstdlib>
#include <memory>
#include <cxxabi.h>

namespace conduit::core {

std::string type_name(const std::type_info& info) {
    return type_name(std::type_index(info));
}

std::string type_name(std::type_index index) {
    int status = 0;
    std::unique_ptr<char, void (*)(void*)> demangled(
        abi::__cxa_demangle(index.name(), nullptr, nullptr, &status), std::free);
    if (status != 0 || !demangled) {
        return index.name();
    }
    return demangled.get();
}

} // namespace conduit::core
