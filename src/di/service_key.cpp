#include "di/service_key.hpp"
#include "core/type_name.hpp"

namespace conduit::di {

std::string ServiceKey::name() const {
    if (!is_generic()) {
        return core::type_name(service);
    }
    return core::type_name(service) + "<" + core::type_name(first) + ", " + core::type_name(second) + ">";
}

} // namespace conduit::di
