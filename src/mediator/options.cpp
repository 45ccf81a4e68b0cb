#include "mediator/options.hpp"
#include "core/config.hpp"
#include "mediator/errors.hpp"

using json = nlohmann::json;

namespace conduit::mediator {

std::string duplicate_policy_to_string(DuplicatePolicy policy) {
    switch (policy) {
        case DuplicatePolicy::REJECT:  return "reject";
        case DuplicatePolicy::REPLACE: return "replace";
        default: return "unknown";
    }
}

DuplicatePolicy duplicate_policy_from_string(const std::string& str) {
    if (str == "reject" || str == "error") return DuplicatePolicy::REJECT;
    if (str == "replace")                  return DuplicatePolicy::REPLACE;
    throw InvalidArgument("duplicate_policy", "unknown duplicate handler policy '" + str + "'");
}

MediatorOptions MediatorOptions::from_env() {
    core::config::load_dotenv();

    MediatorOptions options;
    options.duplicate_policy = duplicate_policy_from_string(
        core::config::get_env_or("CONDUIT_DUPLICATE_HANDLERS", "reject"));
    return options;
}

MediatorOptions MediatorOptions::from_json(const json& j) {
    MediatorOptions options;
    if (!j.is_object()) {
        throw InvalidArgument("options", "mediator options must be a JSON object");
    }
    options.duplicate_policy = duplicate_policy_from_string(j.value("duplicate_policy", "reject"));
    return options;
}

json MediatorOptions::to_json() const {
    json j;
    j["duplicate_policy"] = duplicate_policy_to_string(duplicate_policy);
    return j;
}

} // namespace conduit::mediator
