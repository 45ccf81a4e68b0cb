#pragma once
#include <string>
#include <nlohmann/json.hpp>

namespace conduit::mediator {

// What registration does when a pair already has a different handler.
enum class DuplicatePolicy {
    REJECT,     // throw DuplicateHandler
    REPLACE     // warn, later registration wins
};

std::string duplicate_policy_to_string(DuplicatePolicy policy);

// Accepts "reject"/"error" and "replace". Throws InvalidArgument otherwise.
DuplicatePolicy duplicate_policy_from_string(const std::string& str);

struct MediatorOptions {
    DuplicatePolicy duplicate_policy = DuplicatePolicy::REJECT;

    // CONDUIT_DUPLICATE_HANDLERS, after loading .env.
    static MediatorOptions from_env();
    static MediatorOptions from_json(const nlohmann::json& j);
    nlohmann::json to_json() const;
};

} // namespace conduit::mediator
