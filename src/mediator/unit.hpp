#pragma once
#include <cstddef>
#include <functional>
#include <ostream>
#include <string>

namespace conduit::mediator {

// Zero-information response for command-style requests.
// Every Unit equals every other Unit.
struct Unit {
    static const Unit value;

    int compare(const Unit&) const { return 0; }
    std::string to_string() const { return "()"; }
};

inline const Unit Unit::value{};

inline bool operator==(const Unit&, const Unit&) { return true; }
inline bool operator!=(const Unit&, const Unit&) { return false; }
inline bool operator<(const Unit&, const Unit&) { return false; }

inline std::ostream& operator<<(std::ostream& os, const Unit&) {
    return os << "()";
}

} // namespace conduit::mediator

namespace std {

template <>
struct hash<conduit::mediator::Unit> {
    size_t operator()(const conduit::mediator::Unit&) const noexcept { return 0; }
};

} // namespace std
