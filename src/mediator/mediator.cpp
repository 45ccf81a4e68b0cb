#include "mediator/mediator.hpp"

namespace conduit::mediator {

Mediator::InvokerCache& Mediator::invoker_cache() {
    static InvokerCache cache;
    return cache;
}

size_t Mediator::cached_invoker_count() {
    return invoker_cache().size();
}

void Mediator::rethrow_cause(const InvocationError& envelope) {
    std::rethrow_if_nested(envelope);
    throw envelope;
}

} // namespace conduit::mediator
