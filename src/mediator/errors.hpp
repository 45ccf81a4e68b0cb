#pragma once
#include <stdexcept>
#include <string>
#include <utility>

namespace conduit::mediator {

// A caller passed an absent or malformed argument.
class InvalidArgument : public std::invalid_argument {
public:
    InvalidArgument(std::string parameter, const std::string& message)
        : std::invalid_argument(message + " (parameter '" + parameter + "')"),
          parameter_(std::move(parameter)) {}

    const std::string& parameter() const noexcept { return parameter_; }

private:
    std::string parameter_;
};

// No handler is registered for the runtime request type.
class HandlerNotFound : public std::runtime_error {
public:
    explicit HandlerNotFound(std::string request_type)
        : std::runtime_error("No handler registered for request type " + request_type),
          request_type_(std::move(request_type)) {}

    const std::string& request_type() const noexcept { return request_type_; }

private:
    std::string request_type_;
};

// A second, different implementation was registered for a pair that already has one.
class DuplicateHandler : public std::logic_error {
public:
    DuplicateHandler(std::string request_type, const std::string& existing, const std::string& incoming)
        : std::logic_error("Handler for request type " + request_type + " already registered as " +
                           existing + ", refusing " + incoming),
          request_type_(std::move(request_type)) {}

    const std::string& request_type() const noexcept { return request_type_; }

private:
    std::string request_type_;
};

// A handler returned an empty future instead of a pending result.
class InvalidHandlerResult : public std::logic_error {
public:
    explicit InvalidHandlerResult(const std::string& request_type)
        : std::logic_error("Handler for request type " + request_type + " did not return a valid future") {}
};

// Envelope raised by the erased invoker around a synchronous handler failure.
// The original exception is nested; Mediator::send never lets this escape.
class InvocationError : public std::runtime_error {
public:
    explicit InvocationError(const std::string& request_type)
        : std::runtime_error("Handler for request type " + request_type + " failed") {}
};

} // namespace conduit::mediator
