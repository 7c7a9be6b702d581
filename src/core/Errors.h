#pragma once
#include <stdexcept>
#include <string>

/** Broken byte stream: malformed header, truncated body, invalid UTF-8, failed read/write. */
class TransportError : public std::runtime_error {
public:
    explicit TransportError(const std::string& what) : std::runtime_error(what) {}
};

/** The backend could not be located or spawned. */
class BackendStartError : public std::runtime_error {
public:
    explicit BackendStartError(const std::string& what) : std::runtime_error(what) {}
};

class RequestTimeoutError : public std::runtime_error {
public:
    RequestTimeoutError(const std::string& method, long long id)
        : std::runtime_error("Request timeout: " + method + " (id " + std::to_string(id) + ")"),
          requestId(id) {}

    long long requestId;
};

/** The backend answered with a JSON-RPC error object. */
class BackendResponseError : public std::runtime_error {
public:
    BackendResponseError(int code, const std::string& message)
        : std::runtime_error("Backend error " + std::to_string(code) + ": " + message),
          code(code) {}

    int code;
};
