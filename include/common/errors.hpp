#pragma once

#include <stdexcept>
#include <string>

namespace updown {

/**
 * Transport or non-2xx HTTP failure. status is 0 when no response arrived.
 */
class HttpError : public std::runtime_error {
public:
    HttpError(long status, const std::string& message, std::string body = "")
        : std::runtime_error(message), status_(status), body_(std::move(body)) {}

    long status() const { return status_; }
    const std::string& body() const { return body_; }
    bool is_transport() const { return status_ == 0; }

private:
    long status_;
    std::string body_;
};

/**
 * JSON-RPC error object returned by a node, or a malformed RPC response.
 */
class RpcError : public std::runtime_error {
public:
    RpcError(int code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    int code() const { return code_; }

private:
    int code_;
};

// Redemption could not be performed or reverted on chain
class SettlementError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace updown
