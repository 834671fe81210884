#pragma once

#include <string>
#include <memory>
#include <atomic>
#include <nlohmann/json.hpp>
#include "utils/http_client.hpp"

namespace updown {

/**
 * Ethereum JSON-RPC 2.0 caller. The endpoint is chosen per call so one
 * client serves the whole failover pool.
 */
class JsonRpcClient {
public:
    virtual ~JsonRpcClient() = default;

    // Returns the "result" member. Throws RpcError on an error object,
    // HttpError on transport failure.
    virtual nlohmann::json call(const std::string& url, const std::string& method,
                                const nlohmann::json& params) = 0;
};

class HttpJsonRpcClient : public JsonRpcClient {
public:
    explicit HttpJsonRpcClient(std::shared_ptr<HttpTransport> http);

    nlohmann::json call(const std::string& url, const std::string& method,
                        const nlohmann::json& params) override;

private:
    std::shared_ptr<HttpTransport> http_;
    std::atomic<int64_t> next_id_{1};
};

} // namespace updown
