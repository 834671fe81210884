#pragma once

#include <string>
#include <vector>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include "chain/json_rpc_client.hpp"

namespace updown {

/**
 * Handle on one endpoint that answered a probe.
 */
class RpcConnection {
public:
    RpcConnection(std::string url, std::shared_ptr<JsonRpcClient> client)
        : url_(std::move(url)), client_(std::move(client)) {}

    const std::string& url() const { return url_; }

    nlohmann::json call(const std::string& method, const nlohmann::json& params = nlohmann::json::array()) {
        return client_->call(url_, method, params);
    }

private:
    std::string url_;
    std::shared_ptr<JsonRpcClient> client_;
};

/**
 * Ordered list of RPC endpoints. Every connect() re-probes from the top
 * with eth_blockNumber; the first endpoint that answers wins. Nothing is
 * cached between operations.
 */
class RpcEndpointPool {
public:
    RpcEndpointPool(std::vector<std::string> endpoints, std::shared_ptr<JsonRpcClient> client);

    // Preferred endpoint goes first; empty clears it
    void set_preferred(const std::string& url);

    std::vector<std::string> candidates() const;

    // True when the endpoint answers eth_blockNumber
    bool probe(const std::string& url);

    // Throws RpcError when no endpoint answers
    RpcConnection connect();

private:
    std::vector<std::string> endpoints_;
    std::string preferred_;
    std::shared_ptr<JsonRpcClient> client_;
    mutable std::mutex mutex_;
};

} // namespace updown
