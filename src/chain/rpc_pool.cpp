#include "chain/rpc_pool.hpp"
#include "common/errors.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

namespace updown {

RpcEndpointPool::RpcEndpointPool(std::vector<std::string> endpoints,
                                 std::shared_ptr<JsonRpcClient> client)
    : endpoints_(std::move(endpoints))
    , client_(std::move(client))
{
}

void RpcEndpointPool::set_preferred(const std::string& url) {
    std::lock_guard<std::mutex> lock(mutex_);
    preferred_ = url;
}

std::vector<std::string> RpcEndpointPool::candidates() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> out;
    if (!preferred_.empty()) {
        out.push_back(preferred_);
    }
    for (const auto& url : endpoints_) {
        if (std::find(out.begin(), out.end(), url) == out.end()) {
            out.push_back(url);
        }
    }
    return out;
}

bool RpcEndpointPool::probe(const std::string& url) {
    try {
        auto result = client_->call(url, "eth_blockNumber", nlohmann::json::array());
        return result.is_string() && !result.get<std::string>().empty();
    } catch (const std::exception& e) {
        spdlog::warn("RPC {} unavailable: {}", url, e.what());
        return false;
    }
}

RpcConnection RpcEndpointPool::connect() {
    for (const auto& url : candidates()) {
        if (probe(url)) {
            spdlog::debug("Using RPC {}", url);
            return RpcConnection(url, client_);
        }
    }
    throw RpcError(-32000, "No RPC endpoint available");
}

} // namespace updown
