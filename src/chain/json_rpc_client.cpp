#include "chain/json_rpc_client.hpp"
#include "common/errors.hpp"
#include <spdlog/spdlog.h>

namespace updown {

HttpJsonRpcClient::HttpJsonRpcClient(std::shared_ptr<HttpTransport> http)
    : http_(std::move(http))
{
}

nlohmann::json HttpJsonRpcClient::call(const std::string& url, const std::string& method,
                                       const nlohmann::json& params) {
    nlohmann::json request = {
        {"jsonrpc", "2.0"},
        {"id", next_id_++},
        {"method", method},
        {"params", params}
    };

    auto body = http_->post(url, request.dump(), {{"Content-Type", "application/json"}});

    nlohmann::json response = nlohmann::json::parse(body, nullptr, false);
    if (response.is_discarded() || !response.is_object()) {
        throw RpcError(-32700, "Malformed RPC response from " + url);
    }

    if (response.contains("error") && !response["error"].is_null()) {
        const auto& err = response["error"];
        int code = err.value("code", -32000);
        std::string message = err.value("message", std::string("unknown RPC error"));
        spdlog::debug("RPC {} on {} failed: {} ({})", method, url, message, code);
        throw RpcError(code, message);
    }

    if (!response.contains("result")) {
        throw RpcError(-32603, "RPC response without result");
    }
    return response["result"];
}

} // namespace updown
