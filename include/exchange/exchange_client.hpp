#pragma once

#include <string>
#include <vector>
#include "common/types.hpp"
#include "market_data/order_book.hpp"

namespace updown {

struct OrderRequest {
    std::string token_id;
    Side side{Side::BUY};
    Price price{0.0};            // two decimals
    Size shares{0.0};            // whole shares
    OrderType type{OrderType::FAK};
    bool neg_risk{false};
};

/**
 * Broker acknowledgement. A transport-level success carrying an error field,
 * or lacking an order id, is a rejection.
 */
struct OrderAck {
    bool accepted{false};
    std::string order_id;
    std::string status;          // matched, live, delayed, unmatched
    Size filled_shares{0.0};
    std::string error;
    bool insufficient_funds{false};
};

struct CancelAck {
    bool success{false};
    std::string error;
};

/**
 * Exchange/broker client. Read-only mode is a fixed property of the
 * instance, known before any call is made.
 */
class ExchangeClient {
public:
    virtual ~ExchangeClient() = default;

    virtual bool is_read_only() const = 0;

    // Throws on transport failure
    virtual OrderBook get_order_book(const std::string& token_id) = 0;

    virtual OrderAck submit_order(const OrderRequest& req) = 0;
    virtual CancelAck cancel_order(const std::string& order_id) = 0;

    // Throws on transport failure
    virtual std::vector<Position> get_positions() = 0;
};

} // namespace updown
