#include "core/adapters/BybitExchangeGateway.h"

#include "common/Logger.h"
#include "common/QtyStepHelper.h"
#include "core/model/Errors.h"

#include <algorithm>
#include <cctype>
#include <set>

namespace riskguard {
namespace core {

namespace {
bool isSensitiveKey(const std::string& key) {
    static const std::set<std::string> kKeys = {
        "api_key", "apikey", "api_secret", "secret", "sign", "signature",
        "x-bapi-api-key", "x-bapi-sign", "token", "authorization"
    };
    std::string lower = key;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return kKeys.find(lower) != kKeys.end();
}

void maskSensitiveJson(nlohmann::json& node) {
    if (node.is_object()) {
        for (auto it = node.begin(); it != node.end(); ++it) {
            if (isSensitiveKey(it.key())) {
                it.value() = "***";
            } else {
                maskSensitiveJson(it.value());
            }
        }
        return;
    }
    if (node.is_array()) {
        for (auto& item : node) {
            maskSensitiveJson(item);
        }
    }
}

// Bybit 는 숫자를 문자열로 준다 ("0.01", "")
double toDouble(const nlohmann::json& node, const char* key) {
    if (!node.contains(key)) {
        return 0.0;
    }
    const auto& v = node.at(key);
    if (v.is_number()) {
        return v.get<double>();
    }
    if (v.is_string()) {
        const auto s = v.get<std::string>();
        if (s.empty()) {
            return 0.0;
        }
        try {
            return std::stod(s);
        } catch (const std::exception&) {
            return 0.0;
        }
    }
    return 0.0;
}

std::string toStringField(const nlohmann::json& node, const char* key) {
    if (!node.contains(key) || !node.at(key).is_string()) {
        return std::string();
    }
    return node.at(key).get<std::string>();
}

std::string positionKey(const std::string& symbol, PositionSide side) {
    return symbol + "|" + positionSideToString(side);
}

bool containsQtyHint(const std::string& msg) {
    std::string lower = msg;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower.find("qty") != std::string::npos || lower.find("quantity") != std::string::npos ||
           lower.find("precision") != std::string::npos;
}

constexpr int kPageGuard = 50;
} // namespace

BybitExchangeGateway::BybitExchangeGateway(std::shared_ptr<network::IHttpClient> http, ExchangeConfig config)
    : config_(std::move(config))
    , http_(std::move(http)) {}

BybitErrorClass BybitExchangeGateway::classifyRetCode(int ret_code, const std::string& ret_msg) {
    if (ret_code == 0) {
        return BybitErrorClass::OK;
    }
    // 10006: rate limit, 10016: 서버 내부 오류
    if (ret_code == 10006 || ret_code == 10016) {
        return BybitErrorClass::TRANSIENT;
    }
    if (ret_code == 110094 || ret_code == 170136 || ret_code == 170137) {
        return BybitErrorClass::PRECISION;
    }
    if (ret_code == 10001 && containsQtyHint(ret_msg)) {
        return BybitErrorClass::PRECISION;
    }
    return BybitErrorClass::REJECTED;
}

std::string BybitExchangeGateway::sanitizeForLog(const std::string& text) {
    try {
        auto j = nlohmann::json::parse(text);
        maskSensitiveJson(j);
        return j.dump();
    } catch (const nlohmann::json::exception&) {
        return text;
    }
}

nlohmann::json BybitExchangeGateway::unwrap(const network::HttpResponse& response, const std::string& what) {
    if (response.isRateLimited() || response.isForbidden() || response.isServerError()) {
        LOG_DEBUG("{} transient HTTP {}", what, response.status_code);
        throw TransientGatewayError(what + ": HTTP " + std::to_string(response.status_code), response.status_code);
    }
    if (!response.isSuccess()) {
        const std::string safe_body = sanitizeForLog(response.body);
        LOG_ERROR("{} failed: HTTP {} {}", what, response.status_code, safe_body);
        throw GatewayError(what + ": HTTP " + std::to_string(response.status_code) + " " + safe_body,
                           response.status_code);
    }

    nlohmann::json body;
    try {
        body = response.json();
    } catch (const nlohmann::json::exception& e) {
        throw TransientGatewayError(what + ": unparseable response: " + e.what());
    }

    const int ret_code = body.value("retCode", -1);
    const std::string ret_msg = body.value("retMsg", std::string());
    switch (classifyRetCode(ret_code, ret_msg)) {
        case BybitErrorClass::OK:
            break;
        case BybitErrorClass::TRANSIENT:
            LOG_DEBUG("{} transient retCode {} {}", what, ret_code, ret_msg);
            throw TransientGatewayError(what + ": retCode " + std::to_string(ret_code) + " " + ret_msg, ret_code);
        case BybitErrorClass::PRECISION:
            throw PrecisionError(what + ": retCode " + std::to_string(ret_code) + " " + ret_msg, ret_code);
        case BybitErrorClass::REJECTED:
            LOG_ERROR("{} rejected: {}", what, sanitizeForLog(response.body));
            throw GatewayError(what + ": retCode " + std::to_string(ret_code) + " " + ret_msg, ret_code);
    }

    if (!body.contains("result") || !body["result"].is_object()) {
        return nlohmann::json::object();
    }
    return body["result"];
}

AccountMarginState BybitExchangeGateway::getMarginState() {
    auto response = http_->get("/v5/account/wallet-balance", {{"accountType", config_.account_type}});
    const auto result = unwrap(response, "wallet-balance");

    const auto list = result.value("list", nlohmann::json::array());
    if (!list.is_array() || list.empty()) {
        throw GatewayError("wallet-balance: empty account list");
    }
    const auto& account = list.at(0);

    AccountMarginState state;
    state.total_equity = toDouble(account, "totalEquity");
    state.used_initial_margin = toDouble(account, "totalInitialMargin");
    state.free_margin = toDouble(account, "totalAvailableBalance");
    state.utilization = (state.total_equity > 0.0)
        ? std::clamp(state.used_initial_margin / state.total_equity, 0.0, 1.0)
        : 0.0;
    return state;
}

std::vector<OpenOrder> BybitExchangeGateway::listOpenOrders() {
    std::vector<OpenOrder> orders;
    std::string cursor;

    for (int page = 0; page < kPageGuard; ++page) {
        std::map<std::string, std::string> params{
            {"category", config_.category},
            {"settleCoin", config_.settle_coin},
            {"limit", "50"}
        };
        if (!cursor.empty()) {
            params["cursor"] = cursor;
        }

        const auto result = unwrap(http_->get("/v5/order/realtime", params), "order/realtime");
        for (const auto& item : result.value("list", nlohmann::json::array())) {
            OpenOrder order;
            order.order_id = toStringField(item, "orderId");
            order.symbol = toStringField(item, "symbol");
            order.side = (toStringField(item, "side") == "Sell") ? OrderSide::SELL : OrderSide::BUY;
            order.qty = toDouble(item, "qty");
            order.reduce_only = item.value("reduceOnly", false);
            orders.push_back(order);
        }

        cursor = toStringField(result, "nextPageCursor");
        if (cursor.empty()) {
            break;
        }
    }
    return orders;
}

int BybitExchangeGateway::cancelAllOrders(const std::optional<std::string>& symbol) {
    nlohmann::json body;
    body["category"] = config_.category;
    if (symbol.has_value()) {
        body["symbol"] = *symbol;
    } else {
        body["settleCoin"] = config_.settle_coin;
    }

    const auto result = unwrap(http_->post("/v5/order/cancel-all", body), "order/cancel-all");
    const auto list = result.value("list", nlohmann::json::array());
    const int canceled = list.is_array() ? static_cast<int>(list.size()) : 0;
    LOG_INFO("cancel-all {}: {} order(s) canceled", symbol.value_or(config_.settle_coin), canceled);
    return canceled;
}

std::vector<Position> BybitExchangeGateway::listPositions() {
    std::vector<Position> positions;
    std::map<std::string, int> idx_map;
    std::string cursor;

    for (int page = 0; page < kPageGuard; ++page) {
        std::map<std::string, std::string> params{
            {"category", config_.category},
            {"settleCoin", config_.settle_coin},
            {"limit", "200"}
        };
        if (!cursor.empty()) {
            params["cursor"] = cursor;
        }

        const auto result = unwrap(http_->get("/v5/position/list", params), "position/list");
        for (const auto& item : result.value("list", nlohmann::json::array())) {
            const double size = toDouble(item, "size");
            if (size <= 0.0) {
                continue;
            }
            Position p;
            p.symbol = toStringField(item, "symbol");
            p.side = (toStringField(item, "side") == "Sell") ? PositionSide::SHORT : PositionSide::LONG;
            p.size = size;
            p.entry_price = toDouble(item, "avgPrice");
            idx_map[positionKey(p.symbol, p.side)] = item.value("positionIdx", 0);
            positions.push_back(p);
        }

        cursor = toStringField(result, "nextPageCursor");
        if (cursor.empty()) {
            break;
        }
    }

    std::lock_guard<std::mutex> lock(cache_mutex_);
    position_idx_ = std::move(idx_map);
    return positions;
}

std::string BybitExchangeGateway::placeReduceOnlyMarket(const std::string& symbol, OrderSide side, Quantity qty) {
    const InstrumentSpec spec = getInstrumentSpec(symbol);

    nlohmann::json body;
    body["category"] = config_.category;
    body["symbol"] = symbol;
    body["side"] = orderSideToString(side);
    body["orderType"] = "Market";
    body["qty"] = common::qtyToString(qty, spec.qty_step);
    body["reduceOnly"] = true;
    body["timeInForce"] = "IOC";

    {
        // 매도 청산은 롱 포지션, 매수 청산은 숏 포지션을 줄인다
        const PositionSide reduced = (side == OrderSide::SELL) ? PositionSide::LONG : PositionSide::SHORT;
        std::lock_guard<std::mutex> lock(cache_mutex_);
        const auto it = position_idx_.find(positionKey(symbol, reduced));
        if (it != position_idx_.end() && it->second != 0) {
            body["positionIdx"] = it->second;
        }
    }

    nlohmann::json result;
    try {
        result = unwrap(http_->post("/v5/order/create", body), "order/create " + symbol);
    } catch (const PrecisionError&) {
        // 다음 조회에서 step 을 다시 받아오도록 캐시 무효화
        std::lock_guard<std::mutex> lock(cache_mutex_);
        spec_cache_.erase(symbol);
        throw;
    }
    const std::string order_id = toStringField(result, "orderId");
    LOG_INFO("Reduce-only market {} {} qty={} -> {}", symbol, orderSideToString(side),
             body["qty"].get<std::string>(), order_id);
    return order_id;
}

InstrumentSpec BybitExchangeGateway::getInstrumentSpec(const std::string& symbol) {
    {
        std::lock_guard<std::mutex> lock(cache_mutex_);
        const auto it = spec_cache_.find(symbol);
        if (it != spec_cache_.end()) {
            return it->second;
        }
    }

    const auto result = unwrap(
        http_->get("/v5/market/instruments-info", {{"category", config_.category}, {"symbol", symbol}}),
        "instruments-info " + symbol);
    const auto list = result.value("list", nlohmann::json::array());
    if (!list.is_array() || list.empty()) {
        throw GatewayError("instruments-info: unknown symbol " + symbol);
    }

    const auto& item = list.at(0);
    const auto lot = item.value("lotSizeFilter", nlohmann::json::object());
    InstrumentSpec spec;
    spec.symbol = symbol;
    spec.qty_step = toDouble(lot, "qtyStep");
    spec.min_qty = toDouble(lot, "minOrderQty");

    std::lock_guard<std::mutex> lock(cache_mutex_);
    spec_cache_[symbol] = spec;
    return spec;
}

} // namespace core
} // namespace riskguard
