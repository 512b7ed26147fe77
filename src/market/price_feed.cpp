// STAKEGUARD - Market Price Feed Implementation
// Copyright (c) 2024 STAKEGUARD Developers
// MIT License

#include "stakeguard/market/price_feed.h"
#include "stakeguard/core/json.h"
#include "stakeguard/util/logging.h"

#include <sstream>

namespace stakeguard {
namespace market {

CoinGeckoFeed::CoinGeckoFeed(net::IHttpClient& http, const Config& config)
    : http_(http), config_(config) {}

std::string CoinGeckoFeed::BuildRequestUrl() const {
    std::ostringstream ss;
    ss << config_.priceUrl
       << (config_.priceUrl.find('?') == std::string::npos ? "?" : "&")
       << "ids=" << config_.assetId
       << "&vs_currencies=" << config_.vsCurrency
       << "&include_market_cap=true"
       << "&include_24hr_vol=true"
       << "&include_24hr_change=true";
    return ss.str();
}

std::optional<MarketSnapshot> CoinGeckoFeed::FetchSnapshot() {
    net::HttpResponse response = http_.Get(BuildRequestUrl());

    if (!response.ok) {
        LOG_DEBUG(util::LogCategory::MARKET) << "Error while fetching market data: "
                                             << response.error;
        return std::nullopt;
    }
    if (response.statusCode != 200) {
        LOG_DEBUG(util::LogCategory::MARKET) << "Failed to fetch market data. HTTP Status: "
                                             << response.statusCode;
        return std::nullopt;
    }

    auto snapshot = ParseSnapshot(response.body, config_.assetId, config_.vsCurrency);
    if (!snapshot) {
        LOG_DEBUG(util::LogCategory::MARKET) << "Market data response has no "
                                             << config_.vsCurrency << " price for "
                                             << config_.assetId;
    }
    return snapshot;
}

std::optional<MarketSnapshot> CoinGeckoFeed::ParseSnapshot(const std::string& body,
                                                           const std::string& assetId,
                                                           const std::string& vsCurrency) {
    auto parsed = core::JSONValue::TryParse(body);
    if (!parsed || !parsed->IsObject()) {
        return std::nullopt;
    }

    const core::JSONValue& root = *parsed;
    const core::JSONValue& asset = root[assetId];
    if (!asset.IsObject() || !asset[vsCurrency].IsNumber()) {
        return std::nullopt;
    }

    MarketSnapshot snapshot;
    snapshot.price = asset[vsCurrency].GetDouble();
    snapshot.marketCap = asset[vsCurrency + "_market_cap"].GetDouble(0.0);
    snapshot.volume24h = asset[vsCurrency + "_24h_vol"].GetDouble(0.0);
    snapshot.change24hPct = asset[vsCurrency + "_24h_change"].GetDouble(0.0);
    return snapshot;
}

} // namespace market
} // namespace stakeguard
