// STAKEGUARD - Market Price Feed
// Copyright (c) 2024 STAKEGUARD Developers
// MIT License

#ifndef STAKEGUARD_MARKET_PRICE_FEED_H
#define STAKEGUARD_MARKET_PRICE_FEED_H

#include "stakeguard/net/http_client.h"

#include <optional>
#include <string>

namespace stakeguard {
namespace market {

/// Default CoinGecko simple-price endpoint
constexpr const char* DEFAULT_PRICE_URL = "https://api.coingecko.com/api/v3/simple/price";
constexpr const char* DEFAULT_ASSET_ID = "dusk-network";
constexpr const char* DEFAULT_VS_CURRENCY = "usd";

/**
 * Spot price and 24h statistics for the staked asset.
 */
struct MarketSnapshot {
    double price{0.0};
    double marketCap{0.0};
    double volume24h{0.0};
    double change24hPct{0.0};

    bool operator==(const MarketSnapshot& other) const {
        return price == other.price && marketCap == other.marketCap &&
               volume24h == other.volume24h && change24hPct == other.change24hPct;
    }
    bool operator!=(const MarketSnapshot& other) const { return !(*this == other); }
};

// ============================================================================
// Feed Interface
// ============================================================================

class IMarketFeed {
public:
    virtual ~IMarketFeed() = default;

    /// Fetch the current snapshot; nullopt when unavailable. Never throws.
    virtual std::optional<MarketSnapshot> FetchSnapshot() = 0;
};

// ============================================================================
// CoinGecko Feed
// ============================================================================

class CoinGeckoFeed : public IMarketFeed {
public:
    struct Config {
        std::string priceUrl{DEFAULT_PRICE_URL};
        std::string assetId{DEFAULT_ASSET_ID};
        std::string vsCurrency{DEFAULT_VS_CURRENCY};
    };

    CoinGeckoFeed(net::IHttpClient& http, const Config& config);

    std::optional<MarketSnapshot> FetchSnapshot() override;

    /// Full request URL including the query selecting the asset and statistics
    std::string BuildRequestUrl() const;

    /**
     * Extract a snapshot from a simple-price response body, e.g.
     * {"dusk-network":{"usd":0.21,"usd_market_cap":9.7e7,...}}.
     * The price field is required; missing statistics read as 0.
     */
    static std::optional<MarketSnapshot> ParseSnapshot(const std::string& body,
                                                       const std::string& assetId,
                                                       const std::string& vsCurrency);

private:
    net::IHttpClient& http_;
    Config config_;
};

} // namespace market
} // namespace stakeguard

#endif // STAKEGUARD_MARKET_PRICE_FEED_H
