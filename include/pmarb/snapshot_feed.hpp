#pragma once
#include "pmarb/engine.hpp"
#include <map>
#include <mutex>
#include <nlohmann/json.hpp>

namespace pmarb {

// Market data and relationship signals read from a JSON snapshot:
//
//   { "markets": [ { "venue", "market_id", "yes_price", "no_price",
//                    "best_bid", "best_ask", "timestamp_ms",
//                    "book": { "bids": [[p, s], ...], "asks": [...] },
//                    "no_book": {...} } ],
//     "relationships": [ { "market_a", "market_b", "kind", "direction",
//                          "confidence" } ] }
//
// Quotes without timestamp_ms are stamped with the load time.
class SnapshotFeed : public MarketDataSource, public RelationshipClassifier {
public:
  SnapshotFeed() = default;
  explicit SnapshotFeed(const std::string &path);

  // Re-reads the file given at construction
  void reload();
  void load(const nlohmann::json &snapshot);

  MarketQuote quote(const std::string &market_id) override;
  std::optional<OrderBook> orderBook(const std::string &market_id) override;
  std::optional<OrderBook> noOrderBook(const std::string &market_id) override;
  std::vector<MarketQuote> quotes() override;

  RelationshipSignal classify(const std::string &market_a,
                              const std::string &market_b) override;

  // Market pairs that have a declared relationship
  std::vector<std::pair<std::string, std::string>> pairs() const;

  static OrderBook parseBook(const std::string &market_id,
                             const nlohmann::json &j);

private:
  std::string path_;
  std::map<std::string, MarketQuote> quotes_;
  std::vector<RelationshipSignal> relationships_;
  mutable std::mutex mtx_;
};

} // namespace pmarb
