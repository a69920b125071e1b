#include "pmarb/snapshot_feed.hpp"
#include <algorithm>
#include <fstream>
#include <spdlog/spdlog.h>
#include <stdexcept>

using json = nlohmann::json;

namespace pmarb {

SnapshotFeed::SnapshotFeed(const std::string &path) : path_(path) { reload(); }

void SnapshotFeed::reload() {
  std::ifstream in(path_);
  if (!in.is_open())
    throw std::runtime_error("cannot open snapshot " + path_);
  json j;
  try {
    in >> j;
  } catch (const json::exception &e) {
    throw std::runtime_error("invalid snapshot " + path_ + ": " + e.what());
  }
  load(j);
}

// ── Parsing ──────────────────────────────────────────────────────────
static std::vector<OrderBookLevel> parseLevels(const json &arr) {
  std::vector<OrderBookLevel> levels;
  if (!arr.is_array())
    return levels;
  for (const auto &l : arr) {
    if (l.is_array() && l.size() >= 2)
      levels.push_back({l[0].get<double>(), l[1].get<double>()});
    else if (l.is_object())
      levels.push_back({l.at("price").get<double>(), l.at("size").get<double>()});
  }
  return levels;
}

OrderBook SnapshotFeed::parseBook(const std::string &market_id, const json &j) {
  OrderBook book;
  book.market_id = market_id;
  if (j.contains("bids"))
    book.bids = parseLevels(j["bids"]);
  if (j.contains("asks"))
    book.asks = parseLevels(j["asks"]);

  // Sort: bids descending, asks ascending
  std::sort(book.bids.begin(), book.bids.end(),
            [](auto &a, auto &b) { return a.price > b.price; });
  std::sort(book.asks.begin(), book.asks.end(),
            [](auto &a, auto &b) { return a.price < b.price; });
  return book;
}

void SnapshotFeed::load(const json &snapshot) {
  std::map<std::string, MarketQuote> quotes;
  std::vector<RelationshipSignal> relationships;
  auto now = std::chrono::system_clock::now();

  try {
    for (const auto &m : snapshot.value("markets", json::array())) {
      MarketQuote q;
      q.venue = parseVenue(m.value("venue", "polymarket"));
      q.market_id = m.at("market_id").get<std::string>();
      q.yes_price = m.at("yes_price").get<double>();
      q.no_price = m.value("no_price", 1.0 - q.yes_price);
      q.best_bid = m.value("best_bid", 0.0);
      q.best_ask = m.value("best_ask", 0.0);
      q.timestamp = m.contains("timestamp_ms")
                        ? from_epoch_ms(m["timestamp_ms"].get<long long>())
                        : now;
      if (m.contains("book") && m["book"].is_object())
        q.book = parseBook(q.market_id, m["book"]);
      if (m.contains("no_book") && m["no_book"].is_object())
        q.no_book = parseBook(q.market_id, m["no_book"]);
      if (q.venue == Venue::UNKNOWN)
        spdlog::warn("[Snapshot] {} has unknown venue '{}'", q.market_id,
                     m.value("venue", ""));
      quotes[q.market_id] = std::move(q);
    }

    for (const auto &r : snapshot.value("relationships", json::array())) {
      RelationshipSignal s;
      s.market_a = r.at("market_a").get<std::string>();
      s.market_b = r.at("market_b").get<std::string>();
      auto kind = parseRelation(r.value("kind", "independent"));
      auto dir = parseDirection(r.value("direction", "none"));
      if (!kind || !dir) {
        spdlog::warn("[Snapshot] Skipping relationship {} / {}: bad kind or "
                     "direction",
                     s.market_a, s.market_b);
        continue;
      }
      s.kind = *kind;
      s.direction = *dir;
      s.confidence = r.value("confidence", 0.0);
      relationships.push_back(s);
    }
  } catch (const json::exception &e) {
    throw std::runtime_error(std::string("malformed snapshot: ") + e.what());
  }

  std::lock_guard<std::mutex> lock(mtx_);
  quotes_ = std::move(quotes);
  relationships_ = std::move(relationships);
  spdlog::info("[Snapshot] Loaded {} markets, {} relationships", quotes_.size(),
               relationships_.size());
}

// ── MarketDataSource ─────────────────────────────────────────────────
MarketQuote SnapshotFeed::quote(const std::string &market_id) {
  std::lock_guard<std::mutex> lock(mtx_);
  auto it = quotes_.find(market_id);
  if (it == quotes_.end())
    throw std::runtime_error("no quote for market " + market_id);
  return it->second;
}

std::optional<OrderBook> SnapshotFeed::orderBook(const std::string &market_id) {
  std::lock_guard<std::mutex> lock(mtx_);
  auto it = quotes_.find(market_id);
  if (it == quotes_.end())
    return std::nullopt;
  return it->second.book;
}

std::optional<OrderBook>
SnapshotFeed::noOrderBook(const std::string &market_id) {
  std::lock_guard<std::mutex> lock(mtx_);
  auto it = quotes_.find(market_id);
  if (it == quotes_.end())
    return std::nullopt;
  return it->second.no_book;
}

std::vector<MarketQuote> SnapshotFeed::quotes() {
  std::lock_guard<std::mutex> lock(mtx_);
  std::vector<MarketQuote> out;
  out.reserve(quotes_.size());
  for (const auto &kv : quotes_)
    out.push_back(kv.second);
  return out;
}

// ── RelationshipClassifier ───────────────────────────────────────────
RelationshipSignal SnapshotFeed::classify(const std::string &market_a,
                                          const std::string &market_b) {
  std::lock_guard<std::mutex> lock(mtx_);
  for (const auto &r : relationships_) {
    if (r.market_a == market_a && r.market_b == market_b)
      return r;
    if (r.market_a == market_b && r.market_b == market_a) {
      // Same relationship seen from the other side
      RelationshipSignal s = r;
      std::swap(s.market_a, s.market_b);
      if (s.direction == Direction::A_IMPLIES_B)
        s.direction = Direction::B_IMPLIES_A;
      else if (s.direction == Direction::B_IMPLIES_A)
        s.direction = Direction::A_IMPLIES_B;
      return s;
    }
  }

  RelationshipSignal none;
  none.market_a = market_a;
  none.market_b = market_b;
  return none;
}

std::vector<std::pair<std::string, std::string>> SnapshotFeed::pairs() const {
  std::lock_guard<std::mutex> lock(mtx_);
  std::vector<std::pair<std::string, std::string>> out;
  for (const auto &r : relationships_)
    out.emplace_back(r.market_a, r.market_b);
  return out;
}

} // namespace pmarb
