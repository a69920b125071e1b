#pragma once
#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace pmarb {

// ── Venue identifier ─────────────────────────────────────────────────
enum class Venue { POLYMARKET, KALSHI, PNP, UNKNOWN };

struct VenueHash {
  size_t operator()(Venue v) const {
    return std::hash<int>()(static_cast<int>(v));
  }
};

const char *venueName(Venue venue);
Venue parseVenue(const std::string &name); // UNKNOWN if not recognised

// ── Fee schedules ────────────────────────────────────────────────────
enum class FeeModel {
  WINNER_FLAT,     // rate charged on winnings only
  PRICE_BRACKETED, // mid_rate inside [bracket_low, bracket_high], else low
  FLAT             // rate on notional
};

struct VenueFeeSchedule {
  FeeModel model = FeeModel::FLAT;
  double rate = 0.01;
  double low_rate = 0.005;
  double mid_rate = 0.015;
  double bracket_low = 0.20;
  double bracket_high = 0.80;
};

// ── Unhedged Leg2 handling ───────────────────────────────────────────
enum class UnhedgedPolicy { ALERT, UNWIND, UNWIND_AND_ALERT };

const char *policyName(UnhedgedPolicy policy);
std::optional<UnhedgedPolicy> parsePolicy(const std::string &name);

// ── Configuration ────────────────────────────────────────────────────
struct CostConfig {
  std::unordered_map<Venue, VenueFeeSchedule, VenueHash> fee_table;
  double unknown_venue_fee_rate = 0.01; // fallback for unlisted venues
  long gas_units_per_leg = 150000;
  double default_gas_price_gwei = 30.0;
  double native_token_usd = 1.0; // MATIC
  double default_slippage_pct = 0.5;
  std::string gas_rpc_url; // empty = no oracle

  CostConfig();
};

struct RiskConfig {
  double total_capital_usd = 10000.0;
  double max_position_size_pct = 10.0;
  double max_single_market_exposure_pct = 20.0;
  double max_total_exposure_pct = 80.0;
  double liquidity_fraction = 0.5; // never take more than half the book
  int allocation_ttl_ms = 30000;
};

struct ExecutorConfig {
  int leg_fill_timeout_ms = 5000;
  UnhedgedPolicy unhedged_policy = UnhedgedPolicy::ALERT;
  double unwind_price_buffer = 0.02;
};

struct StrategyConfig {
  double min_deviation_pct = 0.5;
  double min_confidence = 0.85;
  double min_spread_pct = 1.0;
  double min_profit_margin_pct = 2.5;
  double position_size_usd = 100.0;
  int max_opportunities = 10;
  int max_concurrent_executions = 4;
  int max_quote_age_ms = 10000;
};

struct AlertConfig {
  std::string telegram_bot_token;
  std::string telegram_chat_id;
};

struct Config {
  bool live_mode = false; // paper by default
  int scan_interval_s = 1;
  int max_cycles = 0; // 0 = run until signalled
  std::string log_dir = "logs";
  std::string snapshot_path;
  std::string state_path;
  CostConfig cost;
  RiskConfig risk;
  ExecutorConfig exec;
  StrategyConfig strategy;
  AlertConfig alert;
};

// ── Market Data ──────────────────────────────────────────────────────
enum class Side { BUY, SELL };

inline const char *sideName(Side side) {
  return side == Side::BUY ? "BUY" : "SELL";
}
inline Side opposite(Side side) {
  return side == Side::BUY ? Side::SELL : Side::BUY;
}

struct OrderBookLevel {
  double price;
  double size;
};

struct OrderBook {
  std::string market_id;
  std::vector<OrderBookLevel> bids;
  std::vector<OrderBookLevel> asks;

  double bestBid() const { return bids.empty() ? 0.0 : bids.front().price; }
  double bestAsk() const { return asks.empty() ? 1.0 : asks.front().price; }
  double midpoint() const { return (bestBid() + bestAsk()) / 2.0; }
  double spread() const { return bestAsk() - bestBid(); }

  // Contracts resting on the side a taker of `side` would consume
  double depth(Side side) const {
    double total = 0.0;
    for (const auto &l : (side == Side::BUY ? asks : bids))
      total += l.size;
    return total;
  }
};

struct MarketQuote {
  Venue venue = Venue::POLYMARKET;
  std::string market_id;
  double yes_price = 0.0;
  double no_price = 0.0;
  double best_bid = 0.0;
  double best_ask = 0.0;
  std::optional<OrderBook> book;    // YES outcome
  std::optional<OrderBook> no_book; // NO outcome
  std::chrono::system_clock::time_point timestamp;
};

// ── Relationship signals ─────────────────────────────────────────────
enum class RelationKind {
  MUTUALLY_EXCLUSIVE,
  COMPLEMENTARY,
  ENTAILMENT,
  INDEPENDENT,
  CONTRADICTION
};

enum class Direction { A_IMPLIES_B, B_IMPLIES_A, SYMMETRIC, NONE };

const char *relationName(RelationKind kind);
std::optional<RelationKind> parseRelation(const std::string &name);
const char *directionName(Direction direction);
std::optional<Direction> parseDirection(const std::string &name);

struct RelationshipSignal {
  std::string market_a;
  std::string market_b;
  RelationKind kind = RelationKind::INDEPENDENT;
  Direction direction = Direction::NONE;
  double confidence = 0.0;
};

// ── Strategy attribution ─────────────────────────────────────────────
enum class StrategyKind { REBALANCING, COMBINATORIAL };

inline const char *strategyName(StrategyKind kind) {
  return kind == StrategyKind::REBALANCING ? "rebalancing" : "combinatorial";
}

// ── Timing helpers ───────────────────────────────────────────────────
inline double elapsed_ms(std::chrono::steady_clock::time_point start) {
  auto now = std::chrono::steady_clock::now();
  return std::chrono::duration<double, std::milli>(now - start).count();
}

inline long long epoch_ms(std::chrono::system_clock::time_point tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             tp.time_since_epoch())
      .count();
}

inline std::chrono::system_clock::time_point from_epoch_ms(long long ms) {
  return std::chrono::system_clock::time_point(std::chrono::milliseconds(ms));
}

} // namespace pmarb
