#pragma once
#include "pmarb/common.hpp"
#include <variant>

namespace pmarb {

// ── Rebalancing: YES + NO != 1.00 inside one market ──────────────────
enum class RebalanceSide {
  BUY_BOTH, // sum < 1
  SELL_BOTH // sum > 1
};

struct RebalancingOpportunity {
  std::string id;
  Venue venue = Venue::POLYMARKET;
  std::string market_id;
  double yes_price = 0.0;
  double no_price = 0.0;
  double price_sum = 0.0;
  double deviation = 0.0; // |sum - 1|
  RebalanceSide side = RebalanceSide::BUY_BOTH;
  std::optional<OrderBook> yes_book;
  std::optional<OrderBook> no_book;
  std::chrono::system_clock::time_point quoted_at;
};

// ── Combinatorial: two linked markets priced inconsistently ──────────
struct OpportunityLeg {
  Venue venue = Venue::POLYMARKET;
  std::string market_id;
  std::string outcome = "YES";
  double price = 0.0;
  Side side = Side::BUY;
  std::optional<OrderBook> book;
  std::chrono::system_clock::time_point quoted_at;
};

struct CombinatorialOpportunity {
  std::string id;
  OpportunityLeg leg_a;
  OpportunityLeg leg_b;
  RelationshipSignal relationship;
};

using Opportunity = std::variant<RebalancingOpportunity, CombinatorialOpportunity>;

template <class... Ts> struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

const std::string &opportunityId(const Opportunity &opp);
StrategyKind strategyOf(const Opportunity &opp);
std::vector<std::string> marketsOf(const Opportunity &opp);

// The two tradeable legs implied by an opportunity. A rebalancing
// opportunity trades the YES and NO outcome of the same market.
std::pair<OpportunityLeg, OpportunityLeg> legsOf(const Opportunity &opp);

} // namespace pmarb
