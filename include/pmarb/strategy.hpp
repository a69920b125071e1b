#pragma once
#include "pmarb/opportunity.hpp"
#include "pmarb/profitability.hpp"
#include <unordered_map>

namespace pmarb {

struct RankedOpportunity {
  Opportunity opportunity;
  ProfitabilityAnalysis analysis;
};

// ── Rebalancing detector ─────────────────────────────────────────────
// YES + NO should sum to 1.00; buy both below, sell both above.
class RebalancingDetector {
public:
  explicit RebalancingDetector(const StrategyConfig &config);

  std::optional<RebalancingOpportunity> detect(const MarketQuote &quote) const;
  std::vector<Opportunity> scan(const std::vector<MarketQuote> &quotes) const;

private:
  StrategyConfig config_;
};

// ── Combinatorial detector ───────────────────────────────────────────
// Linked markets whose prices contradict their logical relationship.
class CombinatorialDetector {
public:
  explicit CombinatorialDetector(const StrategyConfig &config);

  std::optional<CombinatorialOpportunity>
  detect(const RelationshipSignal &signal, const MarketQuote &a,
         const MarketQuote &b) const;

  // Signals whose markets are missing from `quotes` are skipped
  std::vector<Opportunity>
  scan(const std::vector<RelationshipSignal> &signals,
       const std::unordered_map<std::string, MarketQuote> &quotes) const;

private:
  StrategyConfig config_;
};

// Descending by net_profit_pct, truncated to max_count
std::vector<RankedOpportunity>
prioritize(std::vector<RankedOpportunity> candidates, size_t max_count);

} // namespace pmarb
