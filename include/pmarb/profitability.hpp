#pragma once
#include "pmarb/cost_model.hpp"
#include "pmarb/opportunity.hpp"

namespace pmarb {

enum class RiskFactorKind {
  MISSING_ORDER_BOOK,
  INSUFFICIENT_DEPTH,
  HIGH_SLIPPAGE,
  HIGH_GAS,
  SPREAD_BELOW_MINIMUM,
  STALE_QUOTE
};

struct RiskFactor {
  RiskFactorKind kind;
  std::string description;
};

struct CostInputs {
  double position_size_usd = 100.0;
  std::optional<double> gas_price_gwei;
  // Evaluation time; enables the stale-quote check when set
  std::optional<std::chrono::system_clock::time_point> as_of;
};

struct ProfitabilityAnalysis {
  std::string opportunity_id;
  StrategyKind strategy = StrategyKind::REBALANCING;
  double position_size_usd = 0.0;
  double gross_spread_usd = 0.0;
  double gross_spread_pct = 0.0;
  TransactionCosts costs;
  double net_profit_usd = 0.0;
  double net_profit_pct = 0.0;
  bool is_profitable = false;
  double break_even_spread_pct = 0.0;
  double min_required_spread_pct = 0.0;
  std::string recommendation;
  std::vector<RiskFactor> risk_factors;
  std::optional<std::chrono::system_clock::time_point> evaluated_at;

  bool hasRisk(RiskFactorKind kind) const;
};

class ProfitabilityAnalyzer {
public:
  ProfitabilityAnalyzer(const CostModel &costs, double min_profit_margin_pct,
                        int max_quote_age_ms = 10000);

  ProfitabilityAnalysis analyze(const Opportunity &opp,
                                const CostInputs &inputs) const;

private:
  const CostModel &costs_;
  double min_margin_pct_;
  int max_quote_age_ms_;

  double grossSpread(const Opportunity &opp, double size) const;
};

} // namespace pmarb
