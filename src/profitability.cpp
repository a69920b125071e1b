#include "pmarb/profitability.hpp"
#include <algorithm>
#include <cmath>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

namespace pmarb {

bool ProfitabilityAnalysis::hasRisk(RiskFactorKind kind) const {
  for (const auto &r : risk_factors)
    if (r.kind == kind)
      return true;
  return false;
}

ProfitabilityAnalyzer::ProfitabilityAnalyzer(const CostModel &costs,
                                             double min_profit_margin_pct,
                                             int max_quote_age_ms)
    : costs_(costs), min_margin_pct_(min_profit_margin_pct),
      max_quote_age_ms_(max_quote_age_ms) {}

double ProfitabilityAnalyzer::grossSpread(const Opportunity &opp,
                                          double size) const {
  return std::visit(
      overloaded{
          [size](const RebalancingOpportunity &o) {
            return std::abs(o.yes_price + o.no_price - 1.0) * size;
          },
          [size](const CombinatorialOpportunity &o) {
            return std::abs(o.leg_a.price - o.leg_b.price) * size;
          },
      },
      opp);
}

// ── Profitability analysis ───────────────────────────────────────────
ProfitabilityAnalysis
ProfitabilityAnalyzer::analyze(const Opportunity &opp,
                               const CostInputs &inputs) const {
  ProfitabilityAnalysis a;
  a.opportunity_id = opportunityId(opp);
  a.strategy = strategyOf(opp);
  a.position_size_usd = inputs.position_size_usd;
  a.evaluated_at = inputs.as_of;

  double size = inputs.position_size_usd;
  auto legs = legsOf(opp);

  a.gross_spread_usd = grossSpread(opp, size);
  a.gross_spread_pct = size > 0 ? a.gross_spread_usd / size * 100.0 : 0.0;

  // Fees assume both legs win (worst case for winner-fee venues)
  double fee_a =
      costs_.platformFee(legs.first.venue, size, legs.first.price, true);
  double fee_b =
      costs_.platformFee(legs.second.venue, size, legs.second.price, true);

  // One on-chain transaction per leg
  double gas_leg =
      costs_.gasCost(costs_.config().gas_units_per_leg, inputs.gas_price_gwei);

  auto slip_a = costs_.slippage(legs.first.book, size, legs.first.side);
  auto slip_b = costs_.slippage(legs.second.book, size, legs.second.side);

  auto &c = a.costs;
  c.platform_fees_usd = fee_a + fee_b;
  c.gas_costs_usd = 2.0 * gas_leg;
  c.slippage_costs_usd = slip_a.slippage_usd + slip_b.slippage_usd;
  c.total_costs_usd =
      c.platform_fees_usd + c.gas_costs_usd + c.slippage_costs_usd;
  c.total_costs_pct = size > 0 ? c.total_costs_usd / size * 100.0 : 0.0;

  a.net_profit_usd = a.gross_spread_usd - c.total_costs_usd;
  a.net_profit_pct = size > 0 ? a.net_profit_usd / size * 100.0 : 0.0;
  a.break_even_spread_pct = c.total_costs_pct;
  a.min_required_spread_pct = a.break_even_spread_pct + min_margin_pct_;
  a.is_profitable = a.net_profit_pct >= min_margin_pct_;

  // ── Risk factors ──
  if (!slip_a.from_book || !slip_b.from_book)
    a.risk_factors.push_back({RiskFactorKind::MISSING_ORDER_BOOK,
                              "Missing order book data - using conservative "
                              "slippage estimate"});
  if ((slip_a.from_book && !slip_a.fully_fillable) ||
      (slip_b.from_book && !slip_b.fully_fillable))
    a.risk_factors.push_back(
        {RiskFactorKind::INSUFFICIENT_DEPTH,
         fmt::format("Visible depth below order size ({:.2f} / {:.2f})",
                     std::min(slip_a.available_liquidity,
                              slip_b.available_liquidity),
                     size)});
  if (c.slippage_costs_usd > a.gross_spread_usd * 0.3)
    a.risk_factors.push_back({RiskFactorKind::HIGH_SLIPPAGE,
                              "High slippage risk (>30% of gross spread)"});
  if (c.gas_costs_usd > a.gross_spread_usd * 0.2)
    a.risk_factors.push_back(
        {RiskFactorKind::HIGH_GAS, "High gas costs (>20% of gross spread)"});
  if (a.gross_spread_pct < a.min_required_spread_pct)
    a.risk_factors.push_back(
        {RiskFactorKind::SPREAD_BELOW_MINIMUM,
         fmt::format("Spread ({:.2f}%) below minimum required ({:.2f}%)",
                     a.gross_spread_pct, a.min_required_spread_pct)});

  if (inputs.as_of) {
    auto max_age = std::chrono::milliseconds(max_quote_age_ms_);
    for (const auto *leg : {&legs.first, &legs.second}) {
      if (leg->quoted_at.time_since_epoch().count() == 0)
        continue;
      if (*inputs.as_of - leg->quoted_at > max_age) {
        a.risk_factors.push_back(
            {RiskFactorKind::STALE_QUOTE,
             fmt::format("Stale quote for {} ({} ms old)", leg->market_id,
                         std::chrono::duration_cast<std::chrono::milliseconds>(
                             *inputs.as_of - leg->quoted_at)
                             .count())});
      }
    }
  }

  if (a.is_profitable)
    a.recommendation =
        fmt::format("PROFITABLE - execute (net {:.2f}%)", a.net_profit_pct);
  else if (a.gross_spread_pct >= a.break_even_spread_pct)
    a.recommendation = fmt::format(
        "BREAK-EVEN - wait for wider spread (net {:.2f}%)", a.net_profit_pct);
  else
    a.recommendation =
        fmt::format("NOT PROFITABLE - skip (net {:.2f}%, need {:.2f}%)",
                    a.net_profit_pct, a.min_required_spread_pct);

  spdlog::debug("[Profit] {}: gross=${:.2f} fees=${:.2f} gas=${:.4f} "
                "slippage=${:.2f} net=${:.2f} ({:.2f}%)",
                a.opportunity_id, a.gross_spread_usd, c.platform_fees_usd,
                c.gas_costs_usd, c.slippage_costs_usd, a.net_profit_usd,
                a.net_profit_pct);
  return a;
}

} // namespace pmarb
