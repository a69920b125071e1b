#include "pmarb/strategy.hpp"
#include <algorithm>
#include <cmath>
#include <spdlog/spdlog.h>

namespace pmarb {

static constexpr double kEps = 1e-9;

static bool validPrice(double p) {
  return std::isfinite(p) && p >= 0.0 && p <= 1.0;
}

// ── Rebalancing ──────────────────────────────────────────────────────
RebalancingDetector::RebalancingDetector(const StrategyConfig &config)
    : config_(config) {}

std::optional<RebalancingOpportunity>
RebalancingDetector::detect(const MarketQuote &quote) const {
  if (!validPrice(quote.yes_price) || !validPrice(quote.no_price)) {
    spdlog::warn("[Strategy] {}: prices out of range (yes={}, no={})",
                 quote.market_id, quote.yes_price, quote.no_price);
    return std::nullopt;
  }

  double sum = quote.yes_price + quote.no_price;
  double deviation = std::abs(sum - 1.0);
  if (deviation * 100.0 + kEps < config_.min_deviation_pct || deviation < kEps)
    return std::nullopt;

  RebalancingOpportunity opp;
  opp.id = "REB-" + quote.market_id;
  opp.venue = quote.venue;
  opp.market_id = quote.market_id;
  opp.yes_price = quote.yes_price;
  opp.no_price = quote.no_price;
  opp.price_sum = sum;
  opp.deviation = deviation;
  opp.side = sum < 1.0 ? RebalanceSide::BUY_BOTH : RebalanceSide::SELL_BOTH;
  opp.yes_book = quote.book;
  opp.no_book = quote.no_book;
  opp.quoted_at = quote.timestamp;

  spdlog::debug("[Strategy] Rebalancing candidate {}: YES={:.3f} NO={:.3f} "
                "sum={:.3f} ({})",
                quote.market_id, quote.yes_price, quote.no_price, sum,
                opp.side == RebalanceSide::BUY_BOTH ? "buy both" : "sell both");
  return opp;
}

std::vector<Opportunity>
RebalancingDetector::scan(const std::vector<MarketQuote> &quotes) const {
  std::vector<Opportunity> out;
  for (const auto &q : quotes) {
    if (auto opp = detect(q))
      out.emplace_back(std::move(*opp));
  }
  return out;
}

// ── Combinatorial ────────────────────────────────────────────────────
CombinatorialDetector::CombinatorialDetector(const StrategyConfig &config)
    : config_(config) {}

static OpportunityLeg makeLeg(const MarketQuote &q, Side side) {
  OpportunityLeg leg;
  leg.venue = q.venue;
  leg.market_id = q.market_id;
  leg.outcome = "YES";
  leg.price = q.yes_price;
  leg.side = side;
  leg.book = q.book;
  leg.quoted_at = q.timestamp;
  return leg;
}

std::optional<CombinatorialOpportunity>
CombinatorialDetector::detect(const RelationshipSignal &signal,
                              const MarketQuote &a,
                              const MarketQuote &b) const {
  if (signal.kind != RelationKind::MUTUALLY_EXCLUSIVE &&
      signal.kind != RelationKind::COMPLEMENTARY &&
      signal.kind != RelationKind::ENTAILMENT)
    return std::nullopt;
  if (signal.confidence + kEps < config_.min_confidence)
    return std::nullopt;
  if (!validPrice(a.yes_price) || !validPrice(b.yes_price))
    return std::nullopt;

  double pa = a.yes_price;
  double pb = b.yes_price;
  if (std::abs(pa - pb) * 100.0 + kEps < config_.min_spread_pct)
    return std::nullopt;

  // true: sell A / buy B
  bool sell_a;
  if (signal.kind == RelationKind::ENTAILMENT) {
    switch (signal.direction) {
    case Direction::A_IMPLIES_B:
      // P(A) <= P(B) must hold
      if (pa <= pb)
        return std::nullopt;
      sell_a = true;
      break;
    case Direction::B_IMPLIES_A:
      if (pb <= pa)
        return std::nullopt;
      sell_a = false;
      break;
    case Direction::SYMMETRIC:
      sell_a = pa > pb;
      break;
    case Direction::NONE:
    default:
      return std::nullopt;
    }
  } else {
    sell_a = pa > pb;
  }

  CombinatorialOpportunity opp;
  opp.id = "CMB-" + a.market_id + "-" + b.market_id;
  opp.leg_a = makeLeg(a, sell_a ? Side::SELL : Side::BUY);
  opp.leg_b = makeLeg(b, sell_a ? Side::BUY : Side::SELL);
  opp.relationship = signal;

  spdlog::debug("[Strategy] Combinatorial candidate {} ({} {}, conf {:.2f}): "
                "{} A @ {:.3f}, {} B @ {:.3f}",
                opp.id, relationName(signal.kind),
                directionName(signal.direction), signal.confidence,
                sideName(opp.leg_a.side), pa, sideName(opp.leg_b.side), pb);
  return opp;
}

std::vector<Opportunity> CombinatorialDetector::scan(
    const std::vector<RelationshipSignal> &signals,
    const std::unordered_map<std::string, MarketQuote> &quotes) const {
  std::vector<Opportunity> out;
  for (const auto &s : signals) {
    auto ia = quotes.find(s.market_a);
    auto ib = quotes.find(s.market_b);
    if (ia == quotes.end() || ib == quotes.end()) {
      spdlog::debug("[Strategy] No quote for pair {} / {}", s.market_a,
                    s.market_b);
      continue;
    }
    if (auto opp = detect(s, ia->second, ib->second))
      out.emplace_back(std::move(*opp));
  }
  return out;
}

// ── Prioritization ───────────────────────────────────────────────────
std::vector<RankedOpportunity>
prioritize(std::vector<RankedOpportunity> candidates, size_t max_count) {
  std::stable_sort(candidates.begin(), candidates.end(),
                   [](const RankedOpportunity &x, const RankedOpportunity &y) {
                     return x.analysis.net_profit_pct >
                            y.analysis.net_profit_pct;
                   });
  if (candidates.size() > max_count)
    candidates.erase(candidates.begin() + max_count, candidates.end());
  return candidates;
}

} // namespace pmarb
