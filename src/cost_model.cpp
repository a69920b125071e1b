#include "pmarb/cost_model.hpp"
#include <algorithm>
#include <cmath>
#include <spdlog/spdlog.h>

namespace pmarb {

CostModel::CostModel(const CostConfig &config, GasPriceOracle *oracle)
    : config_(config), oracle_(oracle) {}

// ── Platform fees ────────────────────────────────────────────────────
double CostModel::platformFee(Venue venue, double position_size_usd,
                              std::optional<double> contract_price,
                              bool is_winner) const {
  if (position_size_usd <= 0.0)
    return 0.0;

  auto it = config_.fee_table.find(venue);
  if (it == config_.fee_table.end()) {
    spdlog::warn("[Cost] Unknown venue '{}', assuming {:.2f}% fee",
                 venueName(venue), config_.unknown_venue_fee_rate * 100.0);
    return position_size_usd * config_.unknown_venue_fee_rate;
  }

  const auto &s = it->second;
  switch (s.model) {
  case FeeModel::WINNER_FLAT:
    // Charged on winnings only
    return is_winner ? position_size_usd * s.rate : 0.0;

  case FeeModel::PRICE_BRACKETED: {
    double price = contract_price.value_or(0.5);
    double rate = (price < s.bracket_low || price > s.bracket_high)
                      ? s.low_rate
                      : s.mid_rate;
    return position_size_usd * rate;
  }

  case FeeModel::FLAT:
    return position_size_usd * s.rate;
  }
  return position_size_usd * config_.unknown_venue_fee_rate;
}

// ── Gas ──────────────────────────────────────────────────────────────
GasEstimate CostModel::gasEstimate(long gas_units,
                                   std::optional<double> gas_price_gwei) const {
  GasEstimate est;
  est.gas_units = gas_units;

  if (!gas_price_gwei && oracle_) {
    gas_price_gwei = oracle_->gasPriceGwei();
    est.from_oracle = gas_price_gwei.has_value();
  }
  est.gas_price_gwei = gas_price_gwei.value_or(config_.default_gas_price_gwei);

  std::optional<double> token_usd;
  if (oracle_)
    token_usd = oracle_->nativeTokenUsd();
  est.native_token_usd = token_usd.value_or(config_.native_token_usd);

  double cost_wei = static_cast<double>(gas_units) * est.gas_price_gwei * 1e9;
  est.gas_cost_native = cost_wei / 1e18;
  est.gas_cost_usd = est.gas_cost_native * est.native_token_usd;
  return est;
}

double CostModel::gasCost(long gas_units,
                          std::optional<double> gas_price_gwei) const {
  return gasEstimate(gas_units, gas_price_gwei).gas_cost_usd;
}

// ── VWAP calculation ─────────────────────────────────────────────────
double CostModel::computeVWAP(const OrderBook &book, Side side, double size) {
  const auto &levels = (side == Side::BUY) ? book.asks : book.bids;

  if (levels.empty())
    return 0.0;

  double remaining = size;
  double total_cost = 0.0;
  double total_filled = 0.0;

  for (auto &level : levels) {
    double fill = std::min(remaining, level.size);
    total_cost += fill * level.price;
    total_filled += fill;
    remaining -= fill;

    if (remaining <= 0)
      break;
  }

  if (total_filled == 0.0)
    return 0.0;
  return total_cost / total_filled;
}

// ── Slippage estimation ──────────────────────────────────────────────
SlippageEstimate CostModel::slippage(const std::optional<OrderBook> &book,
                                     double order_size, Side side) const {
  SlippageEstimate est;

  std::vector<OrderBookLevel> levels;
  if (book) {
    for (const auto &l : (side == Side::BUY ? book->asks : book->bids)) {
      if (l.size > 0.0 && l.price > 0.0)
        levels.push_back(l);
    }
  }

  if (levels.empty()) {
    // No depth data is never zero slippage
    double pct = config_.default_slippage_pct;
    est.best_price = 0.5;
    est.execution_price =
        side == Side::BUY ? 0.5 * (1.0 + pct / 100.0) : 0.5 * (1.0 - pct / 100.0);
    est.slippage_pct = pct;
    est.slippage_usd = std::max(order_size, 0.0) * pct / 100.0;
    return est;
  }

  // Best price first: asks ascending, bids descending
  if (side == Side::BUY)
    std::sort(levels.begin(), levels.end(),
              [](auto &a, auto &b) { return a.price < b.price; });
  else
    std::sort(levels.begin(), levels.end(),
              [](auto &a, auto &b) { return a.price > b.price; });

  OrderBook sorted;
  (side == Side::BUY ? sorted.asks : sorted.bids) = levels;

  est.from_book = true;
  est.best_price = levels.front().price;
  for (const auto &l : levels)
    est.available_liquidity += l.size;

  if (order_size <= 0.0) {
    est.execution_price = est.best_price;
    est.fully_fillable = true;
    return est;
  }

  est.execution_price = computeVWAP(sorted, side, order_size);
  est.filled = std::min(order_size, est.available_liquidity);
  est.fully_fillable = est.available_liquidity >= order_size;

  double diff = std::abs(est.execution_price - est.best_price);
  est.slippage_pct = diff / est.best_price * 100.0;
  est.slippage_usd = diff * order_size;

  spdlog::debug("[Cost] Slippage {} {:.2f}: best={:.4f} exec={:.4f} "
                "({:.3f}%, ${:.4f})",
                sideName(side), order_size, est.best_price,
                est.execution_price, est.slippage_pct, est.slippage_usd);
  return est;
}

} // namespace pmarb
