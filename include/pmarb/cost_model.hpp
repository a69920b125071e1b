#pragma once
#include "pmarb/common.hpp"
#include "pmarb/gas_oracle.hpp"

namespace pmarb {

struct GasEstimate {
  long gas_units = 0;
  double gas_price_gwei = 0.0;
  double gas_cost_native = 0.0; // MATIC
  double gas_cost_usd = 0.0;
  double native_token_usd = 0.0;
  bool from_oracle = false;
};

struct SlippageEstimate {
  double best_price = 0.0;
  double execution_price = 0.0; // size-weighted average of consumed levels
  double slippage_pct = 0.0;
  double slippage_usd = 0.0;
  double available_liquidity = 0.0;
  double filled = 0.0;
  bool fully_fillable = false;
  bool from_book = false; // false = conservative default was used
};

struct TransactionCosts {
  double platform_fees_usd = 0.0;
  double gas_costs_usd = 0.0;
  double slippage_costs_usd = 0.0;
  double total_costs_usd = 0.0;
  double total_costs_pct = 0.0;
};

// Venue fee, gas and slippage arithmetic. Holds only read-only state after
// construction, so one instance is shared by every concurrent evaluation.
class CostModel {
public:
  explicit CostModel(const CostConfig &config,
                     GasPriceOracle *oracle = nullptr);

  double platformFee(Venue venue, double position_size_usd,
                     std::optional<double> contract_price = std::nullopt,
                     bool is_winner = true) const;

  double gasCost(long gas_units,
                 std::optional<double> gas_price_gwei = std::nullopt) const;
  GasEstimate gasEstimate(long gas_units,
                          std::optional<double> gas_price_gwei) const;

  SlippageEstimate slippage(const std::optional<OrderBook> &book,
                            double order_size, Side side) const;

  // Size-weighted average price of `size` contracts taken from the book.
  // Returns 0 if the relevant side is empty.
  static double computeVWAP(const OrderBook &book, Side side, double size);

  const CostConfig &config() const { return config_; }

private:
  CostConfig config_;
  GasPriceOracle *oracle_;
};

} // namespace pmarb
