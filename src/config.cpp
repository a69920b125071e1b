#include "pmarb/config.hpp"
#include <cstdlib>
#include <fstream>
#include <spdlog/fmt/fmt.h>

using json = nlohmann::json;

namespace pmarb {

template <typename T>
static void read(const json &j, const char *key, T &out) {
  if (!j.contains(key) || j[key].is_null())
    return;
  try {
    out = j[key].get<T>();
  } catch (const json::exception &e) {
    throw ConfigError(fmt::format("config key '{}': {}", key, e.what()));
  }
}

static FeeModel parseFeeModel(const std::string &name) {
  if (name == "winner_flat")
    return FeeModel::WINNER_FLAT;
  if (name == "price_bracketed")
    return FeeModel::PRICE_BRACKETED;
  if (name == "flat")
    return FeeModel::FLAT;
  throw ConfigError("unknown fee model: " + name);
}

// ── JSON → Config ────────────────────────────────────────────────────
Config loadConfig(const json &j, Config cfg) {
  if (!j.is_object())
    throw ConfigError("config root must be an object");

  read(j, "live_mode", cfg.live_mode);
  read(j, "scan_interval_s", cfg.scan_interval_s);
  read(j, "max_cycles", cfg.max_cycles);
  read(j, "log_dir", cfg.log_dir);
  read(j, "snapshot_path", cfg.snapshot_path);
  read(j, "state_path", cfg.state_path);

  if (j.contains("cost")) {
    const auto &c = j["cost"];
    read(c, "unknown_venue_fee_rate", cfg.cost.unknown_venue_fee_rate);
    read(c, "gas_units_per_leg", cfg.cost.gas_units_per_leg);
    read(c, "default_gas_price_gwei", cfg.cost.default_gas_price_gwei);
    read(c, "native_token_usd", cfg.cost.native_token_usd);
    read(c, "default_slippage_pct", cfg.cost.default_slippage_pct);
    read(c, "gas_rpc_url", cfg.cost.gas_rpc_url);

    if (c.contains("fees")) {
      for (const auto &[name, f] : c["fees"].items()) {
        Venue venue = parseVenue(name);
        if (venue == Venue::UNKNOWN)
          throw ConfigError("fee table: unknown venue " + name);
        auto &s = cfg.cost.fee_table[venue];
        std::string model;
        read(f, "model", model);
        if (!model.empty())
          s.model = parseFeeModel(model);
        read(f, "rate", s.rate);
        read(f, "low_rate", s.low_rate);
        read(f, "mid_rate", s.mid_rate);
        read(f, "bracket_low", s.bracket_low);
        read(f, "bracket_high", s.bracket_high);
      }
    }
  }

  if (j.contains("risk")) {
    const auto &r = j["risk"];
    read(r, "total_capital_usd", cfg.risk.total_capital_usd);
    read(r, "max_position_size_pct", cfg.risk.max_position_size_pct);
    read(r, "max_single_market_exposure_pct",
         cfg.risk.max_single_market_exposure_pct);
    read(r, "max_total_exposure_pct", cfg.risk.max_total_exposure_pct);
    read(r, "liquidity_fraction", cfg.risk.liquidity_fraction);
    read(r, "allocation_ttl_ms", cfg.risk.allocation_ttl_ms);
  }

  if (j.contains("executor")) {
    const auto &e = j["executor"];
    read(e, "leg_fill_timeout_ms", cfg.exec.leg_fill_timeout_ms);
    read(e, "unwind_price_buffer", cfg.exec.unwind_price_buffer);
    std::string name;
    read(e, "unhedged_policy", name);
    if (!name.empty()) {
      auto policy = parsePolicy(name);
      if (!policy)
        throw ConfigError("unknown unhedged_policy: " + name);
      cfg.exec.unhedged_policy = *policy;
    }
  }

  if (j.contains("strategy")) {
    const auto &s = j["strategy"];
    read(s, "min_deviation_pct", cfg.strategy.min_deviation_pct);
    read(s, "min_confidence", cfg.strategy.min_confidence);
    read(s, "min_spread_pct", cfg.strategy.min_spread_pct);
    read(s, "min_profit_margin_pct", cfg.strategy.min_profit_margin_pct);
    read(s, "position_size_usd", cfg.strategy.position_size_usd);
    read(s, "max_opportunities", cfg.strategy.max_opportunities);
    read(s, "max_concurrent_executions",
         cfg.strategy.max_concurrent_executions);
    read(s, "max_quote_age_ms", cfg.strategy.max_quote_age_ms);
  }

  if (j.contains("alert")) {
    read(j["alert"], "telegram_bot_token", cfg.alert.telegram_bot_token);
    read(j["alert"], "telegram_chat_id", cfg.alert.telegram_chat_id);
  }
  return cfg;
}

Config loadConfigFile(const std::string &path, Config base) {
  std::ifstream in(path);
  if (!in.is_open())
    throw ConfigError("cannot open config file " + path);
  json j;
  try {
    in >> j;
  } catch (const json::exception &e) {
    throw ConfigError(fmt::format("{}: {}", path, e.what()));
  }
  return loadConfig(j, std::move(base));
}

void applyEnv(Config &cfg) {
  if (auto *v = std::getenv("POLYGON_RPC_URL"))
    cfg.cost.gas_rpc_url = v;
  if (auto *v = std::getenv("TELEGRAM_BOT_TOKEN"))
    cfg.alert.telegram_bot_token = v;
  if (auto *v = std::getenv("TELEGRAM_CHAT_ID"))
    cfg.alert.telegram_chat_id = v;
}

// ── Validation ───────────────────────────────────────────────────────
static void requireRange(const char *name, double v, double lo, double hi) {
  if (!(v >= lo && v <= hi))
    throw ConfigError(
        fmt::format("{} = {} out of range [{}, {}]", name, v, lo, hi));
}

void validateConfig(const Config &cfg) {
  if (cfg.scan_interval_s < 0)
    throw ConfigError("scan_interval_s must be >= 0");
  if (cfg.max_cycles < 0)
    throw ConfigError("max_cycles must be >= 0");

  for (const auto &kv : cfg.cost.fee_table) {
    const auto &s = kv.second;
    requireRange("fee rate", s.rate, 0.0, 1.0);
    requireRange("fee low_rate", s.low_rate, 0.0, 1.0);
    requireRange("fee mid_rate", s.mid_rate, 0.0, 1.0);
    if (s.bracket_low > s.bracket_high)
      throw ConfigError(fmt::format("{} fee bracket is inverted",
                                    venueName(kv.first)));
  }
  requireRange("unknown_venue_fee_rate", cfg.cost.unknown_venue_fee_rate, 0.0,
               1.0);
  if (cfg.cost.gas_units_per_leg < 0)
    throw ConfigError("gas_units_per_leg must be >= 0");
  requireRange("default_gas_price_gwei", cfg.cost.default_gas_price_gwei, 0.0,
               1e6);
  requireRange("native_token_usd", cfg.cost.native_token_usd, 0.0, 1e9);
  requireRange("default_slippage_pct", cfg.cost.default_slippage_pct, 0.0,
               100.0);

  if (!(cfg.risk.total_capital_usd > 0.0))
    throw ConfigError("total_capital_usd must be > 0");
  requireRange("max_position_size_pct", cfg.risk.max_position_size_pct, 0.0,
               100.0);
  requireRange("max_single_market_exposure_pct",
               cfg.risk.max_single_market_exposure_pct, 0.0, 100.0);
  requireRange("max_total_exposure_pct", cfg.risk.max_total_exposure_pct, 0.0,
               100.0);
  requireRange("liquidity_fraction", cfg.risk.liquidity_fraction, 0.0, 1.0);
  if (cfg.risk.allocation_ttl_ms <= 0)
    throw ConfigError("allocation_ttl_ms must be > 0");

  if (cfg.exec.leg_fill_timeout_ms <= 0)
    throw ConfigError("leg_fill_timeout_ms must be > 0");
  requireRange("unwind_price_buffer", cfg.exec.unwind_price_buffer, 0.0, 1.0);

  requireRange("min_deviation_pct", cfg.strategy.min_deviation_pct, 0.0, 100.0);
  requireRange("min_confidence", cfg.strategy.min_confidence, 0.0, 1.0);
  requireRange("min_spread_pct", cfg.strategy.min_spread_pct, 0.0, 100.0);
  requireRange("min_profit_margin_pct", cfg.strategy.min_profit_margin_pct,
               -100.0, 100.0);
  if (!(cfg.strategy.position_size_usd > 0.0))
    throw ConfigError("position_size_usd must be > 0");
  if (cfg.strategy.max_opportunities < 1)
    throw ConfigError("max_opportunities must be >= 1");
  if (cfg.strategy.max_concurrent_executions < 1)
    throw ConfigError("max_concurrent_executions must be >= 1");
  if (cfg.strategy.max_quote_age_ms <= 0)
    throw ConfigError("max_quote_age_ms must be > 0");
}

} // namespace pmarb
