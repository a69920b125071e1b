#include "pmarb/ledger.hpp"
#include <Eigen/Dense>
#include <algorithm>
#include <cmath>
#include <fstream>
#include <nlohmann/json.hpp>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace pmarb {

static constexpr double kEps = 1e-9;

const char *rejectionName(RejectionReason reason) {
  switch (reason) {
  case RejectionReason::INVALID_REQUEST:
    return "INVALID_REQUEST";
  case RejectionReason::DUPLICATE_OPPORTUNITY:
    return "DUPLICATE_OPPORTUNITY";
  case RejectionReason::POSITION_SIZE_LIMIT:
    return "POSITION_SIZE_LIMIT";
  case RejectionReason::TOTAL_EXPOSURE_LIMIT:
    return "TOTAL_EXPOSURE_LIMIT";
  case RejectionReason::LIQUIDITY_LIMIT:
    return "LIQUIDITY_LIMIT";
  case RejectionReason::SINGLE_MARKET_LIMIT:
    return "SINGLE_MARKET_LIMIT";
  }
  return "UNKNOWN";
}

const char *positionStatusName(PositionStatus status) {
  switch (status) {
  case PositionStatus::PENDING:
    return "pending";
  case PositionStatus::OPEN:
    return "open";
  case PositionStatus::CLOSED:
    return "closed";
  case PositionStatus::FAILED:
    return "failed";
  }
  return "pending";
}

static std::optional<PositionStatus> parseStatus(const std::string &s) {
  if (s == "pending")
    return PositionStatus::PENDING;
  if (s == "open")
    return PositionStatus::OPEN;
  if (s == "closed")
    return PositionStatus::CLOSED;
  if (s == "failed")
    return PositionStatus::FAILED;
  return std::nullopt;
}

CapitalLedger::CapitalLedger(const RiskConfig &config)
    : config_(config), clock_([] { return std::chrono::system_clock::now(); }) {
  spdlog::info("[Ledger] Initialized (capital ${:.2f}, max position {:.1f}%, "
               "max market {:.1f}%, max total {:.1f}%)",
               config_.total_capital_usd, config_.max_position_size_pct,
               config_.max_single_market_exposure_pct,
               config_.max_total_exposure_pct);
}

void CapitalLedger::setClock(
    std::function<std::chrono::system_clock::time_point()> clock) {
  std::lock_guard<std::mutex> lock(mtx_);
  clock_ = std::move(clock);
}

// ── Internal exposure helpers (mtx_ held) ────────────────────────────
void CapitalLedger::purgeExpired(std::chrono::system_clock::time_point now) {
  for (auto it = reservations_.begin(); it != reservations_.end();) {
    if (!it->second.active && now > it->second.allocation.expires_at) {
      spdlog::info("[Ledger] Allocation for {} expired, releasing ${:.2f}",
                   it->first, it->second.allocation.approved_usd);
      it = reservations_.erase(it);
    } else {
      ++it;
    }
  }
}

double CapitalLedger::openExposure() const {
  double total = 0.0;
  for (const auto &kv : positions_)
    if (kv.second.status == PositionStatus::OPEN)
      total += kv.second.size_usd;
  return total;
}

bool CapitalLedger::live(const Reservation &r) const {
  return r.active || clock_() <= r.allocation.expires_at;
}

double CapitalLedger::reservedExposure() const {
  double total = 0.0;
  for (const auto &kv : reservations_)
    if (live(kv.second))
      total += kv.second.allocation.approved_usd;
  return total;
}

double CapitalLedger::marketExposure(const std::string &market_id) const {
  double total = 0.0;
  for (const auto &kv : positions_) {
    const auto &p = kv.second;
    if (p.status != PositionStatus::OPEN)
      continue;
    if (p.market_id == market_id || (p.market_b_id && *p.market_b_id == market_id))
      total += p.size_usd;
  }
  for (const auto &kv : reservations_) {
    if (!live(kv.second))
      continue;
    const auto &ids = kv.second.allocation.market_ids;
    if (std::find(ids.begin(), ids.end(), market_id) != ids.end())
      total += kv.second.allocation.approved_usd;
  }
  return total;
}

// ── Authorization ────────────────────────────────────────────────────
Authorization CapitalLedger::authorize(const std::string &opportunity_id,
                                       StrategyKind strategy,
                                       double requested_usd) {
  CapitalRequest req;
  req.opportunity_id = opportunity_id;
  req.strategy = strategy;
  req.requested_usd = requested_usd;
  return authorize(req);
}

Authorization CapitalLedger::authorize(const CapitalRequest &request) {
  std::lock_guard<std::mutex> lock(mtx_);
  auto now = clock_();
  purgeExpired(now);

  auto reject = [&](RejectionReason reason, double limit,
                    const std::string &detail) -> Authorization {
    spdlog::warn("[Ledger] Rejected {} (${:.2f}): {} - {}",
                 request.opportunity_id, request.requested_usd,
                 rejectionName(reason), detail);
    return Rejection{reason, detail, request.requested_usd, limit};
  };

  double capital = config_.total_capital_usd;
  double requested = request.requested_usd;

  if (request.opportunity_id.empty() || !std::isfinite(requested) ||
      requested <= 0.0)
    return reject(RejectionReason::INVALID_REQUEST, 0.0,
                  "empty opportunity id or non-positive amount");

  bool duplicate = reservations_.count(request.opportunity_id) > 0;
  for (const auto &kv : positions_) {
    if (kv.second.opportunity_id == request.opportunity_id &&
        (kv.second.status == PositionStatus::OPEN ||
         kv.second.status == PositionStatus::PENDING))
      duplicate = true;
  }
  if (duplicate)
    return reject(RejectionReason::DUPLICATE_OPPORTUNITY, 0.0,
                  "opportunity already holds capital");

  // (a) position size
  double max_position = capital * config_.max_position_size_pct / 100.0;
  if (requested > max_position + kEps)
    return reject(RejectionReason::POSITION_SIZE_LIMIT, max_position,
                  fmt::format("${:.2f} > max position ${:.2f}", requested,
                              max_position));

  // (b) total exposure, counting live reservations
  double max_total = capital * config_.max_total_exposure_pct / 100.0;
  double remaining = max_total - openExposure() - reservedExposure();
  if (requested > remaining + kEps)
    return reject(RejectionReason::TOTAL_EXPOSURE_LIMIT, std::max(remaining, 0.0),
                  fmt::format("${:.2f} > remaining capacity ${:.2f}",
                              requested, std::max(remaining, 0.0)));

  // (c) visible liquidity
  if (request.available_liquidity) {
    double cap = *request.available_liquidity * config_.liquidity_fraction;
    if (requested > cap + kEps)
      return reject(RejectionReason::LIQUIDITY_LIMIT, cap,
                    fmt::format("${:.2f} > {:.0f}% of visible depth ({:.2f})",
                                requested, config_.liquidity_fraction * 100.0,
                                *request.available_liquidity));
  }

  // (d) per-market concentration
  double max_market = capital * config_.max_single_market_exposure_pct / 100.0;
  for (const auto &m : request.market_ids) {
    double current = marketExposure(m);
    if (current + requested > max_market + kEps)
      return reject(RejectionReason::SINGLE_MARKET_LIMIT, max_market - current,
                    fmt::format("market {} at ${:.2f} + ${:.2f} > ${:.2f}", m,
                                current, requested, max_market));
  }

  CapitalAllocation alloc;
  alloc.opportunity_id = request.opportunity_id;
  alloc.strategy = request.strategy;
  alloc.market_ids = request.market_ids;
  alloc.requested_usd = requested;
  alloc.approved_usd = requested;
  alloc.allocation_pct = capital > 0 ? requested / capital * 100.0 : 0.0;
  alloc.max_allocation_usd = max_position;
  alloc.timestamp = now;
  alloc.expires_at = now + std::chrono::milliseconds(config_.allocation_ttl_ms);

  reservations_[alloc.opportunity_id] = Reservation{alloc, false, ""};

  spdlog::info("[Ledger] Allocated ${:.2f} ({:.2f}% of capital) for {}",
               requested, alloc.allocation_pct, alloc.opportunity_id);
  return alloc;
}

bool CapitalLedger::activate(const std::string &opportunity_id) {
  std::lock_guard<std::mutex> lock(mtx_);
  auto it = reservations_.find(opportunity_id);
  if (it == reservations_.end())
    return false;

  if (!it->second.active && clock_() > it->second.allocation.expires_at) {
    spdlog::warn("[Ledger] Allocation for {} expired before execution",
                 opportunity_id);
    reservations_.erase(it);
    return false;
  }
  it->second.active = true;
  if (it->second.position_id.empty()) {
    auto pos = makePosition(it->second.allocation, 0.0, Side::BUY,
                            PositionStatus::PENDING);
    pos.note = "awaiting execution";
    it->second.position_id = pos.position_id;
    positions_[pos.position_id] = pos;
    spdlog::debug("[Ledger] {} pending for {}", pos.position_id,
                  opportunity_id);
  }
  return true;
}

void CapitalLedger::release(const std::string &opportunity_id) {
  std::lock_guard<std::mutex> lock(mtx_);
  auto it = reservations_.find(opportunity_id);
  if (it == reservations_.end())
    return;
  if (!it->second.position_id.empty()) {
    auto &pos = settleReservation(it, 0.0, Side::BUY, PositionStatus::FAILED);
    pos.note = "released before execution";
  } else {
    reservations_.erase(it);
  }
  spdlog::info("[Ledger] Released allocation for {}", opportunity_id);
}

// ── Position lifecycle ───────────────────────────────────────────────
Position CapitalLedger::makePosition(const CapitalAllocation &allocation,
                                     double entry_price, Side side,
                                     PositionStatus status) {
  Position p;
  p.position_id = fmt::format("POS-{:06d}", next_position_++);
  p.opportunity_id = allocation.opportunity_id;
  if (!allocation.market_ids.empty())
    p.market_id = allocation.market_ids[0];
  if (allocation.market_ids.size() > 1 &&
      allocation.market_ids[1] != allocation.market_ids[0])
    p.market_b_id = allocation.market_ids[1];
  p.strategy = allocation.strategy;
  p.side = side;
  p.size_usd = allocation.approved_usd;
  p.entry_price = entry_price;
  p.status = status;
  p.opened_at = clock_();
  return p;
}

Position &CapitalLedger::settleReservation(
    std::map<std::string, Reservation>::iterator it, double entry_price,
    Side side, PositionStatus status) {
  std::string id = it->second.position_id;
  if (id.empty()) {
    auto pos = makePosition(it->second.allocation, entry_price, side, status);
    id = pos.position_id;
    positions_[id] = pos;
  }
  reservations_.erase(it);

  auto &pos = positions_.at(id);
  pos.entry_price = entry_price;
  pos.side = side;
  pos.status = status;
  pos.opened_at = clock_();
  if (status != PositionStatus::OPEN)
    pos.closed_at = pos.opened_at;
  return pos;
}

Position CapitalLedger::recordOpen(const CapitalAllocation &allocation,
                                   double entry_price, Side side,
                                   const std::string &note) {
  std::lock_guard<std::mutex> lock(mtx_);
  auto it = reservations_.find(allocation.opportunity_id);
  if (it == reservations_.end())
    throw LedgerError("no live allocation for " + allocation.opportunity_id);
  if (!it->second.active && clock_() > it->second.allocation.expires_at) {
    reservations_.erase(it);
    throw LedgerError("allocation expired for " + allocation.opportunity_id);
  }

  auto &pos = settleReservation(it, entry_price, side, PositionStatus::OPEN);
  pos.note = note;

  spdlog::info("[Ledger] Position opened: {} | {} | {} ${:.2f} @ {:.4f}",
               pos.position_id, strategyName(pos.strategy), sideName(side),
               pos.size_usd, entry_price);
  return pos;
}

Position CapitalLedger::recordAbort(const CapitalAllocation &allocation,
                                    const std::string &reason) {
  std::lock_guard<std::mutex> lock(mtx_);
  auto it = reservations_.find(allocation.opportunity_id);
  Position *pos;
  if (it != reservations_.end()) {
    pos = &settleReservation(it, 0.0, Side::BUY, PositionStatus::FAILED);
  } else {
    auto p = makePosition(allocation, 0.0, Side::BUY, PositionStatus::FAILED);
    p.closed_at = p.opened_at;
    pos = &(positions_[p.position_id] = p);
  }
  pos->note = reason;

  spdlog::info("[Ledger] {} aborted cleanly, ${:.2f} released ({})",
               allocation.opportunity_id, allocation.approved_usd, reason);
  return *pos;
}

Position CapitalLedger::recordHedged(const CapitalAllocation &allocation,
                                     double entry_price, double exit_price,
                                     Side side, double realized_pnl_usd,
                                     double fees_paid_usd,
                                     const std::string &note) {
  std::lock_guard<std::mutex> lock(mtx_);
  auto it = reservations_.find(allocation.opportunity_id);
  if (it == reservations_.end())
    throw LedgerError("no live allocation for " + allocation.opportunity_id);
  if (!it->second.active && clock_() > it->second.allocation.expires_at) {
    reservations_.erase(it);
    throw LedgerError("allocation expired for " + allocation.opportunity_id);
  }

  auto &pos = settleReservation(it, entry_price, side, PositionStatus::CLOSED);
  pos.exit_price = exit_price;
  pos.fees_paid_usd = fees_paid_usd;
  pos.pnl_usd = realized_pnl_usd - fees_paid_usd;
  pos.pnl_pct = pos.size_usd > 0.0 ? pos.pnl_usd / pos.size_usd * 100.0 : 0.0;
  pos.note = note;

  pnl_history_.push_back(
      {pos.position_id, pos.strategy, pos.pnl_usd, pos.pnl_pct, *pos.closed_at});

  spdlog::info("[Ledger] Position hedged and closed: {} | {} | PnL ${:.2f} "
               "({:.2f}%)",
               pos.position_id, strategyName(pos.strategy), pos.pnl_usd,
               pos.pnl_pct);
  return pos;
}

Position CapitalLedger::recordClose(const std::string &position_id,
                                    double exit_price, double fees_paid_usd) {
  std::lock_guard<std::mutex> lock(mtx_);
  auto it = positions_.find(position_id);
  if (it == positions_.end())
    throw LedgerError("position not found: " + position_id);

  auto &pos = it->second;
  if (pos.status != PositionStatus::OPEN)
    throw LedgerError(fmt::format("position {} is not open (status: {})",
                                  position_id, positionStatusName(pos.status)));

  double pnl_pct = 0.0;
  if (pos.entry_price > 0.0) {
    pnl_pct = pos.side == Side::BUY
                  ? (exit_price - pos.entry_price) / pos.entry_price * 100.0
                  : (pos.entry_price - exit_price) / pos.entry_price * 100.0;
  }

  pos.exit_price = exit_price;
  pos.status = PositionStatus::CLOSED;
  pos.closed_at = clock_();
  pos.pnl_pct = pnl_pct;
  pos.pnl_usd = pnl_pct / 100.0 * pos.size_usd - fees_paid_usd;
  pos.fees_paid_usd = fees_paid_usd;

  pnl_history_.push_back(
      {pos.position_id, pos.strategy, pos.pnl_usd, pos.pnl_pct, *pos.closed_at});

  spdlog::info("[Ledger] Position closed: {} | PnL ${:.2f} ({:.2f}%)",
               position_id, pos.pnl_usd, pos.pnl_pct);
  return pos;
}

// ── Sizing ───────────────────────────────────────────────────────────
double CapitalLedger::positionSize(std::optional<double> available_liquidity,
                                   std::optional<double> max_allocation_usd) {
  std::lock_guard<std::mutex> lock(mtx_);
  purgeExpired(clock_());

  double size = config_.total_capital_usd * config_.max_position_size_pct / 100.0;
  if (max_allocation_usd)
    size = std::min(size, *max_allocation_usd);
  if (available_liquidity)
    size = std::min(size, *available_liquidity * config_.liquidity_fraction);

  double remaining =
      config_.total_capital_usd * config_.max_total_exposure_pct / 100.0 -
      openExposure() - reservedExposure();
  if (remaining <= 0.0) {
    spdlog::warn("[Ledger] No remaining exposure capacity");
    return 0.0;
  }
  return std::max(0.0, std::min(size, remaining));
}

// ── Read views ───────────────────────────────────────────────────────
ExposureMetrics CapitalLedger::exposure() const {
  std::lock_guard<std::mutex> lock(mtx_);
  ExposureMetrics m;

  for (const auto &kv : positions_) {
    const auto &p = kv.second;
    if (p.status != PositionStatus::OPEN)
      continue;
    m.total_exposure_usd += p.size_usd;
    m.exposure_by_market[p.market_id] += p.size_usd;
    if (p.market_b_id)
      m.exposure_by_market[*p.market_b_id] += p.size_usd;
    m.exposure_by_strategy[strategyName(p.strategy)] += p.size_usd;
  }
  m.reserved_usd = reservedExposure();

  for (const auto &kv : m.exposure_by_market) {
    if (kv.second > m.max_single_market_exposure) {
      m.max_single_market_exposure = kv.second;
      m.max_single_market = kv.first;
    }
  }
  if (config_.total_capital_usd > 0)
    m.max_single_market_exposure_pct =
        m.max_single_market_exposure / config_.total_capital_usd * 100.0;

  if (!m.exposure_by_market.empty()) {
    Eigen::VectorXd exposures(m.exposure_by_market.size());
    Eigen::Index i = 0;
    for (const auto &kv : m.exposure_by_market)
      exposures[i++] = kv.second;
    double sum = exposures.sum();
    if (sum > 0.0) {
      // Herfindahl-Hirschman index over per-market shares
      double hhi = (exposures / sum).squaredNorm();
      m.diversification_score = 1.0 - hhi;
    }
  }
  return m;
}

PnlSummary CapitalLedger::pnlSummary(const PnlFilter &filter) const {
  std::lock_guard<std::mutex> lock(mtx_);
  PnlSummary s;
  if (filter.strategy)
    s.strategy = strategyName(*filter.strategy);

  std::vector<double> pnls;
  for (const auto &r : pnl_history_) {
    if (filter.strategy && r.strategy != *filter.strategy)
      continue;
    if (filter.from && r.timestamp < *filter.from)
      continue;
    if (filter.to && r.timestamp > *filter.to)
      continue;
    pnls.push_back(r.pnl_usd);
  }

  s.total_trades = static_cast<int>(pnls.size());
  if (pnls.empty())
    return s;

  Eigen::Map<const Eigen::VectorXd> v(pnls.data(),
                                      static_cast<Eigen::Index>(pnls.size()));
  s.total_pnl_usd = v.sum();
  s.avg_pnl_usd = v.mean();
  s.winning_trades = static_cast<int>((v.array() > 0.0).count());
  s.losing_trades = s.total_trades - s.winning_trades;
  s.win_rate_pct = 100.0 * s.winning_trades / s.total_trades;
  if (pnls.size() > 1) {
    double var = (v.array() - s.avg_pnl_usd).square().sum() /
                 static_cast<double>(pnls.size() - 1);
    s.pnl_stddev_usd = std::sqrt(var);
  }
  return s;
}

std::optional<Position>
CapitalLedger::position(const std::string &position_id) const {
  std::lock_guard<std::mutex> lock(mtx_);
  auto it = positions_.find(position_id);
  if (it == positions_.end())
    return std::nullopt;
  return it->second;
}

std::vector<Position> CapitalLedger::positions() const {
  std::lock_guard<std::mutex> lock(mtx_);
  std::vector<Position> out;
  out.reserve(positions_.size());
  for (const auto &kv : positions_)
    out.push_back(kv.second);
  return out;
}

// ── Persistence ──────────────────────────────────────────────────────
static json positionToJson(const Position &p) {
  json j = {{"position_id", p.position_id},
            {"opportunity_id", p.opportunity_id},
            {"market_id", p.market_id},
            {"strategy", strategyName(p.strategy)},
            {"side", sideName(p.side)},
            {"size_usd", p.size_usd},
            {"entry_price", p.entry_price},
            {"status", positionStatusName(p.status)},
            {"opened_at_ms", epoch_ms(p.opened_at)},
            {"pnl_usd", p.pnl_usd},
            {"pnl_pct", p.pnl_pct},
            {"fees_paid_usd", p.fees_paid_usd},
            {"note", p.note}};
  j["market_b_id"] = p.market_b_id ? json(*p.market_b_id) : json(nullptr);
  j["exit_price"] = p.exit_price ? json(*p.exit_price) : json(nullptr);
  j["closed_at_ms"] = p.closed_at ? json(epoch_ms(*p.closed_at)) : json(nullptr);
  return j;
}

static Position positionFromJson(const json &j) {
  Position p;
  p.position_id = j.at("position_id").get<std::string>();
  p.opportunity_id = j.value("opportunity_id", "");
  p.market_id = j.at("market_id").get<std::string>();
  if (j.contains("market_b_id") && j["market_b_id"].is_string())
    p.market_b_id = j["market_b_id"].get<std::string>();
  p.strategy = j.value("strategy", "") == "combinatorial"
                   ? StrategyKind::COMBINATORIAL
                   : StrategyKind::REBALANCING;
  p.side = j.value("side", "BUY") == "SELL" ? Side::SELL : Side::BUY;
  p.size_usd = j.at("size_usd").get<double>();
  p.entry_price = j.at("entry_price").get<double>();
  if (j.contains("exit_price") && j["exit_price"].is_number())
    p.exit_price = j["exit_price"].get<double>();

  auto status = parseStatus(j.value("status", ""));
  if (!status)
    throw LedgerError("invalid position status in state for " + p.position_id);
  p.status = *status;

  p.opened_at = from_epoch_ms(j.at("opened_at_ms").get<long long>());
  if (j.contains("closed_at_ms") && j["closed_at_ms"].is_number())
    p.closed_at = from_epoch_ms(j["closed_at_ms"].get<long long>());
  p.pnl_usd = j.value("pnl_usd", 0.0);
  p.pnl_pct = j.value("pnl_pct", 0.0);
  p.fees_paid_usd = j.value("fees_paid_usd", 0.0);
  p.note = j.value("note", "");
  return p;
}

void CapitalLedger::saveState(const std::string &path) const {
  std::lock_guard<std::mutex> lock(mtx_);
  json state;
  state["total_capital_usd"] = config_.total_capital_usd;
  state["next_position"] = next_position_;

  state["positions"] = json::array();
  for (const auto &kv : positions_)
    state["positions"].push_back(positionToJson(kv.second));

  state["pnl_history"] = json::array();
  for (const auto &r : pnl_history_) {
    state["pnl_history"].push_back({{"position_id", r.position_id},
                                    {"strategy", strategyName(r.strategy)},
                                    {"pnl_usd", r.pnl_usd},
                                    {"pnl_pct", r.pnl_pct},
                                    {"timestamp_ms", epoch_ms(r.timestamp)}});
  }

  std::ofstream out(path, std::ios::trunc);
  if (!out.is_open())
    throw LedgerError("cannot write ledger state to " + path);
  out << state.dump(2);
  spdlog::info("[Ledger] State saved to {}", path);
}

void CapitalLedger::loadState(const std::string &path) {
  std::ifstream in(path);
  if (!in.is_open())
    throw LedgerError("cannot read ledger state from " + path);

  json state;
  try {
    in >> state;
  } catch (const json::exception &e) {
    throw LedgerError(std::string("corrupt ledger state: ") + e.what());
  }

  std::map<std::string, Position> positions;
  std::vector<PnlRecord> history;
  try {
    for (const auto &j : state.at("positions")) {
      auto p = positionFromJson(j);
      positions[p.position_id] = p;
    }
    for (const auto &j : state.at("pnl_history")) {
      history.push_back(
          {j.at("position_id").get<std::string>(),
           j.value("strategy", "") == "combinatorial"
               ? StrategyKind::COMBINATORIAL
               : StrategyKind::REBALANCING,
           j.at("pnl_usd").get<double>(), j.value("pnl_pct", 0.0),
           from_epoch_ms(j.at("timestamp_ms").get<long long>())});
    }
  } catch (const json::exception &e) {
    throw LedgerError(std::string("corrupt ledger state: ") + e.what());
  }

  std::lock_guard<std::mutex> lock(mtx_);
  double saved_capital = state.value("total_capital_usd", config_.total_capital_usd);
  if (std::abs(saved_capital - config_.total_capital_usd) > kEps)
    spdlog::warn("[Ledger] State capital ${:.2f} differs from configured "
                 "${:.2f}; using configured value",
                 saved_capital, config_.total_capital_usd);

  // No reservation survives a restart, so a pending position never ran
  for (auto &kv : positions) {
    auto &p = kv.second;
    if (p.status != PositionStatus::PENDING)
      continue;
    spdlog::warn("[Ledger] {} was pending at save time, marking failed",
                 p.position_id);
    p.status = PositionStatus::FAILED;
    p.closed_at = p.opened_at;
    p.note = "interrupted before execution";
  }

  positions_ = std::move(positions);
  pnl_history_ = std::move(history);
  reservations_.clear();
  next_position_ = std::max<long>(state.value("next_position", 1L),
                                  static_cast<long>(positions_.size()) + 1);
  spdlog::info("[Ledger] Loaded {} positions, {} PnL records from {}",
               positions_.size(), pnl_history_.size(), path);
}

} // namespace pmarb
