#pragma once
#include "pmarb/common.hpp"
#include <functional>
#include <map>
#include <mutex>
#include <stdexcept>
#include <variant>

namespace pmarb {

class LedgerError : public std::runtime_error {
public:
  explicit LedgerError(const std::string &msg) : std::runtime_error(msg) {}
};

// ── Capital authorization ────────────────────────────────────────────
struct CapitalRequest {
  std::string opportunity_id;
  StrategyKind strategy = StrategyKind::REBALANCING;
  double requested_usd = 0.0;
  std::vector<std::string> market_ids;
  std::optional<double> available_liquidity; // contracts visible in the book
};

struct CapitalAllocation {
  std::string opportunity_id;
  StrategyKind strategy = StrategyKind::REBALANCING;
  std::vector<std::string> market_ids;
  double requested_usd = 0.0;
  double approved_usd = 0.0;
  double allocation_pct = 0.0; // of total capital
  double max_allocation_usd = 0.0;
  std::chrono::system_clock::time_point timestamp;
  std::chrono::system_clock::time_point expires_at;
};

enum class RejectionReason {
  INVALID_REQUEST,
  DUPLICATE_OPPORTUNITY,
  POSITION_SIZE_LIMIT,
  TOTAL_EXPOSURE_LIMIT,
  LIQUIDITY_LIMIT,
  SINGLE_MARKET_LIMIT
};

const char *rejectionName(RejectionReason reason);

struct Rejection {
  RejectionReason reason = RejectionReason::INVALID_REQUEST;
  std::string detail;
  double requested_usd = 0.0;
  double limit_usd = 0.0;
};

using Authorization = std::variant<CapitalAllocation, Rejection>;

// ── Positions ────────────────────────────────────────────────────────
enum class PositionStatus { PENDING, OPEN, CLOSED, FAILED };

const char *positionStatusName(PositionStatus status);

struct Position {
  std::string position_id;
  std::string opportunity_id;
  std::string market_id;
  std::optional<std::string> market_b_id; // combinatorial second market
  StrategyKind strategy = StrategyKind::REBALANCING;
  Side side = Side::BUY;
  double size_usd = 0.0;
  double entry_price = 0.0;
  std::optional<double> exit_price;
  PositionStatus status = PositionStatus::PENDING;
  std::chrono::system_clock::time_point opened_at;
  std::optional<std::chrono::system_clock::time_point> closed_at;
  double pnl_usd = 0.0;
  double pnl_pct = 0.0;
  double fees_paid_usd = 0.0;
  std::string note;
};

struct PnlRecord {
  std::string position_id;
  StrategyKind strategy;
  double pnl_usd;
  double pnl_pct;
  std::chrono::system_clock::time_point timestamp;
};

struct ExposureMetrics {
  double total_exposure_usd = 0.0;
  double reserved_usd = 0.0; // authorized, not yet open
  std::map<std::string, double> exposure_by_market;
  std::map<std::string, double> exposure_by_strategy;
  std::string max_single_market;
  double max_single_market_exposure = 0.0;
  double max_single_market_exposure_pct = 0.0;
  double diversification_score = 1.0; // 1 - HHI
};

struct PnlFilter {
  std::optional<StrategyKind> strategy;
  std::optional<std::chrono::system_clock::time_point> from;
  std::optional<std::chrono::system_clock::time_point> to;
};

struct PnlSummary {
  double total_pnl_usd = 0.0;
  int total_trades = 0;
  int winning_trades = 0;
  int losing_trades = 0;
  double win_rate_pct = 0.0;
  double avg_pnl_usd = 0.0;
  double pnl_stddev_usd = 0.0;
  std::string strategy = "all";
};

// Single writer for all capital state. Every mutating call takes the same
// mutex so exposure checks and the writes they guard are atomic.
class CapitalLedger {
public:
  explicit CapitalLedger(const RiskConfig &config);

  Authorization authorize(const CapitalRequest &request);
  Authorization authorize(const std::string &opportunity_id,
                          StrategyKind strategy, double requested_usd);

  // Pins an unexpired allocation for execution and records its pending
  // position. False if missing/expired.
  bool activate(const std::string &opportunity_id);
  void release(const std::string &opportunity_id);

  Position recordOpen(const CapitalAllocation &allocation, double entry_price,
                      Side side, const std::string &note = "");
  Position recordAbort(const CapitalAllocation &allocation,
                       const std::string &reason);
  // Both legs filled: the spread is locked in, so the position goes straight
  // to closed with pnl = realized spread - fees.
  Position recordHedged(const CapitalAllocation &allocation, double entry_price,
                        double exit_price, Side side, double realized_pnl_usd,
                        double fees_paid_usd = 0.0,
                        const std::string &note = "");
  Position recordClose(const std::string &position_id, double exit_price,
                       double fees_paid_usd = 0.0);

  double positionSize(std::optional<double> available_liquidity = std::nullopt,
                      std::optional<double> max_allocation_usd = std::nullopt);

  ExposureMetrics exposure() const;
  PnlSummary pnlSummary(const PnlFilter &filter = {}) const;
  std::optional<Position> position(const std::string &position_id) const;
  std::vector<Position> positions() const;

  void saveState(const std::string &path) const;
  void loadState(const std::string &path);

  // Test hook: overrides the clock used for allocation expiry
  void setClock(std::function<std::chrono::system_clock::time_point()> clock);

private:
  struct Reservation {
    CapitalAllocation allocation;
    bool active = false; // pinned by activate(), no longer expires
    std::string position_id; // pending position created by activate()
  };

  RiskConfig config_;
  mutable std::mutex mtx_;
  std::map<std::string, Position> positions_;
  std::map<std::string, Reservation> reservations_;
  std::vector<PnlRecord> pnl_history_;
  long next_position_ = 1;
  std::function<std::chrono::system_clock::time_point()> clock_;

  // Callers hold mtx_
  void purgeExpired(std::chrono::system_clock::time_point now);
  bool live(const Reservation &r) const;
  double openExposure() const;
  double reservedExposure() const;
  double marketExposure(const std::string &market_id) const;
  Position makePosition(const CapitalAllocation &allocation,
                        double entry_price, Side side, PositionStatus status);
  // Moves the reservation's pending position (or a new one) into `status`
  // and drops the reservation.
  Position &settleReservation(std::map<std::string, Reservation>::iterator it,
                              double entry_price, Side side,
                              PositionStatus status);
};

} // namespace pmarb
