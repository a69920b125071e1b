#pragma once
#include "pmarb/alerter.hpp"
#include "pmarb/venue_adapter.hpp"
#include <mutex>
#include <set>
#include <utility>

namespace pmarb {

enum class ExecutionState {
  CREATED,
  LEG1_SUBMITTED,
  LEG1_FILLED,
  LEG2_SUBMITTED,
  COMPLETE,
  LEG1_TIMED_OUT,
  LEG1_FAILED,
  LEG2_FAILED_UNHEDGED
};

const char *executionStateName(ExecutionState state);

struct LegRequest {
  Order order;
  std::optional<double> visible_liquidity; // unknown counts as least liquid
};

struct StateTransition {
  ExecutionState from;
  ExecutionState to;
  std::string note;
  std::chrono::system_clock::time_point at;
};

struct ExecutionReport {
  std::string execution_id;
  ExecutionState state = ExecutionState::CREATED;
  Order leg1; // submitted first
  Order leg2;
  std::vector<StateTransition> transitions;
  std::optional<double> realized_pnl_usd; // set on COMPLETE only

  bool cancel_attempted = false;
  bool cancel_succeeded = false;
  bool unwind_attempted = false;
  bool unwind_filled = false;
  std::optional<Order> unwind_order;

  std::string detail;

  bool complete() const { return state == ExecutionState::COMPLETE; }
  bool unhedged() const {
    return state == ExecutionState::LEG2_FAILED_UNHEDGED;
  }
};

class AtomicExecutor;

// One two-leg attempt. run() may be called exactly once, and each order id
// gets a single awaitFill, so a venue repeating a fill is never consumed twice
// and leg2 is submitted at most once.
class TwoLegExecution {
public:
  TwoLegExecution(AtomicExecutor &executor, std::string execution_id,
                  LegRequest a, LegRequest b);

  ExecutionReport run();
  const ExecutionReport &report() const { return report_; }

private:
  AtomicExecutor &executor_;
  LegRequest first_;
  LegRequest second_;
  ExecutionReport report_;
  bool started_ = false;

  void transition(ExecutionState to, const std::string &note);
  std::optional<std::string> submitLeg(Order &order);
  FillStatus awaitLeg(Order &order);
  void cancelLeg(const Order &order);
  void handleUnhedged(const std::string &detail);
  void unwind();
};

class AtomicExecutor {
public:
  AtomicExecutor(const ExecutorConfig &config, VenueRouter &router,
                 Alerter *alerter = nullptr);

  ExecutionReport execute(const std::string &execution_id,
                          const LegRequest &a, const LegRequest &b);

  // Less liquid leg first; ties keep the given order
  static std::pair<LegRequest, LegRequest> orderLegs(const LegRequest &a,
                                                     const LegRequest &b);

  // Locked-in spread of a fully filled pair
  static double realizedPnl(const Order &leg1, const Order &leg2);

private:
  friend class TwoLegExecution;

  ExecutorConfig config_;
  VenueRouter &router_;
  Alerter *alerter_;
  std::mutex ids_mtx_;
  std::set<std::string> used_order_ids_;

  // False if the venue handed back an id already used by any execution
  bool claimOrderId(const std::string &order_id);
};

} // namespace pmarb
