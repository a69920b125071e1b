#include "pmarb/atomic_executor.hpp"
#include <algorithm>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace pmarb {

const char *executionStateName(ExecutionState state) {
  switch (state) {
  case ExecutionState::CREATED:
    return "Created";
  case ExecutionState::LEG1_SUBMITTED:
    return "Leg1Submitted";
  case ExecutionState::LEG1_FILLED:
    return "Leg1Filled";
  case ExecutionState::LEG2_SUBMITTED:
    return "Leg2Submitted";
  case ExecutionState::COMPLETE:
    return "Complete";
  case ExecutionState::LEG1_TIMED_OUT:
    return "Leg1TimedOut";
  case ExecutionState::LEG1_FAILED:
    return "Leg1Failed";
  case ExecutionState::LEG2_FAILED_UNHEDGED:
    return "Leg2FailedUnhedged";
  }
  return "Unknown";
}

// ── Executor ─────────────────────────────────────────────────────────
AtomicExecutor::AtomicExecutor(const ExecutorConfig &config,
                               VenueRouter &router, Alerter *alerter)
    : config_(config), router_(router), alerter_(alerter) {}

std::pair<LegRequest, LegRequest>
AtomicExecutor::orderLegs(const LegRequest &a, const LegRequest &b) {
  if (!a.visible_liquidity)
    return {a, b};
  if (!b.visible_liquidity)
    return {b, a};
  if (*b.visible_liquidity < *a.visible_liquidity)
    return {b, a};
  return {a, b};
}

double AtomicExecutor::realizedPnl(const Order &leg1, const Order &leg2) {
  double size = std::min(leg1.filled_size, leg2.filled_size);
  if (leg1.side == Side::BUY && leg2.side == Side::BUY)
    return (1.0 - leg1.price - leg2.price) * size;
  if (leg1.side == Side::SELL && leg2.side == Side::SELL)
    return (leg1.price + leg2.price - 1.0) * size;

  const Order &sell = leg1.side == Side::SELL ? leg1 : leg2;
  const Order &buy = leg1.side == Side::BUY ? leg1 : leg2;
  return (sell.price - buy.price) * size;
}

bool AtomicExecutor::claimOrderId(const std::string &order_id) {
  std::lock_guard<std::mutex> lock(ids_mtx_);
  return used_order_ids_.insert(order_id).second;
}

ExecutionReport AtomicExecutor::execute(const std::string &execution_id,
                                        const LegRequest &a,
                                        const LegRequest &b) {
  TwoLegExecution exec(*this, execution_id, a, b);
  return exec.run();
}

// ── Two-leg state machine ────────────────────────────────────────────
TwoLegExecution::TwoLegExecution(AtomicExecutor &executor,
                                 std::string execution_id, LegRequest a,
                                 LegRequest b)
    : executor_(executor) {
  auto ordered = AtomicExecutor::orderLegs(a, b);
  first_ = std::move(ordered.first);
  second_ = std::move(ordered.second);
  report_.execution_id = std::move(execution_id);
  report_.leg1 = first_.order;
  report_.leg2 = second_.order;
}

void TwoLegExecution::transition(ExecutionState to, const std::string &note) {
  report_.transitions.push_back(
      {report_.state, to, note, std::chrono::system_clock::now()});
  spdlog::debug("[Exec] {}: {} → {} {}", report_.execution_id,
                executionStateName(report_.state), executionStateName(to),
                note);
  report_.state = to;
}

std::optional<std::string> TwoLegExecution::submitLeg(Order &order) {
  std::optional<std::string> id;
  try {
    id = executor_.router_.at(order.venue).submit(order);
  } catch (const std::exception &e) {
    spdlog::error("[Exec] {}: submit on {} threw: {}", report_.execution_id,
                  venueName(order.venue), e.what());
    id.reset();
  }

  if (!id) {
    order.status = OrderStatus::FAILED;
    return std::nullopt;
  }
  if (!executor_.claimOrderId(*id)) {
    spdlog::error("[Exec] {}: venue returned already-used order id {}",
                  report_.execution_id, *id);
    order.status = OrderStatus::FAILED;
    return std::nullopt;
  }

  order.order_id = *id;
  order.status = OrderStatus::SUBMITTED;
  return id;
}

FillStatus TwoLegExecution::awaitLeg(Order &order) {
  auto timeout = std::chrono::milliseconds(executor_.config_.leg_fill_timeout_ms);
  FillStatus status;
  try {
    status = executor_.router_.at(order.venue).awaitFill(order.order_id, timeout);
  } catch (const std::exception &e) {
    spdlog::error("[Exec] {}: awaitFill {} threw: {}", report_.execution_id,
                  order.order_id, e.what());
    status = FillStatus::REJECTED;
  }

  spdlog::debug("[Exec] {}: {} → {}", report_.execution_id, order.order_id,
                fillStatusName(status));
  if (status == FillStatus::FILLED) {
    order.status = OrderStatus::FILLED;
    order.filled_size = order.size;
  } else if (status == FillStatus::REJECTED) {
    order.status = OrderStatus::FAILED;
  }
  return status;
}

void TwoLegExecution::cancelLeg(const Order &order) {
  report_.cancel_attempted = true;
  try {
    report_.cancel_succeeded =
        executor_.router_.at(order.venue).cancel(order.order_id);
  } catch (const std::exception &e) {
    spdlog::warn("[Exec] {}: cancel {} threw: {}", report_.execution_id,
                 order.order_id, e.what());
    report_.cancel_succeeded = false;
  }
  if (!report_.cancel_succeeded)
    spdlog::warn("[Exec] {}: cancel of {} failed", report_.execution_id,
                 order.order_id);
}

ExecutionReport TwoLegExecution::run() {
  if (started_)
    throw std::logic_error("execution " + report_.execution_id +
                           " already ran");
  started_ = true;

  auto &leg1 = report_.leg1;
  auto &leg2 = report_.leg2;

  spdlog::info("[Exec] {}: leg1 {} {} {} @ {:.3f} x {:.2f} on {}, then {} "
               "{} {} @ {:.3f}",
               report_.execution_id, sideName(leg1.side), leg1.market_id,
               leg1.outcome, leg1.price, leg1.size, venueName(leg1.venue),
               sideName(leg2.side), leg2.market_id, leg2.outcome, leg2.price);

  // ── Leg 1 ──
  if (!submitLeg(leg1)) {
    report_.detail = "leg1 submit rejected";
    transition(ExecutionState::LEG1_FAILED, report_.detail);
    if (executor_.alerter_)
      executor_.alerter_->executionAborted(report_.execution_id,
                                           report_.detail);
    return report_;
  }
  transition(ExecutionState::LEG1_SUBMITTED, leg1.order_id);

  auto fill1 = awaitLeg(leg1);
  if (fill1 == FillStatus::TIMED_OUT) {
    cancelLeg(leg1);
    if (report_.cancel_succeeded)
      leg1.status = OrderStatus::CANCELLED;
    report_.detail = fmt::format("leg1 not filled within {} ms",
                                 executor_.config_.leg_fill_timeout_ms);
    transition(ExecutionState::LEG1_TIMED_OUT, report_.detail);
    spdlog::info("[Exec] {}: {}, aborted with no exposure",
                 report_.execution_id, report_.detail);
    if (executor_.alerter_)
      executor_.alerter_->executionAborted(report_.execution_id,
                                           report_.detail);
    return report_;
  }
  if (fill1 == FillStatus::REJECTED) {
    report_.detail = "leg1 fill rejected";
    transition(ExecutionState::LEG1_FAILED, report_.detail);
    spdlog::info("[Exec] {}: {}, aborted with no exposure",
                 report_.execution_id, report_.detail);
    if (executor_.alerter_)
      executor_.alerter_->executionAborted(report_.execution_id,
                                           report_.detail);
    return report_;
  }
  transition(ExecutionState::LEG1_FILLED, leg1.order_id);

  // ── Leg 2 (only reachable with leg1 exactly filled) ──
  if (leg1.status != OrderStatus::FILLED)
    throw std::logic_error("leg2 requested without a filled leg1");

  if (!submitLeg(leg2)) {
    handleUnhedged("leg2 submit rejected");
    return report_;
  }
  transition(ExecutionState::LEG2_SUBMITTED, leg2.order_id);

  auto fill2 = awaitLeg(leg2);
  if (fill2 == FillStatus::TIMED_OUT) {
    cancelLeg(leg2);
    if (report_.cancel_succeeded)
      leg2.status = OrderStatus::CANCELLED;
    handleUnhedged(fmt::format("leg2 not filled within {} ms",
                               executor_.config_.leg_fill_timeout_ms));
    return report_;
  }
  if (fill2 == FillStatus::REJECTED) {
    handleUnhedged("leg2 fill rejected");
    return report_;
  }

  report_.realized_pnl_usd = AtomicExecutor::realizedPnl(leg1, leg2);
  report_.detail = "both legs filled";
  transition(ExecutionState::COMPLETE, report_.detail);
  spdlog::info("[Exec] ✅ {} complete, realized ${:.4f}", report_.execution_id,
               *report_.realized_pnl_usd);
  return report_;
}

// ── Unhedged handling ────────────────────────────────────────────────
void TwoLegExecution::handleUnhedged(const std::string &detail) {
  report_.detail = detail;
  transition(ExecutionState::LEG2_FAILED_UNHEDGED, detail);

  const auto &leg1 = report_.leg1;
  auto policy = executor_.config_.unhedged_policy;
  spdlog::critical("[Exec] {}: UNHEDGED - {} (leg1 {} {} x {:.2f} open, "
                   "leg2 {}, policy {})",
                   report_.execution_id, detail, sideName(leg1.side),
                   leg1.market_id, leg1.filled_size,
                   orderStatusName(report_.leg2.status), policyName(policy));

  if (policy == UnhedgedPolicy::UNWIND ||
      policy == UnhedgedPolicy::UNWIND_AND_ALERT)
    unwind();

  if (executor_.alerter_ && (policy == UnhedgedPolicy::ALERT ||
                             policy == UnhedgedPolicy::UNWIND_AND_ALERT)) {
    UnhedgedAlert alert;
    alert.execution_id = report_.execution_id;
    alert.filled_leg = leg1;
    alert.failed_leg = report_.leg2;
    alert.exposure_usd = leg1.filled_size * leg1.price;
    alert.detail = detail;
    if (report_.unwind_attempted)
      alert.detail += report_.unwind_filled ? " (unwind filled)"
                                            : " (unwind failed)";
    executor_.alerter_->unhedgedExposure(alert);
  }
}

// One marketable opposite-side order for leg1's filled size. Never retried.
void TwoLegExecution::unwind() {
  const auto &leg1 = report_.leg1;
  double buffer = executor_.config_.unwind_price_buffer;

  Order order;
  order.market_id = leg1.market_id;
  order.outcome = leg1.outcome;
  order.venue = leg1.venue;
  order.side = opposite(leg1.side);
  order.size = leg1.filled_size;
  order.price = order.side == Side::SELL
                    ? std::max(0.01, leg1.price - buffer)
                    : std::min(0.99, leg1.price + buffer);

  report_.unwind_attempted = true;
  spdlog::warn("[Exec] {}: unwinding {} {} x {:.2f} @ {:.3f}",
               report_.execution_id, sideName(order.side), order.market_id,
               order.size, order.price);

  if (submitLeg(order) && awaitLeg(order) == FillStatus::FILLED) {
    report_.unwind_filled = true;
    spdlog::warn("[Exec] {}: unwind filled", report_.execution_id);
  } else {
    spdlog::critical("[Exec] {}: unwind failed, exposure remains",
                     report_.execution_id);
  }
  report_.unwind_order = order;
}

} // namespace pmarb
