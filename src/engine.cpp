#include "pmarb/engine.hpp"
#include "pmarb/logger.hpp"
#include <algorithm>
#include <future>
#include <set>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace pmarb {

const char *executionStatusName(ExecutionStatus status) {
  switch (status) {
  case ExecutionStatus::SUCCESS:
    return "SUCCESS";
  case ExecutionStatus::REJECTED:
    return "REJECTED";
  case ExecutionStatus::ABORTED_CLEAN:
    return "ABORTED_CLEAN";
  case ExecutionStatus::FAILED_UNHEDGED:
    return "FAILED_UNHEDGED";
  }
  return "REJECTED";
}

ArbitrageEngine::ArbitrageEngine(const Config &config, const CostModel &costs,
                                 CapitalLedger &ledger,
                                 AtomicExecutor &executor,
                                 MarketDataSource &data, Logger *journal)
    : config_(config),
      analyzer_(costs, config.strategy.min_profit_margin_pct,
                config.strategy.max_quote_age_ms),
      rebalancing_(config.strategy), combinatorial_(config.strategy),
      ledger_(ledger), executor_(executor), data_(data), journal_(journal) {}

// ── Evaluation ───────────────────────────────────────────────────────
ProfitabilityAnalysis ArbitrageEngine::evaluate(const Opportunity &opp) const {
  CostInputs in;
  in.position_size_usd = config_.strategy.position_size_usd;
  in.as_of = std::chrono::system_clock::now();
  return analyzer_.analyze(opp, in);
}

std::vector<RankedOpportunity>
ArbitrageEngine::scan(const std::vector<MarketQuote> &quotes,
                      const std::vector<RelationshipSignal> &signals) const {
  auto candidates = rebalancing_.scan(quotes);

  std::unordered_map<std::string, MarketQuote> by_id;
  for (const auto &q : quotes)
    by_id[q.market_id] = q;
  for (auto &opp : combinatorial_.scan(signals, by_id))
    candidates.push_back(std::move(opp));

  std::vector<RankedOpportunity> ranked;
  for (auto &opp : candidates) {
    RankedOpportunity r{opp, evaluate(opp)};
    if (journal_)
      journal_->logOpportunity(r);
    if (!r.analysis.is_profitable) {
      spdlog::debug("[Engine] {} skipped: {}", r.analysis.opportunity_id,
                    r.analysis.recommendation);
      continue;
    }
    ranked.push_back(std::move(r));
  }

  spdlog::info("[Engine] {} candidates, {} profitable", candidates.size(),
               ranked.size());
  return prioritize(std::move(ranked),
                    static_cast<size_t>(std::max(0, config_.strategy.max_opportunities)));
}

// ── Quote refresh ────────────────────────────────────────────────────
MarketQuote ArbitrageEngine::freshQuote(const std::string &market_id) {
  auto q = data_.quote(market_id);
  if (!q.book)
    q.book = data_.orderBook(market_id);
  if (!q.no_book)
    q.no_book = data_.noOrderBook(market_id);
  return q;
}

std::optional<Opportunity> ArbitrageEngine::refresh(const Opportunity &opp) {
  return std::visit(
      overloaded{
          [&](const RebalancingOpportunity &o) -> std::optional<Opportunity> {
            MarketQuote q;
            try {
              q = freshQuote(o.market_id);
            } catch (const std::exception &e) {
              spdlog::warn("[Engine] Quote refresh failed for {} ({}), using "
                           "scan snapshot",
                           o.market_id, e.what());
              return opp;
            }
            auto r = rebalancing_.detect(q);
            if (!r || r->side != o.side)
              return std::nullopt;
            r->id = o.id;
            return Opportunity(*r);
          },
          [&](const CombinatorialOpportunity &o) -> std::optional<Opportunity> {
            MarketQuote qa, qb;
            try {
              qa = freshQuote(o.leg_a.market_id);
              qb = freshQuote(o.leg_b.market_id);
            } catch (const std::exception &e) {
              spdlog::warn("[Engine] Quote refresh failed for {} ({}), using "
                           "scan snapshot",
                           o.id, e.what());
              return opp;
            }
            auto r = combinatorial_.detect(o.relationship, qa, qb);
            if (!r || r->leg_a.side != o.leg_a.side)
              return std::nullopt;
            r->id = o.id;
            return Opportunity(*r);
          },
      },
      opp);
}

// ── Authorize → execute → record ─────────────────────────────────────
ExecutionResult ArbitrageEngine::authorizeAndExecute(const Opportunity &opp) {
  ExecutionResult result;
  result.opportunity_id = opportunityId(opp);
  result.strategy = strategyOf(opp);

  auto fresh = refresh(opp);
  if (!fresh) {
    result.detail = "mispricing closed on refresh";
    return finish(std::move(result));
  }

  auto analysis = evaluate(*fresh);
  result.analysis = analysis;
  if (!analysis.is_profitable) {
    result.detail = analysis.recommendation;
    return finish(std::move(result));
  }

  auto legs = legsOf(*fresh);
  auto depthOf = [](const OpportunityLeg &l) -> std::optional<double> {
    if (!l.book)
      return std::nullopt;
    return l.book->depth(l.side);
  };
  auto depth_a = depthOf(legs.first);
  auto depth_b = depthOf(legs.second);

  CapitalRequest req;
  req.opportunity_id = result.opportunity_id;
  req.strategy = result.strategy;
  req.requested_usd = config_.strategy.position_size_usd;
  req.market_ids = marketsOf(*fresh);
  if (depth_a && depth_b)
    req.available_liquidity = std::min(*depth_a, *depth_b);
  else if (depth_a)
    req.available_liquidity = depth_a;
  else if (depth_b)
    req.available_liquidity = depth_b;

  auto auth = ledger_.authorize(req);
  if (auto *rej = std::get_if<Rejection>(&auth)) {
    result.rejection = *rej;
    result.detail =
        fmt::format("{}: {}", rejectionName(rej->reason), rej->detail);
    return finish(std::move(result));
  }
  auto alloc = std::get<CapitalAllocation>(auth);

  if (!ledger_.activate(alloc.opportunity_id)) {
    result.detail = "allocation expired before execution";
    return finish(std::move(result));
  }

  auto makeLeg = [&](const OpportunityLeg &l, std::optional<double> depth) {
    LegRequest lr;
    lr.order.market_id = l.market_id;
    lr.order.outcome = l.outcome;
    lr.order.venue = l.venue;
    lr.order.side = l.side;
    lr.order.price = l.price;
    lr.order.size = alloc.approved_usd;
    lr.visible_liquidity = depth;
    return lr;
  };

  auto exec_id = fmt::format("EXEC-{}-{}", alloc.opportunity_id, ++exec_seq_);
  auto report = executor_.execute(exec_id, makeLeg(legs.first, depth_a),
                                  makeLeg(legs.second, depth_b));
  result.report = report;
  result.detail = report.detail;

  const auto &leg1 = report.leg1;
  const auto &leg2 = report.leg2;

  switch (report.state) {
  case ExecutionState::COMPLETE: {
    double entry, exit_price;
    Side side;
    std::string note;
    if (alloc.strategy == StrategyKind::REBALANCING) {
      // Pair cost basis; settles to 1.00
      entry = leg1.price + leg2.price;
      exit_price = 1.0;
      side = leg1.side;
      note = fmt::format("{} YES+NO", sideName(side));
    } else {
      const auto &buy = leg1.side == Side::BUY ? leg1 : leg2;
      const auto &sell = leg1.side == Side::BUY ? leg2 : leg1;
      entry = buy.price;
      exit_price = sell.price;
      side = Side::BUY;
      note = fmt::format("SELL {} @ {:.3f} / BUY {} @ {:.3f}", sell.market_id,
                         sell.price, buy.market_id, buy.price);
    }
    result.position =
        ledger_.recordHedged(alloc, entry, exit_price, side,
                             report.realized_pnl_usd.value_or(0.0), 0.0, note);
    result.pnl_usd = result.position->pnl_usd;
    result.status = ExecutionStatus::SUCCESS;
    break;
  }

  case ExecutionState::LEG1_TIMED_OUT:
  case ExecutionState::LEG1_FAILED:
    result.position = ledger_.recordAbort(alloc, report.detail);
    result.status = ExecutionStatus::ABORTED_CLEAN;
    break;

  case ExecutionState::LEG2_FAILED_UNHEDGED: {
    auto pos = ledger_.recordOpen(alloc, leg1.price, leg1.side,
                                  "UNHEDGED: " + report.detail);
    if (report.unwind_filled && report.unwind_order)
      pos = ledger_.recordClose(pos.position_id, report.unwind_order->price);
    result.position = pos;
    result.pnl_usd = pos.pnl_usd;
    result.status = ExecutionStatus::FAILED_UNHEDGED;
    break;
  }

  default:
    throw std::logic_error(fmt::format("execution {} ended in non-terminal "
                                       "state {}",
                                       exec_id,
                                       executionStateName(report.state)));
  }

  return finish(std::move(result));
}

ExecutionResult ArbitrageEngine::finish(ExecutionResult result) {
  switch (result.status) {
  case ExecutionStatus::SUCCESS:
    spdlog::info("[Engine] ✅ {} executed, locked ${:.4f}",
                 result.opportunity_id, result.pnl_usd.value_or(0.0));
    break;
  case ExecutionStatus::REJECTED:
    spdlog::warn("[Engine] {} rejected: {}", result.opportunity_id,
                 result.detail);
    break;
  case ExecutionStatus::ABORTED_CLEAN:
    spdlog::info("[Engine] {} aborted cleanly: {}", result.opportunity_id,
                 result.detail);
    break;
  case ExecutionStatus::FAILED_UNHEDGED:
    spdlog::critical("[Engine] {} left UNHEDGED: {}", result.opportunity_id,
                     result.detail);
    break;
  }
  if (journal_)
    journal_->logExecution(result);
  return result;
}

// ── Batch execution ──────────────────────────────────────────────────
std::vector<ExecutionResult>
ArbitrageEngine::executeBatch(const std::vector<RankedOpportunity> &ranked) {
  size_t max_parallel =
      static_cast<size_t>(std::max(1, config_.strategy.max_concurrent_executions));

  std::vector<ExecutionResult> results;
  results.reserve(ranked.size());

  size_t i = 0;
  while (i < ranked.size()) {
    std::set<std::string> busy;
    std::vector<std::future<ExecutionResult>> batch;

    // Opportunities sharing a market are not independent
    while (i < ranked.size() && batch.size() < max_parallel) {
      auto markets = marketsOf(ranked[i].opportunity);
      bool overlaps = false;
      for (const auto &m : markets)
        overlaps = overlaps || busy.count(m) > 0;
      if (overlaps && !batch.empty())
        break;

      busy.insert(markets.begin(), markets.end());
      const Opportunity &opp = ranked[i].opportunity;
      batch.push_back(std::async(std::launch::async, [this, &opp] {
        return authorizeAndExecute(opp);
      }));
      ++i;
    }

    for (auto &f : batch)
      results.push_back(f.get());
  }
  return results;
}

} // namespace pmarb
