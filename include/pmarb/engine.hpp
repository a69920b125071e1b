#pragma once
#include "pmarb/atomic_executor.hpp"
#include "pmarb/ledger.hpp"
#include "pmarb/strategy.hpp"
#include <atomic>

namespace pmarb {

class Logger;

// ── Inbound data interfaces ──────────────────────────────────────────
class MarketDataSource {
public:
  virtual ~MarketDataSource() = default;
  // Throws if the market is unknown or the source is unreachable
  virtual MarketQuote quote(const std::string &market_id) = 0;
  virtual std::optional<OrderBook> orderBook(const std::string &market_id) = 0;
  // Book for the NO outcome of a binary market
  virtual std::optional<OrderBook>
  noOrderBook(const std::string &market_id) = 0;
  virtual std::vector<MarketQuote> quotes() = 0;
};

class RelationshipClassifier {
public:
  virtual ~RelationshipClassifier() = default;
  virtual RelationshipSignal classify(const std::string &market_a,
                                      const std::string &market_b) = 0;
};

// ── Execution outcome ────────────────────────────────────────────────
enum class ExecutionStatus { SUCCESS, REJECTED, ABORTED_CLEAN, FAILED_UNHEDGED };

const char *executionStatusName(ExecutionStatus status);

struct ExecutionResult {
  std::string opportunity_id;
  StrategyKind strategy = StrategyKind::REBALANCING;
  ExecutionStatus status = ExecutionStatus::REJECTED;
  std::optional<Position> position;
  std::optional<double> pnl_usd;
  std::optional<ProfitabilityAnalysis> analysis;
  std::optional<Rejection> rejection;
  std::optional<ExecutionReport> report;
  std::string detail;
};

class ArbitrageEngine {
public:
  ArbitrageEngine(const Config &config, const CostModel &costs,
                  CapitalLedger &ledger, AtomicExecutor &executor,
                  MarketDataSource &data, Logger *journal = nullptr);

  ProfitabilityAnalysis evaluate(const Opportunity &opp) const;

  // Detect, analyze and rank candidates for one cycle
  std::vector<RankedOpportunity>
  scan(const std::vector<MarketQuote> &quotes,
       const std::vector<RelationshipSignal> &signals) const;

  ExecutionResult authorizeAndExecute(const Opportunity &opp);

  // Runs opportunities with disjoint markets concurrently, at most
  // max_concurrent_executions at a time. Results keep input order.
  std::vector<ExecutionResult>
  executeBatch(const std::vector<RankedOpportunity> &ranked);

  ExposureMetrics exposure() const { return ledger_.exposure(); }
  PnlSummary pnlSummary(const PnlFilter &filter = {}) const {
    return ledger_.pnlSummary(filter);
  }

private:
  Config config_;
  ProfitabilityAnalyzer analyzer_;
  RebalancingDetector rebalancing_;
  CombinatorialDetector combinatorial_;
  CapitalLedger &ledger_;
  AtomicExecutor &executor_;
  MarketDataSource &data_;
  Logger *journal_;
  std::atomic<long> exec_seq_{0};

  // Re-detects against fresh quotes. nullopt when the mispricing closed.
  std::optional<Opportunity> refresh(const Opportunity &opp);
  MarketQuote freshQuote(const std::string &market_id);
  ExecutionResult finish(ExecutionResult result);
};

} // namespace pmarb
