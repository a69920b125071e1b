#pragma once
#include "pmarb/engine.hpp"
#include <fstream>
#include <mutex>
#include <string>

namespace pmarb {

// CSV trade journal: opportunities.csv and executions.csv under log_dir
class Logger {
public:
  explicit Logger(const std::string &log_dir = "logs");
  ~Logger();

  void logOpportunity(const RankedOpportunity &opp);
  void logExecution(const ExecutionResult &result);
  void logCycle(int cycle, int markets_scanned, int opportunities_found,
                int executions, double elapsed_ms);

private:
  std::string log_dir_;
  std::ofstream exec_csv_;
  std::ofstream opp_csv_;
  std::mutex mtx_;

  void ensureHeaders();
};

} // namespace pmarb
