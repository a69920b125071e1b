#include "pmarb/logger.hpp"
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <spdlog/spdlog.h>
#include <sstream>

namespace pmarb {

static std::string timestamp() {
  auto now = std::chrono::system_clock::now();
  auto t = std::chrono::system_clock::to_time_t(now);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                now.time_since_epoch()) %
            1000;
  std::ostringstream ss;
  ss << std::put_time(std::localtime(&t), "%Y-%m-%dT%H:%M:%S") << '.'
     << std::setfill('0') << std::setw(3) << ms.count();
  return ss.str();
}

// Commas and quotes in free text would break the row
static std::string csvField(const std::string &s) {
  if (s.find_first_of(",\"\n") == std::string::npos)
    return s;
  std::string out = "\"";
  for (char c : s) {
    if (c == '"')
      out += '"';
    out += c == '\n' ? ' ' : c;
  }
  return out + "\"";
}

Logger::Logger(const std::string &log_dir) : log_dir_(log_dir) {
  std::filesystem::create_directories(log_dir_);

  exec_csv_.open(log_dir_ + "/executions.csv", std::ios::app);
  opp_csv_.open(log_dir_ + "/opportunities.csv", std::ios::app);
  ensureHeaders();
}

Logger::~Logger() {
  if (exec_csv_.is_open())
    exec_csv_.close();
  if (opp_csv_.is_open())
    opp_csv_.close();
}

void Logger::ensureHeaders() {
  // tellp() is unreliable with ios::app
  auto exec_path = std::filesystem::path(log_dir_) / "executions.csv";
  auto opp_path = std::filesystem::path(log_dir_) / "opportunities.csv";

  if (std::filesystem::file_size(exec_path) == 0) {
    exec_csv_ << "timestamp,opportunity_id,strategy,status,execution_state,"
                 "position_id,size_usd,pnl_usd,detail\n";
  }
  if (std::filesystem::file_size(opp_path) == 0) {
    opp_csv_ << "timestamp,opportunity_id,strategy,gross_spread_pct,"
                "total_costs_usd,net_profit_usd,net_profit_pct,profitable,"
                "risk_factors\n";
  }
}

void Logger::logOpportunity(const RankedOpportunity &opp) {
  std::lock_guard<std::mutex> lock(mtx_);
  const auto &a = opp.analysis;

  opp_csv_ << timestamp() << "," << csvField(a.opportunity_id) << ","
           << strategyName(a.strategy) << "," << std::fixed
           << std::setprecision(4) << a.gross_spread_pct << ","
           << std::setprecision(6) << a.costs.total_costs_usd << ","
           << a.net_profit_usd << "," << std::setprecision(4)
           << a.net_profit_pct << "," << (a.is_profitable ? 1 : 0) << ","
           << a.risk_factors.size() << "\n";
  opp_csv_.flush();

  if (a.is_profitable)
    spdlog::info("💰 {} {}: gross {:.2f}%, net ${:.4f} ({:.2f}%)",
                 strategyName(a.strategy), a.opportunity_id,
                 a.gross_spread_pct, a.net_profit_usd, a.net_profit_pct);
}

void Logger::logExecution(const ExecutionResult &result) {
  std::lock_guard<std::mutex> lock(mtx_);

  exec_csv_ << timestamp() << "," << csvField(result.opportunity_id) << ","
            << strategyName(result.strategy) << ","
            << executionStatusName(result.status) << ","
            << (result.report ? executionStateName(result.report->state) : "")
            << "," << (result.position ? result.position->position_id : "")
            << "," << std::fixed << std::setprecision(2)
            << (result.position ? result.position->size_usd : 0.0) << ","
            << std::setprecision(6) << result.pnl_usd.value_or(0.0) << ","
            << csvField(result.detail) << "\n";
  exec_csv_.flush();
}

void Logger::logCycle(int cycle, int markets_scanned, int opportunities_found,
                      int executions, double elapsed) {
  spdlog::info("── Cycle {} ── markets={}, opportunities={}, executions={}, "
               "elapsed={:.1f}ms ──",
               cycle, markets_scanned, opportunities_found, executions,
               elapsed);
}

} // namespace pmarb
