#include "pmarb/alerter.hpp"
#include "pmarb/http.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace pmarb {

void LogAlerter::unhedgedExposure(const UnhedgedAlert &alert) {
  spdlog::critical("🚨 UNHEDGED EXPOSURE [{}]: {} {} {} x {:.2f} @ {:.3f} "
                   "filled on {}, hedge {} {} failed (${:.2f} at risk) - {}",
                   alert.execution_id, sideName(alert.filled_leg.side),
                   alert.filled_leg.market_id, alert.filled_leg.outcome,
                   alert.filled_leg.filled_size, alert.filled_leg.price,
                   venueName(alert.filled_leg.venue),
                   sideName(alert.failed_leg.side),
                   alert.failed_leg.market_id, alert.exposure_usd,
                   alert.detail);
}

void LogAlerter::executionAborted(const std::string &execution_id,
                                  const std::string &reason) {
  spdlog::info("[Alert] Execution {} aborted cleanly: {}", execution_id,
               reason);
}

TelegramAlerter::TelegramAlerter(const std::string &bot_token,
                                 const std::string &chat_id, long timeout_s)
    : bot_token_(bot_token), chat_id_(chat_id), timeout_s_(timeout_s) {
  initHttp();
}

std::string TelegramAlerter::formatMessage(const UnhedgedAlert &alert) {
  return fmt::format("🚨 UNHEDGED EXPOSURE\n"
                     "Execution: {}\n"
                     "Filled: {} {} {} x {:.2f} @ {:.3f} ({})\n"
                     "Failed hedge: {} {} {} ({})\n"
                     "At risk: ${:.2f}\n"
                     "{}",
                     alert.execution_id, sideName(alert.filled_leg.side),
                     alert.filled_leg.market_id, alert.filled_leg.outcome,
                     alert.filled_leg.filled_size, alert.filled_leg.price,
                     venueName(alert.filled_leg.venue),
                     sideName(alert.failed_leg.side),
                     alert.failed_leg.market_id, alert.failed_leg.outcome,
                     venueName(alert.failed_leg.venue), alert.exposure_usd,
                     alert.detail);
}

void TelegramAlerter::unhedgedExposure(const UnhedgedAlert &alert) {
  LogAlerter::unhedgedExposure(alert);
  if (!send(formatMessage(alert)))
    spdlog::error("[Alert] Telegram delivery failed for {}",
                  alert.execution_id);
}

bool TelegramAlerter::send(const std::string &text) {
  if (bot_token_.empty() || chat_id_.empty())
    return false;

  std::string url = "https://api.telegram.org/bot" + bot_token_ + "/sendMessage";
  json body = {{"chat_id", chat_id_}, {"text", text}};
  try {
    auto resp = json::parse(
        httpPost(url, body.dump(), {"Content-Type: application/json"},
                 timeout_s_),
        nullptr, false);
    if (resp.is_discarded() || !resp.value("ok", false)) {
      spdlog::warn("[Alert] Telegram rejected message");
      return false;
    }
    return true;
  } catch (const std::exception &e) {
    spdlog::warn("[Alert] Telegram request failed: {}", e.what());
    return false;
  }
}

} // namespace pmarb
