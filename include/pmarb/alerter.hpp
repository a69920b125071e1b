#pragma once
#include "pmarb/venue_adapter.hpp"

namespace pmarb {

struct UnhedgedAlert {
  std::string execution_id;
  Order filled_leg;
  Order failed_leg;
  double exposure_usd = 0.0; // filled size × price of the open leg
  std::string detail;
};

class Alerter {
public:
  virtual ~Alerter() = default;
  virtual void unhedgedExposure(const UnhedgedAlert &alert) = 0;
  virtual void executionAborted(const std::string &execution_id,
                                const std::string &reason) = 0;
};

class LogAlerter : public Alerter {
public:
  void unhedgedExposure(const UnhedgedAlert &alert) override;
  void executionAborted(const std::string &execution_id,
                        const std::string &reason) override;
};

// Logs like LogAlerter, then pushes unhedged alerts to a Telegram chat.
// Delivery failures are logged, never thrown.
class TelegramAlerter : public LogAlerter {
public:
  TelegramAlerter(const std::string &bot_token, const std::string &chat_id,
                  long timeout_s = 5);

  void unhedgedExposure(const UnhedgedAlert &alert) override;

  static std::string formatMessage(const UnhedgedAlert &alert);

private:
  std::string bot_token_;
  std::string chat_id_;
  long timeout_s_;

  bool send(const std::string &text);
};

} // namespace pmarb
