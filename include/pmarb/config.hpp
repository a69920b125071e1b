#pragma once
#include "pmarb/common.hpp"
#include <nlohmann/json.hpp>
#include <stdexcept>

namespace pmarb {

class ConfigError : public std::runtime_error {
public:
  explicit ConfigError(const std::string &msg) : std::runtime_error(msg) {}
};

// Overlays keys present in `j` onto `base`; missing keys keep defaults.
Config loadConfig(const nlohmann::json &j, Config base = {});
Config loadConfigFile(const std::string &path, Config base = {});

// POLYGON_RPC_URL, TELEGRAM_BOT_TOKEN, TELEGRAM_CHAT_ID
void applyEnv(Config &cfg);

// Throws ConfigError on out-of-range values
void validateConfig(const Config &cfg);

} // namespace pmarb
