#include "pmarb/gas_oracle.hpp"
#include "pmarb/http.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <stdexcept>

using json = nlohmann::json;

namespace pmarb {

RpcGasOracle::RpcGasOracle(const std::string &rpc_url, long timeout_s)
    : rpc_url_(rpc_url), timeout_s_(timeout_s) {
  initHttp();
}

std::string RpcGasOracle::httpPost(const std::string &body) {
  return pmarb::httpPost(rpc_url_, body, {"Content-Type: application/json"},
                         timeout_s_);
}

std::optional<double>
RpcGasOracle::parseGasPriceResponse(const std::string &body) {
  auto resp = json::parse(body, nullptr, false);
  if (resp.is_discarded() || !resp.contains("result") ||
      !resp["result"].is_string())
    return std::nullopt;

  // "0x6fc23ac00" wei
  auto hex = resp["result"].get<std::string>();
  if (hex.size() < 3 || hex.compare(0, 2, "0x") != 0)
    return std::nullopt;

  unsigned long long wei = 0;
  try {
    wei = std::stoull(hex.substr(2), nullptr, 16);
  } catch (const std::exception &) {
    return std::nullopt;
  }
  return static_cast<double>(wei) / 1e9;
}

std::optional<double> RpcGasOracle::gasPriceGwei() {
  if (rpc_url_.empty())
    return std::nullopt;

  json req = {{"jsonrpc", "2.0"},
              {"method", "eth_gasPrice"},
              {"params", json::array()},
              {"id", 1}};
  try {
    auto gwei = parseGasPriceResponse(httpPost(req.dump()));
    if (!gwei)
      spdlog::warn("[Gas] Unexpected eth_gasPrice response");
    return gwei;
  } catch (const std::exception &e) {
    spdlog::warn("[Gas] Gas price fetch failed: {}", e.what());
    return std::nullopt;
  }
}

} // namespace pmarb
