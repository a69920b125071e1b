#pragma once
#include "pmarb/common.hpp"

namespace pmarb {

// Source of live network pricing. Implementations report nullopt when the
// value is unavailable; they never throw.
class GasPriceOracle {
public:
  virtual ~GasPriceOracle() = default;
  virtual std::optional<double> gasPriceGwei() = 0;
  virtual std::optional<double> nativeTokenUsd() = 0;
};

// Polygon JSON-RPC oracle (eth_gasPrice). Token USD price is not available
// over plain RPC, so nativeTokenUsd() always defers to the configured default.
class RpcGasOracle : public GasPriceOracle {
public:
  explicit RpcGasOracle(const std::string &rpc_url, long timeout_s = 3);

  std::optional<double> gasPriceGwei() override;
  std::optional<double> nativeTokenUsd() override { return std::nullopt; }

  // Parses an eth_gasPrice response body into gwei
  static std::optional<double> parseGasPriceResponse(const std::string &body);

private:
  std::string rpc_url_;
  long timeout_s_;

  std::string httpPost(const std::string &body);
};

} // namespace pmarb
