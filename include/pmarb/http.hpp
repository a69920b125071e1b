#pragma once
#include <string>
#include <vector>

namespace pmarb {

// Idempotent process-wide libcurl initialisation
void initHttp();

// Blocking POST; throws std::runtime_error on transport failure.
std::string httpPost(const std::string &url, const std::string &body,
                     const std::vector<std::string> &headers,
                     long timeout_s = 10);

} // namespace pmarb
