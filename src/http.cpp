#include "pmarb/http.hpp"
#include <cstdlib>
#include <curl/curl.h>
#include <mutex>
#include <stdexcept>

namespace pmarb {

// ── cURL write callback ──────────────────────────────────────────────
static size_t writeCallback(char *data, size_t size, size_t nmemb,
                            void *userp) {
  auto *buf = static_cast<std::string *>(userp);
  buf->append(data, size * nmemb);
  return size * nmemb;
}

// Thread-safe curl lifecycle management
static std::once_flag curl_init_flag;
static void initCurlOnce() {
  curl_global_init(CURL_GLOBAL_DEFAULT);
  std::atexit(curl_global_cleanup);
}

void initHttp() { std::call_once(curl_init_flag, initCurlOnce); }

std::string httpPost(const std::string &url, const std::string &body,
                     const std::vector<std::string> &extra_headers,
                     long timeout_s) {
  initHttp();
  CURL *curl = curl_easy_init();
  if (!curl)
    throw std::runtime_error("Failed to init curl");

  std::string response;
  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl, CURLOPT_POST, 1L);
  curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);
  curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeout_s);

  struct curl_slist *headers = nullptr;
  headers = curl_slist_append(headers, "Accept: application/json");
  for (const auto &h : extra_headers)
    headers = curl_slist_append(headers, h.c_str());
  curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);

  CURLcode res = curl_easy_perform(curl);
  curl_slist_free_all(headers);
  curl_easy_cleanup(curl);

  if (res != CURLE_OK) {
    throw std::runtime_error(std::string("HTTP POST failed: ") +
                             curl_easy_strerror(res));
  }
  return response;
}

} // namespace pmarb
