#include "sources/prober_scrape.hpp"

#include <algorithm>
#include <memory>
#include <string>
#include <utility>

#include <curl/curl.h>

#include "core/log.hpp"
#include "core/timestamp.hpp"
#include "sources/exposition.hpp"

namespace sla_agent::sources {
namespace {

constexpr long kHttpOk = 200;

struct CurlDeleter {
  void operator()(CURL* handle) const {
    if (handle != nullptr) {
      curl_easy_cleanup(handle);
    }
  }
};

using CurlHandle = std::unique_ptr<CURL, CurlDeleter>;

std::size_t append_body(void* contents, std::size_t size, std::size_t nmemb, void* userp) {
  auto* body = static_cast<std::string*>(userp);
  const std::size_t bytes = size * nmemb;
  body->append(static_cast<const char*>(contents), bytes);
  return bytes;
}

}  // namespace

ProberScrapeSource::ProberScrapeSource(ProberScrapeOptions options) : options_(std::move(options)) {}

model::CounterSnapshot ProberScrapeSource::fetch() {
  model::CounterSnapshot snapshot{};
  const auto start = std::chrono::steady_clock::now();

  CurlHandle curl(curl_easy_init());
  if (curl == nullptr) {
    snapshot.duration_seconds = core::seconds_since(start);
    core::log_error("fetch", "curl_easy_init failed");
    return snapshot;
  }

  std::string body;
  char error_buffer[CURL_ERROR_SIZE]{};
  curl_easy_setopt(curl.get(), CURLOPT_URL, options_.url.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
  // libcurl reads a zero timeout as "no timeout".
  const long timeout_ms = std::max<long>(1, static_cast<long>(options_.timeout.count()));
  curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, timeout_ms);
  curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT_MS, timeout_ms);
  // Signals are reserved for shutdown; libcurl must not install its own.
  curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, append_body);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &body);
  curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, error_buffer);

  const CURLcode rc = curl_easy_perform(curl.get());
  snapshot.duration_seconds = core::seconds_since(start);

  if (rc != CURLE_OK) {
    const std::string detail = error_buffer[0] != '\0' ? error_buffer : curl_easy_strerror(rc);
    core::log_error("fetch", "error fetching prober metrics from " + options_.url + ": " + detail);
    return snapshot;
  }

  long status = 0;
  curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);
  if (status != kHttpOk) {
    core::log_error("fetch", "prober returned non-200 status: " + std::to_string(status));
    return snapshot;
  }

  snapshot.success_total = parse_metric_value(body, options_.success_metric);
  snapshot.fail_total = parse_metric_value(body, options_.fail_metric);

  if (!snapshot.success_total.has_value()) {
    core::log_debug("fetch", "success metric '" + options_.success_metric + "' not found in prober metrics");
  }
  if (!snapshot.fail_total.has_value()) {
    core::log_debug("fetch", "fail metric '" + options_.fail_metric + "' not found in prober metrics");
  }

  return snapshot;
}

}  // namespace sla_agent::sources
