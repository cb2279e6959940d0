#include "http_collector.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "httplib.h"
#include "nlohmann/json.hpp"
#include "utils/utils.hpp"

#include <algorithm>
#include <ctime>
#include <stdexcept>
#include <type_traits>

HttpCollector::HttpCollector(const std::string &endpoint_url,
                             uint32_t timeout_ms, bool verify_tls)
    : timeout_ms_(timeout_ms), verify_tls_(verify_tls) {
  auto url = Utils::parse_http_url(endpoint_url);
  if (!url)
    throw std::invalid_argument("Invalid collector endpoint URL: " +
                                endpoint_url);
  host_ = url->host;
  port_ = url->port;
  path_ = url->path;
  is_https_ = url->is_https;
  if (is_https_ && !verify_tls_)
    LOG(LogLevel::WARN, LogComponent::IO_COLLECTOR,
        "TLS certificate verification is disabled for " << host_);
}

std::vector<Sample> HttpCollector::parse_samples(const std::string &body) {
  nlohmann::json payload;
  try {
    payload = nlohmann::json::parse(body);
  } catch (const nlohmann::json::parse_error &e) {
    throw CollectionError(std::string("Malformed collector response: ") +
                          e.what());
  }
  if (!payload.is_array())
    throw CollectionError("Collector response is not a JSON array");

  std::vector<Sample> samples;
  samples.reserve(payload.size());
  try {
    for (const auto &item : payload) {
      Sample sample;
      sample.timestamp_ms = item.at("timestamp_ms").get<uint64_t>();
      sample.value = item.at("value").get<double>();
      sample.source_tag = item.value("source", std::string());
      samples.push_back(std::move(sample));
    }
  } catch (const nlohmann::json::exception &e) {
    throw CollectionError(std::string("Malformed sample in response: ") +
                          e.what());
  }

  // Detectors rely on ingestion order
  std::stable_sort(samples.begin(), samples.end(),
                   [](const Sample &a, const Sample &b) {
                     return a.timestamp_ms < b.timestamp_ms;
                   });
  return samples;
}

std::vector<Sample> HttpCollector::fetch(const std::string &signal,
                                         const TimeWindow &window) {
  httplib::Params params{{"signal", signal},
                         {"since", std::to_string(window.start_ms)},
                         {"until", std::to_string(window.end_ms)}};

  auto send_request = [&](auto &client) {
    if constexpr (std::is_same_v<std::decay_t<decltype(client)>,
                                 httplib::SSLClient>) {
      client.enable_server_certificate_verification(verify_tls_);
    }
    const time_t sec = static_cast<time_t>(timeout_ms_ / 1000);
    const time_t usec = static_cast<time_t>((timeout_ms_ % 1000) * 1000);
    client.set_connection_timeout(sec, usec);
    client.set_read_timeout(sec, usec);
    return client.Get(path_, params, httplib::Headers{});
  };

  auto res = [&]() {
    if (is_https_) {
      httplib::SSLClient cli(host_, port_);
      return send_request(cli);
    }
    httplib::Client cli(host_, port_);
    return send_request(cli);
  }();

  if (!res)
    throw CollectionError("Request to " + host_ + path_ +
                          " failed: " + httplib::to_string(res.error()));
  if (res->status >= 400)
    throw CollectionError("Collector endpoint returned status " +
                          std::to_string(res->status));

  auto samples = parse_samples(res->body);
  LOG(LogLevel::DEBUG, LogComponent::IO_COLLECTOR,
      "Fetched " << samples.size() << " samples for '" << signal << "'");
  return samples;
}
