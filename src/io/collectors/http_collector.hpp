#ifndef HTTP_COLLECTOR_HPP
#define HTTP_COLLECTOR_HPP

#include "base_collector.hpp"

#include <cstdint>
#include <string>

/**
 * Pulls samples from an HTTP endpoint:
 *   GET <path>?signal=<s>&since=<start_ms>&until=<end_ms>
 * The response is a JSON array of {"timestamp_ms", "value", "source"}.
 */
class HttpCollector : public ICollector {
public:
  HttpCollector(const std::string &endpoint_url, uint32_t timeout_ms,
                bool verify_tls = true);

  std::vector<Sample> fetch(const std::string &signal,
                            const TimeWindow &window) override;
  const char *get_name() const override { return "HttpCollector"; }

  // Exposed for tests; throws CollectionError on malformed payloads.
  static std::vector<Sample> parse_samples(const std::string &body);

  bool verifies_certificates() const { return verify_tls_; }

private:
  std::string host_;
  int port_ = 80;
  std::string path_;
  bool is_https_ = false;
  uint32_t timeout_ms_;
  bool verify_tls_;
};

#endif // HTTP_COLLECTOR_HPP
