#include "http_notifier.hpp"
#include "core/logger.hpp"
#include "httplib.h"
#include "utils/alert_formatter.hpp"
#include "utils/utils.hpp"

#include <ctime>
#include <string>
#include <type_traits>

HttpNotifier::HttpNotifier(const std::string &webhook_url, uint32_t timeout_ms)
    : timeout_ms_(timeout_ms) {
  auto url = Utils::parse_http_url(webhook_url);
  if (url) {
    host_ = url->host;
    port_ = url->port;
    path_ = url->path;
    is_https_ = url->is_https;
    LOG(LogLevel::TRACE, LogComponent::IO_DISPATCH,
        "HttpNotifier initialized | Host: " << host_ << ":" << port_
                                            << " | Path: " << path_);
  } else {
    LOG(LogLevel::ERROR, LogComponent::IO_DISPATCH,
        "Invalid webhook URL format provided to HttpNotifier: "
            << webhook_url);
  }
}

bool HttpNotifier::send(const Alert &alert) {
  if (host_.empty()) {
    LOG(LogLevel::ERROR, LogComponent::IO_DISPATCH,
        "Cannot send alert " << alert.id << ": no valid webhook configured");
    return false;
  }

  bool success = false;
  auto send_request = [&](auto &client) {
    if constexpr (std::is_same_v<std::decay_t<decltype(client)>,
                                 httplib::SSLClient>) {
      client.enable_server_certificate_verification(false);
    }
    const time_t sec = static_cast<time_t>(timeout_ms_ / 1000);
    const time_t usec = static_cast<time_t>((timeout_ms_ % 1000) * 1000);
    client.set_connection_timeout(sec, usec);
    client.set_read_timeout(sec, usec);
    client.set_write_timeout(sec, usec);

    std::string json_body = AlertFormatter::format_alert_to_json(alert);
    auto res = client.Post(path_.c_str(), json_body, "application/json");

    if (res && res->status < 400) {
      LOG(LogLevel::TRACE, LogComponent::IO_DISPATCH,
          "Alert " << alert.id << " posted to " << host_ << path_
                   << " | Status: " << res->status);
      success = true;
    } else {
      LOG(LogLevel::WARN, LogComponent::IO_DISPATCH,
          "Failed to post alert " << alert.id << " to " << host_ << path_
                                  << " | "
                                  << (res ? "Status: " +
                                                std::to_string(res->status)
                                          : "Error: " +
                                                httplib::to_string(res.error())));
      success = false;
    }
  };

  if (is_https_) {
    httplib::SSLClient cli(host_, port_);
    send_request(cli);
  } else {
    httplib::Client cli(host_, port_);
    send_request(cli);
  }
  return success;
}
