#ifndef HTTP_NOTIFIER_HPP
#define HTTP_NOTIFIER_HPP

#include "base_notifier.hpp"

#include <cstdint>
#include <string>

// POSTs the alert JSON to a webhook. Any status >= 400, connection error or
// timeout is a failed send.
class HttpNotifier : public INotifier {
public:
  HttpNotifier(const std::string &webhook_url, uint32_t timeout_ms);
  bool send(const Alert &alert) override;
  const char *get_name() const override { return "HttpNotifier"; }

private:
  std::string host_;
  int port_ = 80;
  std::string path_;
  bool is_https_ = false;
  uint32_t timeout_ms_;
};

#endif // HTTP_NOTIFIER_HPP
