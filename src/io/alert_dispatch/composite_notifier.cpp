#include "composite_notifier.hpp"
#include "core/logger.hpp"
#include "file_notifier.hpp"
#include "http_notifier.hpp"
#include "stdout_notifier.hpp"
#include "syslog_notifier.hpp"

#include <exception>
#include <utility>

std::unique_ptr<CompositeNotifier>
CompositeNotifier::from_config(const Config::AlertingConfig &config) {
  auto composite = std::make_unique<CompositeNotifier>();
  if (config.stdout_enabled)
    composite->add(std::make_unique<StdoutNotifier>());
  if (config.file_enabled)
    composite->add(std::make_unique<FileNotifier>(config.alert_output_path));
  if (config.syslog_enabled)
    composite->add(std::make_unique<SyslogNotifier>());
  if (config.http_enabled)
    composite->add(std::make_unique<HttpNotifier>(config.http_webhook_url,
                                                  config.dispatch_timeout_ms));

  LOG(LogLevel::INFO, LogComponent::IO_DISPATCH,
      "Configured " << composite->size() << " alert notifiers");
  return composite;
}

void CompositeNotifier::add(std::unique_ptr<INotifier> notifier) {
  if (notifier)
    notifiers_.push_back(std::move(notifier));
}

bool CompositeNotifier::send(const Alert &alert) {
  if (notifiers_.empty()) {
    LOG(LogLevel::WARN, LogComponent::IO_DISPATCH,
        "No notifiers configured; alert " << alert.id << " not delivered");
    return false;
  }

  bool all_ok = true;
  for (const auto &notifier : notifiers_) {
    bool ok = false;
    try {
      ok = notifier->send(alert);
    } catch (const std::exception &e) {
      LOG(LogLevel::ERROR, LogComponent::IO_DISPATCH,
          notifier->get_name() << " threw while sending " << alert.id << ": "
                               << e.what());
    }
    if (!ok) {
      LOG(LogLevel::WARN, LogComponent::IO_DISPATCH,
          notifier->get_name() << " failed to deliver " << alert.id);
      all_ok = false;
    }
  }
  return all_ok;
}
