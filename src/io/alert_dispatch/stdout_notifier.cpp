#include "stdout_notifier.hpp"
#include "utils/alert_formatter.hpp"
#include "utils/utils.hpp"

#include <iostream>

StdoutNotifier::StdoutNotifier(std::ostream &out) : out_(out) {}

StdoutNotifier::StdoutNotifier() : out_(std::cout) {}

bool StdoutNotifier::send(const Alert &alert) {
  std::lock_guard<std::mutex> lock(out_mutex_);
  out_ << "\n=== DISASTER ALERT " << alert.id << " ("
       << Utils::format_time_ms_iso8601(alert.created_at_ms) << ") ===\n"
       << AlertFormatter::format_alert_message(alert) << "\n"
       << std::endl;
  return out_.good();
}
