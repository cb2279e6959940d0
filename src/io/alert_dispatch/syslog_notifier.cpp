#include "syslog_notifier.hpp"
#include "core/logger.hpp"

#include <exception>
#include <sstream>
#include <syslog.h>

SyslogNotifier::SyslogNotifier() {
  openlog("crowdsense", LOG_PID | LOG_CONS, LOG_USER);
}

SyslogNotifier::~SyslogNotifier() { closelog(); }

bool SyslogNotifier::send(const Alert &alert) {
  try {
    std::ostringstream ss;
    ss << "ALERT: " << alert.disaster_type << " | "
       << "Location: " << alert.location << " | "
       << "Severity: " << alert_severity_to_string(alert.severity) << " | "
       << "z=" << alert.z_score << " | id=" << alert.id;

    LOG(LogLevel::TRACE, LogComponent::IO_DISPATCH,
        "Sending alert to syslog: " << ss.str());
    syslog(LOG_WARNING, "%s", ss.str().c_str());
    return true;
  } catch (const std::exception &e) {
    LOG(LogLevel::ERROR, LogComponent::IO_DISPATCH,
        "Exception while sending alert to syslog: " << e.what());
    return false;
  }
}
