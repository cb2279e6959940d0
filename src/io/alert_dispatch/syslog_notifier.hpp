#ifndef SYSLOG_NOTIFIER_HPP
#define SYSLOG_NOTIFIER_HPP

#include "base_notifier.hpp"

class SyslogNotifier : public INotifier {
public:
  SyslogNotifier();
  ~SyslogNotifier() override;

  bool send(const Alert &alert) override;
  const char *get_name() const override { return "SyslogNotifier"; }
};

#endif // SYSLOG_NOTIFIER_HPP
