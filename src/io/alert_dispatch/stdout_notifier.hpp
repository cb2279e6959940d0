#ifndef STDOUT_NOTIFIER_HPP
#define STDOUT_NOTIFIER_HPP

#include "base_notifier.hpp"

#include <mutex>
#include <ostream>

// Prints the human-readable alert message.
class StdoutNotifier : public INotifier {
public:
  explicit StdoutNotifier(std::ostream &out);
  StdoutNotifier();

  bool send(const Alert &alert) override;
  const char *get_name() const override { return "StdoutNotifier"; }

private:
  std::ostream &out_;
  std::mutex out_mutex_;
};

#endif // STDOUT_NOTIFIER_HPP
