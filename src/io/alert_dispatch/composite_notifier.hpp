#ifndef COMPOSITE_NOTIFIER_HPP
#define COMPOSITE_NOTIFIER_HPP

#include "base_notifier.hpp"
#include "core/config.hpp"

#include <cstddef>
#include <memory>
#include <vector>

// Fans an alert out to every child. The send succeeds only if every child
// succeeded; every child is attempted regardless.
class CompositeNotifier : public INotifier {
public:
  CompositeNotifier() = default;

  // One child per channel enabled in the [Alerting] section.
  static std::unique_ptr<CompositeNotifier>
  from_config(const Config::AlertingConfig &config);

  void add(std::unique_ptr<INotifier> notifier);
  size_t size() const { return notifiers_.size(); }

  bool send(const Alert &alert) override;
  const char *get_name() const override { return "CompositeNotifier"; }

private:
  std::vector<std::unique_ptr<INotifier>> notifiers_;
};

#endif // COMPOSITE_NOTIFIER_HPP
