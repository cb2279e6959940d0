#ifndef BASE_NOTIFIER_HPP
#define BASE_NOTIFIER_HPP

#include "core/alert.hpp"

// Delivers one alert. send() returns true only on complete delivery;
// implementations enforce their own timeouts and never throw on transport
// failure.
class INotifier {
public:
  virtual ~INotifier() = default;
  virtual bool send(const Alert &alert) = 0;
  virtual const char *get_name() const = 0;
};

#endif // BASE_NOTIFIER_HPP
