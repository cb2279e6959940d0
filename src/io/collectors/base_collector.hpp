#ifndef BASE_COLLECTOR_HPP
#define BASE_COLLECTOR_HPP

#include "detection/sample.hpp"

#include <string>
#include <vector>

// Source of samples for a signal. fetch() throws CollectionError on a
// transient failure and returns nothing partial.
class ICollector {
public:
  virtual ~ICollector() = default;
  virtual std::vector<Sample> fetch(const std::string &signal,
                                    const TimeWindow &window) = 0;
  virtual const char *get_name() const = 0;
};

#endif // BASE_COLLECTOR_HPP
