#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <stdexcept>
#include <string>

// Transient failure of a Collector; the scheduler retries the task.
class CollectionError : public std::runtime_error {
public:
  explicit CollectionError(const std::string &what)
      : std::runtime_error(what) {}
};

// Internal numeric failure inside a detector. Never leaves the detector.
class DetectionError : public std::runtime_error {
public:
  explicit DetectionError(const std::string &what)
      : std::runtime_error(what) {}
};

class DispatchError : public std::runtime_error {
public:
  explicit DispatchError(const std::string &what)
      : std::runtime_error(what) {}
};

// Storage is best-effort; callers log this and carry on.
class PersistenceError : public std::runtime_error {
public:
  explicit PersistenceError(const std::string &what)
      : std::runtime_error(what) {}
};

#endif // ERRORS_HPP
