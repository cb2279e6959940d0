#ifndef BASE_LOCATION_RESOLVER_HPP
#define BASE_LOCATION_RESOLVER_HPP

#include <optional>
#include <string>

// Best-effort extraction of a place name from free text.
class ILocationResolver {
public:
  virtual ~ILocationResolver() = default;
  virtual std::optional<std::string> resolve(const std::string &raw_text) = 0;
};

#endif // BASE_LOCATION_RESOLVER_HPP
