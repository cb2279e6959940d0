#ifndef GAZETTEER_LOCATION_RESOLVER_HPP
#define GAZETTEER_LOCATION_RESOLVER_HPP

#include "base_location_resolver.hpp"
#include "utils/aho_corasick.hpp"

#include <string>
#include <vector>

// Finds the longest known place name mentioned in the text, ignoring case.
class GazetteerLocationResolver : public ILocationResolver {
public:
  explicit GazetteerLocationResolver(
      const std::vector<std::string> &known_locations);

  std::optional<std::string> resolve(const std::string &raw_text) override;

  size_t size() const { return location_count_; }

private:
  Utils::AhoCorasick matcher_;
  size_t location_count_;
};

#endif // GAZETTEER_LOCATION_RESOLVER_HPP
