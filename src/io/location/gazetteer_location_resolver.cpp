#include "gazetteer_location_resolver.hpp"
#include "core/logger.hpp"
#include "utils/utils.hpp"

#include <cctype>

namespace {
bool is_word_char(char ch) {
  return std::isalnum(static_cast<unsigned char>(ch)) != 0;
}

std::vector<std::string> clean_names(const std::vector<std::string> &names) {
  std::vector<std::string> cleaned;
  for (const auto &name : names) {
    std::string trimmed = Utils::trim_copy(name);
    if (!trimmed.empty())
      cleaned.push_back(std::move(trimmed));
  }
  return cleaned;
}
} // namespace

GazetteerLocationResolver::GazetteerLocationResolver(
    const std::vector<std::string> &known_locations)
    : matcher_(clean_names(known_locations)),
      location_count_(clean_names(known_locations).size()) {
  LOG(LogLevel::DEBUG, LogComponent::IO_LOCATION,
      "Gazetteer loaded with " << location_count_ << " locations");
}

std::optional<std::string>
GazetteerLocationResolver::resolve(const std::string &raw_text) {
  if (matcher_.empty() || raw_text.empty())
    return std::nullopt;

  // Longest whole-word match; ties go to the earliest mention
  std::optional<size_t> best;
  for (const auto &match : matcher_.find_all(raw_text)) {
    const size_t length = matcher_.pattern(match.pattern_index).size();
    const size_t start = match.end_offset - length;
    if (start > 0 && is_word_char(raw_text[start - 1]))
      continue;
    if (match.end_offset < raw_text.size() &&
        is_word_char(raw_text[match.end_offset]))
      continue;
    if (!best || length > matcher_.pattern(*best).size())
      best = match.pattern_index;
  }

  if (!best)
    return std::nullopt;
  LOG(LogLevel::TRACE, LogComponent::IO_LOCATION,
      "Resolved '" << matcher_.pattern(*best) << "' from: " << raw_text);
  return matcher_.pattern(*best);
}
