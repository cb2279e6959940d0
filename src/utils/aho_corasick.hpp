#ifndef AHO_CORASICK_HPP
#define AHO_CORASICK_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace Utils {

// Case-insensitive multi-pattern matcher. Patterns and text are folded to
// lowercase before matching; matches report the pattern as registered.
class AhoCorasick {
public:
  struct Match {
    size_t pattern_index;
    size_t end_offset; // one past the last matched character
  };

  explicit AhoCorasick(const std::vector<std::string> &patterns);

  std::vector<Match> find_all(std::string_view text) const;

  // Longest pattern found in the text; ties go to the earliest match.
  std::optional<std::string> find_longest(std::string_view text) const;

  const std::string &pattern(size_t index) const { return patterns_[index]; }
  bool empty() const { return patterns_.empty(); }

private:
  struct TrieNode {
    std::unordered_map<char, int> children;
    int suffix_link = 0;
    int output_link = 0;
    std::vector<size_t> pattern_indices;
  };

  std::vector<TrieNode> trie_;
  std::vector<std::string> patterns_;
};

} // namespace Utils

#endif // AHO_CORASICK_HPP
