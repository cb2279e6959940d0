#include "aho_corasick.hpp"

#include <cctype>
#include <cstddef>
#include <queue>

namespace Utils {

namespace {
char fold(char ch) {
  return static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
}
} // namespace

AhoCorasick::AhoCorasick(const std::vector<std::string> &patterns)
    : patterns_(patterns) {
  trie_.emplace_back();

  for (size_t i = 0; i < patterns_.size(); ++i) {
    if (patterns_[i].empty())
      continue;
    int node = 0;
    for (char raw : patterns_[i]) {
      char ch = fold(raw);
      auto it = trie_[node].children.find(ch);
      if (it == trie_[node].children.end()) {
        int next = static_cast<int>(trie_.size());
        trie_[node].children[ch] = next;
        trie_.emplace_back();
        node = next;
      } else {
        node = it->second;
      }
    }
    trie_[node].pattern_indices.push_back(i);
  }

  // Suffix and output links, breadth first.
  std::queue<int> q;
  for (auto const &[key, val] : trie_[0].children)
    q.push(val);

  while (!q.empty()) {
    int u = q.front();
    q.pop();

    for (auto const &[ch, v] : trie_[u].children) {
      if (u != 0) {
        int j = trie_[u].suffix_link;
        while (j > 0 && trie_[j].children.find(ch) == trie_[j].children.end())
          j = trie_[j].suffix_link;
        auto it = trie_[j].children.find(ch);
        if (it != trie_[j].children.end() && it->second != v)
          trie_[v].suffix_link = it->second;
      }
      q.push(v);
    }

    int suffix_node = trie_[u].suffix_link;
    if (!trie_[suffix_node].pattern_indices.empty())
      trie_[u].output_link = suffix_node;
    else
      trie_[u].output_link = trie_[suffix_node].output_link;
  }
}

std::vector<AhoCorasick::Match>
AhoCorasick::find_all(std::string_view text) const {
  std::vector<Match> matches;
  int current_node = 0;

  for (size_t pos = 0; pos < text.size(); ++pos) {
    char ch = fold(text[pos]);
    while (current_node > 0 && trie_[current_node].children.find(ch) ==
                                   trie_[current_node].children.end())
      current_node = trie_[current_node].suffix_link;

    auto it = trie_[current_node].children.find(ch);
    if (it != trie_[current_node].children.end())
      current_node = it->second;

    int temp_node = current_node;
    while (temp_node > 0) {
      for (size_t pattern_idx : trie_[temp_node].pattern_indices)
        matches.push_back({pattern_idx, pos + 1});
      temp_node = trie_[temp_node].output_link;
    }
  }
  return matches;
}

std::optional<std::string>
AhoCorasick::find_longest(std::string_view text) const {
  std::optional<size_t> best;
  for (const auto &match : find_all(text)) {
    if (!best || patterns_[match.pattern_index].size() > patterns_[*best].size())
      best = match.pattern_index;
  }
  if (!best)
    return std::nullopt;
  return patterns_[*best];
}

} // namespace Utils
