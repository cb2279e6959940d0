#include "utils.hpp"

#include <chrono>
#include <cstdint>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <regex>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace Utils {

std::vector<std::string> split_string(const std::string &text, char delimiter) {
  std::vector<std::string> tokens;
  std::string current_token;
  std::istringstream token_stream(text);

  while (std::getline(token_stream, current_token, delimiter)) {
    tokens.push_back(current_token);
  }
  return tokens;
}

std::vector<std::string> split_and_trim(const std::string &text,
                                        char delimiter) {
  std::vector<std::string> tokens;
  for (const auto &token : split_string(text, delimiter)) {
    std::string trimmed = trim_copy(token);
    if (!trimmed.empty())
      tokens.push_back(std::move(trimmed));
  }
  return tokens;
}

uint64_t get_current_time_ms() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

std::string format_time_ms_iso8601(uint64_t timestamp_ms) {
  std::time_t seconds = static_cast<std::time_t>(timestamp_ms / 1000);
  std::tm utc{};
  gmtime_r(&seconds, &utc);

  std::ostringstream oss;
  oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3)
      << std::setfill('0') << (timestamp_ms % 1000) << 'Z';
  return oss.str();
}

void create_directory_for_file(const std::string &file_path) {
  std::filesystem::path parent = std::filesystem::path(file_path).parent_path();
  if (parent.empty())
    return;
  std::error_code ec;
  std::filesystem::create_directories(parent, ec);
}

std::string normalize_label(std::string_view raw) {
  std::string result;
  result.reserve(raw.size());
  bool pending_space = false;
  for (unsigned char ch : raw) {
    if (std::isspace(ch)) {
      pending_space = !result.empty();
      continue;
    }
    if (pending_space) {
      result.push_back(' ');
      pending_space = false;
    }
    result.push_back(static_cast<char>(std::tolower(ch)));
  }
  return result;
}

std::optional<HttpUrl> parse_http_url(const std::string &url) {
  // Group 1: scheme, 2: host, 3: port, 4: path
  static const std::regex url_regex(
      R"(^(https?):\/\/([^\/:]+)(?::(\d{1,5}))?(\/.*)?$)");
  std::smatch match;
  if (!std::regex_match(url, match, url_regex))
    return std::nullopt;

  HttpUrl parsed;
  parsed.is_https = match[1].str() == "https";
  parsed.host = match[2].str();
  parsed.port = parsed.is_https ? 443 : 80;
  if (match[3].matched) {
    auto port = string_to_number<int>(match[3].str());
    if (!port || *port < 1 || *port > 65535)
      return std::nullopt;
    parsed.port = *port;
  }
  parsed.path = match[4].matched ? match[4].str() : "/";
  return parsed;
}

} // namespace Utils
