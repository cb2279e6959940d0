#ifndef ALERT_FORMATTER_HPP
#define ALERT_FORMATTER_HPP

#include "core/alert.hpp"
#include "nlohmann/json.hpp"

#include <cstddef>
#include <optional>
#include <string>

namespace AlertFormatter {

// Longest message a text-only channel carries
constexpr size_t MAX_MESSAGE_LENGTH = 160;

nlohmann::json alert_to_json_object(const Alert &alert_data);
std::string format_alert_to_json(const Alert &alert_data);

// Inverse of alert_to_json_object. Returns nullopt if required fields are
// missing or malformed.
std::optional<Alert> alert_from_json_object(const nlohmann::json &j);

// "<TYPE> - <Location>\n\nSeverity: <sev> | z=<z> | count=<value>",
// truncated with "..." to MAX_MESSAGE_LENGTH.
std::string format_alert_message(const Alert &alert_data);

} // namespace AlertFormatter

#endif // ALERT_FORMATTER_HPP
