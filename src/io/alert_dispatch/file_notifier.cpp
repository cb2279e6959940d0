#include "file_notifier.hpp"
#include "core/logger.hpp"
#include "utils/alert_formatter.hpp"
#include "utils/utils.hpp"

#include <exception>
#include <string>

FileNotifier::FileNotifier(const std::string &file_path)
    : alert_file_output_path_(file_path) {
  if (!alert_file_output_path_.empty()) {
    Utils::create_directory_for_file(alert_file_output_path_);
    alert_file_stream_.open(alert_file_output_path_, std::ios::app);
    if (!alert_file_stream_.is_open())
      LOG(LogLevel::ERROR, LogComponent::IO_DISPATCH,
          "FileNotifier could not open alert output file: "
              << alert_file_output_path_);
  }
}

FileNotifier::~FileNotifier() {
  if (alert_file_stream_.is_open()) {
    alert_file_stream_.flush();
    alert_file_stream_.close();
  }
}

bool FileNotifier::send(const Alert &alert) {
  std::lock_guard<std::mutex> lock(stream_mutex_);
  if (!alert_file_stream_.is_open())
    return false;

  try {
    std::string json_output = AlertFormatter::format_alert_to_json(alert);
    alert_file_stream_ << json_output << std::endl;

    if (!alert_file_stream_.good()) {
      LOG(LogLevel::ERROR, LogComponent::IO_DISPATCH,
          "Failed to write alert to file: " << alert_file_output_path_);
      alert_file_stream_.clear();
      return false;
    }
    LOG(LogLevel::TRACE, LogComponent::IO_DISPATCH,
        "Alert " << alert.id << " written to " << alert_file_output_path_);
    return true;
  } catch (const std::exception &e) {
    LOG(LogLevel::ERROR, LogComponent::IO_DISPATCH,
        "Exception while writing alert to file: " << e.what());
    return false;
  }
}
