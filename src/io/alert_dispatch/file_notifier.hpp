#ifndef FILE_NOTIFIER_HPP
#define FILE_NOTIFIER_HPP

#include "base_notifier.hpp"

#include <fstream>
#include <mutex>
#include <string>

// Appends one JSON object per line.
class FileNotifier : public INotifier {
public:
  explicit FileNotifier(const std::string &file_path);
  ~FileNotifier() override;

  bool send(const Alert &alert) override;
  const char *get_name() const override { return "FileNotifier"; }

private:
  std::string alert_file_output_path_;
  std::ofstream alert_file_stream_;
  std::mutex stream_mutex_;
};

#endif // FILE_NOTIFIER_HPP
