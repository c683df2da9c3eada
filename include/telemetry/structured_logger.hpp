#pragma once
#include <nlohmann/json.hpp>
#include <string>
#include <mutex>
#include <condition_variable>
#include <thread>
#include <queue>

// One JSON object per line, written in batches by a background thread.
// Events logged while the writer is not running are dropped.
class StructuredLogger {
public:
  static StructuredLogger& Instance();
  // Adds "ts" (unix millis) and "event" to the given fields and enqueues the line.
  void LogEvent(const std::string& event, const nlohmann::json& fields);
  // Enqueue a pre-built JSON line (one object, no trailing newline needed)
  void LogJsonLine(const std::string& json_line);
  // Drains the queue and stops the writer.
  void Shutdown();
  void Initialize(const std::string& file_path);
  bool IsRunning();
private:
  StructuredLogger();
  ~StructuredLogger();
  void Worker();
  std::mutex mutex_;
  std::condition_variable cv_;
  std::queue<std::string> queue_;
  std::thread worker_;
  bool running_ = false;
  std::string file_path_;
};
