#pragma once
#include <string>
#include <memory>
#include <fstream>
#include <mutex>
#include <chrono>
#include <queue>
#include <thread>
#include <condition_variable>

enum class LogLevel { DEBUG, INFO, WARNING, ERROR, CRITICAL };

struct LogEntry {
  std::chrono::system_clock::time_point timestamp;
  LogLevel level;
  std::string message;
  std::thread::id thread_id;
};

// Asynchronous process-wide logger. Calls are dropped until Initialize().
// Never pass seed or secret key material to it.
class Logger {
  static std::unique_ptr<Logger> instance_;
  static std::mutex instance_mutex_;
  std::ofstream log_file_;
  bool to_stderr_ = false;
  std::mutex log_mutex_;
  std::queue<LogEntry> log_queue_;
  std::thread worker_thread_;
  std::condition_variable cv_;
  bool running_ = false;
  LogLevel min_level_ = LogLevel::INFO;
  Logger() = default;
  void WorkerFunction();
  void StopWorker();
  void WriteLogEntry(const LogEntry&);
  std::string FormatLogEntry(const LogEntry&);
public:
  // path "-" writes to stderr instead of a file.
  static void Initialize(const std::string& path, LogLevel min_level = LogLevel::INFO);
  static void Shutdown();
  static bool IsEnabled(LogLevel level);
  static LogLevel ParseLevel(const std::string& name, LogLevel fallback = LogLevel::INFO);
  static const char* LevelToString(LogLevel);
  static void Log(LogLevel level, const std::string& message);
  static void Debug(const std::string& m);
  static void Info(const std::string& m);
  static void Warning(const std::string& m);
  static void Error(const std::string& m);
  static void Critical(const std::string& m);
  ~Logger();
};
