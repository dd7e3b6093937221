#pragma once

#include <atomic>
#include <condition_variable>
#include <deque>
#include <fstream>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace black_bars::logger {

// Log levels
enum class LogLevel { Debug, Info, Warning, Error };

// Parses "debug" / "info" / "warning" / "warn" / "error" (case-insensitive)
std::optional<LogLevel> ParseLogLevel(const std::string& name);

// Thread-safe logger: callers push to a queue; a dedicated writer thread does all file I/O (non-blocking for callers).
// Messages at Info and above are also echoed to the console on the calling thread.
class BlackBarsLogger {
   public:
    static BlackBarsLogger& GetInstance();

    // Initialize logger with log file path (opens file and starts writer thread)
    void Initialize(const std::string& log_path);

    // Log a message with specified level (thread-safe, enqueues; does not block on file I/O)
    void Log(LogLevel level, const std::string& message);

    // Messages below this level are dropped (file and console)
    void SetMinLevel(LogLevel level);
    LogLevel GetMinLevel() const;

    // Console echo can be disabled (tests)
    void SetConsoleEcho(bool enabled);

    // Shutdown logger (enqueues shutdown message, drains queue, closes file)
    void Shutdown();

    // Blocks until the writer thread has written everything queued so far
    void FlushLogs();

    bool IsInitialized() const { return initialized_.load(); }

   private:
    BlackBarsLogger() = default;
    ~BlackBarsLogger();

    BlackBarsLogger(const BlackBarsLogger&) = delete;
    BlackBarsLogger& operator=(const BlackBarsLogger&) = delete;

    // Writer thread entry: drains queue, writes to file, closes file on shutdown
    void WriterLoop();

    bool OpenLogFile();
    void CloseLogFile();
    void WriteToFile(const std::string& formatted_message);
    void WriteToConsole(LogLevel level, const std::string& message);
    std::string FormatMessage(LogLevel level, const std::string& message);
    static const char* GetLogLevelString(LogLevel level);

    std::string log_path_;
    std::ofstream log_file_;

    std::deque<std::string> queue_;
    std::mutex queue_lock_;
    std::condition_variable queue_cv_;
    std::condition_variable drained_cv_;
    bool writer_busy_ = false;
    std::atomic<bool> shutdown_writer_{false};
    std::thread writer_thread_;

    std::mutex console_lock_;
    std::atomic<int> min_level_{static_cast<int>(LogLevel::Info)};
    std::atomic<bool> console_echo_{true};
    std::atomic<bool> initialized_{false};
};

// Global convenience functions
void Initialize(const std::string& log_path);
void SetMinLevel(LogLevel level);
void SetConsoleEcho(bool enabled);
void Shutdown();
void FlushLogs();

}  // namespace black_bars::logger
