#include "black_bars_logger.hpp"
#include "logging.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <vector>

namespace black_bars::logger {

std::optional<LogLevel> ParseLogLevel(const std::string& name) {
    std::string v = name;
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (v == "debug") return LogLevel::Debug;
    if (v == "info") return LogLevel::Info;
    if (v == "warning" || v == "warn") return LogLevel::Warning;
    if (v == "error") return LogLevel::Error;
    return std::nullopt;
}

BlackBarsLogger& BlackBarsLogger::GetInstance() {
    static BlackBarsLogger instance;
    return instance;
}

BlackBarsLogger::~BlackBarsLogger() { Shutdown(); }

void BlackBarsLogger::Initialize(const std::string& log_path) {
    bool expected = false;
    if (!initialized_.compare_exchange_strong(expected, true)) {
        return;  // Already initialized
    }

    log_path_ = log_path;

    // Create directory if it doesn't exist
    std::error_code ec;
    std::filesystem::path log_dir = std::filesystem::path(log_path_).parent_path();
    if (!log_dir.empty() && !std::filesystem::exists(log_dir, ec)) {
        std::filesystem::create_directories(log_dir, ec);
    }

    if (!OpenLogFile()) {
        std::cerr << "BlackBars: Failed to open log file " << log_path_ << std::endl;
        initialized_ = false;
        return;
    }

    shutdown_writer_ = false;
    writer_thread_ = std::thread(&BlackBarsLogger::WriterLoop, this);

    Log(LogLevel::Info, "BlackBars Logger initialized");
}

void BlackBarsLogger::Log(LogLevel level, const std::string& message) {
    if (static_cast<int>(level) < min_level_.load()) {
        return;
    }

    if (console_echo_.load() && level != LogLevel::Debug) {
        WriteToConsole(level, message);
    }

    if (!initialized_.load()) {
        return;
    }

    std::string formatted_message = FormatMessage(level, message);
    {
        std::lock_guard<std::mutex> lock(queue_lock_);
        queue_.push_back(std::move(formatted_message));
    }
    queue_cv_.notify_one();
}

void BlackBarsLogger::SetMinLevel(LogLevel level) { min_level_.store(static_cast<int>(level)); }

LogLevel BlackBarsLogger::GetMinLevel() const { return static_cast<LogLevel>(min_level_.load()); }

void BlackBarsLogger::SetConsoleEcho(bool enabled) { console_echo_.store(enabled); }

void BlackBarsLogger::FlushLogs() {
    if (!initialized_.load()) {
        return;
    }

    std::unique_lock<std::mutex> lock(queue_lock_);
    drained_cv_.wait_for(lock, std::chrono::seconds(5), [this] { return queue_.empty() && !writer_busy_; });
}

void BlackBarsLogger::Shutdown() {
    bool expected = true;
    if (!initialized_.compare_exchange_strong(expected, false)) {
        return;  // Already shut down or never initialized
    }

    {
        std::lock_guard<std::mutex> lock(queue_lock_);
        queue_.push_back(FormatMessage(LogLevel::Info, "BlackBars Logger shutting down"));
        shutdown_writer_ = true;
    }
    queue_cv_.notify_one();

    if (writer_thread_.joinable()) {
        writer_thread_.join();
    }

    CloseLogFile();
}

void BlackBarsLogger::WriterLoop() {
    std::vector<std::string> batch;
    while (true) {
        {
            std::unique_lock<std::mutex> lock(queue_lock_);
            queue_cv_.wait(lock, [this] { return !queue_.empty() || shutdown_writer_.load(); });
            if (queue_.empty() && shutdown_writer_.load()) {
                break;
            }
            batch.assign(std::make_move_iterator(queue_.begin()), std::make_move_iterator(queue_.end()));
            queue_.clear();
            writer_busy_ = true;
        }

        for (const auto& line : batch) {
            WriteToFile(line);
        }
        batch.clear();
        log_file_.flush();

        {
            std::lock_guard<std::mutex> lock(queue_lock_);
            writer_busy_ = false;
        }
        drained_cv_.notify_all();
    }

    log_file_.flush();
}

bool BlackBarsLogger::OpenLogFile() {
    if (log_file_.is_open()) {
        return true;
    }
    // Binary mode so the CRLF line endings are written as-is
    log_file_.open(log_path_, std::ios::out | std::ios::app | std::ios::binary);
    return log_file_.is_open();
}

void BlackBarsLogger::CloseLogFile() {
    if (log_file_.is_open()) {
        log_file_.flush();
        log_file_.close();
    }
}

void BlackBarsLogger::WriteToFile(const std::string& formatted_message) {
    if (!log_file_.is_open()) {
        return;
    }
    log_file_.write(formatted_message.data(), static_cast<std::streamsize>(formatted_message.size()));
}

void BlackBarsLogger::WriteToConsole(LogLevel level, const std::string& message) {
    std::lock_guard<std::mutex> lock(console_lock_);
    switch (level) {
        case LogLevel::Warning: std::cout << "Warning: " << message << std::endl; break;
        case LogLevel::Error:   std::cerr << "Error: " << message << std::endl; break;
        default:                std::cout << message << std::endl; break;
    }
}

std::string BlackBarsLogger::FormatMessage(LogLevel level, const std::string& message) {
    const auto now = std::chrono::system_clock::now();
    const std::time_t now_c = std::chrono::system_clock::to_time_t(now);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm local_tm{};
#ifdef _WIN32
    localtime_s(&local_tm, &now_c);
#else
    localtime_r(&now_c, &local_tm);
#endif

    // HH:MM:SS:mmm [tid] | LEVEL | message
    std::ostringstream log_line;
    log_line << std::setfill('0')
             << std::setw(2) << local_tm.tm_hour << ":"
             << std::setw(2) << local_tm.tm_min << ":"
             << std::setw(2) << local_tm.tm_sec << ":"
             << std::setw(3) << ms.count()
             << std::setfill(' ')
             << " [" << std::setw(5) << std::this_thread::get_id() << "] | "
             << std::setw(5) << GetLogLevelString(level) << " | "
             << message;

    std::string line_string = log_line.str();

    // Replace all standalone LF with CRLF
    for (size_t offset = 0; (offset = line_string.find('\n', offset)) != std::string::npos; ) {
        if (offset == 0 || line_string[offset - 1] != '\r') {
            line_string.replace(offset, 1, "\r\n", 2);
            offset += 2;
        } else {
            offset += 1;
        }
    }

    // Ensure line ends with CRLF
    while (!line_string.empty() && (line_string.back() == '\n' || line_string.back() == '\r')) {
        line_string.pop_back();
    }
    line_string += "\r\n";

    return line_string;
}

const char* BlackBarsLogger::GetLogLevelString(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:   return "DEBUG";
        case LogLevel::Info:    return "INFO ";
        case LogLevel::Warning: return "WARN ";
        case LogLevel::Error:   return "ERROR";
        default:                return "UNKNO";
    }
}

// Global convenience functions
void Initialize(const std::string& log_path) { BlackBarsLogger::GetInstance().Initialize(log_path); }

void SetMinLevel(LogLevel level) { BlackBarsLogger::GetInstance().SetMinLevel(level); }

void SetConsoleEcho(bool enabled) { BlackBarsLogger::GetInstance().SetConsoleEcho(enabled); }

void Shutdown() { BlackBarsLogger::GetInstance().Shutdown(); }

void FlushLogs() { BlackBarsLogger::GetInstance().FlushLogs(); }

}  // namespace black_bars::logger

namespace {

void LogV(black_bars::logger::LogLevel level, const char* msg, va_list args) {
    char buffer[1024];
    vsnprintf(buffer, sizeof(buffer), msg, args);
    black_bars::logger::BlackBarsLogger::GetInstance().Log(level, buffer);
}

}  // anonymous namespace

void LogDebug(const char* msg, ...) {
    va_list args;
    va_start(args, msg);
    LogV(black_bars::logger::LogLevel::Debug, msg, args);
    va_end(args);
}

void LogInfo(const char* msg, ...) {
    va_list args;
    va_start(args, msg);
    LogV(black_bars::logger::LogLevel::Info, msg, args);
    va_end(args);
}

void LogWarn(const char* msg, ...) {
    va_list args;
    va_start(args, msg);
    LogV(black_bars::logger::LogLevel::Warning, msg, args);
    va_end(args);
}

void LogError(const char* msg, ...) {
    va_list args;
    va_start(args, msg);
    LogV(black_bars::logger::LogLevel::Error, msg, args);
    va_end(args);
}
