#pragma once

#include <atomic>
#include <chrono>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <thread>

namespace toolhost {

enum class LogLevel {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
};

/// Parse "debug", "info", "warn"/"warning" or "error" (case-insensitive).
std::optional<LogLevel> ParseLogLevel(std::string_view text);

const char* LogLevelName(LogLevel level);

/// One log event. The views are only valid for the duration of
/// ILogSink::Write.
struct LogRecord {
    LogLevel level = LogLevel::Info;
    std::string_view component;
    std::string_view message;
    std::chrono::system_clock::time_point time;
    std::thread::id thread;
};

class ILogSink {
public:
    virtual ~ILogSink() = default;
    virtual void Write(const LogRecord& record) = 0;
};

// "2024-05-01T12:00:00.123Z [WARN] [loader] message"
class ConsoleSink : public ILogSink {
public:
    explicit ConsoleSink(std::ostream& out = std::cerr);
    void Write(const LogRecord& record) override;

private:
    std::ostream& out_;
};

// "12:00:00 WARN  [loader] message" with per-level colors for terminals.
// Without color the output is ConsoleSink's.
class ColorConsoleSink : public ILogSink {
public:
    explicit ColorConsoleSink(bool use_color, std::ostream& out = std::cerr);
    void Write(const LogRecord& record) override;

private:
    bool use_color_;
    std::ostream& out_;
};

// One JSON object per line: ts, level, component, thread, message.
class JsonSink : public ILogSink {
public:
    explicit JsonSink(std::ostream& out);
    void Write(const LogRecord& record) override;

private:
    std::ostream& out_;
};

// Appends to `path` in JsonSink or ConsoleSink format, flushing per record.
class FileSink : public ILogSink {
public:
    FileSink(const std::string& path, bool json);

    [[nodiscard]] bool IsOpen() const { return file_.is_open(); }

    void Write(const LogRecord& record) override;

private:
    std::ofstream file_;
    std::unique_ptr<ILogSink> format_;
};

// ---------------------------------------------------------------------------
// Logger: filters by level, stamps each record and serializes writes to the
// sink. Level checks do not lock, so disabled debug logging on the request
// path stays cheap.
// ---------------------------------------------------------------------------
class Logger {
public:
    explicit Logger(std::unique_ptr<ILogSink> sink, LogLevel min_level = LogLevel::Info);

    void SetLevel(LogLevel level) noexcept;
    [[nodiscard]] bool Enabled(LogLevel level) const noexcept;

    void Debug(std::string_view component, std::string_view message);
    void Info(std::string_view component, std::string_view message);
    void Warn(std::string_view component, std::string_view message);
    void Error(std::string_view component, std::string_view message);

    void Log(LogLevel level, std::string_view component, std::string_view message);

private:
    std::unique_ptr<ILogSink> sink_;
    std::atomic<LogLevel> min_level_;
    std::mutex write_mutex_;
};

// ---------------------------------------------------------------------------
// Process-wide logger. Starts out discarding everything; `toolhost serve`
// installs the configured one before the server threads start. Replacing it
// later is safe: callers that already hold the old one finish with it.
// ---------------------------------------------------------------------------
void InitGlobalLogger(std::unique_ptr<ILogSink> sink, LogLevel min_level);

std::shared_ptr<Logger> GlobalLogger();

/// True when stderr is a terminal and NO_COLOR is not set, unless forced.
bool ShouldUseColor(bool force_color, bool force_no_color);

void LogDebug(std::string_view component, std::string_view message);
void LogInfo(std::string_view component, std::string_view message);
void LogWarn(std::string_view component, std::string_view message);
void LogError(std::string_view component, std::string_view message);

} // namespace toolhost
