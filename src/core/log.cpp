#include <toolhost/core/log.hpp>
#include <toolhost/core/ansi.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <sstream>

#include <unistd.h>

namespace toolhost {

namespace {

using SystemClock = std::chrono::system_clock;

// ISO-8601 UTC with milliseconds: 2024-05-01T12:00:00.123Z
std::string IsoTimestamp(SystemClock::time_point time) {
    const auto secs = SystemClock::to_time_t(time);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                            time.time_since_epoch()).count() % 1000;
    std::tm utc{};
    gmtime_r(&secs, &utc);

    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0')
        << std::setw(3) << millis << 'Z';
    return oss.str();
}

// Local wall clock, HH:MM:SS.
std::string ClockTime(SystemClock::time_point time) {
    const auto secs = SystemClock::to_time_t(time);
    std::tm local{};
    localtime_r(&secs, &local);

    std::ostringstream oss;
    oss << std::put_time(&local, "%H:%M:%S");
    return oss.str();
}

std::string ThreadTag(std::thread::id id) {
    std::ostringstream oss;
    oss << id;
    return oss.str();
}

void WritePlain(std::ostream& out, const LogRecord& r) {
    out << IsoTimestamp(r.time) << " [" << LogLevelName(r.level) << "] [" << r.component
        << "] " << r.message << '\n';
}

std::string_view LevelStyle(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return ansi::kGray;
        case LogLevel::Info:  return ansi::kCyan;
        case LogLevel::Warn:  return ansi::kYellow;
        case LogLevel::Error: return ansi::kBoldRed;
    }
    return ansi::kReset;
}

class DiscardSink : public ILogSink {
public:
    void Write(const LogRecord&) override {}
};

std::shared_ptr<Logger>& GlobalSlot() {
    static std::shared_ptr<Logger> slot =
        std::make_shared<Logger>(std::make_unique<DiscardSink>(), LogLevel::Error);
    return slot;
}

} // anonymous namespace

std::optional<LogLevel> ParseLogLevel(std::string_view text) {
    std::string name(text);
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (name == "debug") {
        return LogLevel::Debug;
    }
    if (name == "info") {
        return LogLevel::Info;
    }
    if (name == "warn" || name == "warning") {
        return LogLevel::Warn;
    }
    if (name == "error") {
        return LogLevel::Error;
    }
    return std::nullopt;
}

const char* LogLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
    }
    return "UNKNOWN";
}

// ---------------------------------------------------------------------------
// Sinks
// ---------------------------------------------------------------------------
ConsoleSink::ConsoleSink(std::ostream& out) : out_(out) {}

void ConsoleSink::Write(const LogRecord& record) {
    WritePlain(out_, record);
}

ColorConsoleSink::ColorConsoleSink(bool use_color, std::ostream& out)
    : use_color_(use_color), out_(out) {}

void ColorConsoleSink::Write(const LogRecord& record) {
    if (!use_color_) {
        WritePlain(out_, record);
        return;
    }

    std::string level = LogLevelName(record.level);
    level.resize(5, ' ');
    const auto style = LevelStyle(record.level);

    out_ << ansi::Paint(ClockTime(record.time), ansi::kGray, true) << ' '
         << ansi::Paint(level, style, true) << ' '
         << ansi::Paint("[" + std::string(record.component) + "]", ansi::kGray, true) << ' '
         << ansi::Paint(record.message, style, record.level == LogLevel::Error) << '\n';
}

JsonSink::JsonSink(std::ostream& out) : out_(out) {}

void JsonSink::Write(const LogRecord& record) {
    nlohmann::json line = {
        {"ts", IsoTimestamp(record.time)},
        {"level", LogLevelName(record.level)},
        {"component", std::string(record.component)},
        {"thread", ThreadTag(record.thread)},
        {"message", std::string(record.message)},
    };
    // Plugin error text may be arbitrary bytes.
    out_ << line.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << '\n';
}

FileSink::FileSink(const std::string& path, bool json)
    : file_(path, std::ios::out | std::ios::app) {
    if (json) {
        format_ = std::make_unique<JsonSink>(file_);
    } else {
        format_ = std::make_unique<ConsoleSink>(file_);
    }
}

void FileSink::Write(const LogRecord& record) {
    if (!file_.is_open()) {
        return;
    }
    format_->Write(record);
    file_.flush();
}

// ---------------------------------------------------------------------------
// Logger
// ---------------------------------------------------------------------------
Logger::Logger(std::unique_ptr<ILogSink> sink, LogLevel min_level)
    : sink_(std::move(sink)), min_level_(min_level) {}

void Logger::SetLevel(LogLevel level) noexcept {
    min_level_.store(level, std::memory_order_relaxed);
}

bool Logger::Enabled(LogLevel level) const noexcept {
    return static_cast<int>(level) >=
           static_cast<int>(min_level_.load(std::memory_order_relaxed));
}

void Logger::Debug(std::string_view component, std::string_view message) {
    Log(LogLevel::Debug, component, message);
}

void Logger::Info(std::string_view component, std::string_view message) {
    Log(LogLevel::Info, component, message);
}

void Logger::Warn(std::string_view component, std::string_view message) {
    Log(LogLevel::Warn, component, message);
}

void Logger::Error(std::string_view component, std::string_view message) {
    Log(LogLevel::Error, component, message);
}

void Logger::Log(LogLevel level, std::string_view component, std::string_view message) {
    if (!Enabled(level)) {
        return;
    }
    LogRecord record;
    record.level = level;
    record.component = component;
    record.message = message;
    record.time = SystemClock::now();
    record.thread = std::this_thread::get_id();

    std::lock_guard<std::mutex> lock(write_mutex_);
    sink_->Write(record);
}

// ---------------------------------------------------------------------------
// Global logger
// ---------------------------------------------------------------------------
void InitGlobalLogger(std::unique_ptr<ILogSink> sink, LogLevel min_level) {
    std::atomic_store(&GlobalSlot(), std::make_shared<Logger>(std::move(sink), min_level));
}

std::shared_ptr<Logger> GlobalLogger() {
    return std::atomic_load(&GlobalSlot());
}

bool ShouldUseColor(bool force_color, bool force_no_color) {
    if (force_no_color || std::getenv("NO_COLOR") != nullptr) {
        return false;
    }
    return force_color || isatty(STDERR_FILENO) != 0;
}

void LogDebug(std::string_view component, std::string_view message) {
    GlobalLogger()->Debug(component, message);
}

void LogInfo(std::string_view component, std::string_view message) {
    GlobalLogger()->Info(component, message);
}

void LogWarn(std::string_view component, std::string_view message) {
    GlobalLogger()->Warn(component, message);
}

void LogError(std::string_view component, std::string_view message) {
    GlobalLogger()->Error(component, message);
}

} // namespace toolhost
