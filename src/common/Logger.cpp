#include "graphweave/common/Logger.h"
#include "graphweave/backends/SpdlogBackend.h"

#include <cctype>
#include <mutex>

namespace graphweave {

std::unique_ptr<ILoggerBackend> Logger::backend_;
static std::recursive_mutex backend_mutex;

static bool capture_enabled_ = false;
static std::vector<std::string> captured_logs_;
static std::mutex capture_mutex_;

const char* logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "trace";
        case LogLevel::Debug: return "debug";
        case LogLevel::Info: return "info";
        case LogLevel::Warn: return "warn";
        case LogLevel::Error: return "error";
        case LogLevel::Critical: return "critical";
        case LogLevel::Off: return "off";
    }
    return "unknown";
}

void Logger::setBackend(std::unique_ptr<ILoggerBackend> backend) {
    std::lock_guard<std::recursive_mutex> lock(backend_mutex);
    backend_ = std::move(backend);
}

void Logger::initialize() {
    std::lock_guard<std::recursive_mutex> lock(backend_mutex);
    if (!backend_) {
        backend_ = std::make_unique<SpdlogBackend>();
    }
}

void Logger::initialize(const std::string& logDir, bool logToFile) {
    std::lock_guard<std::recursive_mutex> lock(backend_mutex);
    if (!backend_) {
        backend_ = std::make_unique<SpdlogBackend>(logDir, logToFile);
    }
}

void Logger::setLevel(LogLevel level) {
    std::lock_guard<std::recursive_mutex> lock(backend_mutex);
    ensureBackend();
    backend_->setLevel(level);
}

void Logger::trace(const std::string& message, const std::source_location& loc) {
    dispatch(LogLevel::Trace, message, loc);
}

void Logger::debug(const std::string& message, const std::source_location& loc) {
    dispatch(LogLevel::Debug, message, loc);
}

void Logger::info(const std::string& message, const std::source_location& loc) {
    dispatch(LogLevel::Info, message, loc);
}

void Logger::warn(const std::string& message, const std::source_location& loc) {
    dispatch(LogLevel::Warn, message, loc);
}

void Logger::error(const std::string& message, const std::source_location& loc) {
    dispatch(LogLevel::Error, message, loc);
}

void Logger::flush() {
    std::lock_guard<std::recursive_mutex> lock(backend_mutex);
    ensureBackend();
    backend_->flush();
}

void Logger::dispatch(LogLevel level, const std::string& message,
                      const std::source_location& loc) {
    std::string enhanced = extractFunctionName(loc) + "() - " + message;
    {
        std::lock_guard<std::recursive_mutex> lock(backend_mutex);
        ensureBackend();
        backend_->log(level, enhanced, loc);
    }
    captureLog(level, enhanced);
}

void Logger::ensureBackend() {
    if (!backend_) {
        initialize();
    }
}

// ===== Capture =====

void Logger::enableCapture(bool enable) {
    std::lock_guard<std::mutex> lock(capture_mutex_);
    capture_enabled_ = enable;
}

bool Logger::isCaptureEnabled() {
    std::lock_guard<std::mutex> lock(capture_mutex_);
    return capture_enabled_;
}

std::vector<std::string> Logger::getCapturedLogs(const std::string& pattern, size_t maxLines) {
    std::lock_guard<std::mutex> lock(capture_mutex_);

    std::vector<std::string> result;
    for (const auto& line : captured_logs_) {
        if (pattern.empty() || line.find(pattern) != std::string::npos) {
            result.push_back(line);
        }
    }

    if (maxLines > 0 && result.size() > maxLines) {
        result.erase(result.begin(), result.begin() + (result.size() - maxLines));
    }
    return result;
}

void Logger::clearCapturedLogs() {
    std::lock_guard<std::mutex> lock(capture_mutex_);
    captured_logs_.clear();
}

void Logger::captureLog(LogLevel level, const std::string& message) {
    std::lock_guard<std::mutex> lock(capture_mutex_);
    if (capture_enabled_) {
        captured_logs_.push_back(std::string("[") + logLevelName(level) + "] " + message);
    }
}

std::string Logger::extractFunctionName(const std::source_location& loc) {
    std::string full = loc.function_name();

    size_t paren = full.find('(');
    if (paren == std::string::npos) {
        return "Unknown";
    }

    // Last top-level space before the argument list separates return type from name
    int depth = 0;
    size_t start = 0;
    for (size_t i = 0; i < paren; ++i) {
        char c = full[i];
        if (c == '<') ++depth;
        else if (c == '>') --depth;
        else if (c == ' ' && depth == 0) start = i + 1;
    }

    std::string name;
    depth = 0;
    for (size_t i = start; i < paren; ++i) {
        char c = full[i];
        if (c == '<') ++depth;
        else if (c == '>') --depth;
        else if (depth == 0) name += c;
    }

    while (!name.empty() && (std::isspace(static_cast<unsigned char>(name.front())) ||
                             name.front() == '*' || name.front() == '&')) {
        name.erase(0, 1);
    }
    while (!name.empty() && std::isspace(static_cast<unsigned char>(name.back()))) {
        name.pop_back();
    }

    return name.empty() ? "Unknown" : name;
}

}  // namespace graphweave
