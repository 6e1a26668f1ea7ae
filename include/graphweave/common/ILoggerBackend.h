#pragma once

#include <source_location>
#include <string>

namespace graphweave {

/// Severity of a log record, ordered from most to least verbose
enum class LogLevel {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
    Critical = 5,
    Off = 6
};

/// Returns a short lowercase tag for the level ("trace", "debug", ...)
const char* logLevelName(LogLevel level);

/**
 * @brief Sink for records produced by graphweave::Logger
 *
 * Hosts that already own a logging system implement this interface and hand
 * it to Logger::setBackend(); the engine then never touches spdlog directly.
 *
 * @code
 * class HostLog : public graphweave::ILoggerBackend {
 * public:
 *     void log(LogLevel level, const std::string& message,
 *              const std::source_location& loc) override {
 *         host_->write(static_cast<int>(level), message, loc.file_name(), loc.line());
 *     }
 *     void setLevel(LogLevel level) override { minimum_ = level; }
 *     void flush() override { host_->flush(); }
 * };
 * @endcode
 */
class ILoggerBackend {
public:
    virtual ~ILoggerBackend() = default;

    /// Write one already-formatted record
    virtual void log(LogLevel level, const std::string& message,
                     const std::source_location& loc) = 0;

    /// Drop records below @p level
    virtual void setLevel(LogLevel level) = 0;

    virtual void flush() = 0;
};

}  // namespace graphweave
