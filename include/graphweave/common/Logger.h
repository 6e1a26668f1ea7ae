#pragma once

#include "graphweave/common/ILoggerBackend.h"
#include <format>
#include <memory>
#include <source_location>
#include <string>
#include <vector>

namespace graphweave {

/**
 * @brief Process-wide logging facade used by every engine module
 *
 * The backend is created lazily (SpdlogBackend, console only) on the first
 * record unless the host injected one with setBackend() or called
 * initialize() with a log directory.
 *
 * Capture mode keeps a copy of every record in memory so tests can assert
 * on diagnostics:
 * @code
 * graphweave::Logger::enableCapture(true);
 * engine.setGraph(nodes, edges);
 * auto dropped = graphweave::Logger::getCapturedLogs("dropping edge");
 * @endcode
 */
class Logger {
public:
    /// Replace the active backend (ownership transferred)
    static void setBackend(std::unique_ptr<ILoggerBackend> backend);

    /// Create the default console backend if none is installed yet
    static void initialize();

    /**
     * @brief Create the default backend with an additional file sink
     * @param logDir Directory receiving graphweave.log (created if missing)
     * @param logToFile false keeps console output only
     */
    static void initialize(const std::string& logDir, bool logToFile = true);

    static void setLevel(LogLevel level);

    static void trace(const std::string& message,
                      const std::source_location& loc = std::source_location::current());
    static void debug(const std::string& message,
                      const std::source_location& loc = std::source_location::current());
    static void info(const std::string& message,
                     const std::source_location& loc = std::source_location::current());
    static void warn(const std::string& message,
                     const std::source_location& loc = std::source_location::current());
    static void error(const std::string& message,
                      const std::source_location& loc = std::source_location::current());

    static void flush();

    // ===== Capture =====

    static void enableCapture(bool enable);
    static bool isCaptureEnabled();

    /**
     * @brief Captured records, oldest first
     * @param pattern Substring filter (empty = everything)
     * @param maxLines Keep only the newest N matches (0 = unlimited)
     */
    static std::vector<std::string> getCapturedLogs(
        const std::string& pattern = "",
        size_t maxLines = 0);

    static void clearCapturedLogs();

private:
    static std::unique_ptr<ILoggerBackend> backend_;
    static void ensureBackend();
    static void dispatch(LogLevel level, const std::string& message,
                         const std::source_location& loc);
    static std::string extractFunctionName(const std::source_location& loc);
    static void captureLog(LogLevel level, const std::string& message);
};

}  // namespace graphweave

#define LOG_TRACE(...) graphweave::Logger::trace(std::format(__VA_ARGS__), std::source_location::current())
#define LOG_DEBUG(...) graphweave::Logger::debug(std::format(__VA_ARGS__), std::source_location::current())
#define LOG_INFO(...)  graphweave::Logger::info(std::format(__VA_ARGS__), std::source_location::current())
#define LOG_WARN(...)  graphweave::Logger::warn(std::format(__VA_ARGS__), std::source_location::current())
#define LOG_ERROR(...) graphweave::Logger::error(std::format(__VA_ARGS__), std::source_location::current())
