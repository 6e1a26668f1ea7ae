#pragma once

#include "graphweave/common/ILoggerBackend.h"
#include <memory>
#include <spdlog/spdlog.h>

namespace graphweave {

/**
 * @brief Default Logger backend built on spdlog
 *
 * Console output always; with a log directory a second sink appends to
 * <logDir>/graphweave.log. The LOG_LEVEL (or SPDLOG_LEVEL) environment
 * variable overrides the initial level.
 */
class SpdlogBackend : public ILoggerBackend {
public:
    explicit SpdlogBackend(const std::string& logDir = "", bool logToFile = false);

    void log(LogLevel level, const std::string& message,
             const std::source_location& loc) override;
    void setLevel(LogLevel level) override;
    void flush() override;

private:
    std::shared_ptr<spdlog::logger> logger_;

    static spdlog::level::level_enum convertLevel(LogLevel level);
    static std::shared_ptr<spdlog::logger> createLogger(const std::string& logDir, bool logToFile);
};

}  // namespace graphweave
