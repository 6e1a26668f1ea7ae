#include "graphweave/backends/SpdlogBackend.h"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <vector>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace graphweave {

namespace {

constexpr const char* kLoggerName = "graphweave";
constexpr const char* kConsolePattern = "[%H:%M:%S.%e] [%^%l%$] %v";
constexpr const char* kFilePattern = "[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v";

std::optional<spdlog::level::level_enum> levelFromEnvironment() {
    const char* env = std::getenv("LOG_LEVEL");
    if (!env) {
        env = std::getenv("SPDLOG_LEVEL");
    }
    if (!env) {
        return std::nullopt;
    }

    std::string value(env);
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (value == "trace") return spdlog::level::trace;
    if (value == "debug") return spdlog::level::debug;
    if (value == "info") return spdlog::level::info;
    if (value == "warn" || value == "warning") return spdlog::level::warn;
    if (value == "err" || value == "error") return spdlog::level::err;
    if (value == "critical") return spdlog::level::critical;
    if (value == "off") return spdlog::level::off;
    return std::nullopt;
}

}  // namespace

SpdlogBackend::SpdlogBackend(const std::string& logDir, bool logToFile)
    : logger_(createLogger(logDir, logToFile)) {
    logger_->set_level(spdlog::level::info);
    if (auto level = levelFromEnvironment()) {
        logger_->set_level(*level);
    }
}

std::shared_ptr<spdlog::logger> SpdlogBackend::createLogger(const std::string& logDir, bool logToFile) {
    // A second backend in the same process reuses the registered logger
    if (auto existing = spdlog::get(kLoggerName)) {
        return existing;
    }

    std::vector<spdlog::sink_ptr> sinks;

    auto console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console->set_pattern(kConsolePattern);
    sinks.push_back(console);

    if (logToFile && !logDir.empty()) {
        std::filesystem::create_directories(logDir);
        auto path = std::filesystem::path(logDir) / "graphweave.log";
        auto file = std::make_shared<spdlog::sinks::basic_file_sink_mt>(path.string(), true);
        file->set_pattern(kFilePattern);
        sinks.push_back(file);
    }

    auto logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
    spdlog::register_logger(logger);
    return logger;
}

void SpdlogBackend::log(LogLevel level, const std::string& message,
                        [[maybe_unused]] const std::source_location& loc) {
    logger_->log(convertLevel(level), message);
}

void SpdlogBackend::setLevel(LogLevel level) {
    logger_->set_level(convertLevel(level));
}

void SpdlogBackend::flush() {
    logger_->flush();
}

spdlog::level::level_enum SpdlogBackend::convertLevel(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return spdlog::level::trace;
        case LogLevel::Debug: return spdlog::level::debug;
        case LogLevel::Info: return spdlog::level::info;
        case LogLevel::Warn: return spdlog::level::warn;
        case LogLevel::Error: return spdlog::level::err;
        case LogLevel::Critical: return spdlog::level::critical;
        case LogLevel::Off: return spdlog::level::off;
    }
    return spdlog::level::info;
}

}  // namespace graphweave
