#pragma once

#include <atomic>
#include <string>

#include <quill/Logger.h>
#include <quill/core/LogLevel.h>
#include <tl/optional.hpp>

struct LoggingConfig {
    std::string logger_name{"interval_algebra"};
    quill::LogLevel log_level{quill::LogLevel::Info};
    // console sink when absent
    tl::optional<std::string> log_file{};
    std::string format_pattern{"%(time) [%(thread_id)] %(source_location:<28) "
                               "LOG_%(log_level:<9) %(logger:<12) %(message)"};
    std::string timestamp_pattern{"%H:%M:%S.%Qns"};
};

extern std::atomic<quill::Logger*> g_logger;

// Replaces any logger already registered under cfg.logger_name.
quill::Logger* setup_logging(const LoggingConfig& cfg = LoggingConfig{});

quill::Logger* library_logger();
