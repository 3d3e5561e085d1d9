#include "logging.hpp"

#include <memory>
#include <mutex>
#include <utility>

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/LogMacros.h>
#include <quill/sinks/ConsoleSink.h>
#include <quill/sinks/FileSink.h>

std::atomic<quill::Logger*> g_logger{};

namespace {
std::once_flag g_backend_started;
std::mutex g_setup_lock;

// g_setup_lock held
quill::Logger* setup_logging_locked(const LoggingConfig& cfg) {
    std::call_once(g_backend_started, []() { quill::Backend::start(); });

    // create_or_get_logger hands back an existing logger untouched, sink and pattern included
    if (quill::Logger* existing = quill::Frontend::get_logger(cfg.logger_name)) {
        if (existing == g_logger.load(std::memory_order_acquire))
            g_logger.store(nullptr, std::memory_order_release);
        quill::Frontend::remove_logger_blocking(existing);
    }

    std::shared_ptr<quill::Sink> sink =
        cfg.log_file ? quill::Frontend::create_or_get_sink<quill::FileSink>(
                           *cfg.log_file,
                           []() {
                               quill::FileSinkConfig file_cfg;
                               file_cfg.set_open_mode('w');
                               file_cfg.set_filename_append_option(quill::FilenameAppendOption::StartDateTime);
                               return file_cfg;
                           }(),
                           quill::FileEventNotifier{})
                     : quill::Frontend::create_or_get_sink<quill::ConsoleSink>("interval_console_sink");

    quill::PatternFormatterOptions pfo;
    pfo.format_pattern = cfg.format_pattern;
    pfo.timestamp_pattern = cfg.timestamp_pattern;
    pfo.timestamp_timezone = quill::Timezone::GmtTime;

    quill::Logger* logger = quill::Frontend::create_or_get_logger(cfg.logger_name, std::move(sink), pfo);
    logger->set_log_level(cfg.log_level);
    g_logger.store(logger, std::memory_order_release);

    LOG_DEBUG(logger, "Logger {} ready, sink {}", cfg.logger_name, cfg.log_file.value_or("console"));
    return logger;
}
} // namespace

quill::Logger* setup_logging(const LoggingConfig& cfg) {
    const std::lock_guard<std::mutex> setup_guard{g_setup_lock};
    return setup_logging_locked(cfg);
}

quill::Logger* library_logger() {
    if (quill::Logger* logger = g_logger.load(std::memory_order_acquire))
        return logger;

    const std::lock_guard<std::mutex> setup_guard{g_setup_lock};
    if (quill::Logger* logger = g_logger.load(std::memory_order_acquire))
        return logger;

    return setup_logging_locked(LoggingConfig{});
}
