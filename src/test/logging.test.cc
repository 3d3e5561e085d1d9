#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>
#include <quill/LogMacros.h>
#include <quill/core/LogLevel.h>

#include "interval.hpp"
#include "logging.hpp"

namespace {

LoggingConfig test_logging_config() {
    LoggingConfig cfg;
    cfg.logger_name = "interval_tests";
    cfg.log_level = quill::LogLevel::Warning;
    return cfg;
}

std::vector<std::filesystem::path> files_with_prefix(const std::filesystem::path& dir, const std::string& prefix) {
    std::vector<std::filesystem::path> found;
    for (const std::filesystem::directory_entry& entry : std::filesystem::directory_iterator{dir}) {
        if (entry.is_regular_file() && entry.path().filename().string().starts_with(prefix))
            found.push_back(entry.path());
    }
    return found;
}

} // namespace

TEST(Logging, ReconfiguredLoggerSwitchesToFileSink) {
    const std::filesystem::path dir = std::filesystem::path{::testing::TempDir()} / "interval_logging";
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);

    LoggingConfig cfg;
    cfg.logger_name = "interval_reconfigured";
    cfg.log_level = quill::LogLevel::Warning;
    ASSERT_NE(nullptr, setup_logging(cfg));

    cfg.log_file = (dir / "intervals.log").string();
    quill::Logger* file_logger = setup_logging(cfg);
    ASSERT_NE(nullptr, file_logger);
    EXPECT_EQ(file_logger, g_logger.load());
    EXPECT_EQ(quill::LogLevel::Warning, file_logger->get_log_level());

    LOG_WARNING(file_logger, "endpoint shift refused at {}", 42);
    file_logger->flush_log();

    const std::vector<std::filesystem::path> logs = files_with_prefix(dir, "intervals");
    ASSERT_EQ(1u, logs.size());

    std::ifstream in{logs.front()};
    const std::string contents{std::istreambuf_iterator<char>{in}, std::istreambuf_iterator<char>{}};
    EXPECT_NE(std::string::npos, contents.find("endpoint shift refused at 42"));

    setup_logging(test_logging_config());
}

TEST(Logging, ConcurrentRefusedShiftsShareLogger) {
    constexpr int kThreads = 8;
    std::vector<quill::Logger*> seen(kThreads, nullptr);
    std::vector<int> refused(kThreads, 0);

    {
        std::vector<std::jthread> workers;
        for (int idx = 0; idx < kThreads; ++idx) {
            workers.emplace_back([idx, &seen, &refused]() {
                Interval<int> window = Interval<int>::closed(0, idx);
                refused[idx] = !window.try_left_crop(idx + 1).has_value();
                seen[idx] = library_logger();
            });
        }
    }

    for (int idx = 0; idx < kThreads; ++idx) {
        EXPECT_EQ(1, refused[idx]);
        EXPECT_EQ(g_logger.load(), seen[idx]);
    }
}
