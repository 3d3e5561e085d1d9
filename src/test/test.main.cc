#include <gtest/gtest.h>

#include <quill/core/LogLevel.h>

#include "logging.hpp"

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);

    LoggingConfig cfg;
    cfg.logger_name = "interval_tests";
    cfg.log_level = quill::LogLevel::Warning;
    setup_logging(cfg);

    return RUN_ALL_TESTS();
}
