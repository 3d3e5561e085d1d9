#include <string>
#include <variant>

#include <gtest/gtest.h>

#include "interval.error.hpp"
#include "interval.format.hpp"
#include "interval.hpp"
#include "logging.hpp"

TEST(IntervalError, RequireNonEmpty) {
    const tl::expected<Interval<int>, IntervalError> ok = require_non_empty(Interval<int>::closed(1, 2));
    ASSERT_TRUE(ok.has_value());
    EXPECT_EQ(Interval<int>::closed(1, 2), *ok);

    const tl::expected<Interval<int>, IntervalError> empty = require_non_empty(Interval<int>::open(2, 2));
    ASSERT_FALSE(empty.has_value());
    ASSERT_TRUE(std::holds_alternative<EmptyIntervalError>(empty.error()));
    EXPECT_EQ("2", std::get<EmptyIntervalError>(empty.error()).point);
}

TEST(IntervalError, Describe) {
    EXPECT_EQ("inverted interval: left point 5 lies past right point 4",
              describe_interval_error(InvertedIntervalError{"5", "4"}));
    EXPECT_EQ("empty interval at point 2", describe_interval_error(EmptyIntervalError{"2"}));
    EXPECT_EQ("no error", describe_interval_error(IntervalError{}));
}

TEST(IntervalError, Logging) {
    ASSERT_NE(nullptr, library_logger());
    EXPECT_EQ(g_logger.load(), library_logger());

    log_interval_error(nullptr, InvertedIntervalError{"1", "0"});
    log_interval_error(library_logger(), InvertedIntervalError{"1", "0"});
    log_interval_error(library_logger(), IntervalError{});
}

TEST(IntervalError, RenderPoint) {
    EXPECT_EQ("1.25", render_point(1.25));
    EXPECT_EQ("abc", render_point(std::string{"abc"}));
}
