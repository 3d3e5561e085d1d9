#pragma once

#include <string>
#include <variant>

#include <fmt/format.h>
#include <quill/Logger.h>

struct InvertedIntervalError {
    std::string left_point;
    std::string right_point;
};

struct EmptyIntervalError {
    std::string point;
};

using IntervalError = std::variant<std::monostate, InvertedIntervalError, EmptyIntervalError>;

std::string describe_interval_error(const IntervalError& err);
void log_interval_error(quill::Logger* logger, const IntervalError& err);

template <typename T>
std::string render_point(const T& point) {
    if constexpr (fmt::is_formattable<T>::value) {
        return fmt::format("{}", point);
    } else {
        return "<point>";
    }
}
