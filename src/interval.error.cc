#include "interval.error.hpp"

#include <string>
#include <utility>

#include <fmt/format.h>
#include <quill/LogMacros.h>
#include <quill/Logger.h>

template <typename... Visitors>
struct VariantVisitor : public Visitors... {
    VariantVisitor() : Visitors{}... {}
    VariantVisitor(Visitors&&... visitors) : Visitors{std::forward<Visitors>(visitors)}... {}

    using Visitors::operator()...;
};

std::string describe_interval_error(const IntervalError& err) {
    return std::visit(VariantVisitor{
                          [](const InvertedIntervalError& e) {
                              return fmt::format("inverted interval: left point {} lies past right point {}",
                                                 e.left_point, e.right_point);
                          },
                          [](const EmptyIntervalError& e) {
                              return fmt::format("empty interval at point {}", e.point);
                          },
                          [](std::monostate) { return std::string{"no error"}; },
                      },
                      err);
}

void log_interval_error(quill::Logger* logger, const IntervalError& err) {
    if (!logger)
        return;

    std::visit(VariantVisitor{
                   [logger](const InvertedIntervalError& e) {
                       LOG_WARNING(logger, "Rejected endpoint shift, left {} > right {}", e.left_point,
                                   e.right_point);
                   },
                   [logger](const EmptyIntervalError& e) {
                       LOG_WARNING(logger, "Empty interval where a non-empty one is required (point {})", e.point);
                   },
                   [](std::monostate) {},
               },
               err);
}
