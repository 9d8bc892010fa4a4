#include "poco.h"

#include <fmt/format.h>

#include <stdexcept>

namespace aera::core {

std::string to_string(DriftStatus status) {
    switch (status) {
    case DriftStatus::stable:
        return "STABLE";
    case DriftStatus::escalating:
        return "ESCALATING";
    case DriftStatus::accelerating:
        return "ACCELERATING";
    default:
        throw std::invalid_argument("Unknown drift status enumeration value.");
    }
}

DriftStatus parse_drift_status(const std::string &text) {
    if (text == "STABLE") {
        return DriftStatus::stable;
    }
    if (text == "ESCALATING") {
        return DriftStatus::escalating;
    }
    if (text == "ACCELERATING") {
        return DriftStatus::accelerating;
    }

    throw std::invalid_argument(fmt::format("Unknown drift status: '{}'", text));
}

std::string to_string(StageStatus status) {
    return status == StageStatus::success ? "SUCCESS" : "FAILED";
}

std::string to_string(const MetricValue &value) {
    return std::visit([](const auto &v) { return fmt::format("{}", v); }, value);
}

} // namespace aera::core
