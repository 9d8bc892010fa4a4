#include "run_context.h"

#include <crossguid/guid.hpp>

#include <stdexcept>

namespace aera {

RunContext::RunContext(RunSettings settings, core::Date snapshot_date)
    : RunContext(xg::newGuid().str(), std::chrono::system_clock::now(), std::move(settings),
                 snapshot_date) {}

RunContext::RunContext(std::string run_id, core::TimePoint started_at, RunSettings settings,
                       core::Date snapshot_date)
    : run_id_{std::move(run_id)}, started_at_{started_at}, settings_{std::move(settings)},
      snapshot_date_{snapshot_date} {
    if (run_id_.empty()) {
        throw std::invalid_argument("The run identifier must not be empty.");
    }
    if (!snapshot_date_.ok()) {
        throw std::invalid_argument("The run snapshot date is not a valid calendar date.");
    }
}

const std::string &RunContext::run_id() const noexcept { return run_id_; }

const core::TimePoint &RunContext::started_at() const noexcept { return started_at_; }

const core::Date &RunContext::snapshot_date() const noexcept { return snapshot_date_; }

core::Date RunContext::baseline_date() const {
    return core::add_days(snapshot_date_, -settings_.baseline_days);
}

const RunSettings &RunContext::settings() const noexcept { return settings_; }

std::int64_t RunContext::elapsed_ms(const core::TimePoint &now) const noexcept {
    return std::chrono::duration_cast<std::chrono::milliseconds>(now - started_at_).count();
}

} // namespace aera
