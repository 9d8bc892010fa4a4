#include "univariate_summary.h"

#include <cmath>

namespace aera::core {
UnivariateSummary::UnivariateSummary()
    : name_{"Untitled"}, min_{std::nan("")}, max_{std::nan("")} {}

UnivariateSummary::UnivariateSummary(std::string name)
    : name_{std::move(name)}, min_{std::nan("")}, max_{std::nan("")} {}

UnivariateSummary::UnivariateSummary(const std::vector<double> &values) : UnivariateSummary() {
    append(values);
}

const std::string &UnivariateSummary::name() const noexcept { return name_; }

bool UnivariateSummary::is_empty() const noexcept { return count_ < 1.0; }

std::size_t UnivariateSummary::count() const noexcept { return static_cast<std::size_t>(count_); }

double UnivariateSummary::min() const noexcept { return min_; }

double UnivariateSummary::max() const noexcept { return max_; }

double UnivariateSummary::sum() const noexcept { return count_ * mean_; }

double UnivariateSummary::average() const noexcept { return is_empty() ? std::nan("") : mean_; }

double UnivariateSummary::population_variance() const noexcept {
    if (is_empty()) {
        return std::nan("");
    }

    return second_moment_;
}

double UnivariateSummary::std_deviation() const noexcept {
    return std::sqrt(population_variance());
}

void UnivariateSummary::append(double value) noexcept {
    if (is_empty()) {
        min_ = value;
        max_ = value;
    } else {
        min_ = value < min_ ? value : min_;
        max_ = value > max_ ? value : max_;
    }

    // Moments calculation
    double n = count_;
    double n1 = n + 1.0;
    double delta = (mean_ - value) / n1;
    second_moment_ += (1 + n) * delta * delta;
    second_moment_ *= n / n1;
    mean_ -= delta;
    count_ = n1;
}

void UnivariateSummary::append(const std::vector<double> &values) noexcept {
    for (const auto &v : values) {
        append(v);
    }
}
} // namespace aera::core
