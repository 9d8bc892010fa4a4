#include "date_util.h"

#include <fmt/chrono.h>
#include <fmt/format.h>

#include <charconv>
#include <ctime>
#include <stdexcept>

namespace {
int parse_field(const std::string &text, std::size_t offset, std::size_t length) {
    int value{};
    const auto *first = text.data() + offset;
    const auto *last = first + length;
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc{} || ptr != last) {
        throw std::invalid_argument(fmt::format("Invalid ISO date: '{}'", text));
    }

    return value;
}
} // anonymous namespace

namespace aera::core {

Date today_utc() {
    auto now = std::chrono::system_clock::now();
    return Date{std::chrono::floor<std::chrono::days>(now)};
}

Date add_days(const Date &date, int days) {
    return Date{std::chrono::sys_days{date} + std::chrono::days{days}};
}

Date parse_iso_date(const std::string &text) {
    if (text.size() != 10 || text[4] != '-' || text[7] != '-') {
        throw std::invalid_argument(fmt::format("Invalid ISO date: '{}'", text));
    }

    auto date = Date{std::chrono::year{parse_field(text, 0, 4)},
                     std::chrono::month{static_cast<unsigned>(parse_field(text, 5, 2))},
                     std::chrono::day{static_cast<unsigned>(parse_field(text, 8, 2))}};
    if (!date.ok()) {
        throw std::invalid_argument(fmt::format("Invalid calendar date: '{}'", text));
    }

    return date;
}

std::string to_iso_string(const Date &date) {
    return fmt::format("{:04}-{:02}-{:02}", static_cast<int>(date.year()),
                       static_cast<unsigned>(date.month()), static_cast<unsigned>(date.day()));
}

std::string to_iso_timestamp(const TimePoint &time) {
    using namespace std::chrono;
    auto seconds_part = floor<seconds>(time);
    auto millis = duration_cast<milliseconds>(time - seconds_part).count();
    auto tm = fmt::gmtime(system_clock::to_time_t(seconds_part));
    return fmt::format("{:%Y-%m-%dT%H:%M:%S}.{:03}Z", tm, millis);
}

} // namespace aera::core
