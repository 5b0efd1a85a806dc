#include "notetrack/core/date.hpp"

#include <cstdio>
#include <stdexcept>

namespace notetrack::core {

namespace {

// Days-from-civil and civil-from-days over 400-year eras.
std::int64_t daysFromCivil(int year, unsigned month, unsigned day) {
	const std::int64_t y = static_cast<std::int64_t>(year) - (month <= 2 ? 1 : 0);
	const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
	const auto yoe = static_cast<unsigned>(y - era * 400);
	const unsigned doy = (153 * (month > 2 ? month - 3 : month + 9) + 2) / 5 + day - 1;
	const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
	return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

} // namespace

bool Date::isLeapYear(int year) {
	return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

unsigned Date::daysInMonth(int year, unsigned month) {
	static constexpr unsigned kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
	if (month < 1 || month > 12) {
		throw std::invalid_argument("Month must be in the range 1-12.");
	}
	if (month == 2 && isLeapYear(year)) {
		return 29;
	}
	return kDays[month - 1];
}

std::optional<Date> Date::tryFromCivil(int year, unsigned month, unsigned day) {
	if (month < 1 || month > 12) {
		return std::nullopt;
	}
	if (day < 1 || day > daysInMonth(year, month)) {
		return std::nullopt;
	}
	return fromDaysSinceEpoch(daysFromCivil(year, month, day));
}

Date Date::fromCivil(int year, unsigned month, unsigned day) {
	auto date = tryFromCivil(year, month, day);
	if (!date) {
		throw std::invalid_argument("Invalid calendar date " + std::to_string(year) + "-" + std::to_string(month) +
		                            "-" + std::to_string(day) + ".");
	}
	return *date;
}

Date::Civil Date::toCivil() const {
	const std::int64_t z = days_ + 719468;
	const std::int64_t era = (z >= 0 ? z : z - 146096) / 146097;
	const auto doe = static_cast<unsigned>(z - era * 146097);
	const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
	const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
	const unsigned mp = (5 * doy + 2) / 153;
	const unsigned day = doy - (153 * mp + 2) / 5 + 1;
	const unsigned month = mp < 10 ? mp + 3 : mp - 9;
	const auto year = static_cast<int>(static_cast<std::int64_t>(yoe) + era * 400 + (month <= 2 ? 1 : 0));
	return Civil{year, month, day};
}

int Date::year() const {
	return toCivil().year;
}

unsigned Date::month() const {
	return toCivil().month;
}

unsigned Date::day() const {
	return toCivil().day;
}

unsigned Date::weekday() const {
	// 1970-01-01 was a Thursday.
	const std::int64_t shifted = (days_ + 4) % 7;
	return static_cast<unsigned>(shifted < 0 ? shifted + 7 : shifted);
}

unsigned Date::dayOfYear() const {
	const auto civil = toCivil();
	return static_cast<unsigned>(days_ - daysFromCivil(civil.year, 1, 1)) + 1;
}

Date::TimePoint Date::toTimePoint() const {
	return TimePoint{} + std::chrono::hours(24 * days_);
}

std::string Date::toIsoString() const {
	const auto civil = toCivil();
	char buffer[32];
	std::snprintf(buffer, sizeof(buffer), "%04d-%02u-%02u", civil.year, civil.month, civil.day);
	return buffer;
}

} // namespace notetrack::core
