#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace notetrack::core {

/**
 * @class Date
 * @brief A calendar day in the proleptic Gregorian calendar.
 *
 * Dates are stored as a signed day count relative to 1970-01-01, which makes
 * day arithmetic and ordering trivial. Every series produced by the library
 * is indexed at this granularity.
 */
class Date {
public:
	using TimePoint = std::chrono::system_clock::time_point;

	/// Constructs 1970-01-01.
	Date() = default;

	/**
	 * @brief Builds a date from civil components.
	 * @throws std::invalid_argument If the month or day is out of range.
	 */
	static Date fromCivil(int year, unsigned month, unsigned day);

	/// Non-throwing variant of fromCivil().
	static std::optional<Date> tryFromCivil(int year, unsigned month, unsigned day);

	static Date fromDaysSinceEpoch(std::int64_t days) {
		Date date;
		date.days_ = days;
		return date;
	}

	int year() const;
	unsigned month() const;
	unsigned day() const;

	/// Day of week, 0 = Sunday.
	unsigned weekday() const;

	/// Day of year, 1-based.
	unsigned dayOfYear() const;

	std::int64_t daysSinceEpoch() const {
		return days_;
	}

	Date addDays(std::int64_t count) const {
		return fromDaysSinceEpoch(days_ + count);
	}

	/// Signed number of days from this date to @p other.
	std::int64_t daysUntil(const Date &other) const {
		return other.days_ - days_;
	}

	/// Midnight UTC of this day.
	TimePoint toTimePoint() const;

	/// Formats as YYYY-MM-DD.
	std::string toIsoString() const;

	static bool isLeapYear(int year);
	static unsigned daysInMonth(int year, unsigned month);

	bool operator==(const Date &other) const {
		return days_ == other.days_;
	}
	bool operator!=(const Date &other) const {
		return days_ != other.days_;
	}
	bool operator<(const Date &other) const {
		return days_ < other.days_;
	}
	bool operator<=(const Date &other) const {
		return days_ <= other.days_;
	}
	bool operator>(const Date &other) const {
		return days_ > other.days_;
	}
	bool operator>=(const Date &other) const {
		return days_ >= other.days_;
	}

private:
	struct Civil {
		int year;
		unsigned month;
		unsigned day;
	};

	Civil toCivil() const;

	std::int64_t days_ = 0;
};

} // namespace notetrack::core
