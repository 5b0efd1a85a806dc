#pragma once

#include "notetrack/core/date.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace notetrack::utils {

/**
 * @struct DateTimeFields
 * @brief Result of a strict parse: a calendar day plus a wall-clock time.
 *
 * Components absent from the pattern keep their defaults (1970-01-01, 00:00:00).
 */
struct DateTimeFields {
	core::Date date;
	int hour = 0;
	int minute = 0;
	int second = 0;

	/// Elapsed seconds since midnight.
	int secondsOfDay() const {
		return hour * 3600 + minute * 60 + second;
	}
};

/**
 * @class DateFormat
 * @brief Strict parser and formatter for moment-style date patterns.
 *
 * Supported tokens: YYYY, YY, MMMM, MMM, MM, M, Do, DD, D, dddd, ddd, HH, H,
 * hh, h, mm, m, ss, s, A, a. Text inside square brackets is literal, as is any
 * character that does not start a token.
 *
 * Parsing is strict: fixed-width tokens require their exact width, literals
 * must match exactly, the whole input must be consumed and the resulting
 * calendar date must exist.
 */
class DateFormat {
public:
	/**
	 * @brief Compiles a pattern.
	 * @throws std::invalid_argument If the pattern is empty.
	 */
	explicit DateFormat(std::string pattern);

	const std::string &pattern() const {
		return pattern_;
	}

	/// Parses date and time components. Returns std::nullopt when the text does not match strictly.
	std::optional<DateTimeFields> parse(std::string_view text) const;

	/// Parses a calendar day, discarding any time components.
	std::optional<core::Date> parseDate(std::string_view text) const;

	std::string format(const core::Date &date) const;
	std::string format(const DateTimeFields &fields) const;

private:
	enum class TokenKind {
		Literal,
		Year4,
		Year2,
		MonthLong,
		MonthShort,
		Month2,
		Month1,
		DayOrdinal,
		Day2,
		Day1,
		WeekdayLong,
		WeekdayShort,
		Hour24Padded,
		Hour24,
		Hour12Padded,
		Hour12,
		Minute2,
		Minute1,
		Second2,
		Second1,
		MeridiemUpper,
		MeridiemLower
	};

	struct Token {
		TokenKind kind;
		std::string literal;
	};

	void compile();

	std::string pattern_;
	std::vector<Token> tokens_;
};

/// The twelve accepted clock-time patterns, 24-hour forms first.
const std::vector<std::string> &timeOfDayPatterns();

/**
 * @brief Parses a clock time against timeOfDayPatterns().
 * @return Seconds since midnight, or std::nullopt if no pattern matches strictly.
 */
std::optional<int> parseTimeOfDay(std::string_view text);

} // namespace notetrack::utils
