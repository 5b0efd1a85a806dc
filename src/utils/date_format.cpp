#include "notetrack/utils/date_format.hpp"

#include <array>
#include <cctype>
#include <cstdio>
#include <stdexcept>
#include <utility>

namespace notetrack::utils {

namespace {

constexpr std::array<const char *, 12> kMonthNames = {"January", "February", "March",     "April",
                                                      "May",     "June",     "July",      "August",
                                                      "September", "October", "November", "December"};

constexpr std::array<const char *, 7> kWeekdayNames = {"Sunday",   "Monday", "Tuesday", "Wednesday",
                                                       "Thursday", "Friday", "Saturday"};

bool isDigit(char ch) {
	return std::isdigit(static_cast<unsigned char>(ch)) != 0;
}

// Reads between min_width and max_width digits, greedily.
std::optional<int> readNumber(std::string_view text, std::size_t &pos, std::size_t min_width, std::size_t max_width) {
	std::size_t end = pos;
	while (end < text.size() && end - pos < max_width && isDigit(text[end])) {
		++end;
	}
	if (end - pos < min_width) {
		return std::nullopt;
	}
	int value = 0;
	for (std::size_t i = pos; i < end; ++i) {
		value = value * 10 + (text[i] - '0');
	}
	pos = end;
	return value;
}

bool matchesIgnoreCase(std::string_view text, std::size_t pos, std::string_view word) {
	if (text.size() - pos < word.size()) {
		return false;
	}
	for (std::size_t i = 0; i < word.size(); ++i) {
		if (std::tolower(static_cast<unsigned char>(text[pos + i])) !=
		    std::tolower(static_cast<unsigned char>(word[i]))) {
			return false;
		}
	}
	return true;
}

// Returns the zero-based index of the name found at pos, trying full names or 3-letter abbreviations.
template <std::size_t N>
std::optional<int> readName(std::string_view text, std::size_t &pos, const std::array<const char *, N> &names,
                            bool abbreviated) {
	for (std::size_t i = 0; i < N; ++i) {
		std::string_view name(names[i]);
		if (abbreviated) {
			name = name.substr(0, 3);
		}
		if (matchesIgnoreCase(text, pos, name)) {
			pos += name.size();
			return static_cast<int>(i);
		}
	}
	return std::nullopt;
}

std::string pad(int value, int width) {
	char buffer[16];
	std::snprintf(buffer, sizeof(buffer), "%0*d", width, value);
	return buffer;
}

std::string ordinal(unsigned day) {
	const unsigned tens = day % 100;
	if (tens >= 11 && tens <= 13) {
		return std::to_string(day) + "th";
	}
	switch (day % 10) {
	case 1:
		return std::to_string(day) + "st";
	case 2:
		return std::to_string(day) + "nd";
	case 3:
		return std::to_string(day) + "rd";
	default:
		return std::to_string(day) + "th";
	}
}

} // namespace

DateFormat::DateFormat(std::string pattern) : pattern_(std::move(pattern)) {
	if (pattern_.empty()) {
		throw std::invalid_argument("Date format pattern must not be empty.");
	}
	compile();
}

void DateFormat::compile() {
	// Longest tokens first so that e.g. "MMMM" is not read as "MM" + "MM".
	static const std::vector<std::pair<std::string, TokenKind>> kTokenTable = {
	    {"YYYY", TokenKind::Year4},        {"YY", TokenKind::Year2},          {"MMMM", TokenKind::MonthLong},
	    {"MMM", TokenKind::MonthShort},    {"MM", TokenKind::Month2},         {"M", TokenKind::Month1},
	    {"Do", TokenKind::DayOrdinal},     {"DD", TokenKind::Day2},           {"D", TokenKind::Day1},
	    {"dddd", TokenKind::WeekdayLong},  {"ddd", TokenKind::WeekdayShort},  {"HH", TokenKind::Hour24Padded},
	    {"H", TokenKind::Hour24},          {"hh", TokenKind::Hour12Padded},   {"h", TokenKind::Hour12},
	    {"mm", TokenKind::Minute2},        {"m", TokenKind::Minute1},         {"ss", TokenKind::Second2},
	    {"s", TokenKind::Second1},         {"A", TokenKind::MeridiemUpper},   {"a", TokenKind::MeridiemLower}};

	auto appendLiteral = [this](std::string_view text) {
		if (!tokens_.empty() && tokens_.back().kind == TokenKind::Literal) {
			tokens_.back().literal.append(text);
		} else {
			tokens_.push_back(Token{TokenKind::Literal, std::string(text)});
		}
	};

	std::size_t pos = 0;
	while (pos < pattern_.size()) {
		if (pattern_[pos] == '[') {
			const std::size_t close = pattern_.find(']', pos + 1);
			if (close != std::string::npos) {
				appendLiteral(std::string_view(pattern_).substr(pos + 1, close - pos - 1));
				pos = close + 1;
				continue;
			}
		}

		bool matched = false;
		for (const auto &entry : kTokenTable) {
			if (pattern_.compare(pos, entry.first.size(), entry.first) == 0) {
				tokens_.push_back(Token{entry.second, {}});
				pos += entry.first.size();
				matched = true;
				break;
			}
		}
		if (!matched) {
			appendLiteral(std::string_view(pattern_).substr(pos, 1));
			++pos;
		}
	}
}

std::optional<DateTimeFields> DateFormat::parse(std::string_view text) const {
	int year = 1970;
	int month = 1;
	int day = 1;
	int hour = 0;
	int minute = 0;
	int second = 0;
	bool twelve_hour = false;
	std::optional<bool> post_meridiem;
	std::optional<int> weekday;

	std::size_t pos = 0;
	for (const auto &token : tokens_) {
		std::optional<int> value;
		switch (token.kind) {
		case TokenKind::Literal:
			if (text.compare(pos, token.literal.size(), token.literal) != 0) {
				return std::nullopt;
			}
			pos += token.literal.size();
			continue;
		case TokenKind::Year4:
			value = readNumber(text, pos, 4, 4);
			if (!value) {
				return std::nullopt;
			}
			year = *value;
			break;
		case TokenKind::Year2:
			value = readNumber(text, pos, 2, 2);
			if (!value) {
				return std::nullopt;
			}
			year = *value + (*value > 68 ? 1900 : 2000);
			break;
		case TokenKind::MonthLong:
		case TokenKind::MonthShort:
			value = readName(text, pos, kMonthNames, token.kind == TokenKind::MonthShort);
			if (!value) {
				return std::nullopt;
			}
			month = *value + 1;
			break;
		case TokenKind::Month2:
		case TokenKind::Month1:
			value = readNumber(text, pos, token.kind == TokenKind::Month2 ? 2 : 1, 2);
			if (!value) {
				return std::nullopt;
			}
			month = *value;
			break;
		case TokenKind::DayOrdinal:
			value = readNumber(text, pos, 1, 2);
			if (!value) {
				return std::nullopt;
			}
			if (!(matchesIgnoreCase(text, pos, "st") || matchesIgnoreCase(text, pos, "nd") ||
			      matchesIgnoreCase(text, pos, "rd") || matchesIgnoreCase(text, pos, "th"))) {
				return std::nullopt;
			}
			pos += 2;
			day = *value;
			break;
		case TokenKind::Day2:
		case TokenKind::Day1:
			value = readNumber(text, pos, token.kind == TokenKind::Day2 ? 2 : 1, 2);
			if (!value) {
				return std::nullopt;
			}
			day = *value;
			break;
		case TokenKind::WeekdayLong:
		case TokenKind::WeekdayShort:
			weekday = readName(text, pos, kWeekdayNames, token.kind == TokenKind::WeekdayShort);
			if (!weekday) {
				return std::nullopt;
			}
			break;
		case TokenKind::Hour24Padded:
		case TokenKind::Hour24:
		case TokenKind::Hour12Padded:
		case TokenKind::Hour12: {
			const bool padded = token.kind == TokenKind::Hour24Padded || token.kind == TokenKind::Hour12Padded;
			value = readNumber(text, pos, padded ? 2 : 1, 2);
			if (!value) {
				return std::nullopt;
			}
			hour = *value;
			twelve_hour = token.kind == TokenKind::Hour12Padded || token.kind == TokenKind::Hour12;
			break;
		}
		case TokenKind::Minute2:
		case TokenKind::Minute1:
			value = readNumber(text, pos, token.kind == TokenKind::Minute2 ? 2 : 1, 2);
			if (!value) {
				return std::nullopt;
			}
			minute = *value;
			break;
		case TokenKind::Second2:
		case TokenKind::Second1:
			value = readNumber(text, pos, token.kind == TokenKind::Second2 ? 2 : 1, 2);
			if (!value) {
				return std::nullopt;
			}
			second = *value;
			break;
		case TokenKind::MeridiemUpper:
		case TokenKind::MeridiemLower:
			if (matchesIgnoreCase(text, pos, "am")) {
				post_meridiem = false;
			} else if (matchesIgnoreCase(text, pos, "pm")) {
				post_meridiem = true;
			} else {
				return std::nullopt;
			}
			pos += 2;
			break;
		}
	}

	if (pos != text.size()) {
		return std::nullopt;
	}

	if (twelve_hour && (hour < 1 || hour > 12)) {
		return std::nullopt;
	}
	if (post_meridiem.has_value()) {
		if (*post_meridiem && hour < 12) {
			hour += 12;
		} else if (!*post_meridiem && hour == 12) {
			hour = 0;
		}
	}
	if (hour > 23 || minute > 59 || second > 59) {
		return std::nullopt;
	}

	auto date = core::Date::tryFromCivil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
	if (!date) {
		return std::nullopt;
	}
	if (weekday && static_cast<unsigned>(*weekday) != date->weekday()) {
		return std::nullopt;
	}

	DateTimeFields fields;
	fields.date = *date;
	fields.hour = hour;
	fields.minute = minute;
	fields.second = second;
	return fields;
}

std::optional<core::Date> DateFormat::parseDate(std::string_view text) const {
	auto fields = parse(text);
	if (!fields) {
		return std::nullopt;
	}
	return fields->date;
}

std::string DateFormat::format(const core::Date &date) const {
	DateTimeFields fields;
	fields.date = date;
	return format(fields);
}

std::string DateFormat::format(const DateTimeFields &fields) const {
	const int year = fields.date.year();
	const auto month = static_cast<int>(fields.date.month());
	const auto day = static_cast<int>(fields.date.day());
	const int hour12 = fields.hour % 12 == 0 ? 12 : fields.hour % 12;
	const bool pm = fields.hour >= 12;

	std::string out;
	for (const auto &token : tokens_) {
		switch (token.kind) {
		case TokenKind::Literal:
			out += token.literal;
			break;
		case TokenKind::Year4:
			out += pad(year, 4);
			break;
		case TokenKind::Year2:
			out += pad(((year % 100) + 100) % 100, 2);
			break;
		case TokenKind::MonthLong:
			out += kMonthNames[static_cast<std::size_t>(month - 1)];
			break;
		case TokenKind::MonthShort:
			out += std::string(kMonthNames[static_cast<std::size_t>(month - 1)]).substr(0, 3);
			break;
		case TokenKind::Month2:
			out += pad(month, 2);
			break;
		case TokenKind::Month1:
			out += std::to_string(month);
			break;
		case TokenKind::DayOrdinal:
			out += ordinal(static_cast<unsigned>(day));
			break;
		case TokenKind::Day2:
			out += pad(day, 2);
			break;
		case TokenKind::Day1:
			out += std::to_string(day);
			break;
		case TokenKind::WeekdayLong:
			out += kWeekdayNames[fields.date.weekday()];
			break;
		case TokenKind::WeekdayShort:
			out += std::string(kWeekdayNames[fields.date.weekday()]).substr(0, 3);
			break;
		case TokenKind::Hour24Padded:
			out += pad(fields.hour, 2);
			break;
		case TokenKind::Hour24:
			out += std::to_string(fields.hour);
			break;
		case TokenKind::Hour12Padded:
			out += pad(hour12, 2);
			break;
		case TokenKind::Hour12:
			out += std::to_string(hour12);
			break;
		case TokenKind::Minute2:
			out += pad(fields.minute, 2);
			break;
		case TokenKind::Minute1:
			out += std::to_string(fields.minute);
			break;
		case TokenKind::Second2:
			out += pad(fields.second, 2);
			break;
		case TokenKind::Second1:
			out += std::to_string(fields.second);
			break;
		case TokenKind::MeridiemUpper:
			out += pm ? "PM" : "AM";
			break;
		case TokenKind::MeridiemLower:
			out += pm ? "pm" : "am";
			break;
		}
	}
	return out;
}

const std::vector<std::string> &timeOfDayPatterns() {
	static const std::vector<std::string> kPatterns = {"HH:mm",   "HH:m",   "H:mm",   "H:m",
	                                                   "hh:mm A", "hh:mm a", "hh:m A", "hh:m a",
	                                                   "h:mm A",  "h:mm a",  "h:m A",  "h:m a"};
	return kPatterns;
}

std::optional<int> parseTimeOfDay(std::string_view text) {
	static const std::vector<DateFormat> kFormats = [] {
		std::vector<DateFormat> formats;
		for (const auto &pattern : timeOfDayPatterns()) {
			formats.emplace_back(pattern);
		}
		return formats;
	}();

	for (const auto &format : kFormats) {
		if (auto fields = format.parse(text)) {
			return fields->secondsOfDay();
		}
	}
	return std::nullopt;
}

} // namespace notetrack::utils
