#include "notetrack/extractors/value_parser.hpp"
#include "notetrack/utils/date_format.hpp"
#include "notetrack/utils/string_utils.hpp"

#include <cctype>
#include <charconv>
#include <limits>
#include <string>
#include <system_error>
#include <vector>

namespace notetrack::extractors {

namespace {

bool isDigit(char ch) {
	return std::isdigit(static_cast<unsigned char>(ch)) != 0;
}

} // namespace

std::optional<double> parseLeadingFloat(std::string_view text) {
	std::size_t pos = 0;
	while (pos < text.size() && utils::isSpace(text[pos])) {
		++pos;
	}

	const std::size_t start = pos;
	bool negative = false;
	if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
		negative = text[pos] == '-';
		++pos;
	}

	if (text.substr(pos, 8) == "Infinity") {
		return negative ? -std::numeric_limits<double>::infinity() : std::numeric_limits<double>::infinity();
	}

	std::size_t digits = 0;
	while (pos < text.size() && isDigit(text[pos])) {
		++pos;
		++digits;
	}
	if (pos < text.size() && text[pos] == '.') {
		++pos;
		while (pos < text.size() && isDigit(text[pos])) {
			++pos;
			++digits;
		}
	}
	if (digits == 0) {
		return std::nullopt;
	}

	// An exponent only counts when at least one digit follows it.
	if (pos < text.size() && (text[pos] == 'e' || text[pos] == 'E')) {
		std::size_t exp_pos = pos + 1;
		if (exp_pos < text.size() && (text[exp_pos] == '+' || text[exp_pos] == '-')) {
			++exp_pos;
		}
		if (exp_pos < text.size() && isDigit(text[exp_pos])) {
			while (exp_pos < text.size() && isDigit(text[exp_pos])) {
				++exp_pos;
			}
			pos = exp_pos;
		}
	}

	// from_chars ignores the C locale, so '.' is always the decimal point.
	const std::size_t digits_start = negative || text[start] == '+' ? start + 1 : start;
	double value = 0.0;
	const auto result = std::from_chars(text.data() + digits_start, text.data() + pos, value);
	if (result.ec == std::errc::result_out_of_range) {
		const std::string_view span = text.substr(digits_start, pos - digits_start);
		const std::size_t exponent = span.find_first_of("eE");
		const bool underflow = exponent != std::string_view::npos && exponent + 1 < span.size() &&
		                       span[exponent + 1] == '-';
		value = underflow ? 0.0 : std::numeric_limits<double>::infinity();
	} else if (result.ec != std::errc()) {
		return std::nullopt;
	}
	return negative ? -value : value;
}

std::optional<ParsedValue> parseTimeOrNumber(std::string_view text) {
	const std::string trimmed = utils::trim(text);
	if (trimmed.find(':') != std::string::npos) {
		if (auto seconds = utils::parseTimeOfDay(trimmed)) {
			return ParsedValue{static_cast<double>(*seconds), true};
		}
	}
	if (auto number = parseLeadingFloat(trimmed)) {
		return ParsedValue{*number, false};
	}
	return std::nullopt;
}

void ValueAccumulator::addConstant() {
	matched_ = true;
	has_value_ = true;
	sum_ += query_.constValue();
}

void ValueAccumulator::addAttached(std::string_view values, std::size_t accessor_position) {
	matched_ = true;

	const std::vector<std::string> tokens = utils::splitValues(values, query_.separator());
	std::string_view selected;
	if (tokens.size() == 1) {
		selected = values;
	} else {
		const auto index = static_cast<std::size_t>(query_.accessor(accessor_position));
		if (index >= tokens.size()) {
			return;
		}
		selected = tokens[index];
	}

	if (auto parsed = parseTimeOrNumber(selected)) {
		contribute(*parsed);
	}
}

void ValueAccumulator::contribute(const ParsedValue &parsed) {
	if (query_.ignoreZeroValue() && parsed.value == 0.0) {
		return;
	}
	sum_ += parsed.value;
	has_value_ = true;
	time_value_ = time_value_ || parsed.time_value;
}

std::optional<Extraction> ValueAccumulator::result() const {
	if (!matched_) {
		return std::nullopt;
	}
	Extraction extraction;
	if (has_value_) {
		extraction.value = sum_;
	}
	extraction.time_value = time_value_;
	return extraction;
}

} // namespace notetrack::extractors
