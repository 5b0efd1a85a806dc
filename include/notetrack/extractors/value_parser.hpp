#pragma once

#include "notetrack/core/query.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace notetrack::extractors {

/**
 * @struct Extraction
 * @brief What one extractor found for one document and query.
 *
 * An empty value means the target was present without a usable number.
 * time_value reports that at least one contributing value was a clock time.
 */
struct Extraction {
	std::optional<double> value;
	bool time_value = false;
};

/// A single number read from text.
struct ParsedValue {
	double value = 0.0;
	bool time_value = false;
};

/**
 * @brief Parses the longest numeric prefix of @p text.
 *
 * Leading whitespace is skipped; accepts an optional sign, digits with an
 * optional fraction and exponent, or "Infinity". Returns std::nullopt when no
 * number starts the text.
 */
std::optional<double> parseLeadingFloat(std::string_view text);

/**
 * @brief Reads a clock time or a number.
 *
 * Text containing ':' is tried against the clock-time patterns first and
 * yields seconds since midnight on success; anything else, including a failed
 * time, falls through to parseLeadingFloat().
 */
std::optional<ParsedValue> parseTimeOrNumber(std::string_view text);

/**
 * @class ValueAccumulator
 * @brief Sums the contributions of every match of one query in one document.
 */
class ValueAccumulator {
public:
	explicit ValueAccumulator(const core::Query &query) : query_(query) {}

	/// Records a match that carries no value: adds the query's constant.
	void addConstant();

	/**
	 * @brief Records a match with attached values.
	 *
	 * The values are split on ',' when present, otherwise on the query
	 * separator. A single token is used as is; otherwise the token at the
	 * query's first accessor is used, and an out-of-range accessor contributes
	 * nothing. Exact zeros are dropped for queries that ignore zero values.
	 */
	void addAttached(std::string_view values, std::size_t accessor_position = 0);

	/// Marks a match that contributed nothing.
	void markMatched() {
		matched_ = true;
	}

	bool matched() const {
		return matched_;
	}

	bool hasValue() const {
		return has_value_;
	}

	/// One extraction when any match occurred, with an empty value if nothing was usable.
	std::optional<Extraction> result() const;

private:
	void contribute(const ParsedValue &parsed);

	const core::Query &query_;
	bool matched_ = false;
	bool has_value_ = false;
	bool time_value_ = false;
	double sum_ = 0.0;
};

} // namespace notetrack::extractors
