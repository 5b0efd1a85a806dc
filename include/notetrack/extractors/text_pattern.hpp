#pragma once

#include "notetrack/extractors/inline_scanner.hpp"

#include <boost/regex.hpp>

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace notetrack::extractors {

/**
 * @class TextPattern
 * @brief An ECMAScript regular expression with named capture groups.
 *
 * "(?<name>...)" groups are rewritten into plain capturing groups and their
 * indices are remembered; "\k<name>" back-references are rewritten
 * accordingly. Matching runs on Boost.Regex, whose matcher does not recurse
 * per character, so long lines are safe. '^' and '$' match at line
 * boundaries and '.' does not match a newline.
 */
class TextPattern {
public:
	/**
	 * @brief Compiles @p pattern.
	 * @throws std::invalid_argument If the pattern is empty or not a valid regular expression.
	 */
	explicit TextPattern(const std::string &pattern);

	const std::string &source() const {
		return source_;
	}

	/// The pattern after named groups were rewritten.
	const std::string &translated() const {
		return translated_;
	}

	bool hasNamedGroups() const {
		return !named_groups_.empty();
	}

	std::optional<std::size_t> groupIndex(const std::string &name) const;

	/**
	 * @brief Finds every match in document order.
	 *
	 * Each match carries the text captured by @p value_group when that group
	 * exists and took part in the match.
	 *
	 * @throws std::runtime_error If the matcher gives up on @p text, e.g. when
	 *         backtracking exceeds Boost.Regex's complexity limit.
	 */
	std::vector<InlineMatch> findAll(std::string_view text, const std::string &value_group = "value") const;

private:
	std::string source_;
	std::string translated_;
	std::map<std::string, std::size_t> named_groups_;
	boost::regex regex_;
};

} // namespace notetrack::extractors
