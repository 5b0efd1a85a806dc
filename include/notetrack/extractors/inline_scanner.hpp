#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace notetrack::extractors {

/**
 * @struct InlineMatch
 * @brief One match inside note text: its span and the value text it carries, if any.
 */
struct InlineMatch {
	std::size_t begin = 0;
	std::size_t end = 0;
	std::optional<std::string> values;
};

/**
 * @brief Finds hashtags named @p tag_name, in document order.
 *
 * A hashtag starts at the beginning of the text or after whitespace, may be
 * nested ("#name/child/grandchild"), may carry values after a colon
 * ("#name:12.5", "#name:22:30", "#name:1/2/3", optionally followed by a unit
 * such as "kg"), may be followed by punctuation, and must end at whitespace or
 * the end of the text. Trailing commas are not part of the values.
 */
std::vector<InlineMatch> scanHashtags(std::string_view text, std::string_view tag_name);

/**
 * @brief Finds inline field annotations "key:: values", in document order.
 *
 * The key may be wrapped in up to two '*' on each side and must start the text
 * or follow whitespace. The values are the longest prefix of the rest of the
 * line made of word characters, ". / - , @ ; :" and blanks that ends at
 * whitespace or the end of the line, trimmed.
 */
std::vector<InlineMatch> scanFieldAnnotations(std::string_view text, std::string_view key);

} // namespace notetrack::extractors
