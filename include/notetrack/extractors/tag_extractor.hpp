#pragma once

#include "notetrack/core/query.hpp"
#include "notetrack/extractors/value_parser.hpp"

#include <optional>
#include <string_view>

namespace notetrack::extractors {

/**
 * @brief Sums the inline hashtags of a tag query found in note text.
 *
 * The tag name is the query's parent target when set, otherwise its target.
 * A hashtag carrying values contributes the parsed value (unless the query
 * ignores attached values); a bare hashtag contributes the query constant.
 *
 * @return One extraction when any hashtag matched. Its value is empty when
 *         every match carried values that could not be read.
 */
std::optional<Extraction> extractInlineTag(std::string_view text, const core::Query &query);

} // namespace notetrack::extractors
