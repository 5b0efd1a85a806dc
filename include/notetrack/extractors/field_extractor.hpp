#pragma once

#include "notetrack/core/query.hpp"
#include "notetrack/extractors/value_parser.hpp"

#include <optional>
#include <string_view>

namespace notetrack::extractors {

/**
 * @brief Sums the "key:: value" annotations of a field query found in note text.
 *
 * The key is the query's parent target when set, otherwise its target. Values
 * are read like hashtag values: split on ',' or the separator, picked by the
 * accessor when several are present, parsed as clock time or number.
 */
std::optional<Extraction> extractField(std::string_view text, const core::Query &query);

} // namespace notetrack::extractors
