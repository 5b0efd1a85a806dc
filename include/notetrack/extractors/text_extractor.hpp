#pragma once

#include "notetrack/core/query.hpp"
#include "notetrack/extractors/text_pattern.hpp"
#include "notetrack/extractors/value_parser.hpp"

#include <optional>
#include <string_view>

namespace notetrack::extractors {

/**
 * @brief Sums the matches of a text query's regular expression.
 *
 * When the pattern declares named groups and the query reads attached values,
 * each match contributes the text of its "value" group; otherwise each match
 * contributes the query constant.
 *
 * @return An extraction only when some match contributed a value.
 */
std::optional<Extraction> extractText(std::string_view text, const core::Query &query, const TextPattern &pattern);

/// Compiles the query target and extracts; throws std::invalid_argument for invalid patterns.
std::optional<Extraction> extractText(std::string_view text, const core::Query &query);

} // namespace notetrack::extractors
