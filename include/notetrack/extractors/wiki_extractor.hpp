#pragma once

#include "notetrack/core/query.hpp"
#include "notetrack/extractors/value_parser.hpp"

#include <optional>
#include <string>
#include <vector>

namespace notetrack::extractors {

/**
 * @brief Counts outgoing links equal to the query target.
 * @return The query constant times the number of matches, or std::nullopt without a match.
 */
std::optional<Extraction> extractWikiLinks(const std::vector<std::string> &links, const core::Query &query);

} // namespace notetrack::extractors
