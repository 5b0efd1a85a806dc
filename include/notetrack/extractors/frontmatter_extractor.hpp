#pragma once

#include "notetrack/core/document.hpp"
#include "notetrack/core/query.hpp"
#include "notetrack/extractors/value_parser.hpp"

#include <optional>
#include <string>
#include <vector>

namespace notetrack::extractors {

/**
 * @brief Counts front-matter tags matching a tag query.
 *
 * The "tags" field may hold one tag or a list. A tag matches when it equals
 * the query target or is nested below it ("target/child"). Each match adds the
 * query's constant value. Values attached to front-matter tags are not read.
 *
 * @return The summed constants, or std::nullopt when nothing matched.
 */
std::optional<Extraction> extractFrontMatterTags(const core::FrontMatter &frontmatter, const core::Query &query);

/**
 * @brief Reads a numeric or clock-time value from a front-matter key.
 *
 * The target key is looked up first. When it is absent and the query has a
 * parent target, the parent's value is split into tokens and the token at the
 * query accessor is parsed instead.
 */
std::optional<Extraction> extractFrontMatterKey(const core::FrontMatter &frontmatter, const core::Query &query);

/// Tokens of a multi-value front-matter field, or std::nullopt for kinds that cannot be split.
std::optional<std::vector<std::string>> splitFrontMatterValue(const core::FrontMatterValue &value,
                                                              const std::string &separator);

} // namespace notetrack::extractors
