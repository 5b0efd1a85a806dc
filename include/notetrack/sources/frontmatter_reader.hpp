#pragma once

#include "notetrack/core/document.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace notetrack::sources {

/**
 * @brief Reads the YAML front matter at the top of a note.
 *
 * The block must open on the first line with "---" and close with "---" or
 * "...". Its body is parsed with yaml-cpp. Plain scalars become booleans or
 * numbers when they read as such; quoted scalars stay strings. Sequences
 * become lists and nested mappings become null.
 *
 * @return std::nullopt when the note has no front matter block, or when the
 *         block is not a valid YAML mapping.
 */
std::optional<core::FrontMatter> readFrontMatter(std::string_view text);

/**
 * @brief Collects the targets of `[[target]]` and `[[target|alias]]` links.
 *
 * Embeds (`![[...]]`) are not links and are skipped. Targets keep their
 * order of appearance, duplicates included.
 */
std::vector<std::string> scanWikiLinks(std::string_view text);

/// Front matter and links of a note, as a source would report them.
core::DocumentMetadata deriveMetadata(std::string_view text);

} // namespace notetrack::sources
