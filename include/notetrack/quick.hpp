#pragma once

#include "notetrack/core/query.hpp"
#include "notetrack/pipeline/aggregator.hpp"
#include "notetrack/sources/filesystem_source.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace notetrack::quick {

/**
 * @brief Builds a query from a search-type name such as "tag" or "dvField".
 * @throws std::invalid_argument For unknown names or invalid targets.
 */
inline core::Query makeQuery(int id, const std::string &search_type, const std::string &target) {
	return core::QueryBuilder().withId(id).withSearchType(core::parseSearchType(search_type)).withTarget(target).build();
}

/**
 * @brief Aggregates the notes of a vault directory on disk.
 * @param vault_root Vault root; config.folder is resolved against it.
 * @throws std::invalid_argument If @p vault_root is not a directory, or as pipeline::aggregate().
 */
inline pipeline::AggregationResult trackFolder(const std::filesystem::path &vault_root,
                                               const std::vector<core::Query> &queries,
                                               const pipeline::AggregationConfig &config = {}) {
	const sources::FilesystemDocumentSource source(vault_root);
	return pipeline::aggregate(source, queries, config);
}

} // namespace notetrack::quick
