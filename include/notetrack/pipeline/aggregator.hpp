#pragma once

#include "notetrack/core/date.hpp"
#include "notetrack/core/document.hpp"
#include "notetrack/core/query.hpp"
#include "notetrack/pipeline/aggregation_result.hpp"
#include "notetrack/sources/document_source.hpp"
#include "notetrack/utils/date_format.hpp"

#include <optional>
#include <string>
#include <vector>

namespace notetrack::pipeline {

/**
 * @struct AggregationConfig
 * @brief Options of one aggregation run.
 */
struct AggregationConfig {
	/// Folder whose notes are scanned; "/" is the source root.
	std::string folder = "/";
	bool include_subfolders = true;
	/// Pattern of the date carried by note names, also used for table date cells.
	std::string date_format = "YYYY-MM-DD";
	/// Text stripped from the start of a note name before its date is parsed.
	std::string date_format_prefix;
	/// Text stripped from the end of a note name before its date is parsed.
	std::string date_format_suffix;
	std::optional<core::Date> start_date;
	std::optional<core::Date> end_date;
	/// Appended to a table query's note path to find the note.
	std::string table_document_extension = ".md";

	/// @throws std::invalid_argument If the date format is empty.
	void validate() const;
};

/**
 * @struct DocumentRequirements
 * @brief What the per-document scan needs to read from each note.
 */
struct DocumentRequirements {
	bool needs_metadata = false;
	bool needs_text = false;
	bool has_per_document_queries = false;
};

/// Inspects the non-table queries of a run.
DocumentRequirements analyzeRequirements(const std::vector<core::Query> &queries);

/**
 * @brief Reads the date carried by a note name.
 *
 * The configured prefix and suffix are stripped when present, then the rest
 * must match @p date_format strictly.
 */
std::optional<core::Date> resolveDocumentDate(const std::string &basename, const AggregationConfig &config,
                                              const utils::DateFormat &date_format);

/**
 * @brief Builds one daily dataset per query from the given notes.
 *
 * Notes whose name carries no valid date, or a date outside the configured
 * bounds, are skipped. Table queries read their own note regardless of
 * @p documents.
 *
 * @param source Supplies note text, metadata and table notes.
 * @param documents Candidate notes for the per-document scan.
 * @param queries Queries in output order; ids must be unique.
 * @param config Run options.
 * @return Datasets over the resolved window, or the error that stopped the run.
 * @throws std::invalid_argument If the configuration is invalid or query ids repeat.
 */
AggregationResult aggregate(const sources::IDocumentSource &source,
                            const std::vector<core::DocumentHandle> &documents,
                            const std::vector<core::Query> &queries, const AggregationConfig &config);

/// Lists the candidate notes of @p config.folder and aggregates them.
AggregationResult aggregate(const sources::IDocumentSource &source, const std::vector<core::Query> &queries,
                            const AggregationConfig &config);

} // namespace notetrack::pipeline
