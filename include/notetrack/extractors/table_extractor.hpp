#pragma once

#include "notetrack/core/date.hpp"
#include "notetrack/core/query.hpp"
#include "notetrack/utils/date_format.hpp"

#include <cstddef>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace notetrack::extractors {

/**
 * @struct TableReference
 * @brief All table queries that read the same table of the same note.
 *
 * The x query selects the date column; every y query selects one value column.
 */
struct TableReference {
	std::string file_path;
	int table_index = 0;
	std::optional<core::Query> x_query;
	std::vector<core::Query> y_queries;
};

/**
 * @brief Groups table queries by (note path, table index), in first-seen order.
 *
 * Non-table queries are ignored. When several x queries name the same table
 * the first one is kept.
 */
std::vector<TableReference> groupTableQueries(const std::vector<core::Query> &queries);

/**
 * @struct MarkdownTable
 * @brief A parsed markdown table: header cells and data rows, separator removed.
 */
struct MarkdownTable {
	std::vector<std::string> header;
	std::vector<std::vector<std::string>> rows;

	std::size_t columnCount() const {
		return header.size();
	}
};

/// Splits one table line into trimmed cells, ignoring the outer pipes.
std::vector<std::string> splitTableRow(std::string_view line);

/// Maximal runs of consecutive lines that contain a '|', in document order.
std::vector<std::string> findTableBlocks(std::string_view text);

/**
 * @brief Parses one table block.
 * @return std::nullopt when the block lacks a header and a separator line.
 */
std::optional<MarkdownTable> parseTableBlock(std::string_view block);

/// The table at zero-based @p table_index among all blocks of @p text.
std::optional<MarkdownTable> locateTable(std::string_view text, int table_index);

struct TableObservation {
	core::Date date;
	int query_id = 0;
	double value = 0.0;
};

/**
 * @struct TableExtraction
 * @brief Values read from one table.
 */
struct TableExtraction {
	/// Every date read from the x column, in row order.
	std::vector<core::Date> row_dates;
	std::vector<TableObservation> observations;
	/// Ids of y queries that read at least one clock-time value.
	std::set<int> time_valued_queries;
};

/**
 * @brief Reads the referenced table out of the note text.
 *
 * Rows whose date cell is missing or does not parse strictly are skipped, as
 * are y queries whose column lies beyond the table width. A table without data
 * rows, or whose date column lies beyond its width, yields nothing.
 */
TableExtraction extractTable(const TableReference &reference, std::string_view text,
                             const utils::DateFormat &date_format);

} // namespace notetrack::extractors
