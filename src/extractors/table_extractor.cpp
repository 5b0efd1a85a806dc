#include "notetrack/extractors/table_extractor.hpp"
#include "notetrack/extractors/value_parser.hpp"
#include "notetrack/utils/logging.hpp"
#include "notetrack/utils/string_utils.hpp"

namespace notetrack::extractors {

std::vector<TableReference> groupTableQueries(const std::vector<core::Query> &queries) {
	std::vector<TableReference> tables;
	for (const auto &query : queries) {
		if (!query.isTableQuery()) {
			continue;
		}
		const std::string &file_path = *query.parentTarget();
		const int table_index = query.accessor(0);

		TableReference *table = nullptr;
		for (auto &candidate : tables) {
			if (candidate.file_path == file_path && candidate.table_index == table_index) {
				table = &candidate;
				break;
			}
		}
		if (table == nullptr) {
			tables.push_back(TableReference{file_path, table_index, std::nullopt, {}});
			table = &tables.back();
		}

		if (!query.usedAsXDataset()) {
			table->y_queries.push_back(query);
		} else if (table->x_query) {
			NOTETRACK_WARN("Table {}[{}] already has x query #{}; ignoring query #{}.", file_path, table_index,
			               table->x_query->id(), query.id());
		} else {
			table->x_query = query;
		}
	}
	return tables;
}

std::vector<std::string> splitTableRow(std::string_view line) {
	const std::string row = utils::trimByChar(utils::trim(line), '|');
	std::vector<std::string> cells = utils::split(row, "|");
	for (auto &cell : cells) {
		cell = utils::trim(cell);
	}
	return cells;
}

std::vector<std::string> findTableBlocks(std::string_view text) {
	std::vector<std::string> blocks;
	std::string current;
	bool in_block = false;
	for (const auto &line : utils::splitLines(text)) {
		if (line.find('|') != std::string::npos) {
			if (in_block) {
				current += '\n';
			}
			current += line;
			in_block = true;
		} else if (in_block) {
			blocks.push_back(std::move(current));
			current.clear();
			in_block = false;
		}
	}
	if (in_block) {
		blocks.push_back(std::move(current));
	}
	return blocks;
}

std::optional<MarkdownTable> parseTableBlock(std::string_view block) {
	std::vector<std::string> lines;
	for (auto &line : utils::splitLines(block)) {
		if (!line.empty()) {
			lines.push_back(std::move(line));
		}
	}
	if (lines.size() < 2) {
		return std::nullopt;
	}

	MarkdownTable table;
	table.header = splitTableRow(lines[0]);
	// lines[1] is the separator row.
	for (std::size_t i = 2; i < lines.size(); ++i) {
		table.rows.push_back(splitTableRow(lines[i]));
	}
	return table;
}

std::optional<MarkdownTable> locateTable(std::string_view text, int table_index) {
	if (table_index < 0) {
		return std::nullopt;
	}
	const auto blocks = findTableBlocks(text);
	if (static_cast<std::size_t>(table_index) >= blocks.size()) {
		return std::nullopt;
	}
	return parseTableBlock(blocks[static_cast<std::size_t>(table_index)]);
}

TableExtraction extractTable(const TableReference &reference, std::string_view text,
                             const utils::DateFormat &date_format) {
	TableExtraction extraction;
	if (!reference.x_query) {
		NOTETRACK_WARN("Table {}[{}] has no x query; skipping.", reference.file_path, reference.table_index);
		return extraction;
	}

	const auto table = locateTable(text, reference.table_index);
	if (!table || table->rows.empty()) {
		NOTETRACK_DEBUG("Table {}[{}] has no data rows.", reference.file_path, reference.table_index);
		return extraction;
	}

	const auto x_column = static_cast<std::size_t>(reference.x_query->accessor(1));
	if (x_column >= table->columnCount()) {
		NOTETRACK_DEBUG("Date column {} lies beyond table {}[{}].", x_column, reference.file_path,
		                reference.table_index);
		return extraction;
	}

	std::vector<std::optional<core::Date>> row_dates;
	row_dates.reserve(table->rows.size());
	for (const auto &row : table->rows) {
		std::optional<core::Date> date;
		if (x_column < row.size()) {
			date = date_format.parseDate(row[x_column]);
		}
		if (date) {
			extraction.row_dates.push_back(*date);
		} else {
			NOTETRACK_DEBUG("Skipping table row without a valid date in {}[{}].", reference.file_path,
			                reference.table_index);
		}
		row_dates.push_back(date);
	}

	for (const auto &y_query : reference.y_queries) {
		const auto column = static_cast<std::size_t>(y_query.accessor(1));
		if (column >= table->columnCount()) {
			NOTETRACK_DEBUG("Column {} of query #{} lies beyond table {}[{}].", column, y_query.id(),
			                reference.file_path, reference.table_index);
			continue;
		}

		for (std::size_t i = 0; i < table->rows.size(); ++i) {
			const auto &row = table->rows[i];
			if (!row_dates[i] || column >= row.size()) {
				continue;
			}
			ValueAccumulator accumulator(y_query);
			accumulator.addAttached(row[column], 2);
			const auto result = accumulator.result();
			if (result && result->value) {
				extraction.observations.push_back(TableObservation{*row_dates[i], y_query.id(), *result->value});
				if (result->time_value) {
					extraction.time_valued_queries.insert(y_query.id());
				}
			}
		}
	}
	return extraction;
}

} // namespace notetrack::extractors
