#include "notetrack/pipeline/aggregator.hpp"
#include "notetrack/core/value_store.hpp"
#include "notetrack/extractors/field_extractor.hpp"
#include "notetrack/extractors/frontmatter_extractor.hpp"
#include "notetrack/extractors/table_extractor.hpp"
#include "notetrack/extractors/tag_extractor.hpp"
#include "notetrack/extractors/text_extractor.hpp"
#include "notetrack/extractors/wiki_extractor.hpp"
#include "notetrack/pipeline/dataset_assembler.hpp"
#include "notetrack/pipeline/date_range.hpp"
#include "notetrack/utils/logging.hpp"
#include "notetrack/utils/string_utils.hpp"

#include <map>
#include <set>
#include <stdexcept>

namespace notetrack::pipeline {

namespace {

/// Mutable state shared by the two scan passes.
struct RunState {
	core::DateKeyedValueStore store;
	DateRangeTracker tracker;
	std::set<int> time_valued_queries;
	std::size_t accepted_sources = 0;
	std::size_t out_of_bounds_sources = 0;
};

void record(RunState &state, const std::string &key, const core::Query &query,
            const std::optional<extractors::Extraction> &extraction) {
	if (!extraction) {
		return;
	}
	state.store.add(key, query.id(), extraction->value);
	if (extraction->time_value) {
		state.time_valued_queries.insert(query.id());
	}
}

void scanDocument(RunState &state, const sources::IDocumentSource &source, const core::DocumentHandle &document,
                  const core::Date &date, const std::vector<core::Query> &queries,
                  const std::map<int, extractors::TextPattern> &patterns, const DocumentRequirements &requirements,
                  const utils::DateFormat &date_format) {
	std::optional<core::DocumentMetadata> metadata;
	if (requirements.needs_metadata) {
		metadata = source.readDocumentMetadata(document);
	}
	std::optional<std::string> text;
	if (requirements.needs_text) {
		text = source.readDocumentText(document);
	}

	const std::string key = date_format.format(date);
	const core::FrontMatter *frontmatter = metadata && metadata->frontmatter ? &*metadata->frontmatter : nullptr;

	for (const auto &query : queries) {
		switch (query.type()) {
		case core::SearchType::Frontmatter:
			if (frontmatter) {
				record(state, key, query, extractors::extractFrontMatterKey(*frontmatter, query));
			}
			break;
		case core::SearchType::Tag:
			if (frontmatter) {
				record(state, key, query, extractors::extractFrontMatterTags(*frontmatter, query));
			}
			if (text) {
				record(state, key, query, extractors::extractInlineTag(*text, query));
			}
			break;
		case core::SearchType::Wiki:
			if (metadata) {
				record(state, key, query, extractors::extractWikiLinks(metadata->links, query));
			}
			break;
		case core::SearchType::Text:
			if (text) {
				record(state, key, query, extractors::extractText(*text, query, patterns.at(query.id())));
			}
			break;
		case core::SearchType::DataviewField:
			if (text) {
				record(state, key, query, extractors::extractField(*text, query));
			}
			break;
		case core::SearchType::Table:
			break;
		}
	}
}

void scanTables(RunState &state, const sources::IDocumentSource &source, const std::vector<core::Query> &queries,
                const AggregationConfig &config, const utils::DateFormat &date_format) {
	for (const auto &table : extractors::groupTableQueries(queries)) {
		if (!table.x_query) {
			NOTETRACK_WARN("Table {}[{}] has no x query; skipping.", table.file_path, table.table_index);
			continue;
		}

		const std::string path = table.file_path + config.table_document_extension;
		const auto handle = source.resolveDocumentByPath(path);
		if (!handle) {
			NOTETRACK_WARN("Table note '{}' not found; skipping its queries.", path);
			continue;
		}
		++state.accepted_sources;

		const auto text = source.readDocumentText(*handle);
		if (!text) {
			NOTETRACK_DEBUG("Table note '{}' could not be read.", path);
			continue;
		}

		const auto extraction = extractors::extractTable(table, *text, date_format);
		for (const auto &date : extraction.row_dates) {
			state.tracker.observe(date);
		}
		for (const auto &observation : extraction.observations) {
			state.store.add(date_format.format(observation.date), observation.query_id, observation.value);
		}
		state.time_valued_queries.insert(extraction.time_valued_queries.begin(),
		                                 extraction.time_valued_queries.end());
	}
}

} // namespace

void AggregationConfig::validate() const {
	if (date_format.empty()) {
		throw std::invalid_argument("Date format must not be empty.");
	}
	if (table_document_extension.empty()) {
		throw std::invalid_argument("Table document extension must not be empty.");
	}
}

DocumentRequirements analyzeRequirements(const std::vector<core::Query> &queries) {
	DocumentRequirements requirements;
	for (const auto &query : queries) {
		switch (query.type()) {
		case core::SearchType::Frontmatter:
		case core::SearchType::Wiki:
			requirements.needs_metadata = true;
			requirements.has_per_document_queries = true;
			break;
		case core::SearchType::Tag:
			requirements.needs_metadata = true;
			requirements.needs_text = true;
			requirements.has_per_document_queries = true;
			break;
		case core::SearchType::Text:
		case core::SearchType::DataviewField:
			requirements.needs_text = true;
			requirements.has_per_document_queries = true;
			break;
		case core::SearchType::Table:
			break;
		}
	}
	return requirements;
}

std::optional<core::Date> resolveDocumentDate(const std::string &basename, const AggregationConfig &config,
                                              const utils::DateFormat &date_format) {
	std::string name = basename;
	if (!config.date_format_prefix.empty() && utils::startsWith(name, config.date_format_prefix)) {
		name.erase(0, config.date_format_prefix.size());
	}
	if (!config.date_format_suffix.empty() && utils::endsWith(name, config.date_format_suffix)) {
		name.erase(name.size() - config.date_format_suffix.size());
	}
	return date_format.parseDate(name);
}

AggregationResult aggregate(const sources::IDocumentSource &source,
                            const std::vector<core::DocumentHandle> &documents,
                            const std::vector<core::Query> &queries, const AggregationConfig &config) {
	config.validate();
	const utils::DateFormat date_format(config.date_format);

	std::set<int> ids;
	for (const auto &query : queries) {
		if (!ids.insert(query.id()).second) {
			throw std::invalid_argument("Query id " + std::to_string(query.id()) + " is used more than once.");
		}
	}

	std::map<int, extractors::TextPattern> patterns;
	for (const auto &query : queries) {
		if (query.type() != core::SearchType::Text) {
			continue;
		}
		try {
			patterns.emplace(query.id(), extractors::TextPattern(query.target()));
		} catch (const std::invalid_argument &e) {
			NOTETRACK_ERROR("Query #{} has an invalid pattern: {}", query.id(), e.what());
			return AggregationError{AggregationErrorCode::InvalidQuery,
			                        "Invalid text pattern in query #" + std::to_string(query.id()) + ": " + e.what()};
		}
	}

	RunState state;
	const DocumentRequirements requirements = analyzeRequirements(queries);

	if (requirements.has_per_document_queries) {
		for (const auto &document : documents) {
			const auto date = resolveDocumentDate(document.basename, config, date_format);
			if (!date) {
				NOTETRACK_DEBUG("Skipping '{}': name carries no date in format '{}'.", document.path,
				                config.date_format);
				continue;
			}
			if ((config.start_date && *date < *config.start_date) || (config.end_date && *date > *config.end_date)) {
				NOTETRACK_DEBUG("Skipping '{}': {} lies outside the configured range.", document.path,
				                date->toIsoString());
				++state.out_of_bounds_sources;
				continue;
			}

			++state.accepted_sources;
			state.tracker.observe(*date);
			scanDocument(state, source, document, *date, queries, patterns, requirements, date_format);
		}
	}

	scanTables(state, source, queries, config, date_format);

	const DateRangeResolver resolver(config.start_date, config.end_date);
	auto resolved = resolver.resolve(state.tracker, state.accepted_sources, state.out_of_bounds_sources);
	if (auto *error = std::get_if<AggregationError>(&resolved)) {
		NOTETRACK_INFO("Aggregation failed: {}", error->message);
		return std::move(*error);
	}
	const core::DateWindow window = std::get<core::DateWindow>(resolved);

	const DatasetAssembler assembler(date_format);
	AggregationOutput output{window, assembler.assemble(queries, state.store, window, state.time_valued_queries)};

	NOTETRACK_INFO("Aggregated {} observations from {} notes into {} datasets over {} days ({} to {}).",
	               state.store.size(), state.accepted_sources, output.datasets.size(), window.days(),
	               window.start.toIsoString(), window.end.toIsoString());
	return AggregationResult(std::move(output));
}

AggregationResult aggregate(const sources::IDocumentSource &source, const std::vector<core::Query> &queries,
                            const AggregationConfig &config) {
	return aggregate(source, source.listCandidateDocuments(config.folder, config.include_subfolders), queries,
	                 config);
}

} // namespace notetrack::pipeline
