#include "notetrack/extractors/text_extractor.hpp"
#include "notetrack/utils/logging.hpp"

#include <stdexcept>
#include <vector>

namespace notetrack::extractors {

std::optional<Extraction> extractText(std::string_view text, const core::Query &query, const TextPattern &pattern) {
	const bool read_values = !query.ignoreAttachedValue() && pattern.hasNamedGroups();

	std::vector<InlineMatch> matches;
	try {
		matches = pattern.findAll(text);
	} catch (const std::runtime_error &e) {
		NOTETRACK_WARN("Text query #{} skipped for this note: {}", query.id(), e.what());
		return std::nullopt;
	}

	ValueAccumulator accumulator(query);
	for (const auto &match : matches) {
		if (!read_values) {
			accumulator.addConstant();
		} else if (match.values) {
			accumulator.addAttached(*match.values);
		} else {
			accumulator.markMatched();
		}
	}

	if (!accumulator.hasValue()) {
		return std::nullopt;
	}
	return accumulator.result();
}

std::optional<Extraction> extractText(std::string_view text, const core::Query &query) {
	const TextPattern pattern(query.target());
	return extractText(text, query, pattern);
}

} // namespace notetrack::extractors
