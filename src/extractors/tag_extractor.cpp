#include "notetrack/extractors/tag_extractor.hpp"
#include "notetrack/extractors/inline_scanner.hpp"

namespace notetrack::extractors {

std::optional<Extraction> extractInlineTag(std::string_view text, const core::Query &query) {
	const std::string &tag_name = query.parentTarget() ? *query.parentTarget() : query.target();

	ValueAccumulator accumulator(query);
	for (const auto &match : scanHashtags(text, tag_name)) {
		if (match.values && !query.ignoreAttachedValue()) {
			accumulator.addAttached(*match.values);
		} else {
			accumulator.addConstant();
		}
	}
	return accumulator.result();
}

} // namespace notetrack::extractors
