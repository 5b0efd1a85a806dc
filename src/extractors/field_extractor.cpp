#include "notetrack/extractors/field_extractor.hpp"
#include "notetrack/extractors/inline_scanner.hpp"

namespace notetrack::extractors {

std::optional<Extraction> extractField(std::string_view text, const core::Query &query) {
	const std::string &key = query.parentTarget() ? *query.parentTarget() : query.target();

	ValueAccumulator accumulator(query);
	for (const auto &match : scanFieldAnnotations(text, key)) {
		if (match.values) {
			accumulator.addAttached(*match.values);
		} else {
			accumulator.addConstant();
		}
	}
	return accumulator.result();
}

} // namespace notetrack::extractors
