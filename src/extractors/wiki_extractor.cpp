#include "notetrack/extractors/wiki_extractor.hpp"

namespace notetrack::extractors {

std::optional<Extraction> extractWikiLinks(const std::vector<std::string> &links, const core::Query &query) {
	bool matched = false;
	double measure = 0.0;
	for (const auto &link : links) {
		if (link == query.target()) {
			matched = true;
			measure += query.constValue();
		}
	}
	if (!matched) {
		return std::nullopt;
	}
	return Extraction{measure, false};
}

} // namespace notetrack::extractors
