#include "notetrack/extractors/frontmatter_extractor.hpp"
#include "notetrack/utils/string_utils.hpp"

namespace notetrack::extractors {

namespace {

std::optional<Extraction> fromParsed(const std::optional<ParsedValue> &parsed) {
	if (!parsed) {
		return std::nullopt;
	}
	return Extraction{parsed->value, parsed->time_value};
}

} // namespace

std::optional<Extraction> extractFrontMatterTags(const core::FrontMatter &frontmatter, const core::Query &query) {
	auto it = frontmatter.find("tags");
	if (it == frontmatter.end() || it->second.isNull()) {
		return std::nullopt;
	}

	std::vector<std::string> tags;
	if (it->second.isList()) {
		for (const auto &item : it->second.items()) {
			tags.push_back(item.toString());
		}
	} else {
		tags.push_back(it->second.toString());
	}

	const std::string nested_prefix = query.target() + "/";
	bool matched = false;
	double measure = 0.0;
	for (const auto &tag : tags) {
		if (tag == query.target() || utils::startsWith(tag, nested_prefix)) {
			measure += query.constValue();
			matched = true;
		}
	}

	if (!matched) {
		return std::nullopt;
	}
	return Extraction{measure, false};
}

std::optional<std::vector<std::string>> splitFrontMatterValue(const core::FrontMatterValue &value,
                                                              const std::string &separator) {
	if (value.isList()) {
		std::vector<std::string> tokens;
		for (const auto &item : value.items()) {
			tokens.push_back(item.toString());
		}
		return tokens;
	}
	if (value.isString()) {
		return utils::splitValues(value.asString(), separator);
	}
	return std::nullopt;
}

std::optional<Extraction> extractFrontMatterKey(const core::FrontMatter &frontmatter, const core::Query &query) {
	auto direct = frontmatter.find(query.target());
	if (direct != frontmatter.end() && !direct->second.isNull()) {
		const auto &value = direct->second;
		if (value.isNumber()) {
			return Extraction{value.asNumber(), false};
		}
		if (value.isString()) {
			return fromParsed(parseTimeOrNumber(value.asString()));
		}
		return std::nullopt;
	}

	if (!query.parentTarget()) {
		return std::nullopt;
	}
	auto parent = frontmatter.find(*query.parentTarget());
	if (parent == frontmatter.end() || parent->second.isNull()) {
		return std::nullopt;
	}

	auto tokens = splitFrontMatterValue(parent->second, query.separator());
	const auto index = static_cast<std::size_t>(query.accessor());
	if (!tokens || index >= tokens->size()) {
		return std::nullopt;
	}
	return fromParsed(parseTimeOrNumber((*tokens)[index]));
}

} // namespace notetrack::extractors
