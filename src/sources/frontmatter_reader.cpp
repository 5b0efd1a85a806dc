#include "notetrack/sources/frontmatter_reader.hpp"
#include "notetrack/utils/logging.hpp"
#include "notetrack/utils/string_utils.hpp"

#include <yaml-cpp/yaml.h>

namespace notetrack::sources {

namespace {

core::FrontMatterValue convertNode(const YAML::Node &node) {
	switch (node.Type()) {
	case YAML::NodeType::Sequence: {
		std::vector<core::FrontMatterValue> items;
		items.reserve(node.size());
		for (const auto &item : node) {
			items.push_back(convertNode(item));
		}
		return core::FrontMatterValue::list(std::move(items));
	}
	case YAML::NodeType::Scalar: {
		// Quoted scalars carry the non-specific "!" tag and always stay strings.
		if (node.Tag() == "!") {
			return core::FrontMatterValue::string(node.Scalar());
		}
		bool flag = false;
		if (YAML::convert<bool>::decode(node, flag)) {
			return core::FrontMatterValue::boolean(flag);
		}
		double number = 0.0;
		if (YAML::convert<double>::decode(node, number)) {
			return core::FrontMatterValue::number(number);
		}
		return core::FrontMatterValue::string(node.Scalar());
	}
	case YAML::NodeType::Map:
		NOTETRACK_DEBUG("Nested front matter mapping treated as null.");
		return core::FrontMatterValue();
	default:
		return core::FrontMatterValue();
	}
}

} // namespace

std::optional<core::FrontMatter> readFrontMatter(std::string_view text) {
	const auto lines = utils::splitLines(text);
	if (lines.empty() || utils::trim(lines[0]) != "---") {
		return std::nullopt;
	}

	std::size_t close = 0;
	for (std::size_t i = 1; i < lines.size(); ++i) {
		const std::string trimmed = utils::trim(lines[i]);
		if (trimmed == "---" || trimmed == "...") {
			close = i;
			break;
		}
	}
	if (close == 0) {
		NOTETRACK_DEBUG("Front matter block is not closed.");
		return std::nullopt;
	}

	std::string block;
	for (std::size_t i = 1; i < close; ++i) {
		block += lines[i];
		block += '\n';
	}

	YAML::Node root;
	try {
		root = YAML::Load(block);
	} catch (const YAML::Exception &e) {
		NOTETRACK_DEBUG("Front matter is not valid YAML: {}", e.what());
		return std::nullopt;
	}

	core::FrontMatter frontmatter;
	if (root.IsNull()) {
		return frontmatter;
	}
	if (!root.IsMap()) {
		NOTETRACK_DEBUG("Front matter is not a mapping.");
		return std::nullopt;
	}
	for (const auto &entry : root) {
		if (!entry.first.IsScalar() || entry.first.Scalar().empty()) {
			continue;
		}
		frontmatter[entry.first.Scalar()] = convertNode(entry.second);
	}
	return frontmatter;
}

std::vector<std::string> scanWikiLinks(std::string_view text) {
	std::vector<std::string> links;
	std::size_t pos = 0;
	while ((pos = text.find("[[", pos)) != std::string_view::npos) {
		const std::size_t close = text.find("]]", pos + 2);
		if (close == std::string_view::npos) {
			break;
		}
		const bool embed = pos > 0 && text[pos - 1] == '!';
		std::string_view inner = text.substr(pos + 2, close - pos - 2);
		pos = close + 2;
		if (embed || inner.find('\n') != std::string_view::npos) {
			continue;
		}
		const auto bar = inner.find('|');
		if (bar != std::string_view::npos) {
			inner = inner.substr(0, bar);
		}
		std::string target = utils::trim(inner);
		if (!target.empty()) {
			links.push_back(std::move(target));
		}
	}
	return links;
}

core::DocumentMetadata deriveMetadata(std::string_view text) {
	core::DocumentMetadata metadata;
	metadata.frontmatter = readFrontMatter(text);
	metadata.links = scanWikiLinks(text);
	return metadata;
}

} // namespace notetrack::sources
