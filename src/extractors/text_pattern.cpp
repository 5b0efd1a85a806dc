#include "notetrack/extractors/text_pattern.hpp"

#include <stdexcept>

namespace notetrack::extractors {

namespace {

struct Translation {
	std::string pattern;
	std::map<std::string, std::size_t> groups;
};

Translation translateNamedGroups(const std::string &pattern) {
	Translation result;
	std::size_t group_count = 0;
	bool in_class = false;

	std::size_t i = 0;
	while (i < pattern.size()) {
		const char ch = pattern[i];

		if (ch == '\\') {
			if (i + 1 >= pattern.size()) {
				result.pattern += ch;
				++i;
				continue;
			}
			if (!in_class && pattern[i + 1] == 'k' && i + 2 < pattern.size() && pattern[i + 2] == '<') {
				const std::size_t close = pattern.find('>', i + 3);
				if (close != std::string::npos) {
					auto it = result.groups.find(pattern.substr(i + 3, close - i - 3));
					if (it != result.groups.end()) {
						result.pattern += "\\" + std::to_string(it->second);
						i = close + 1;
						continue;
					}
				}
			}
			result.pattern.append(pattern, i, 2);
			i += 2;
			continue;
		}

		if (in_class) {
			if (ch == ']') {
				in_class = false;
			}
			result.pattern += ch;
			++i;
			continue;
		}

		if (ch == '[') {
			in_class = true;
			result.pattern += ch;
			++i;
			continue;
		}

		if (ch == '(') {
			const bool special = i + 1 < pattern.size() && pattern[i + 1] == '?';
			if (!special) {
				++group_count;
			} else if (i + 3 < pattern.size() && pattern[i + 2] == '<' && pattern[i + 3] != '=' &&
			           pattern[i + 3] != '!') {
				const std::size_t close = pattern.find('>', i + 3);
				if (close == std::string::npos) {
					throw std::invalid_argument("Unterminated group name in pattern '" + pattern + "'.");
				}
				const std::string name = pattern.substr(i + 3, close - i - 3);
				if (name.empty()) {
					throw std::invalid_argument("Empty group name in pattern '" + pattern + "'.");
				}
				++group_count;
				if (!result.groups.emplace(name, group_count).second) {
					throw std::invalid_argument("Duplicate group name '" + name + "' in pattern '" + pattern + "'.");
				}
				result.pattern += '(';
				i = close + 1;
				continue;
			}
		}

		result.pattern += ch;
		++i;
	}
	return result;
}

} // namespace

TextPattern::TextPattern(const std::string &pattern) : source_(pattern) {
	if (pattern.empty()) {
		throw std::invalid_argument("Text pattern must not be empty.");
	}
	auto translation = translateNamedGroups(pattern);
	translated_ = std::move(translation.pattern);
	named_groups_ = std::move(translation.groups);
	try {
		regex_ = boost::regex(translated_, boost::regex::perl | boost::regex::no_mod_s);
	} catch (const boost::regex_error &e) {
		throw std::invalid_argument("Invalid text pattern '" + pattern + "': " + e.what());
	}
}

std::optional<std::size_t> TextPattern::groupIndex(const std::string &name) const {
	auto it = named_groups_.find(name);
	if (it == named_groups_.end()) {
		return std::nullopt;
	}
	return it->second;
}

std::vector<InlineMatch> TextPattern::findAll(std::string_view text, const std::string &value_group) const {
	using Iterator = boost::regex_iterator<std::string_view::const_iterator>;

	const auto group = groupIndex(value_group);
	std::vector<InlineMatch> matches;
	try {
		for (Iterator it(text.begin(), text.end(), regex_), end; it != end; ++it) {
			const auto &result = *it;
			InlineMatch match;
			match.begin = static_cast<std::size_t>(result.position());
			match.end = match.begin + static_cast<std::size_t>(result.length(0));
			if (group && *group < result.size() && result[*group].matched) {
				match.values = result[*group].str();
			}
			matches.push_back(std::move(match));
		}
	} catch (const boost::regex_error &e) {
		throw std::runtime_error("Pattern '" + source_ + "' could not be matched: " + e.what());
	}
	return matches;
}

} // namespace notetrack::extractors
