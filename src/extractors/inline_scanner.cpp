#include "notetrack/extractors/inline_scanner.hpp"
#include "notetrack/utils/string_utils.hpp"

#include <cctype>

namespace notetrack::extractors {

namespace {

bool isTagSegmentChar(char ch) {
	return utils::isWordChar(ch) || ch == '-';
}

bool isTagValueChar(char ch) {
	return std::isdigit(static_cast<unsigned char>(ch)) != 0 || ch == '.' || ch == '/' || ch == '-' ||
	       ch == ':' || ch == ',';
}

bool isTagPunctuation(char ch) {
	switch (ch) {
	case '.':
	case '!':
	case ',':
	case '?':
	case ';':
	case '~':
	case '-':
		return true;
	default:
		return false;
	}
}

bool isFieldValueChar(char ch) {
	if (utils::isWordChar(ch)) {
		return true;
	}
	switch (ch) {
	case '.':
	case '/':
	case '-':
	case ',':
	case '@':
	case ';':
	case ':':
	case ' ':
	case '\t':
		return true;
	default:
		return false;
	}
}

bool atBoundary(std::string_view text, std::size_t pos) {
	return pos >= text.size() || utils::isSpace(text[pos]);
}

} // namespace

std::vector<InlineMatch> scanHashtags(std::string_view text, std::string_view tag_name) {
	std::vector<InlineMatch> matches;
	if (tag_name.empty()) {
		return matches;
	}

	const std::size_t n = text.size();
	std::size_t pos = 0;
	while (pos < n) {
		const std::size_t hash = text.find('#', pos);
		if (hash == std::string_view::npos) {
			break;
		}
		pos = hash + 1;
		if (hash > 0 && !utils::isSpace(text[hash - 1])) {
			continue;
		}
		if (text.compare(hash + 1, tag_name.size(), tag_name) != 0) {
			continue;
		}

		std::size_t p = hash + 1 + tag_name.size();
		while (p + 1 < n && text[p] == '/' && isTagSegmentChar(text[p + 1])) {
			++p;
			while (p < n && isTagSegmentChar(text[p])) {
				++p;
			}
		}

		InlineMatch match;
		match.begin = hash;
		if (p < n && text[p] == ':') {
			const std::size_t values_begin = p + 1;
			std::size_t q = values_begin;
			while (q < n && isTagValueChar(text[q])) {
				++q;
			}
			std::size_t values_end = q;
			while (values_end > values_begin && text[values_end - 1] == ',') {
				--values_end;
			}
			while (q < n && std::isalpha(static_cast<unsigned char>(text[q]))) {
				++q;
			}
			while (q < n && isTagPunctuation(text[q])) {
				++q;
			}
			if (!atBoundary(text, q)) {
				continue;
			}
			match.values = std::string(text.substr(values_begin, values_end - values_begin));
			p = q;
		} else {
			while (p < n && isTagPunctuation(text[p])) {
				++p;
			}
			if (!atBoundary(text, p)) {
				continue;
			}
		}

		match.end = p;
		matches.push_back(std::move(match));
		pos = p;
	}
	return matches;
}

std::vector<InlineMatch> scanFieldAnnotations(std::string_view text, std::string_view key) {
	std::vector<InlineMatch> matches;
	if (key.empty()) {
		return matches;
	}

	const std::size_t n = text.size();
	std::size_t pos = 0;
	while (pos < n) {
		const std::size_t found = text.find(key, pos);
		if (found == std::string_view::npos) {
			break;
		}
		pos = found + 1;

		std::size_t begin = found;
		for (int stars = 0; stars < 2 && begin > 0 && text[begin - 1] == '*'; ++stars) {
			--begin;
		}
		if (begin > 0 && !utils::isSpace(text[begin - 1])) {
			continue;
		}

		std::size_t p = found + key.size();
		for (int stars = 0; stars < 2 && p < n && text[p] == '*'; ++stars) {
			++p;
		}
		if (text.compare(p, 2, "::") != 0) {
			continue;
		}
		p += 2;
		const std::size_t after_colons = p;
		while (p < n && (text[p] == ' ' || text[p] == '\t')) {
			++p;
		}

		std::size_t run_end = p;
		while (run_end < n && isFieldValueChar(text[run_end])) {
			++run_end;
		}

		std::size_t values_end = run_end;
		if (!atBoundary(text, values_end)) {
			// Fall back to the last blank inside the run, which ends the values.
			while (values_end > p && !utils::isSpace(text[values_end - 1])) {
				--values_end;
			}
			if (values_end > p) {
				--values_end;
			} else if (p > after_colons) {
				values_end = p;
			} else {
				continue;
			}
		}

		InlineMatch match;
		match.begin = begin;
		match.end = values_end;
		match.values = utils::trim(text.substr(p, values_end - p));
		matches.push_back(std::move(match));
		pos = values_end > found ? values_end : found + 1;
	}
	return matches;
}

} // namespace notetrack::extractors
