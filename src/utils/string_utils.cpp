#include "notetrack/utils/string_utils.hpp"

#include <cctype>

namespace notetrack::utils {

bool isSpace(char ch) {
	return std::isspace(static_cast<unsigned char>(ch)) != 0;
}

bool isWordChar(char ch) {
	return std::isalnum(static_cast<unsigned char>(ch)) != 0 || ch == '_';
}

std::string trim(std::string_view text) {
	std::size_t begin = 0;
	std::size_t end = text.size();
	while (begin < end && isSpace(text[begin])) {
		++begin;
	}
	while (end > begin && isSpace(text[end - 1])) {
		--end;
	}
	return std::string(text.substr(begin, end - begin));
}

std::string trimByChar(std::string_view text, char ch) {
	std::size_t begin = 0;
	std::size_t end = text.size();
	while (begin < end && text[begin] == ch) {
		++begin;
	}
	while (end > begin && text[end - 1] == ch) {
		--end;
	}
	return std::string(text.substr(begin, end - begin));
}

std::vector<std::string> split(std::string_view text, std::string_view delimiter) {
	std::vector<std::string> parts;
	if (delimiter.empty()) {
		for (char ch : text) {
			parts.emplace_back(1, ch);
		}
		return parts;
	}

	std::size_t start = 0;
	while (true) {
		const std::size_t pos = text.find(delimiter, start);
		if (pos == std::string_view::npos) {
			parts.emplace_back(text.substr(start));
			break;
		}
		parts.emplace_back(text.substr(start, pos - start));
		start = pos + delimiter.size();
	}
	return parts;
}

std::vector<std::string> splitValues(std::string_view text, std::string_view separator) {
	if (text.find(',') != std::string_view::npos) {
		return split(text, ",");
	}
	return split(text, separator);
}

std::vector<std::string> splitLines(std::string_view text) {
	std::vector<std::string> lines;
	std::size_t start = 0;
	while (start <= text.size()) {
		const std::size_t pos = text.find('\n', start);
		std::size_t end = pos == std::string_view::npos ? text.size() : pos;
		std::size_t line_end = end;
		if (line_end > start && text[line_end - 1] == '\r') {
			--line_end;
		}
		lines.emplace_back(text.substr(start, line_end - start));
		if (pos == std::string_view::npos) {
			break;
		}
		start = pos + 1;
	}
	return lines;
}

bool startsWith(std::string_view text, std::string_view prefix) {
	return text.size() >= prefix.size() && text.compare(0, prefix.size(), prefix) == 0;
}

bool endsWith(std::string_view text, std::string_view suffix) {
	return text.size() >= suffix.size() && text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool contains(std::string_view text, std::string_view needle) {
	return text.find(needle) != std::string_view::npos;
}

std::string toLower(std::string_view text) {
	std::string lowered(text);
	for (auto &ch : lowered) {
		ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
	}
	return lowered;
}

} // namespace notetrack::utils
