#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace notetrack::utils {

/// Removes leading and trailing whitespace.
std::string trim(std::string_view text);

/// Removes every leading and trailing occurrence of @p ch.
std::string trimByChar(std::string_view text, char ch);

/**
 * @brief Splits @p text on every occurrence of @p delimiter.
 *
 * Mirrors the usual string split: an empty input yields one empty token and
 * adjacent delimiters yield empty tokens. An empty delimiter splits the text
 * into single characters.
 */
std::vector<std::string> split(std::string_view text, std::string_view delimiter);

/// Splits on a comma when one is present, otherwise on @p separator.
std::vector<std::string> splitValues(std::string_view text, std::string_view separator);

/// Splits text into lines, accepting both LF and CRLF endings.
std::vector<std::string> splitLines(std::string_view text);

bool startsWith(std::string_view text, std::string_view prefix);
bool endsWith(std::string_view text, std::string_view suffix);
bool contains(std::string_view text, std::string_view needle);

/// ASCII whitespace test that is safe for any char value.
bool isSpace(char ch);

/// True for ASCII letters, digits and underscore.
bool isWordChar(char ch);

std::string toLower(std::string_view text);

} // namespace notetrack::utils
