#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace notetrack::core {

/**
 * @struct DocumentHandle
 * @brief Identifies one note known to a document source.
 */
struct DocumentHandle {
	/// Source-relative path with '/' separators, including the extension.
	std::string path;
	/// File name without directory and extension; carries the note's date.
	std::string basename;

	bool operator==(const DocumentHandle &other) const {
		return path == other.path;
	}
};

/**
 * @class FrontMatterValue
 * @brief A parsed front-matter value: null, boolean, number, string or list.
 */
class FrontMatterValue {
public:
	enum class Kind { Null, Boolean, Number, String, List };

	FrontMatterValue() = default;

	static FrontMatterValue boolean(bool value);
	static FrontMatterValue number(double value);
	static FrontMatterValue string(std::string value);
	static FrontMatterValue list(std::vector<FrontMatterValue> items);

	Kind kind() const {
		return kind_;
	}

	bool isNull() const {
		return kind_ == Kind::Null;
	}
	bool isBoolean() const {
		return kind_ == Kind::Boolean;
	}
	bool isNumber() const {
		return kind_ == Kind::Number;
	}
	bool isString() const {
		return kind_ == Kind::String;
	}
	bool isList() const {
		return kind_ == Kind::List;
	}

	/// Accessors throw std::logic_error when the kind does not match.
	bool asBoolean() const;
	double asNumber() const;
	const std::string &asString() const;
	const std::vector<FrontMatterValue> &items() const;

	/**
	 * @brief Renders the value as text.
	 *
	 * Integral numbers print without a fraction, other numbers with the
	 * shortest round-tripping form; lists join their items with commas.
	 */
	std::string toString() const;

private:
	Kind kind_ = Kind::Null;
	bool boolean_ = false;
	double number_ = 0.0;
	std::string string_;
	std::vector<FrontMatterValue> items_;
};

using FrontMatter = std::map<std::string, FrontMatterValue>;

/**
 * @struct DocumentMetadata
 * @brief Parsed metadata of one note.
 */
struct DocumentMetadata {
	std::optional<FrontMatter> frontmatter;
	/// Outgoing wiki links, as written (alias removed).
	std::vector<std::string> links;
};

} // namespace notetrack::core
