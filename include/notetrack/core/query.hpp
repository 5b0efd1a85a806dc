#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace notetrack::core {

/// Where a query looks for its values.
enum class SearchType {
	Frontmatter,
	Tag,
	Wiki,
	Text,
	DataviewField,
	Table
};

/// Returns the configuration name of a search type ("frontmatter", "tag", ...).
std::string toString(SearchType type);

/**
 * @brief Maps a configuration name to a search type.
 * @throws std::invalid_argument For unknown names.
 */
SearchType parseSearchType(const std::string &name);

class QueryBuilder; // Forward declaration

/**
 * @class Query
 * @brief One configured search plus the rules for turning its matches into numbers.
 *
 * Queries are immutable once built. Two queries are the same series when their
 * ids are equal, regardless of their other fields.
 */
class Query {
public:
	friend class QueryBuilder;

	int id() const {
		return id_;
	}

	SearchType type() const {
		return type_;
	}

	const std::string &target() const {
		return target_;
	}

	const std::optional<std::string> &parentTarget() const {
		return parent_target_;
	}

	/// Accessor at @p position, or 0 when the query carries fewer accessors.
	int accessor(std::size_t position = 0) const {
		return position < accessors_.size() ? accessors_[position] : 0;
	}

	const std::vector<int> &accessors() const {
		return accessors_;
	}

	const std::string &separator() const {
		return separator_;
	}

	/// Value contributed by each match that carries no value of its own.
	double constValue() const {
		return const_value_;
	}

	bool ignoreAttachedValue() const {
		return ignore_attached_value_;
	}

	bool ignoreZeroValue() const {
		return ignore_zero_value_;
	}

	bool usedAsXDataset() const {
		return used_as_x_dataset_;
	}

	bool isTableQuery() const {
		return type_ == SearchType::Table;
	}

	bool equalTo(const Query &other) const {
		return id_ == other.id_;
	}

private:
	Query() = default;

	int id_ = 0;
	SearchType type_ = SearchType::Tag;
	std::string target_;
	std::optional<std::string> parent_target_;
	std::vector<int> accessors_;
	std::string separator_ = "/";
	double const_value_ = 1.0;
	bool ignore_attached_value_ = false;
	bool ignore_zero_value_ = false;
	bool used_as_x_dataset_ = false;
};

/**
 * @class QueryBuilder
 * @brief Fluent builder for Query.
 *
 * Targets written with accessor suffixes are expanded at build time:
 * "weight[1]" for front-matter, tag and field queries, and
 * "path/to/note[0][2]" (table index, column, optional value index) for table
 * queries. Explicit parent target or accessors take precedence.
 */
class QueryBuilder {
public:
	QueryBuilder &withId(int id);
	QueryBuilder &withSearchType(SearchType type);
	QueryBuilder &withTarget(std::string target);
	QueryBuilder &withParentTarget(std::string parent_target);
	QueryBuilder &withAccessors(std::vector<int> accessors);
	QueryBuilder &withSeparator(std::string separator);
	QueryBuilder &withConstValue(double value);
	QueryBuilder &ignoreAttachedValue(bool ignore = true);
	QueryBuilder &ignoreZeroValue(bool ignore = true);
	QueryBuilder &asXDataset(bool used_as_x = true);

	/**
	 * @brief Validates the configuration and creates the query.
	 * @throws std::invalid_argument If the target, separator or accessors are invalid.
	 */
	Query build() const;

private:
	int id_ = 0;
	SearchType type_ = SearchType::Tag;
	std::string target_;
	std::optional<std::string> parent_target_;
	std::optional<std::vector<int>> accessors_;
	std::string separator_ = "/";
	double const_value_ = 1.0;
	bool ignore_attached_value_ = false;
	bool ignore_zero_value_ = false;
	bool used_as_x_dataset_ = false;
};

/**
 * @brief Splits trailing "[N]" groups off a target.
 * @return The base name and the indices in order, or std::nullopt when the
 *         target carries no well-formed accessor suffix.
 */
std::optional<std::pair<std::string, std::vector<int>>> splitAccessorSuffix(const std::string &target);

} // namespace notetrack::core
