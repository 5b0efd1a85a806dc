#include "notetrack/core/query.hpp"
#include "notetrack/utils/logging.hpp"

#include <cctype>
#include <stdexcept>
#include <utility>

namespace notetrack::core {

std::string toString(SearchType type) {
	switch (type) {
	case SearchType::Frontmatter:
		return "frontmatter";
	case SearchType::Tag:
		return "tag";
	case SearchType::Wiki:
		return "wiki";
	case SearchType::Text:
		return "text";
	case SearchType::DataviewField:
		return "dvField";
	case SearchType::Table:
		return "table";
	default:
		return "unknown";
	}
}

SearchType parseSearchType(const std::string &name) {
	if (name == "frontmatter") {
		return SearchType::Frontmatter;
	}
	if (name == "tag") {
		return SearchType::Tag;
	}
	if (name == "wiki") {
		return SearchType::Wiki;
	}
	if (name == "text") {
		return SearchType::Text;
	}
	if (name == "dvField") {
		return SearchType::DataviewField;
	}
	if (name == "table") {
		return SearchType::Table;
	}
	throw std::invalid_argument("Unknown search type '" + name + "'.");
}

std::optional<std::pair<std::string, std::vector<int>>> splitAccessorSuffix(const std::string &target) {
	std::vector<int> indices;
	std::size_t end = target.size();
	while (end > 0 && target[end - 1] == ']') {
		const std::size_t open = target.rfind('[', end - 1);
		if (open == std::string::npos || open + 1 == end - 1 || end - open - 2 > 9) {
			break;
		}
		bool all_digits = true;
		for (std::size_t i = open + 1; i < end - 1; ++i) {
			if (!std::isdigit(static_cast<unsigned char>(target[i]))) {
				all_digits = false;
				break;
			}
		}
		if (!all_digits) {
			break;
		}
		indices.insert(indices.begin(), std::stoi(target.substr(open + 1, end - open - 2)));
		end = open;
	}

	if (indices.empty() || end == 0) {
		return std::nullopt;
	}
	return std::make_pair(target.substr(0, end), std::move(indices));
}

QueryBuilder &QueryBuilder::withId(int id) {
	id_ = id;
	return *this;
}

QueryBuilder &QueryBuilder::withSearchType(SearchType type) {
	type_ = type;
	return *this;
}

QueryBuilder &QueryBuilder::withTarget(std::string target) {
	target_ = std::move(target);
	return *this;
}

QueryBuilder &QueryBuilder::withParentTarget(std::string parent_target) {
	parent_target_ = std::move(parent_target);
	return *this;
}

QueryBuilder &QueryBuilder::withAccessors(std::vector<int> accessors) {
	accessors_ = std::move(accessors);
	return *this;
}

QueryBuilder &QueryBuilder::withSeparator(std::string separator) {
	separator_ = std::move(separator);
	return *this;
}

QueryBuilder &QueryBuilder::withConstValue(double value) {
	const_value_ = value;
	return *this;
}

QueryBuilder &QueryBuilder::ignoreAttachedValue(bool ignore) {
	ignore_attached_value_ = ignore;
	return *this;
}

QueryBuilder &QueryBuilder::ignoreZeroValue(bool ignore) {
	ignore_zero_value_ = ignore;
	return *this;
}

QueryBuilder &QueryBuilder::asXDataset(bool used_as_x) {
	used_as_x_dataset_ = used_as_x;
	return *this;
}

Query QueryBuilder::build() const {
	if (target_.empty()) {
		throw std::invalid_argument("Query target must not be empty.");
	}
	if (separator_.empty()) {
		throw std::invalid_argument("Query separator must not be empty.");
	}
	if (used_as_x_dataset_ && type_ != SearchType::Table) {
		throw std::invalid_argument("Only table queries can be used as the x dataset.");
	}

	Query query;
	query.id_ = id_;
	query.type_ = type_;
	query.target_ = target_;
	query.separator_ = separator_;
	query.const_value_ = const_value_;
	query.ignore_attached_value_ = ignore_attached_value_;
	query.ignore_zero_value_ = ignore_zero_value_;
	query.used_as_x_dataset_ = used_as_x_dataset_;

	// Text targets are regular expressions and wiki targets are note names;
	// brackets in them are not accessors.
	const bool accepts_suffix = type_ == SearchType::Frontmatter || type_ == SearchType::Tag ||
	                            type_ == SearchType::DataviewField || type_ == SearchType::Table;
	if (accepts_suffix) {
		if (auto parsed = splitAccessorSuffix(target_)) {
			query.parent_target_ = parsed->first;
			query.accessors_ = parsed->second;
		}
	}
	if (parent_target_) {
		query.parent_target_ = parent_target_;
	}
	if (accessors_) {
		query.accessors_ = *accessors_;
	}

	for (int accessor : query.accessors_) {
		if (accessor < 0) {
			throw std::invalid_argument("Query accessors must be non-negative.");
		}
	}

	if (type_ == SearchType::Table) {
		if (!query.parent_target_ || query.parent_target_->empty()) {
			throw std::invalid_argument("Table query '" + target_ + "' must name the note holding the table.");
		}
		if (query.accessors_.size() < 2) {
			throw std::invalid_argument("Table query '" + target_ + "' must give a table index and a column.");
		}
	}

	NOTETRACK_TRACE("Built {} query #{} for target '{}'.", toString(type_), id_, target_);
	return query;
}

} // namespace notetrack::core
