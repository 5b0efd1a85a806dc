#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace notetrack::core {

/**
 * @struct Observation
 * @brief One value found for one query on one date.
 *
 * An empty value records that the target was present without a usable number.
 */
struct Observation {
	int query_id = 0;
	std::optional<double> value;
};

/**
 * @class DateKeyedValueStore
 * @brief Append-only multimap from a formatted date key to observations.
 *
 * Several observations may accumulate for the same date and query; they are
 * merged by the dataset assembler, never overwritten here.
 */
class DateKeyedValueStore {
public:
	void add(const std::string &date_key, int query_id, std::optional<double> value);

	/// All observations stored under @p date_key, in insertion order.
	const std::vector<Observation> &observations(const std::string &date_key) const;

	/// Observations under @p date_key that belong to @p query_id.
	std::vector<Observation> observationsFor(const std::string &date_key, int query_id) const;

	bool contains(const std::string &date_key) const {
		return entries_.find(date_key) != entries_.end();
	}

	/// Number of distinct date keys.
	std::size_t dateCount() const {
		return entries_.size();
	}

	/// Total number of observations.
	std::size_t size() const {
		return total_;
	}

	bool empty() const {
		return total_ == 0;
	}

private:
	std::unordered_map<std::string, std::vector<Observation>> entries_;
	std::size_t total_ = 0;
};

} // namespace notetrack::core
