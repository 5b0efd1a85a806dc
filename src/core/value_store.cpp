#include "notetrack/core/value_store.hpp"

namespace notetrack::core {

void DateKeyedValueStore::add(const std::string &date_key, int query_id, std::optional<double> value) {
	entries_[date_key].push_back(Observation{query_id, value});
	++total_;
}

const std::vector<Observation> &DateKeyedValueStore::observations(const std::string &date_key) const {
	static const std::vector<Observation> empty_observations{};
	auto it = entries_.find(date_key);
	if (it == entries_.end()) {
		return empty_observations;
	}
	return it->second;
}

std::vector<Observation> DateKeyedValueStore::observationsFor(const std::string &date_key, int query_id) const {
	std::vector<Observation> matching;
	for (const auto &observation : observations(date_key)) {
		if (observation.query_id == query_id) {
			matching.push_back(observation);
		}
	}
	return matching;
}

} // namespace notetrack::core
