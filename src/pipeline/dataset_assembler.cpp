#include "notetrack/pipeline/dataset_assembler.hpp"

namespace notetrack::pipeline {

std::optional<double> mergeObservations(const std::vector<core::Observation> &observations) {
	std::optional<double> merged;
	for (const auto &observation : observations) {
		if (observation.value) {
			merged = merged.value_or(0.0) + *observation.value;
		}
	}
	return merged;
}

std::vector<core::Dataset> DatasetAssembler::assemble(const std::vector<core::Query> &queries,
                                                      const core::DateKeyedValueStore &store,
                                                      const core::DateWindow &window,
                                                      const std::set<int> &time_valued_queries) const {
	std::vector<core::Dataset> datasets;
	datasets.reserve(queries.size());

	for (const auto &query : queries) {
		core::Dataset dataset(query.id(), query.target(), window);
		dataset.setUsingTimeValue(time_valued_queries.count(query.id()) > 0);

		for (std::size_t i = 0; i < dataset.size(); ++i) {
			const core::Date day = dataset.dateAt(i);
			const auto key = date_format_.format(day);
			if (!store.contains(key)) {
				continue;
			}
			if (auto merged = mergeObservations(store.observationsFor(key, query.id()))) {
				dataset.setValue(day, *merged);
			}
		}
		datasets.push_back(std::move(dataset));
	}
	return datasets;
}

} // namespace notetrack::pipeline
