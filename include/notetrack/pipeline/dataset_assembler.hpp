#pragma once

#include "notetrack/core/dataset.hpp"
#include "notetrack/core/query.hpp"
#include "notetrack/core/value_store.hpp"
#include "notetrack/utils/date_format.hpp"

#include <optional>
#include <set>
#include <vector>

namespace notetrack::pipeline {

/**
 * @brief Merges the observations of one query on one day.
 *
 * Non-empty values are summed. Returns std::nullopt when there is no
 * observation or every observation is empty.
 */
std::optional<double> mergeObservations(const std::vector<core::Observation> &observations);

/**
 * @class DatasetAssembler
 * @brief Reshapes the date-keyed store into one dense Dataset per query.
 */
class DatasetAssembler {
public:
	explicit DatasetAssembler(utils::DateFormat date_format) : date_format_(std::move(date_format)) {}

	/**
	 * @brief Builds the datasets in query order.
	 * @param queries All queries of the run, the x query of a table included.
	 * @param store Observations keyed by dates formatted with the run's format.
	 * @param window Days to cover.
	 * @param time_valued_queries Ids of queries that read clock times.
	 */
	std::vector<core::Dataset> assemble(const std::vector<core::Query> &queries,
	                                    const core::DateKeyedValueStore &store, const core::DateWindow &window,
	                                    const std::set<int> &time_valued_queries) const;

private:
	utils::DateFormat date_format_;
};

} // namespace notetrack::pipeline
