#pragma once

#include "notetrack/core/date.hpp"

#include <cstddef>
#include <limits>
#include <optional>
#include <string>
#include <vector>

namespace notetrack::core {

/**
 * @struct DateWindow
 * @brief Inclusive range of calendar days covered by the output series.
 */
struct DateWindow {
	Date start;
	Date end;

	/**
	 * @brief Creates a window.
	 * @throws std::invalid_argument If @p end precedes @p start.
	 */
	static DateWindow between(Date start, Date end);

	/// Number of days in the window, both ends included.
	std::size_t days() const {
		return static_cast<std::size_t>(start.daysUntil(end) + 1);
	}

	bool contains(const Date &date) const {
		return start <= date && date <= end;
	}

	bool operator==(const DateWindow &other) const {
		return start == other.start && end == other.end;
	}
};

/**
 * @class Dataset
 * @brief A dense daily series for one query over a DateWindow.
 *
 * Every day of the window has a slot; days without data stay empty rather
 * than zero so that charts can show gaps.
 */
class Dataset {
public:
	using Value = std::optional<double>;

	Dataset(int query_id, std::string name, DateWindow window);

	int queryId() const {
		return query_id_;
	}

	const std::string &name() const {
		return name_;
	}

	const DateWindow &window() const {
		return window_;
	}

	std::size_t size() const {
		return values_.size();
	}

	/// Date of the slot at @p index; throws std::out_of_range past the end.
	Date dateAt(std::size_t index) const;

	/// Value of the slot at @p index; throws std::out_of_range past the end.
	const Value &valueAt(std::size_t index) const;

	/// Value on @p date, empty for dates outside the window.
	Value valueOn(const Date &date) const;

	/// Sets the value on @p date; throws std::out_of_range outside the window.
	void setValue(const Date &date, double value);

	const std::vector<Value> &values() const {
		return values_;
	}

	/// Number of days carrying a value.
	std::size_t countPresent() const;

	/// Values with gaps replaced by @p missing (NaN by default).
	std::vector<double> toDenseVector(double missing = std::numeric_limits<double>::quiet_NaN()) const;

	/// Midnight UTC timestamps of every slot, for plotting against time axes.
	std::vector<Date::TimePoint> timestamps() const;

	/// Whether the values are clock times expressed in seconds since midnight.
	bool usingTimeValue() const {
		return using_time_value_;
	}

	void setUsingTimeValue(bool using_time_value) {
		using_time_value_ = using_time_value;
	}

private:
	int query_id_;
	std::string name_;
	DateWindow window_;
	std::vector<Value> values_;
	bool using_time_value_ = false;
};

} // namespace notetrack::core
