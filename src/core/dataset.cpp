#include "notetrack/core/dataset.hpp"

#include <stdexcept>
#include <utility>

namespace notetrack::core {

DateWindow DateWindow::between(Date start, Date end) {
	if (end < start) {
		throw std::invalid_argument("Date window end " + end.toIsoString() + " precedes start " +
		                            start.toIsoString() + ".");
	}
	return DateWindow{start, end};
}

Dataset::Dataset(int query_id, std::string name, DateWindow window)
    : query_id_(query_id), name_(std::move(name)), window_(window) {
	if (window_.end < window_.start) {
		throw std::invalid_argument("Dataset window must not end before it starts.");
	}
	values_.resize(window_.days());
}

Date Dataset::dateAt(std::size_t index) const {
	if (index >= values_.size()) {
		throw std::out_of_range("Dataset index out of range.");
	}
	return window_.start.addDays(static_cast<std::int64_t>(index));
}

const Dataset::Value &Dataset::valueAt(std::size_t index) const {
	if (index >= values_.size()) {
		throw std::out_of_range("Dataset index out of range.");
	}
	return values_[index];
}

Dataset::Value Dataset::valueOn(const Date &date) const {
	if (!window_.contains(date)) {
		return std::nullopt;
	}
	return values_[static_cast<std::size_t>(window_.start.daysUntil(date))];
}

void Dataset::setValue(const Date &date, double value) {
	if (!window_.contains(date)) {
		throw std::out_of_range("Date " + date.toIsoString() + " lies outside the dataset window.");
	}
	values_[static_cast<std::size_t>(window_.start.daysUntil(date))] = value;
}

std::size_t Dataset::countPresent() const {
	std::size_t count = 0;
	for (const auto &value : values_) {
		if (value) {
			++count;
		}
	}
	return count;
}

std::vector<double> Dataset::toDenseVector(double missing) const {
	std::vector<double> dense;
	dense.reserve(values_.size());
	for (const auto &value : values_) {
		dense.push_back(value ? *value : missing);
	}
	return dense;
}

std::vector<Date::TimePoint> Dataset::timestamps() const {
	std::vector<Date::TimePoint> result;
	result.reserve(values_.size());
	for (std::size_t i = 0; i < values_.size(); ++i) {
		result.push_back(window_.start.addDays(static_cast<std::int64_t>(i)).toTimePoint());
	}
	return result;
}

} // namespace notetrack::core
