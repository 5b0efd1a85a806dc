#include "notetrack/core/document.hpp"

#include <charconv>
#include <cmath>
#include <cstdio>
#include <stdexcept>
#include <utility>

namespace notetrack::core {

namespace {

std::string formatNumber(double value) {
	if (std::isnan(value)) {
		return "NaN";
	}
	if (std::isinf(value)) {
		return value > 0 ? "Infinity" : "-Infinity";
	}
	if (value == std::floor(value) && std::fabs(value) < 1e15) {
		char buffer[32];
		std::snprintf(buffer, sizeof(buffer), "%.0f", value);
		return buffer;
	}
	// Shortest round-tripping form, independent of the C locale.
	char buffer[32];
	const auto result = std::to_chars(buffer, buffer + sizeof(buffer), value);
	return std::string(buffer, result.ptr);
}

} // namespace

FrontMatterValue FrontMatterValue::boolean(bool value) {
	FrontMatterValue result;
	result.kind_ = Kind::Boolean;
	result.boolean_ = value;
	return result;
}

FrontMatterValue FrontMatterValue::number(double value) {
	FrontMatterValue result;
	result.kind_ = Kind::Number;
	result.number_ = value;
	return result;
}

FrontMatterValue FrontMatterValue::string(std::string value) {
	FrontMatterValue result;
	result.kind_ = Kind::String;
	result.string_ = std::move(value);
	return result;
}

FrontMatterValue FrontMatterValue::list(std::vector<FrontMatterValue> items) {
	FrontMatterValue result;
	result.kind_ = Kind::List;
	result.items_ = std::move(items);
	return result;
}

bool FrontMatterValue::asBoolean() const {
	if (kind_ != Kind::Boolean) {
		throw std::logic_error("Front-matter value is not a boolean.");
	}
	return boolean_;
}

double FrontMatterValue::asNumber() const {
	if (kind_ != Kind::Number) {
		throw std::logic_error("Front-matter value is not a number.");
	}
	return number_;
}

const std::string &FrontMatterValue::asString() const {
	if (kind_ != Kind::String) {
		throw std::logic_error("Front-matter value is not a string.");
	}
	return string_;
}

const std::vector<FrontMatterValue> &FrontMatterValue::items() const {
	if (kind_ != Kind::List) {
		throw std::logic_error("Front-matter value is not a list.");
	}
	return items_;
}

std::string FrontMatterValue::toString() const {
	switch (kind_) {
	case Kind::Null:
		return "null";
	case Kind::Boolean:
		return boolean_ ? "true" : "false";
	case Kind::Number:
		return formatNumber(number_);
	case Kind::String:
		return string_;
	case Kind::List: {
		std::string joined;
		for (std::size_t i = 0; i < items_.size(); ++i) {
			if (i > 0) {
				joined += ",";
			}
			joined += items_[i].toString();
		}
		return joined;
	}
	default:
		return {};
	}
}

} // namespace notetrack::core
