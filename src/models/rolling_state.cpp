#include "finsight/models/rolling_state.hpp"

#include "finsight/utils/stats.hpp"

#include <algorithm>
#include <stdexcept>

namespace finsight::models {

RollingState::RollingState(std::vector<std::string> columns, std::size_t capacity)
    : columns_(std::move(columns)), capacity_(capacity) {
	if (columns_.empty()) {
		throw std::invalid_argument("RollingState needs at least one column.");
	}
	if (capacity_ == 0) {
		throw std::invalid_argument("RollingState capacity must be positive.");
	}
	for (std::size_t i = 0; i < columns_.size(); ++i) {
		if (std::find(columns_.begin() + static_cast<std::ptrdiff_t>(i) + 1, columns_.end(), columns_[i]) !=
		    columns_.end()) {
			throw std::invalid_argument("Duplicate RollingState column '" + columns_[i] + "'.");
		}
	}
	buffers_.reserve(columns_.size());
	for (std::size_t i = 0; i < columns_.size(); ++i) {
		buffers_.emplace_back(capacity_);
	}
}

void RollingState::pushRow(const std::vector<double> &values) {
	if (values.size() != buffers_.size()) {
		throw std::invalid_argument("RollingState row has " + std::to_string(values.size()) + " values, expected " +
		                            std::to_string(buffers_.size()) + ".");
	}
	for (std::size_t i = 0; i < values.size(); ++i) {
		buffers_[i].push_back(values[i]);
	}
}

void RollingState::push(std::size_t column, double value) {
	buffers_.at(column).push_back(value);
}

std::size_t RollingState::columnIndex(const std::string &name) const {
	const auto it = std::find(columns_.begin(), columns_.end(), name);
	if (it == columns_.end()) {
		throw std::out_of_range("RollingState has no column '" + name + "'.");
	}
	return static_cast<std::size_t>(it - columns_.begin());
}

double RollingState::lag(std::size_t column, std::size_t k) const {
	const auto &buffer = buffers_.at(column);
	if (k == 0 || k > buffer.size()) {
		return 0.0;
	}
	return buffer[buffer.size() - k];
}

std::vector<double> RollingState::tail(std::size_t column, std::size_t window) const {
	const auto &buffer = buffers_.at(column);
	const std::size_t count = std::min(window, buffer.size());
	return std::vector<double>(buffer.end() - static_cast<std::ptrdiff_t>(count), buffer.end());
}

double RollingState::trailingMean(std::size_t column, std::size_t window) const {
	return utils::stats::mean(tail(column, window));
}

double RollingState::trailingStd(std::size_t column, std::size_t window) const {
	return utils::stats::sampleStdDev(tail(column, window));
}

double RollingState::trailingMax(std::size_t column, std::size_t window) const {
	const auto values = tail(column, window);
	return values.empty() ? 0.0 : *std::max_element(values.begin(), values.end());
}

double RollingState::trailingSum(std::size_t column, std::size_t window) const {
	double sum = 0.0;
	for (double v : tail(column, window)) {
		sum += v;
	}
	return sum;
}

} // namespace finsight::models
