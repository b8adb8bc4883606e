#pragma once

#include <boost/circular_buffer.hpp>

#include <cstddef>
#include <string>
#include <vector>

namespace finsight::models {

/**
 * @class RollingState
 * @brief Fixed-capacity trailing history of a set of named daily series.
 *
 * Each column keeps at most capacity() values in a ring buffer; pushing onto
 * a full buffer drops the oldest value. Roll-forward forecasting reads its
 * lag and window features from here and pushes each synthetic day back in,
 * so a step only ever sees values that precede it.
 */
class RollingState {
public:
	/// @throws std::invalid_argument If @p columns is empty, has duplicates, or capacity is 0.
	RollingState(std::vector<std::string> columns, std::size_t capacity = 30);

	/// Appends one value per column, in column order.
	/// @throws std::invalid_argument If the row length differs from the column count.
	void pushRow(const std::vector<double> &values);

	void push(std::size_t column, double value);

	/// @throws std::out_of_range If no such column exists.
	std::size_t columnIndex(const std::string &name) const;

	const boost::circular_buffer<double> &history(std::size_t column) const {
		return buffers_.at(column);
	}

	/// The value @p k steps back (k = 1 is the latest); 0 when the history is shorter than k.
	double lag(std::size_t column, std::size_t k) const;

	/// Latest value of the column, 0 when empty.
	double last(std::size_t column) const {
		return lag(column, 1);
	}

	/// Mean of the latest min(window, size) values; 0 when empty.
	double trailingMean(std::size_t column, std::size_t window) const;

	/// Sample standard deviation of the latest min(window, size) values; 0 with fewer than two.
	double trailingStd(std::size_t column, std::size_t window) const;

	double trailingMax(std::size_t column, std::size_t window) const;
	double trailingSum(std::size_t column, std::size_t window) const;

	/// Mean over everything currently held for the column.
	double mean(std::size_t column) const {
		return trailingMean(column, capacity_);
	}

	/// Number of values held by the column.
	std::size_t size(std::size_t column) const {
		return buffers_.at(column).size();
	}

	std::size_t capacity() const {
		return capacity_;
	}

	const std::vector<std::string> &columns() const {
		return columns_;
	}

private:
	std::vector<double> tail(std::size_t column, std::size_t window) const;

	std::vector<std::string> columns_;
	std::size_t capacity_;
	std::vector<boost::circular_buffer<double>> buffers_;
};

} // namespace finsight::models
