#pragma once

#include "finsight/core/date.hpp"

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

namespace finsight::core {

/**
 * @class DailyTable
 * @brief A column-oriented table with one row per calendar day.
 *
 * Dates and named numeric columns are stored in separate vectors so that
 * window statistics can run over contiguous memory. Every column always has
 * exactly rows() entries. Column order is insertion order.
 */
class DailyTable {
public:
	using Column = std::vector<double>;

	DailyTable() = default;

	/**
	 * @brief Constructs a table with the given date axis and no columns.
	 * @throws std::invalid_argument If the dates are not strictly increasing.
	 */
	explicit DailyTable(std::vector<Date> dates);

	std::size_t rows() const {
		return dates_.size();
	}

	bool empty() const {
		return dates_.empty();
	}

	const std::vector<Date> &dates() const {
		return dates_;
	}

	/// @throws std::out_of_range When the table is empty.
	const Date &firstDate() const;
	const Date &lastDate() const;

	bool hasColumn(const std::string &name) const {
		return index_.find(name) != index_.end();
	}

	/**
	 * @brief Adds or replaces a column.
	 * @throws std::invalid_argument If the column length differs from rows().
	 */
	void setColumn(const std::string &name, Column values);

	/// @throws std::out_of_range If no such column exists.
	const Column &column(const std::string &name) const;
	Column &column(const std::string &name);

	const std::vector<std::string> &columnNames() const {
		return names_;
	}

	double at(std::size_t row, const std::string &name) const;

	/// Rows [begin, end) with all columns.
	DailyTable slice(std::size_t begin, std::size_t end) const;
	DailyTable head(std::size_t n) const;
	DailyTable tail(std::size_t n) const;

	/// Index of @p date on the axis, or rows() when absent.
	std::size_t rowOf(const Date &date) const;

	/// True when consecutive dates differ by exactly one day.
	bool isContiguous() const;

	/// True when no cell is NaN or infinite.
	bool allFinite() const;

private:
	std::vector<Date> dates_;
	std::vector<std::string> names_;
	std::vector<Column> columns_;
	std::unordered_map<std::string, std::size_t> index_;
};

} // namespace finsight::core
