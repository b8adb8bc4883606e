#include "finsight/core/daily_table.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace finsight::core {

DailyTable::DailyTable(std::vector<Date> dates) : dates_(std::move(dates)) {
	for (std::size_t i = 1; i < dates_.size(); ++i) {
		if (dates_[i] <= dates_[i - 1]) {
			throw std::invalid_argument("DailyTable dates must be strictly increasing.");
		}
	}
}

const Date &DailyTable::firstDate() const {
	if (dates_.empty()) {
		throw std::out_of_range("DailyTable is empty.");
	}
	return dates_.front();
}

const Date &DailyTable::lastDate() const {
	if (dates_.empty()) {
		throw std::out_of_range("DailyTable is empty.");
	}
	return dates_.back();
}

void DailyTable::setColumn(const std::string &name, Column values) {
	if (values.size() != dates_.size()) {
		throw std::invalid_argument("Column '" + name + "' length must match the number of rows.");
	}
	const auto it = index_.find(name);
	if (it != index_.end()) {
		columns_[it->second] = std::move(values);
		return;
	}
	index_.emplace(name, columns_.size());
	names_.push_back(name);
	columns_.push_back(std::move(values));
}

const DailyTable::Column &DailyTable::column(const std::string &name) const {
	const auto it = index_.find(name);
	if (it == index_.end()) {
		throw std::out_of_range("DailyTable has no column '" + name + "'.");
	}
	return columns_[it->second];
}

DailyTable::Column &DailyTable::column(const std::string &name) {
	const auto it = index_.find(name);
	if (it == index_.end()) {
		throw std::out_of_range("DailyTable has no column '" + name + "'.");
	}
	return columns_[it->second];
}

double DailyTable::at(std::size_t row, const std::string &name) const {
	const auto &values = column(name);
	if (row >= values.size()) {
		throw std::out_of_range("DailyTable row index out of range.");
	}
	return values[row];
}

DailyTable DailyTable::slice(std::size_t begin, std::size_t end) const {
	end = std::min(end, rows());
	begin = std::min(begin, end);
	DailyTable result(std::vector<Date>(dates_.begin() + static_cast<std::ptrdiff_t>(begin),
	                                    dates_.begin() + static_cast<std::ptrdiff_t>(end)));
	for (std::size_t c = 0; c < columns_.size(); ++c) {
		const auto &source = columns_[c];
		result.setColumn(names_[c], Column(source.begin() + static_cast<std::ptrdiff_t>(begin),
		                                   source.begin() + static_cast<std::ptrdiff_t>(end)));
	}
	return result;
}

DailyTable DailyTable::head(std::size_t n) const {
	return slice(0, n);
}

DailyTable DailyTable::tail(std::size_t n) const {
	const std::size_t count = std::min(n, rows());
	return slice(rows() - count, rows());
}

std::size_t DailyTable::rowOf(const Date &date) const {
	const auto it = std::lower_bound(dates_.begin(), dates_.end(), date);
	if (it == dates_.end() || *it != date) {
		return rows();
	}
	return static_cast<std::size_t>(it - dates_.begin());
}

bool DailyTable::isContiguous() const {
	for (std::size_t i = 1; i < dates_.size(); ++i) {
		if (dates_[i] - dates_[i - 1] != 1) {
			return false;
		}
	}
	return true;
}

bool DailyTable::allFinite() const {
	for (const auto &values : columns_) {
		for (double v : values) {
			if (!std::isfinite(v)) {
				return false;
			}
		}
	}
	return true;
}

} // namespace finsight::core
