#pragma once

#include "finsight/core/daily_table.hpp"
#include "finsight/core/date.hpp"
#include "finsight/core/transaction.hpp"
#include "finsight/features/feature_pipeline.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace tests::helpers {

using finsight::core::Date;
using finsight::core::Transaction;
using finsight::core::Transactions;

/// 2024-01-01, a Monday.
inline Date startDate() {
	return Date::fromYmd(2024, 1, 1);
}

inline Date day(std::int64_t offset) {
	return startDate().addDays(offset);
}

inline Transaction expense(const Date &date, double amount, const std::string &category) {
	Transaction tx;
	tx.date = date;
	tx.amount = amount;
	tx.category = category;
	tx.description = category;
	tx.type = finsight::core::TransactionType::Expense;
	return tx;
}

inline Transaction income(const Date &date, double amount) {
	Transaction tx = expense(date, amount, "Other");
	tx.type = finsight::core::TransactionType::Income;
	return tx;
}

/// One expense of @p amount in @p category on each of @p days consecutive days.
inline Transactions constantSpend(std::size_t days, double amount, const std::string &category = "Food") {
	Transactions result;
	for (std::size_t i = 0; i < days; ++i) {
		result.push_back(expense(day(static_cast<std::int64_t>(i)), amount, category));
	}
	return result;
}

/// Expenses from @p generator, called once per day with the day index; zero amounts are skipped.
inline Transactions generated(std::size_t days,
                              const std::function<std::vector<std::pair<std::string, double>>(std::size_t)> &generator) {
	Transactions result;
	for (std::size_t i = 0; i < days; ++i) {
		for (const auto &item : generator(i)) {
			if (item.second > 0.0) {
				result.push_back(expense(day(static_cast<std::int64_t>(i)), item.second, item.first));
			}
		}
	}
	return result;
}

/**
 * @brief Daily table with every category column and total_daily.
 *
 * Categories absent from @p series are zero. All series must share one length.
 */
inline finsight::core::DailyTable categoryTable(const std::map<std::string, std::vector<double>> &series,
                                                const Date &first = startDate()) {
	std::size_t rows = 0;
	for (const auto &entry : series) {
		rows = entry.second.size();
	}
	std::vector<Date> dates;
	for (std::size_t i = 0; i < rows; ++i) {
		dates.push_back(first.addDays(static_cast<std::int64_t>(i)));
	}
	finsight::core::DailyTable table(std::move(dates));
	std::vector<double> total(rows, 0.0);
	for (const auto &category : finsight::core::categories()) {
		const auto it = series.find(category);
		std::vector<double> values = it == series.end() ? std::vector<double>(rows, 0.0) : it->second;
		for (std::size_t i = 0; i < rows; ++i) {
			total[i] += values[i];
		}
		table.setColumn(category, std::move(values));
	}
	table.setColumn(finsight::features::columns::kTotal, std::move(total));
	return table;
}

inline std::vector<double> repeated(std::size_t n, double value) {
	return std::vector<double>(n, value);
}

/// @p amount every @p period days starting at day @p offset, zero elsewhere.
inline std::vector<double> everyNth(std::size_t n, std::size_t period, double amount, std::size_t offset = 0) {
	std::vector<double> values(n, 0.0);
	for (std::size_t i = offset; i < n; i += period) {
		values[i] = amount;
	}
	return values;
}

} // namespace tests::helpers
