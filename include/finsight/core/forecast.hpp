#pragma once

#include "finsight/core/date.hpp"
#include "finsight/core/status.hpp"

#include <optional>
#include <string>
#include <vector>

namespace finsight::core {

enum class Timeframe { Daily, Weekly, Monthly };

std::string toString(Timeframe timeframe);

/// Parses "daily", "weekly" or "monthly"; throws std::invalid_argument otherwise.
Timeframe parseTimeframe(const std::string &text);

/**
 * @struct ForecastPoint
 * @brief One forecast step.
 *
 * Daily points fill @c date; weekly points fill @c week_start and
 * @c week_end; monthly points fill @c month ("YYYY-MM") and use @c date for
 * the month's first day.
 */
struct ForecastPoint {
	Date date;
	Date week_start;
	Date week_end;
	std::string month;
	double predicted = 0.0;
	double lower = 0.0;
	double upper = 0.0;
	Timeframe timeframe = Timeframe::Daily;
};

struct ForecastRequest {
	int horizon = 7;  // days, weeks or months depending on timeframe
	Timeframe timeframe = Timeframe::Daily;
};

struct BacktestDay {
	Date date;
	double actual = 0.0;
	double forecast = 0.0;
};

struct BacktestWeek {
	Date week_start;
	Date week_end;
	double actual = 0.0;
	double forecast = 0.0;
	double delta = 0.0;  // forecast - actual
	bool over = false;
};

/**
 * @brief Hold-out comparison of the trailing days against a model refit without them.
 */
struct Backtest {
	std::vector<BacktestDay> days;
	std::vector<BacktestWeek> weeks;
	int over_days = 0;
	int under_days = 0;
	double mae = 0.0;
	double rmse = 0.0;
	double bias = 0.0;  // mean of actual - forecast; positive when the model undershoots
};

/**
 * @struct ForecastResult
 * @brief Output of every forecaster.
 *
 * Insufficient history is reported through @c status with an empty series,
 * never by throwing.
 */
struct ForecastResult {
	std::vector<ForecastPoint> points;
	double confidence = 0.0;
	std::vector<std::string> drivers;
	Status status = Status::Ok;
	std::string model;
	std::optional<Backtest> backtest;

	bool empty() const {
		return points.empty();
	}

	double totalPredicted() const {
		double sum = 0.0;
		for (const auto &point : points) {
			sum += point.predicted;
		}
		return sum;
	}
};

} // namespace finsight::core
