#pragma once

#include "finsight/core/daily_table.hpp"
#include "finsight/core/forecast.hpp"
#include "finsight/models/iforecaster.hpp"

#include <optional>
#include <string>

namespace finsight::models {

struct OverspendingResult {
	bool overspending = false;
	std::string message;
	double predicted = 0.0;  // next week's forecast
	double reference = 0.0;  // weekly budget or historical weekly average
	double confidence = 0.3;
};

/// Monthly budget totals are compared per week after dividing by this factor.
constexpr double kWeeksPerMonth = 4.3;

/**
 * @brief Compares a one-week forecast against a weekly reference.
 *
 * With a positive monthly budget total the reference is total / 4.3 and the
 * week overspends when the forecast exceeds it. Otherwise the reference is
 * the historical weekly average (7 x mean daily spend) and the week
 * overspends when the forecast exceeds 1.2 times that average.
 * An empty forecast yields the "Unable to ..." failure result.
 */
OverspendingResult assessOverspending(const core::ForecastResult &weekly, double mean_daily,
                                      std::optional<double> monthly_budget_total = std::nullopt);

/**
 * @brief Forecasts one week with @p forecaster and assesses it against @p table's history.
 *
 * Forecasting errors are logged and reported as the failure result.
 */
OverspendingResult checkOverspending(const IForecaster &forecaster, const core::DailyTable &table,
                                     std::optional<double> monthly_budget_total = std::nullopt);

} // namespace finsight::models
