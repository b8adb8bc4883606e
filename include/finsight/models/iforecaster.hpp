#pragma once

#include "finsight/core/date.hpp"
#include "finsight/core/forecast.hpp"
#include "finsight/utils/metrics.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace finsight::models {

/**
 * @class IForecaster
 * @brief An interface for all spending forecasters.
 *
 * A forecaster is prepared from history by its own fit or train method and
 * then answers any number of forecast requests. Too little history is
 * reported through the result's status rather than by throwing.
 */
class IForecaster {
public:
	virtual ~IForecaster() = default;

	/**
	 * @brief Forecasts total spending for the requested horizon and timeframe.
	 * @throws std::invalid_argument If the horizon is not positive.
	 * @throws std::runtime_error If the forecaster has not been prepared.
	 */
	virtual core::ForecastResult forecast(const core::ForecastRequest &request) const = 0;

	/// True once the forecaster holds enough state to answer forecast().
	virtual bool isReady() const = 0;

	/**
	 * @brief Evaluates accuracy metrics against provided actual values.
	 * @param actual Series of ground-truth values.
	 * @param predicted Model predictions aligned to actuals.
	 * @return MAE, RMSE and R² of the pair.
	 */
	virtual utils::AccuracyMetrics score(const std::vector<double> &actual, const std::vector<double> &predicted) const {
		return utils::Metrics::evaluate(actual, predicted);
	}

	/**
	 * @brief Gets the name of the forecaster.
	 * @return A string such as "AutoRegressiveForecaster".
	 */
	virtual std::string getName() const = 0;
};

/// Minimum days of history before any forecaster answers.
constexpr std::size_t kMinForecastHistory = 14;
/// Minimum days of history for a monthly forecast.
constexpr std::size_t kMinMonthlyHistory = 30;
/// Confidence reported with an empty result.
constexpr double kEmptyForecastConfidence = 0.3;

/// @throws std::invalid_argument If the horizon is not positive.
void validateRequest(const core::ForecastRequest &request);

/**
 * @brief Applies the shared history policy.
 * @return An empty result with status InsufficientHistory and confidence 0.3
 *         when @p history_days is below 14, or below 30 for a monthly request;
 *         nullopt when forecasting may proceed.
 */
std::optional<core::ForecastResult> historyShortfall(std::size_t history_days, const core::ForecastRequest &request,
                                                     const std::string &model);

/**
 * @brief Number of consecutive daily steps needed after @p last_date.
 *
 * Daily requests need horizon steps and weekly requests 7 per week. Month m
 * of a monthly request contributes the day count of the month that contains
 * last_date + m months.
 */
std::size_t dailySteps(const core::ForecastRequest &request, const core::Date &last_date);

/**
 * @brief Folds consecutive daily points into the request's timeframe.
 *
 * Weekly points span 7 consecutive forecast days and monthly points span the
 * day counts described by dailySteps(). Bounds are summed like the point values.
 */
std::vector<core::ForecastPoint> shapeForecast(const std::vector<core::ForecastPoint> &daily,
                                               const core::ForecastRequest &request, const core::Date &last_date);

} // namespace finsight::models
