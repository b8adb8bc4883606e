#pragma once

#include "finsight/core/daily_table.hpp"
#include "finsight/models/iforecaster.hpp"
#include "finsight/models/regression_forest.hpp"
#include "finsight/models/rolling_state.hpp"

#include <Eigen/Dense>

#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace finsight::models {

/**
 * @class SpendingPredictor
 * @brief Random-forest forecaster trained on the feature pipeline's daily table.
 *
 * Training scores the forest with expanding, time-ordered cross-validation
 * and then refits on every row. Inference synthesizes the feature row of each
 * future day from the trailing 30 days of the running total series; each
 * predicted day is appended to that series before the next is computed. The
 * trained model, its metrics, importances and recent history persist through
 * save() and load().
 */
class SpendingPredictor final : public IForecaster {
public:
	struct Config {
		ForestConfig forest{300, 15, 5, 2, true, 42};
		std::size_t min_rows = 30;
		int cv_splits = 5;
		std::size_t history_days = 30;
	};

	struct TrainingMetrics {
		double mae = 0.0;
		double rmse = 0.0;
		std::optional<double> r2;
		double cv_mae = 0.0;
		double cv_std = 0.0;
		std::size_t samples_trained = 0;
	};

	struct FeatureImportance {
		std::string feature;
		double importance = 0.0;
	};

	SpendingPredictor() : SpendingPredictor(Config{}) {
	}

	/// @throws std::invalid_argument If the configuration is inconsistent.
	explicit SpendingPredictor(Config config);

	/**
	 * @brief Trains on a feature-pipeline table and keeps its trailing history.
	 * @throws std::invalid_argument With fewer than Config::min_rows rows or a missing feature column.
	 */
	TrainingMetrics train(const core::DailyTable &table);

	/**
	 * @brief Replaces the running series with the tail of a newer table without retraining.
	 * @throws std::invalid_argument If the table is empty or lacks a feature column.
	 */
	void updateHistory(const core::DailyTable &table);

	/// Forecasts from the history kept by train(), updateHistory() or load().
	core::ForecastResult forecast(const core::ForecastRequest &request) const override;

	/**
	 * @brief Forecasts from the tail of @p table, leaving the kept history untouched.
	 * @throws std::invalid_argument If the table lacks a feature column.
	 */
	core::ForecastResult forecastFrom(const core::DailyTable &table, const core::ForecastRequest &request) const;

	bool isReady() const override {
		return forest_ != nullptr && history_.has_value();
	}

	std::string getName() const override {
		return "SpendingPredictor";
	}

	static const std::vector<std::string> &featureNames();

	/**
	 * @brief Feature row for @p date synthesized from a running history.
	 * @param days_since_spike Days since the last spike as of @p date.
	 */
	static Eigen::RowVectorXd syntheticRow(const RollingState &history, double days_since_spike,
	                                       const core::Date &date);

	/**
	 * @brief Daily points for @p steps days after the last kept history date.
	 * @throws std::runtime_error If the predictor is not ready.
	 */
	std::vector<core::ForecastPoint> rollForward(std::size_t steps) const;

	/// clamp(1 - MAE / average daily spend, 0.5, 0.95); 0.7 before training.
	double confidence() const;

	/// The top @p n importances rendered as "<label> (<pct>%)".
	std::vector<std::string> drivers(std::size_t n = 5) const;

	const std::optional<TrainingMetrics> &metrics() const {
		return metrics_;
	}

	/// Sorted by descending importance.
	const std::vector<FeatureImportance> &importances() const {
		return importances_;
	}

	std::size_t historyDays() const {
		return history_ ? history_->rows : 0;
	}

	void save(std::ostream &out) const;

	/// @throws std::runtime_error On a malformed or truncated record.
	static std::unique_ptr<SpendingPredictor> load(std::istream &in);

private:
	/// Running series the synthetic rows are read from.
	struct History {
		RollingState values;
		core::Date last_date;
		double days_since_spike = 0.0;
		double average_daily = 0.0;
		std::size_t rows = 0;
	};

	static Eigen::MatrixXd designMatrix(const core::DailyTable &table);
	static void requireFeatureColumns(const core::DailyTable &table);
	History historyFrom(const core::DailyTable &table) const;
	std::vector<core::ForecastPoint> rollForward(const History &history, std::size_t steps) const;
	core::ForecastResult forecastWith(const History &history, const core::ForecastRequest &request) const;

	Config config_;
	std::unique_ptr<RegressionForest> forest_;
	std::optional<TrainingMetrics> metrics_;
	std::vector<FeatureImportance> importances_;

	std::optional<History> history_;
};

} // namespace finsight::models
