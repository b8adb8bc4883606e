#pragma once

#include "finsight/core/daily_table.hpp"
#include "finsight/core/transaction.hpp"
#include "finsight/models/iforecaster.hpp"
#include "finsight/models/regression_forest.hpp"
#include "finsight/models/rolling_state.hpp"

#include <Eigen/Dense>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace finsight::models {

/**
 * @class AutoRegressiveForecaster
 * @brief Random-forest forecaster that rolls forward one day at a time.
 *
 * The model learns day t's total from the calendar of day t and, for every
 * category and the total, the values of days t-1, t-2, t-3 and the mean of
 * days t-7 to t-1. Same-day category values never enter the features. At
 * forecast time each step reads its features from a RollingState, predicts
 * the total, splits it over categories by their trailing shares and pushes
 * the synthetic day back into the state.
 */
class AutoRegressiveForecaster final : public IForecaster {
public:
	struct Config {
		std::size_t n_trees = 100;
		std::uint32_t seed = 42;
		std::size_t train_window = 90;  // trailing design rows used for training
		std::size_t buffer_size = 30;   // RollingState capacity
		std::size_t share_window = 30;  // days used to split a total over categories
		bool backtest = true;
		std::size_t backtest_days = 14;
		std::size_t min_backtest_history = 28;
	};

	struct Design {
		Eigen::MatrixXd x;
		Eigen::VectorXd y;
		std::vector<core::Date> dates;
	};

	AutoRegressiveForecaster() : AutoRegressiveForecaster(Config{}) {
	}

	/// @throws std::invalid_argument If the configuration is inconsistent.
	explicit AutoRegressiveForecaster(Config config);

	/// Aggregates the transactions onto a daily calendar and fits on it.
	void fit(const core::Transactions &transactions);

	/**
	 * @brief Fits on a frame shaped like features::aggregateDaily() output.
	 *
	 * With fewer than 14 days of spending the forecaster stays unfitted and
	 * forecast() reports insufficient history, however long the calendar span.
	 * @throws std::invalid_argument If a category or total column is missing.
	 */
	void fitFrame(const core::DailyTable &frame);

	core::ForecastResult forecast(const core::ForecastRequest &request) const override;

	bool isReady() const override {
		return forest_ != nullptr;
	}

	std::string getName() const override {
		return "AutoRegressiveForecaster";
	}

	/// Categories in column order followed by "Total".
	static const std::vector<std::string> &stateColumns();
	static const std::vector<std::string> &featureNames();

	/// Training rows for every day whose three-day lag exists.
	static Design buildDesign(const core::DailyTable &frame);

	/// Feature row for @p date from the values held in @p state.
	static Eigen::RowVectorXd featureRow(const RollingState &state, const core::Date &date);

	/// RollingState holding the trailing buffer_size days of @p frame.
	RollingState stateFrom(const core::DailyTable &frame) const;

	/**
	 * @brief Predicts @p date from @p state and pushes the synthetic day into it.
	 * @throws std::runtime_error If the forecaster is not fitted.
	 */
	core::ForecastPoint step(RollingState &state, const core::Date &date) const;

	/// @p steps consecutive daily points starting at @p start.
	std::vector<core::ForecastPoint> rollForward(RollingState state, const core::Date &start, std::size_t steps) const;

	const std::optional<core::Backtest> &backtest() const {
		return backtest_;
	}

	std::size_t historyDays() const {
		return frame_.rows();
	}

	/// Days of the fitted frame with a positive total.
	std::size_t spendDays() const {
		return spend_days_;
	}

	const Config &config() const {
		return config_;
	}

private:
	core::Backtest runBacktest() const;
	std::vector<std::string> drivers() const;

	Config config_;
	core::DailyTable frame_;
	std::unique_ptr<RegressionForest> forest_;
	std::optional<core::Backtest> backtest_;
	std::size_t spend_days_ = 0;
	bool fit_called_ = false;
};

} // namespace finsight::models
