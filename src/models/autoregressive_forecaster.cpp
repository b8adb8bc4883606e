#include "finsight/models/autoregressive_forecaster.hpp"

#include "finsight/features/feature_pipeline.hpp"
#include "finsight/utils/logging.hpp"
#include "finsight/utils/metrics.hpp"
#include "finsight/utils/stats.hpp"

#include <algorithm>
#include <iomanip>
#include <map>
#include <numeric>
#include <sstream>
#include <stdexcept>

namespace finsight::models {

namespace {

constexpr std::size_t kCalendarFeatures = 4;
constexpr std::size_t kFeaturesPerColumn = 4;
constexpr std::size_t kMaxLag = 3;
constexpr std::size_t kMeanWindow = 7;
constexpr std::size_t kDriverCount = 5;

const std::string kTotalColumn = "Total";

void writeCalendar(Eigen::RowVectorXd &row, const core::Date &date) {
	const int dow = date.dayOfWeek();
	row(0) = static_cast<double>(dow);
	row(1) = static_cast<double>(date.isoWeek());
	row(2) = dow >= 5 ? 1.0 : 0.0;
	row(3) = date.day() > 25 ? 1.0 : 0.0;
}

/// Frame column that feeds a state column.
const std::string &frameColumn(const std::string &state_column) {
	static const std::string total(features::columns::kTotal);
	return state_column == kTotalColumn ? total : state_column;
}

} // namespace

AutoRegressiveForecaster::AutoRegressiveForecaster(Config config) : config_(config) {
	if (config_.n_trees == 0) {
		throw std::invalid_argument("AutoRegressiveForecaster needs at least one tree.");
	}
	if (config_.buffer_size < kMeanWindow) {
		throw std::invalid_argument("RollingState must hold at least a week of history.");
	}
	if (config_.train_window < kMinForecastHistory) {
		throw std::invalid_argument("Training window must cover at least two weeks.");
	}
	if (config_.share_window == 0 || config_.backtest_days == 0) {
		throw std::invalid_argument("Share and backtest windows must be positive.");
	}
}

const std::vector<std::string> &AutoRegressiveForecaster::stateColumns() {
	static const std::vector<std::string> columns = [] {
		std::vector<std::string> out(core::categories().begin(), core::categories().end());
		out.push_back(kTotalColumn);
		return out;
	}();
	return columns;
}

const std::vector<std::string> &AutoRegressiveForecaster::featureNames() {
	static const std::vector<std::string> names = [] {
		std::vector<std::string> out{"day_of_week", "week_number", "is_weekend", "is_end_of_month"};
		for (const auto &column : stateColumns()) {
			out.push_back(column + "_lag_1");
			out.push_back(column + "_lag_2");
			out.push_back(column + "_lag_3");
			out.push_back(column + "_mean_7");
		}
		return out;
	}();
	return names;
}

AutoRegressiveForecaster::Design AutoRegressiveForecaster::buildDesign(const core::DailyTable &frame) {
	const auto &columns = stateColumns();
	std::vector<const std::vector<double> *> series;
	series.reserve(columns.size());
	for (const auto &column : columns) {
		if (!frame.hasColumn(frameColumn(column))) {
			throw std::invalid_argument("Daily frame is missing column '" + frameColumn(column) + "'.");
		}
		series.push_back(&frame.column(frameColumn(column)));
	}

	Design design;
	const std::size_t n = frame.rows();
	if (n <= kMaxLag) {
		design.x.resize(0, static_cast<Eigen::Index>(featureNames().size()));
		design.y.resize(0);
		return design;
	}

	const auto rows = static_cast<Eigen::Index>(n - kMaxLag);
	design.x.resize(rows, static_cast<Eigen::Index>(featureNames().size()));
	design.y.resize(rows);
	design.dates.reserve(n - kMaxLag);

	const auto &total = frame.column(features::columns::kTotal);
	for (std::size_t t = kMaxLag; t < n; ++t) {
		Eigen::RowVectorXd row(design.x.cols());
		writeCalendar(row, frame.dates()[t]);
		for (std::size_t c = 0; c < series.size(); ++c) {
			const auto &values = *series[c];
			const auto base = static_cast<Eigen::Index>(kCalendarFeatures + c * kFeaturesPerColumn);
			row(base) = values[t - 1];
			row(base + 1) = values[t - 2];
			row(base + 2) = values[t - 3];
			const std::size_t start = t >= kMeanWindow ? t - kMeanWindow : 0;
			double sum = 0.0;
			for (std::size_t i = start; i < t; ++i) {
				sum += values[i];
			}
			row(base + 3) = sum / static_cast<double>(t - start);
		}
		const auto r = static_cast<Eigen::Index>(t - kMaxLag);
		design.x.row(r) = row;
		design.y(r) = total[t];
		design.dates.push_back(frame.dates()[t]);
	}
	return design;
}

Eigen::RowVectorXd AutoRegressiveForecaster::featureRow(const RollingState &state, const core::Date &date) {
	const auto &columns = stateColumns();
	if (state.columns() != columns) {
		throw std::invalid_argument("RollingState columns do not match the forecaster's columns.");
	}
	Eigen::RowVectorXd row(static_cast<Eigen::Index>(featureNames().size()));
	writeCalendar(row, date);
	for (std::size_t c = 0; c < columns.size(); ++c) {
		const auto base = static_cast<Eigen::Index>(kCalendarFeatures + c * kFeaturesPerColumn);
		row(base) = state.lag(c, 1);
		row(base + 1) = state.lag(c, 2);
		row(base + 2) = state.lag(c, 3);
		row(base + 3) = state.trailingMean(c, kMeanWindow);
	}
	return row;
}

RollingState AutoRegressiveForecaster::stateFrom(const core::DailyTable &frame) const {
	RollingState state(stateColumns(), config_.buffer_size);
	const auto &columns = stateColumns();
	std::vector<const std::vector<double> *> series;
	for (const auto &column : columns) {
		series.push_back(&frame.column(frameColumn(column)));
	}
	const std::size_t n = frame.rows();
	const std::size_t start = n > config_.buffer_size ? n - config_.buffer_size : 0;
	std::vector<double> row(columns.size());
	for (std::size_t t = start; t < n; ++t) {
		for (std::size_t c = 0; c < columns.size(); ++c) {
			row[c] = (*series[c])[t];
		}
		state.pushRow(row);
	}
	return state;
}

void AutoRegressiveForecaster::fit(const core::Transactions &transactions) {
	fitFrame(features::aggregateDaily(transactions));
}

void AutoRegressiveForecaster::fitFrame(const core::DailyTable &frame) {
	fit_called_ = true;
	forest_.reset();
	backtest_.reset();
	frame_ = frame;

	// Zero-filled calendar days do not count as history; a missing total column is reported by buildDesign().
	spend_days_ = frame_.rows();
	if (frame_.hasColumn(features::columns::kTotal)) {
		const auto &total = frame_.column(features::columns::kTotal);
		spend_days_ = static_cast<std::size_t>(
		    std::count_if(total.begin(), total.end(), [](double value) { return value > 0.0; }));
	}
	if (spend_days_ < kMinForecastHistory) {
		FINSIGHT_WARN("AutoRegressiveForecaster: {} spending days over {} calendar days, at least {} required.",
		              spend_days_, frame_.rows(), kMinForecastHistory);
		return;
	}

	auto design = buildDesign(frame_);
	const auto rows = design.x.rows();
	const auto keep = std::min<Eigen::Index>(rows, static_cast<Eigen::Index>(config_.train_window));
	const Eigen::MatrixXd x = design.x.bottomRows(keep);
	const Eigen::VectorXd y = design.y.tail(keep);

	auto forest = RegressionForestBuilder().withTrees(config_.n_trees).withSeed(config_.seed).build();
	forest->fit(x, y);
	forest_ = std::move(forest);
	FINSIGHT_INFO("AutoRegressiveForecaster fitted on {} of {} days ({} trees).", keep, frame_.rows(), config_.n_trees);

	if (config_.backtest && frame_.rows() >= config_.min_backtest_history) {
		backtest_ = runBacktest();
	}
}

core::ForecastPoint AutoRegressiveForecaster::step(RollingState &state, const core::Date &date) const {
	if (!forest_) {
		throw std::runtime_error("Forecast called before fit.");
	}
	const auto per_tree = forest_->predictPerTree(featureRow(state, date));

	core::ForecastPoint point;
	point.date = date;
	point.timeframe = core::Timeframe::Daily;
	point.predicted = std::max(0.0, utils::stats::mean(per_tree));
	point.lower = std::max(0.0, utils::stats::quantile(per_tree, 0.25));
	point.upper = std::max(0.0, utils::stats::quantile(per_tree, 0.75));

	const auto &columns = stateColumns();
	const std::size_t total_index = columns.size() - 1;
	double category_sum = 0.0;
	std::vector<double> shares(total_index, 0.0);
	for (std::size_t c = 0; c < total_index; ++c) {
		shares[c] = state.trailingSum(c, config_.share_window);
		category_sum += shares[c];
	}

	std::vector<double> row(columns.size(), 0.0);
	for (std::size_t c = 0; c < total_index; ++c) {
		row[c] = category_sum > 0.0 ? point.predicted * shares[c] / category_sum : 0.0;
	}
	row[total_index] = point.predicted;
	state.pushRow(row);
	return point;
}

std::vector<core::ForecastPoint> AutoRegressiveForecaster::rollForward(RollingState state, const core::Date &start,
                                                                       std::size_t steps) const {
	std::vector<core::ForecastPoint> points;
	points.reserve(steps);
	for (std::size_t i = 0; i < steps; ++i) {
		points.push_back(step(state, start.addDays(static_cast<std::int64_t>(i))));
	}
	return points;
}

core::ForecastResult AutoRegressiveForecaster::forecast(const core::ForecastRequest &request) const {
	validateRequest(request);
	if (!fit_called_) {
		throw std::runtime_error("Forecast called before fit.");
	}
	if (auto shortfall = historyShortfall(spend_days_, request, getName())) {
		return *shortfall;
	}

	const auto &last = frame_.lastDate();
	const auto daily = rollForward(stateFrom(frame_), last.addDays(1), dailySteps(request, last));

	core::ForecastResult result;
	result.points = shapeForecast(daily, request, last);
	result.confidence = std::min(0.95, 0.5 + static_cast<double>(frame_.rows()) / 200.0);
	result.drivers = drivers();
	result.model = getName();
	result.backtest = backtest_;
	return result;
}

core::Backtest AutoRegressiveForecaster::runBacktest() const {
	const std::size_t n = frame_.rows();
	const std::size_t holdout = config_.backtest_days;
	const auto train = frame_.head(n - holdout);

	Config refit_config = config_;
	refit_config.backtest = false;
	AutoRegressiveForecaster refit(refit_config);
	refit.fitFrame(train);

	core::Backtest backtest;
	if (!refit.isReady()) {
		return backtest;
	}

	const auto predicted = refit.rollForward(refit.stateFrom(train), train.lastDate().addDays(1), holdout);
	const auto &total = frame_.column(features::columns::kTotal);

	std::vector<double> actuals;
	std::vector<double> forecasts;
	std::map<core::Date, core::BacktestWeek> weeks;
	for (std::size_t i = 0; i < holdout; ++i) {
		core::BacktestDay day;
		day.date = frame_.dates()[n - holdout + i];
		day.actual = total[n - holdout + i];
		day.forecast = predicted[i].predicted;
		if (day.forecast > day.actual) {
			++backtest.over_days;
		} else if (day.forecast < day.actual) {
			++backtest.under_days;
		}
		actuals.push_back(day.actual);
		forecasts.push_back(day.forecast);

		auto &week = weeks[day.date.weekEnd()];
		week.week_start = day.date.weekStart();
		week.week_end = day.date.weekEnd();
		week.actual += day.actual;
		week.forecast += day.forecast;
		backtest.days.push_back(day);
	}
	const auto accuracy = score(actuals, forecasts);
	backtest.mae = accuracy.mae;
	backtest.rmse = accuracy.rmse;
	backtest.bias = utils::Metrics::bias(actuals, forecasts);

	const std::size_t skip = weeks.size() > 2 ? weeks.size() - 2 : 0;
	std::size_t index = 0;
	for (auto &entry : weeks) {
		if (index++ < skip) {
			continue;
		}
		auto &week = entry.second;
		week.delta = week.forecast - week.actual;
		week.over = week.delta > 0.0;
		backtest.weeks.push_back(week);
	}

	FINSIGHT_DEBUG("Backtest over {} days: MAE {:.2f}, bias {:.2f}, {} over, {} under.", holdout, backtest.mae,
	               backtest.bias, backtest.over_days, backtest.under_days);
	return backtest;
}

std::vector<std::string> AutoRegressiveForecaster::drivers() const {
	std::vector<std::string> out;
	if (!forest_) {
		return out;
	}
	const auto importances = forest_->featureImportances();
	std::vector<std::size_t> order(importances.size());
	std::iota(order.begin(), order.end(), std::size_t{0});
	std::stable_sort(order.begin(), order.end(),
	                 [&importances](std::size_t a, std::size_t b) { return importances[a] > importances[b]; });
	const auto &names = featureNames();
	for (std::size_t i = 0; i < order.size() && out.size() < kDriverCount; ++i) {
		if (importances[order[i]] <= 0.0) {
			break;
		}
		std::ostringstream label;
		label << names[order[i]] << " (" << std::fixed << std::setprecision(2) << importances[order[i]] * 100.0 << "%)";
		out.push_back(label.str());
	}
	return out;
}

} // namespace finsight::models
