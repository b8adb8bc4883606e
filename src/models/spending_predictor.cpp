#include "finsight/models/spending_predictor.hpp"

#include "finsight/features/feature_pipeline.hpp"
#include "finsight/utils/cross_validation.hpp"
#include "finsight/utils/logging.hpp"
#include "finsight/utils/metrics.hpp"
#include "finsight/utils/stats.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <istream>
#include <limits>
#include <map>
#include <ostream>
#include <sstream>
#include <stdexcept>

namespace finsight::models {

namespace {

constexpr double kPi = 3.14159265358979323846;
constexpr const char *kRecordTag = "finsight-spending-predictor";
constexpr int kRecordVersion = 1;

const std::vector<std::string> kKeyCategories{"Food", "Transport", "Shopping"};

/// Series kept in the running history, in RollingState column order.
const std::vector<std::string> &historyColumns() {
	static const std::vector<std::string> columns = [] {
		std::vector<std::string> out{features::columns::kTotal, features::columns::kMomentum,
		                             features::columns::kDiversity, features::columns::kConsistency};
		out.insert(out.end(), kKeyCategories.begin(), kKeyCategories.end());
		return out;
	}();
	return columns;
}

const std::map<std::string, std::string> &driverLabels() {
	static const std::map<std::string, std::string> labels{
	    {"total_lag_1", "Yesterday's spending"},
	    {"total_lag_7", "Last week's spending"},
	    {"total_rolling_mean_7", "7-day average"},
	    {"day_of_week", "Day of week pattern"},
	    {"is_weekend", "Weekend effect"},
	    {"spending_momentum", "Recent trend"},
	    {"category_diversity", "Spending categories"},
	    {"Food_rolling_mean_7", "Food spending trend"},
	    {"Transport_rolling_mean_7", "Transport trend"},
	};
	return labels;
}

} // namespace

SpendingPredictor::SpendingPredictor(Config config) : config_(config) {
	if (config_.min_rows < 2) {
		throw std::invalid_argument("SpendingPredictor needs at least two training rows.");
	}
	if (config_.cv_splits < 2) {
		throw std::invalid_argument("Cross-validation needs at least two splits.");
	}
	if (config_.history_days < 14) {
		throw std::invalid_argument("SpendingPredictor history must cover at least 14 days.");
	}
}

const std::vector<std::string> &SpendingPredictor::featureNames() {
	static const std::vector<std::string> names = [] {
		namespace cols = features::columns;
		std::vector<std::string> out{cols::kDayOfWeek, cols::kIsWeekend, cols::kIsMonthStart, cols::kIsMonthEnd,
		                             cols::kDowSin,    cols::kDowCos,    cols::kDomSin,       cols::kDomCos};
		for (std::size_t lag : {1, 2, 3, 7}) {
			out.push_back(cols::lag("total", lag));
		}
		for (std::size_t window : {3, 7, 14}) {
			out.push_back(cols::rolling("total", "mean", window));
		}
		out.push_back(cols::rolling("total", "std", 7));
		out.push_back(cols::rolling("total", "max", 7));
		out.insert(out.end(), {cols::kDaysSinceSpike, cols::kMomentum, cols::kDiversity, cols::kConsistency});
		for (const auto &category : kKeyCategories) {
			out.push_back(cols::lag(category, 1));
			out.push_back(cols::lag(category, 7));
			out.push_back(cols::rolling(category, "mean", 7));
		}
		return out;
	}();
	return names;
}

void SpendingPredictor::requireFeatureColumns(const core::DailyTable &table) {
	for (const auto &name : featureNames()) {
		if (!table.hasColumn(name)) {
			throw std::invalid_argument("Feature table is missing column '" + name + "'.");
		}
	}
	for (const auto &name : historyColumns()) {
		if (!table.hasColumn(name)) {
			throw std::invalid_argument("Feature table is missing column '" + name + "'.");
		}
	}
}

Eigen::MatrixXd SpendingPredictor::designMatrix(const core::DailyTable &table) {
	const auto &names = featureNames();
	Eigen::MatrixXd x(static_cast<Eigen::Index>(table.rows()), static_cast<Eigen::Index>(names.size()));
	for (std::size_t f = 0; f < names.size(); ++f) {
		const auto &column = table.column(names[f]);
		for (std::size_t r = 0; r < column.size(); ++r) {
			x(static_cast<Eigen::Index>(r), static_cast<Eigen::Index>(f)) = column[r];
		}
	}
	return x;
}

SpendingPredictor::TrainingMetrics SpendingPredictor::train(const core::DailyTable &table) {
	if (table.rows() < config_.min_rows) {
		throw std::invalid_argument("SpendingPredictor needs at least " + std::to_string(config_.min_rows) +
		                            " days of data, got " + std::to_string(table.rows()) + ".");
	}
	requireFeatureColumns(table);

	const Eigen::MatrixXd x = designMatrix(table);
	const auto &target = table.column(features::columns::kTotal);
	const Eigen::VectorXd y = Eigen::Map<const Eigen::VectorXd>(target.data(), static_cast<Eigen::Index>(target.size()));

	utils::CVConfig cv_config;
	cv_config.n_splits = config_.cv_splits;
	cv_config.strategy = utils::CVStrategy::EXPANDING;
	const auto runner = [this, &x, &y](int train_start, int train_end, int test_start, int test_end) {
		auto fold_forest = RegressionForestBuilder().withConfig(config_.forest).build();
		fold_forest->fit(Eigen::MatrixXd(x.middleRows(train_start, train_end - train_start)),
		                 Eigen::VectorXd(y.segment(train_start, train_end - train_start)));
		const Eigen::VectorXd predicted = fold_forest->predict(Eigen::MatrixXd(x.middleRows(test_start, test_end - test_start)));
		return std::vector<double>(predicted.data(), predicted.data() + predicted.size());
	};
	const auto cv = utils::CrossValidation::evaluate(target, runner, cv_config);

	auto forest = RegressionForestBuilder().withConfig(config_.forest).build();
	forest->fit(x, y);
	const Eigen::VectorXd fitted = forest->predict(x);
	const std::vector<double> fitted_values(fitted.data(), fitted.data() + fitted.size());

	const auto fit = score(target, fitted_values);
	TrainingMetrics metrics;
	metrics.mae = fit.mae;
	metrics.rmse = fit.rmse;
	metrics.r2 = fit.r_squared;
	metrics.cv_mae = cv.mae;
	metrics.cv_std = cv.mae_std;
	metrics.samples_trained = table.rows();

	const auto raw_importances = forest->featureImportances();
	std::vector<FeatureImportance> importances;
	importances.reserve(raw_importances.size());
	for (std::size_t f = 0; f < raw_importances.size(); ++f) {
		importances.push_back({featureNames()[f], raw_importances[f]});
	}
	std::stable_sort(importances.begin(), importances.end(),
	                 [](const FeatureImportance &a, const FeatureImportance &b) { return a.importance > b.importance; });

	forest_ = std::move(forest);
	metrics_ = metrics;
	importances_ = std::move(importances);
	history_ = historyFrom(table);

	FINSIGHT_INFO("SpendingPredictor trained on {} days: MAE {:.2f}, CV MAE {:.2f} (+/- {:.2f}).", table.rows(),
	              metrics.mae, metrics.cv_mae, metrics.cv_std);
	return metrics;
}

SpendingPredictor::History SpendingPredictor::historyFrom(const core::DailyTable &table) const {
	if (table.empty()) {
		throw std::invalid_argument("Cannot take history from an empty table.");
	}
	requireFeatureColumns(table);

	History history{RollingState(historyColumns(), config_.history_days), table.lastDate(),
	                table.column(features::columns::kDaysSinceSpike).back(),
	                utils::stats::mean(table.column(features::columns::kTotal)), table.rows()};

	const auto &columns = historyColumns();
	const std::size_t n = table.rows();
	const std::size_t start = n > config_.history_days ? n - config_.history_days : 0;
	std::vector<double> row(columns.size());
	for (std::size_t r = start; r < n; ++r) {
		for (std::size_t c = 0; c < columns.size(); ++c) {
			row[c] = table.column(columns[c])[r];
		}
		history.values.pushRow(row);
	}
	return history;
}

void SpendingPredictor::updateHistory(const core::DailyTable &table) {
	history_ = historyFrom(table);
}

Eigen::RowVectorXd SpendingPredictor::syntheticRow(const RollingState &history, double days_since_spike,
                                                   const core::Date &date) {
	const std::size_t total = history.columnIndex(features::columns::kTotal);
	const int dow = date.dayOfWeek();
	const unsigned dom = date.day();

	std::vector<double> values{static_cast<double>(dow),
	                           dow >= 5 ? 1.0 : 0.0,
	                           dom <= 3 ? 1.0 : 0.0,
	                           dom >= 28 ? 1.0 : 0.0,
	                           std::sin(2.0 * kPi * dow / 7.0),
	                           std::cos(2.0 * kPi * dow / 7.0),
	                           std::sin(2.0 * kPi * dom / 31.0),
	                           std::cos(2.0 * kPi * dom / 31.0),
	                           history.lag(total, 1),
	                           history.lag(total, 2),
	                           history.lag(total, 3),
	                           history.lag(total, 7),
	                           history.trailingMean(total, 3),
	                           history.trailingMean(total, 7),
	                           history.trailingMean(total, 14),
	                           history.trailingStd(total, 7),
	                           history.trailingMax(total, 7),
	                           days_since_spike,
	                           history.mean(history.columnIndex(features::columns::kMomentum)),
	                           history.mean(history.columnIndex(features::columns::kDiversity)),
	                           history.mean(history.columnIndex(features::columns::kConsistency))};
	for (const auto &category : kKeyCategories) {
		const std::size_t column = history.columnIndex(category);
		// Both lags read the latest observed value; category series are not advanced by forecasts.
		values.push_back(history.last(column));
		values.push_back(history.last(column));
		values.push_back(history.trailingMean(column, 7));
	}
	return Eigen::Map<const Eigen::RowVectorXd>(values.data(), static_cast<Eigen::Index>(values.size()));
}

std::vector<core::ForecastPoint> SpendingPredictor::rollForward(const History &history, std::size_t steps) const {
	if (!forest_) {
		throw std::runtime_error("Forecast called before train.");
	}
	RollingState running = history.values;
	const std::size_t total = running.columnIndex(features::columns::kTotal);
	double days_since_spike = history.days_since_spike;

	std::vector<core::ForecastPoint> points;
	points.reserve(steps);
	for (std::size_t i = 1; i <= steps; ++i) {
		const auto date = history.last_date.addDays(static_cast<std::int64_t>(i));
		days_since_spike += 1.0;
		const auto per_tree = forest_->predictPerTree(syntheticRow(running, days_since_spike, date));

		core::ForecastPoint point;
		point.date = date;
		point.timeframe = core::Timeframe::Daily;
		point.predicted = std::max(0.0, utils::stats::mean(per_tree));
		point.lower = std::max(0.0, utils::stats::quantile(per_tree, 0.25));
		point.upper = std::max(0.0, utils::stats::quantile(per_tree, 0.75));
		running.push(total, point.predicted);
		points.push_back(point);
	}
	return points;
}

std::vector<core::ForecastPoint> SpendingPredictor::rollForward(std::size_t steps) const {
	if (!isReady()) {
		throw std::runtime_error("Forecast called before train.");
	}
	return rollForward(*history_, steps);
}

core::ForecastResult SpendingPredictor::forecastWith(const History &history,
                                                     const core::ForecastRequest &request) const {
	if (auto shortfall = historyShortfall(history.rows, request, getName())) {
		return *shortfall;
	}

	const auto daily = rollForward(history, dailySteps(request, history.last_date));

	core::ForecastResult result;
	result.points = shapeForecast(daily, request, history.last_date);
	result.confidence = 0.7;
	if (metrics_) {
		result.confidence = std::clamp(1.0 - metrics_->mae / (history.average_daily + 1e-6), 0.5, 0.95);
	}
	result.drivers = drivers();
	result.model = getName();
	return result;
}

core::ForecastResult SpendingPredictor::forecast(const core::ForecastRequest &request) const {
	validateRequest(request);
	if (!isReady()) {
		throw std::runtime_error("Forecast called before train.");
	}
	return forecastWith(*history_, request);
}

core::ForecastResult SpendingPredictor::forecastFrom(const core::DailyTable &table,
                                                     const core::ForecastRequest &request) const {
	validateRequest(request);
	if (!forest_) {
		throw std::runtime_error("Forecast called before train.");
	}
	if (table.empty()) {
		return *historyShortfall(0, request, getName());
	}
	return forecastWith(historyFrom(table), request);
}

double SpendingPredictor::confidence() const {
	if (!metrics_ || !history_) {
		return 0.7;
	}
	return std::clamp(1.0 - metrics_->mae / (history_->average_daily + 1e-6), 0.5, 0.95);
}

std::vector<std::string> SpendingPredictor::drivers(std::size_t n) const {
	std::vector<std::string> out;
	const auto &labels = driverLabels();
	for (const auto &entry : importances_) {
		if (out.size() >= n) {
			break;
		}
		const auto it = labels.find(entry.feature);
		std::ostringstream text;
		text << (it == labels.end() ? entry.feature : it->second) << " (" << std::fixed << std::setprecision(2)
		     << entry.importance * 100.0 << "%)";
		out.push_back(text.str());
	}
	return out;
}

// --- Persistence ---

void SpendingPredictor::save(std::ostream &out) const {
	if (!forest_) {
		throw std::runtime_error("Cannot save an untrained SpendingPredictor.");
	}
	out.precision(std::numeric_limits<double>::max_digits10);
	out << kRecordTag << ' ' << kRecordVersion << '\n';

	const auto &names = featureNames();
	out << "features " << names.size();
	for (const auto &name : names) {
		out << ' ' << name;
	}
	out << '\n';

	if (metrics_) {
		out << "metrics 1 " << metrics_->mae << ' ' << metrics_->rmse << ' ' << (metrics_->r2 ? 1 : 0) << ' '
		    << metrics_->r2.value_or(0.0) << ' ' << metrics_->cv_mae << ' ' << metrics_->cv_std << ' '
		    << metrics_->samples_trained << '\n';
	} else {
		out << "metrics 0\n";
	}

	out << "importances " << importances_.size() << '\n';
	for (const auto &entry : importances_) {
		out << entry.feature << ' ' << entry.importance << '\n';
	}

	if (history_) {
		const auto &values = history_->values;
		out << "history 1 " << history_->last_date.toString() << ' ' << history_->days_since_spike << ' '
		    << history_->average_daily << ' ' << history_->rows << ' ' << values.capacity() << ' '
		    << values.columns().size() << '\n';
		for (std::size_t c = 0; c < values.columns().size(); ++c) {
			out << values.columns()[c] << ' ' << values.size(c);
			for (double v : values.history(c)) {
				out << ' ' << v;
			}
			out << '\n';
		}
	} else {
		out << "history 0\n";
	}

	forest_->save(out);
}

std::unique_ptr<SpendingPredictor> SpendingPredictor::load(std::istream &in) {
	std::string tag;
	int version = 0;
	if (!(in >> tag >> version) || tag != kRecordTag || version != kRecordVersion) {
		throw std::runtime_error("Not a SpendingPredictor record.");
	}

	std::size_t count = 0;
	if (!(in >> tag >> count) || tag != "features" || count != featureNames().size()) {
		throw std::runtime_error("SpendingPredictor record has an unexpected feature list.");
	}
	for (std::size_t f = 0; f < count; ++f) {
		std::string name;
		if (!(in >> name) || name != featureNames()[f]) {
			throw std::runtime_error("SpendingPredictor record has an unexpected feature list.");
		}
	}

	auto predictor = std::make_unique<SpendingPredictor>();

	int present = 0;
	if (!(in >> tag >> present) || tag != "metrics") {
		throw std::runtime_error("SpendingPredictor record is missing metrics.");
	}
	if (present != 0) {
		TrainingMetrics metrics;
		int has_r2 = 0;
		double r2 = 0.0;
		if (!(in >> metrics.mae >> metrics.rmse >> has_r2 >> r2 >> metrics.cv_mae >> metrics.cv_std >>
		      metrics.samples_trained)) {
			throw std::runtime_error("SpendingPredictor record has truncated metrics.");
		}
		if (has_r2 != 0) {
			metrics.r2 = r2;
		}
		predictor->metrics_ = metrics;
	}

	if (!(in >> tag >> count) || tag != "importances") {
		throw std::runtime_error("SpendingPredictor record is missing importances.");
	}
	for (std::size_t i = 0; i < count; ++i) {
		FeatureImportance entry;
		if (!(in >> entry.feature >> entry.importance)) {
			throw std::runtime_error("SpendingPredictor record has truncated importances.");
		}
		predictor->importances_.push_back(entry);
	}

	if (!(in >> tag >> present) || tag != "history") {
		throw std::runtime_error("SpendingPredictor record is missing history.");
	}
	if (present != 0) {
		std::string last_date;
		double days_since_spike = 0.0;
		double average_daily = 0.0;
		std::size_t rows = 0;
		std::size_t capacity = 0;
		std::size_t columns = 0;
		if (!(in >> last_date >> days_since_spike >> average_daily >> rows >> capacity >> columns) ||
		    columns != historyColumns().size()) {
			throw std::runtime_error("SpendingPredictor record has a malformed history header.");
		}
		History history{RollingState(historyColumns(), capacity), core::Date::parse(last_date), days_since_spike,
		                average_daily, rows};
		for (std::size_t c = 0; c < columns; ++c) {
			std::string name;
			std::size_t size = 0;
			if (!(in >> name >> size) || name != historyColumns()[c]) {
				throw std::runtime_error("SpendingPredictor record has an unexpected history column.");
			}
			for (std::size_t i = 0; i < size; ++i) {
				double v = 0.0;
				if (!(in >> v)) {
					throw std::runtime_error("SpendingPredictor record has a truncated history column.");
				}
				history.values.push(c, v);
			}
		}
		predictor->history_ = std::move(history);
	}

	predictor->forest_ = RegressionForest::load(in);
	predictor->config_.forest = predictor->forest_->config();
	return predictor;
}

} // namespace finsight::models
