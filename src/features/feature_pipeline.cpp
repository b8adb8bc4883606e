#include "finsight/features/feature_pipeline.hpp"

#include "finsight/utils/logging.hpp"
#include "finsight/utils/stats.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>
#include <set>
#include <stdexcept>

namespace finsight::features {

namespace stats = utils::stats;

namespace {

constexpr double kPi = 3.14159265358979323846;

// Position of a virtual spike / spend event before the first row.
constexpr long kNoEventRow = -999;

bool isLagColumn(const std::string &name) {
	return name.find("lag") != std::string::npos;
}

bool isRollingColumn(const std::string &name) {
	return name.find("rolling") != std::string::npos;
}

} // namespace

namespace columns {

std::string lag(const std::string &base, std::size_t k) {
	return base + "_lag_" + std::to_string(k);
}

std::string rolling(const std::string &base, const std::string &stat, std::size_t window) {
	return base + "_rolling_" + stat + "_" + std::to_string(window);
}

std::string perCategory(const std::string &category, const std::string &feature) {
	return category + "_" + feature;
}

} // namespace columns

int activityLevelCode(double activity_rate) {
	if (activity_rate < 0.1) {
		return 0;
	}
	if (activity_rate < 0.3) {
		return 1;
	}
	return 2;
}

// --- Aggregation ---

core::DailyTable aggregateDaily(const core::Transactions &transactions) {
	bool any = false;
	core::Date first;
	core::Date last;
	for (const auto &tx : transactions) {
		if (tx.type != core::TransactionType::Expense) {
			continue;
		}
		if (!any || tx.date < first) {
			first = tx.date;
		}
		if (!any || tx.date > last) {
			last = tx.date;
		}
		any = true;
	}
	if (!any) {
		return {};
	}

	const auto n = static_cast<std::size_t>(last - first + 1);
	std::vector<core::Date> dates;
	dates.reserve(n);
	for (std::size_t i = 0; i < n; ++i) {
		dates.push_back(first.addDays(static_cast<std::int64_t>(i)));
	}

	std::vector<std::vector<double>> sums(core::kCategoryCount, std::vector<double>(n, 0.0));
	for (const auto &tx : transactions) {
		if (tx.type != core::TransactionType::Expense) {
			continue;
		}
		const auto row = static_cast<std::size_t>(tx.date - first);
		const auto cat = core::categoryIndex(core::normalizeCategory(tx.category));
		sums[cat][row] += std::abs(tx.amount);
	}

	core::DailyTable table(std::move(dates));
	std::vector<double> total(n, 0.0);
	for (std::size_t c = 0; c < core::kCategoryCount; ++c) {
		for (std::size_t i = 0; i < n; ++i) {
			total[i] += sums[c][i];
		}
		table.setColumn(core::categories()[c], std::move(sums[c]));
	}
	table.setColumn(columns::kTotal, std::move(total));
	return table;
}

std::size_t distinctExpenseDays(const core::Transactions &transactions) {
	std::set<std::int64_t> days;
	for (const auto &tx : transactions) {
		if (tx.type == core::TransactionType::Expense) {
			days.insert(tx.date.dayNumber());
		}
	}
	return days.size();
}

core::Transactions toTransactions(const core::DailyTable &table) {
	core::Transactions result;
	for (const auto &category : core::categories()) {
		if (!table.hasColumn(category)) {
			continue;
		}
		const auto &values = table.column(category);
		for (std::size_t i = 0; i < table.rows(); ++i) {
			if (values[i] > 0.0) {
				core::Transaction tx;
				tx.date = table.dates()[i];
				tx.amount = values[i];
				tx.category = category;
				tx.type = core::TransactionType::Expense;
				result.push_back(std::move(tx));
			}
		}
	}
	std::stable_sort(result.begin(), result.end(),
	                 [](const core::Transaction &a, const core::Transaction &b) { return a.date < b.date; });
	return result;
}

namespace {

double categoryValue(const core::DailyTable &table, std::size_t c, std::size_t row) {
	const auto &name = core::categories()[c];
	return table.hasColumn(name) ? table.column(name)[row] : 0.0;
}

std::vector<double> totalColumn(const core::DailyTable &table) {
	if (table.hasColumn(columns::kTotal)) {
		return table.column(columns::kTotal);
	}
	std::vector<double> total(table.rows(), 0.0);
	for (std::size_t c = 0; c < core::kCategoryCount; ++c) {
		for (std::size_t i = 0; i < table.rows(); ++i) {
			total[i] += categoryValue(table, c, i);
		}
	}
	return total;
}

} // namespace

std::vector<WeeklyAggregate> weeklyAggregates(const core::DailyTable &table) {
	std::vector<WeeklyAggregate> weeks;
	if (table.empty()) {
		return weeks;
	}
	const auto total = totalColumn(table);

	std::size_t row = 0;
	while (row < table.rows()) {
		WeeklyAggregate week;
		week.week_start = table.dates()[row].weekStart();
		week.week_end = table.dates()[row].weekEnd();
		std::vector<double> daily;
		int weekend_days = 0;
		for (; row < table.rows() && table.dates()[row] <= week.week_end; ++row) {
			for (std::size_t c = 0; c < core::kCategoryCount; ++c) {
				const double v = categoryValue(table, c, row);
				week.category_sum[c] += v;
				week.category_active_days[c] += v > 0.0 ? 1 : 0;
			}
			daily.push_back(total[row]);
			weekend_days += table.dates()[row].dayOfWeek() >= 5 ? 1 : 0;
		}
		week.days = static_cast<int>(daily.size());
		week.total = std::accumulate(daily.begin(), daily.end(), 0.0);
		week.max_daily = *std::max_element(daily.begin(), daily.end());
		week.avg_daily = stats::mean(daily);
		week.std_daily = stats::sampleStdDev(daily);
		week.weekend_ratio = static_cast<double>(weekend_days) / static_cast<double>(week.days);
		weeks.push_back(week);
	}
	return weeks;
}

std::vector<MonthlyAggregate> monthlyAggregates(const core::DailyTable &table) {
	std::vector<MonthlyAggregate> months;
	if (table.empty()) {
		return months;
	}
	const auto total = totalColumn(table);

	std::size_t row = 0;
	while (row < table.rows()) {
		MonthlyAggregate month;
		month.month = table.dates()[row].monthKey();
		month.month_start = table.dates()[row].monthStart();
		month.month_end = table.dates()[row].monthEnd();
		std::vector<double> daily;
		double diversity = 0.0;
		for (; row < table.rows() && table.dates()[row] <= month.month_end; ++row) {
			int active_categories = 0;
			for (std::size_t c = 0; c < core::kCategoryCount; ++c) {
				const double v = categoryValue(table, c, row);
				month.category_sum[c] += v;
				if (v > 0.0) {
					++month.category_active_days[c];
					++active_categories;
				}
			}
			diversity += active_categories;
			daily.push_back(total[row]);
			month.active_days += total[row] > 0.0 ? 1 : 0;
		}
		month.days = static_cast<int>(daily.size());
		month.total = std::accumulate(daily.begin(), daily.end(), 0.0);
		month.avg_daily = stats::mean(daily);
		month.volatility = stats::sampleStdDev(daily);
		month.avg_category_diversity = diversity / static_cast<double>(month.days);
		months.push_back(month);
	}
	return months;
}

// --- Pipeline ---

FeaturePipeline::FeaturePipeline(Config config) : config_(std::move(config)) {
	if (config_.min_distinct_days == 0) {
		throw std::invalid_argument("Minimum number of distinct days must be positive.");
	}
	if (std::find(config_.lags.begin(), config_.lags.end(), 0u) != config_.lags.end()) {
		throw std::invalid_argument("Lag offsets must be positive.");
	}
	if (std::find(config_.rolling_windows.begin(), config_.rolling_windows.end(), 0u) !=
	    config_.rolling_windows.end()) {
		throw std::invalid_argument("Rolling windows must be positive.");
	}
	for (const auto &category : config_.key_categories) {
		if (!core::isKnownCategory(category)) {
			throw std::invalid_argument("Unknown key category '" + category + "'.");
		}
	}
	if (config_.spike_multiplier <= 0.0) {
		throw std::invalid_argument("Spike multiplier must be positive.");
	}
	if (config_.activity_window == 0 || config_.spike_memory_days == 0) {
		throw std::invalid_argument("Activity and spike-memory windows must be positive.");
	}
}

core::DailyTable FeaturePipeline::build(const core::Transactions &transactions) const {
	const std::size_t distinct_days = distinctExpenseDays(transactions);
	if (distinct_days < config_.min_distinct_days) {
		FINSIGHT_WARN("Feature pipeline needs {} distinct expense days, got {}.", config_.min_distinct_days,
		              distinct_days);
		return {};
	}

	core::DailyTable table = aggregateDaily(transactions);
	addTemporalFeatures(table);
	addLagFeatures(table);
	addRollingFeatures(table);
	addBehavioralFeatures(table);
	fillMissing(table);

	FINSIGHT_DEBUG("Built daily table: {} rows, {} columns ({} .. {}).", table.rows(), table.columnNames().size(),
	               table.firstDate().toString(), table.lastDate().toString());
	return table;
}

void FeaturePipeline::addTemporalFeatures(core::DailyTable &table) const {
	const std::size_t n = table.rows();
	std::vector<double> dow(n), dom(n), wom(n), month(n), weekend(n), month_start(n), month_end(n);
	std::vector<double> dow_sin(n), dow_cos(n), dom_sin(n), dom_cos(n);
	for (std::size_t i = 0; i < n; ++i) {
		const auto &date = table.dates()[i];
		const double d = date.dayOfWeek();
		const double m = date.day();
		dow[i] = d;
		dom[i] = m;
		wom[i] = static_cast<double>((date.day() - 1) / 7 + 1);
		month[i] = date.month();
		weekend[i] = d >= 5 ? 1.0 : 0.0;
		month_start[i] = m <= 3 ? 1.0 : 0.0;
		month_end[i] = m >= 28 ? 1.0 : 0.0;
		dow_sin[i] = std::sin(2.0 * kPi * d / 7.0);
		dow_cos[i] = std::cos(2.0 * kPi * d / 7.0);
		dom_sin[i] = std::sin(2.0 * kPi * m / 31.0);
		dom_cos[i] = std::cos(2.0 * kPi * m / 31.0);
	}
	table.setColumn(columns::kDayOfWeek, std::move(dow));
	table.setColumn(columns::kDayOfMonth, std::move(dom));
	table.setColumn(columns::kWeekOfMonth, std::move(wom));
	table.setColumn(columns::kMonth, std::move(month));
	table.setColumn(columns::kIsWeekend, std::move(weekend));
	table.setColumn(columns::kIsMonthStart, std::move(month_start));
	table.setColumn(columns::kIsMonthEnd, std::move(month_end));
	table.setColumn(columns::kDowSin, std::move(dow_sin));
	table.setColumn(columns::kDowCos, std::move(dow_cos));
	table.setColumn(columns::kDomSin, std::move(dom_sin));
	table.setColumn(columns::kDomCos, std::move(dom_cos));
}

void FeaturePipeline::addLagFeatures(core::DailyTable &table) const {
	for (const auto lag : config_.lags) {
		table.setColumn(columns::lag("total", lag), stats::shift(table.column(columns::kTotal), lag));
		for (const auto &category : config_.key_categories) {
			table.setColumn(columns::lag(category, lag), stats::shift(table.column(category), lag));
		}
	}
}

void FeaturePipeline::addRollingFeatures(core::DailyTable &table) const {
	const auto &total = table.column(columns::kTotal);
	for (const auto window : config_.rolling_windows) {
		auto mean = stats::rollingMean(total, window, 1);
		auto sd = stats::rollingStd(total, window, 2);
		auto max = stats::rollingMax(total, window, 1);
		table.setColumn(columns::rolling("total", "mean", window), std::move(mean));
		table.setColumn(columns::rolling("total", "std", window), std::move(sd));
		table.setColumn(columns::rolling("total", "max", window), std::move(max));
	}
	for (const auto &category : config_.key_categories) {
		table.setColumn(columns::rolling(category, "mean", 7), stats::rollingMean(table.column(category), 7, 1));
	}
}

void FeaturePipeline::addBehavioralFeatures(core::DailyTable &table) const {
	const std::size_t n = table.rows();
	const std::vector<double> total = table.column(columns::kTotal);
	const double avg_daily = stats::mean(total);

	std::vector<double> is_spike(n), days_since_spike(n);
	long last_spike = kNoEventRow;
	for (std::size_t i = 0; i < n; ++i) {
		const bool spike = total[i] > config_.spike_multiplier * avg_daily;
		is_spike[i] = spike ? 1.0 : 0.0;
		if (spike) {
			last_spike = static_cast<long>(i);
			days_since_spike[i] = 0.0;
		} else {
			days_since_spike[i] = static_cast<double>(static_cast<long>(i) - last_spike);
		}
	}
	table.setColumn(columns::kIsSpike, std::move(is_spike));
	table.setColumn(columns::kDaysSinceSpike, std::move(days_since_spike));

	const auto mean3 = stats::rollingMean(total, 3, 3);
	const auto mean3_prev = stats::shift(mean3, 3);
	std::vector<double> momentum(n);
	for (std::size_t i = 0; i < n; ++i) {
		momentum[i] = mean3[i] - mean3_prev[i];
	}
	table.setColumn(columns::kMomentum, std::move(momentum));

	std::vector<double> diversity(n, 0.0);
	for (const auto &category : core::categories()) {
		const auto &values = table.column(category);
		for (std::size_t i = 0; i < n; ++i) {
			diversity[i] += values[i] > 0.0 ? 1.0 : 0.0;
		}
	}
	table.setColumn(columns::kDiversity, std::move(diversity));

	const auto mean7 = stats::rollingMean(total, 7, 1);
	const auto std7 = stats::rollingStd(total, 7, 2);
	std::vector<double> consistency(n);
	for (std::size_t i = 0; i < n; ++i) {
		consistency[i] = std7[i] / (mean7[i] + 1e-6);
	}
	table.setColumn(columns::kConsistency, std::move(consistency));

	for (const auto &category : core::categories()) {
		const std::vector<double> values = table.column(category);
		std::vector<double> active(n);
		for (std::size_t i = 0; i < n; ++i) {
			active[i] = values[i] > 0.0 ? 1.0 : 0.0;
		}

		std::vector<double> since(n);
		long last_spend = kNoEventRow;
		for (std::size_t i = 0; i < n; ++i) {
			if (active[i] > 0.0) {
				last_spend = static_cast<long>(i);
			}
			since[i] = static_cast<double>(static_cast<long>(i) - last_spend);
		}

		const auto recent_sum = stats::rollingSum(values, config_.spike_memory_days, 1);
		std::vector<double> spike_memory(n);
		for (std::size_t i = 0; i < n; ++i) {
			const std::size_t start = i + 1 >= config_.activity_window ? i + 1 - config_.activity_window : 0;
			std::vector<double> window_active;
			for (std::size_t j = start; j <= i; ++j) {
				if (values[j] > 0.0) {
					window_active.push_back(values[j]);
				}
			}
			const double threshold =
			    window_active.empty() ? config_.spike_memory_default : stats::median(std::move(window_active));
			spike_memory[i] = recent_sum[i] > threshold ? 1.0 : 0.0;
		}

		auto rate = stats::rollingMean(active, config_.activity_window, 1);
		std::vector<double> level(n);
		for (std::size_t i = 0; i < n; ++i) {
			level[i] = activityLevelCode(rate[i]);
		}

		table.setColumn(columns::perCategory(category, "days_since_spend"), std::move(since));
		table.setColumn(columns::perCategory(category, "spike_memory"), std::move(spike_memory));
		table.setColumn(columns::perCategory(category, "activity_rate"), std::move(rate));
		table.setColumn(columns::perCategory(category, "activity_level"), std::move(level));
	}
}

void FeaturePipeline::fillMissing(core::DailyTable &table) const {
	const auto expanding = stats::expandingMean(table.column(columns::kTotal));
	for (const auto &name : table.columnNames()) {
		auto &values = table.column(name);
		if (isLagColumn(name)) {
			double carry = std::numeric_limits<double>::quiet_NaN();
			for (auto &v : values) {
				if (std::isnan(v)) {
					v = carry;
				} else {
					carry = v;
				}
			}
		} else if (isRollingColumn(name)) {
			for (std::size_t i = 0; i < values.size(); ++i) {
				if (std::isnan(values[i])) {
					values[i] = expanding[i];
				}
			}
		}
		for (auto &v : values) {
			if (std::isnan(v)) {
				v = 0.0;
			} else if (std::isinf(v)) {
				v = config_.sentinel;
			}
		}
	}
}

std::map<std::string, core::DailyTable> FeaturePipeline::categoryFrames(const core::DailyTable &table) const {
	std::map<std::string, core::DailyTable> frames;
	if (table.empty()) {
		return frames;
	}
	for (const auto &category : core::categories()) {
		if (!table.hasColumn(category)) {
			continue;
		}
		const auto &amount = table.column(category);
		core::DailyTable frame(table.dates());
		frame.setColumn("amount", amount);
		std::vector<double> dow(table.rows()), weekend(table.rows());
		for (std::size_t i = 0; i < table.rows(); ++i) {
			dow[i] = table.dates()[i].dayOfWeek();
			weekend[i] = dow[i] >= 5 ? 1.0 : 0.0;
		}
		frame.setColumn(columns::kDayOfWeek, std::move(dow));
		frame.setColumn(columns::kIsWeekend, std::move(weekend));
		for (const std::size_t lag : {1u, 2u, 3u, 7u}) {
			frame.setColumn("lag_" + std::to_string(lag), stats::shift(amount, lag));
		}
		frame.setColumn("rolling_mean_7", stats::rollingMean(amount, 7, 1));
		frame.setColumn("rolling_std_7", stats::rollingStd(amount, 7, 2));
		for (const auto &name : frame.columnNames()) {
			for (auto &v : frame.column(name)) {
				if (!std::isfinite(v)) {
					v = 0.0;
				}
			}
		}
		frames.emplace(category, std::move(frame));
	}
	return frames;
}

// --- Builder ---

FeaturePipelineBuilder &FeaturePipelineBuilder::withMinDistinctDays(std::size_t days) {
	config_.min_distinct_days = days;
	return *this;
}

FeaturePipelineBuilder &FeaturePipelineBuilder::withLags(std::vector<std::size_t> lags) {
	config_.lags = std::move(lags);
	return *this;
}

FeaturePipelineBuilder &FeaturePipelineBuilder::withRollingWindows(std::vector<std::size_t> windows) {
	config_.rolling_windows = std::move(windows);
	return *this;
}

FeaturePipelineBuilder &FeaturePipelineBuilder::withKeyCategories(std::vector<std::string> categories) {
	config_.key_categories = std::move(categories);
	return *this;
}

FeaturePipelineBuilder &FeaturePipelineBuilder::withSpikeMultiplier(double multiplier) {
	config_.spike_multiplier = multiplier;
	return *this;
}

FeaturePipelineBuilder &FeaturePipelineBuilder::withSentinel(double sentinel) {
	config_.sentinel = sentinel;
	return *this;
}

std::unique_ptr<FeaturePipeline> FeaturePipelineBuilder::build() {
	FINSIGHT_DEBUG("Building feature pipeline: min_days={}, lags={}, windows={}.", config_.min_distinct_days,
	               config_.lags.size(), config_.rolling_windows.size());
	return std::make_unique<FeaturePipeline>(config_);
}

} // namespace finsight::features
