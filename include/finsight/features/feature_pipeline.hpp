#pragma once

#include "finsight/core/daily_table.hpp"
#include "finsight/core/transaction.hpp"

#include <array>
#include <cstddef>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace finsight::features {

namespace columns {

inline constexpr const char *kTotal = "total_daily";
inline constexpr const char *kDayOfWeek = "day_of_week";
inline constexpr const char *kDayOfMonth = "day_of_month";
inline constexpr const char *kWeekOfMonth = "week_of_month";
inline constexpr const char *kMonth = "month";
inline constexpr const char *kIsWeekend = "is_weekend";
inline constexpr const char *kIsMonthStart = "is_month_start";
inline constexpr const char *kIsMonthEnd = "is_month_end";
inline constexpr const char *kDowSin = "dow_sin";
inline constexpr const char *kDowCos = "dow_cos";
inline constexpr const char *kDomSin = "dom_sin";
inline constexpr const char *kDomCos = "dom_cos";
inline constexpr const char *kIsSpike = "is_spike";
inline constexpr const char *kDaysSinceSpike = "days_since_spike";
inline constexpr const char *kMomentum = "spending_momentum";
inline constexpr const char *kDiversity = "category_diversity";
inline constexpr const char *kConsistency = "spending_consistency";

/// "total_lag_7" for base "total", "Food_lag_7" for base "Food".
std::string lag(const std::string &base, std::size_t k);

/// "total_rolling_mean_7"
std::string rolling(const std::string &base, const std::string &stat, std::size_t window);

/// "Food_days_since_spend", "Food_spike_memory", ...
std::string perCategory(const std::string &category, const std::string &feature);

} // namespace columns

/// Maps an activity rate to the three-level code used in the daily table (0 inactive, 1 occasional, 2 regular).
int activityLevelCode(double activity_rate);

/**
 * @brief Sums of one Monday-Sunday week.
 */
struct WeeklyAggregate {
	core::Date week_start;
	core::Date week_end;
	std::array<double, core::kCategoryCount> category_sum{};
	std::array<int, core::kCategoryCount> category_active_days{};
	double total = 0.0;
	double max_daily = 0.0;
	double avg_daily = 0.0;
	double std_daily = 0.0;
	double weekend_ratio = 0.0;
	int days = 0;
};

/**
 * @brief Sums of one calendar month.
 */
struct MonthlyAggregate {
	std::string month;
	core::Date month_start;
	core::Date month_end;
	std::array<double, core::kCategoryCount> category_sum{};
	std::array<int, core::kCategoryCount> category_active_days{};
	double total = 0.0;
	int active_days = 0;
	double avg_daily = 0.0;
	double volatility = 0.0;
	double avg_category_diversity = 0.0;
	int days = 0;
};

/**
 * @brief Expense-only per-category daily sums on a contiguous calendar.
 *
 * Income rows are dropped, amounts are taken as absolute values, unknown
 * categories are folded into "Other" and days without spend are zero rows.
 * The result carries one column per category plus total_daily.
 */
core::DailyTable aggregateDaily(const core::Transactions &transactions);

/// Number of distinct days that carry at least one expense row.
std::size_t distinctExpenseDays(const core::Transactions &transactions);

/// One expense transaction per day and category with a positive amount.
core::Transactions toTransactions(const core::DailyTable &table);

/// Weeks ending on Sunday that overlap the table's date range, oldest first.
std::vector<WeeklyAggregate> weeklyAggregates(const core::DailyTable &table);

/// Calendar months that overlap the table's date range, oldest first.
std::vector<MonthlyAggregate> monthlyAggregates(const core::DailyTable &table);

/**
 * @class FeaturePipeline
 * @brief Turns a transaction list into the daily feature table.
 *
 * Stages run in dependency order (aggregation, temporal, lag, rolling,
 * behavioral) followed by a fill pass that leaves every cell finite. The
 * pipeline itself holds only configuration and can be shared across threads.
 */
class FeaturePipeline {
public:
	struct Config {
		std::size_t min_distinct_days = 14;
		std::vector<std::size_t> lags{1, 2, 3, 7, 14, 30};
		std::vector<std::size_t> rolling_windows{3, 7, 14, 30};
		std::vector<std::string> key_categories{"Food", "Transport", "Shopping"};
		double spike_multiplier = 2.0;
		std::size_t activity_window = 30;
		std::size_t spike_memory_days = 3;
		double spike_memory_default = 200.0;
		double sentinel = 999999.0;
	};

	FeaturePipeline() : FeaturePipeline(Config{}) {
	}

	/// @throws std::invalid_argument If the configuration is inconsistent.
	explicit FeaturePipeline(Config config);

	/**
	 * @brief Builds the daily feature table.
	 * @return An empty table when fewer than min_distinct_days expense days exist.
	 */
	core::DailyTable build(const core::Transactions &transactions) const;

	/**
	 * @brief Per-category frames with amount, calendar, lag 1/2/3/7 and rolling mean/std 7 columns.
	 *
	 * Missing values are filled with 0.
	 */
	std::map<std::string, core::DailyTable> categoryFrames(const core::DailyTable &table) const;

	const Config &config() const {
		return config_;
	}

private:
	void addTemporalFeatures(core::DailyTable &table) const;
	void addLagFeatures(core::DailyTable &table) const;
	void addRollingFeatures(core::DailyTable &table) const;
	void addBehavioralFeatures(core::DailyTable &table) const;
	void fillMissing(core::DailyTable &table) const;

	Config config_;
};

/**
 * @class FeaturePipelineBuilder
 * @brief A builder for fluently configuring FeaturePipeline instances.
 */
class FeaturePipelineBuilder {
public:
	FeaturePipelineBuilder &withMinDistinctDays(std::size_t days);
	FeaturePipelineBuilder &withLags(std::vector<std::size_t> lags);
	FeaturePipelineBuilder &withRollingWindows(std::vector<std::size_t> windows);
	FeaturePipelineBuilder &withKeyCategories(std::vector<std::string> categories);
	FeaturePipelineBuilder &withSpikeMultiplier(double multiplier);
	FeaturePipelineBuilder &withSentinel(double sentinel);

	std::unique_ptr<FeaturePipeline> build();

private:
	FeaturePipeline::Config config_;
};

} // namespace finsight::features
