#include "finsight/budget/ema_budget_generator.hpp"

#include "finsight/budget/savings.hpp"
#include "finsight/core/transaction.hpp"
#include "finsight/features/feature_pipeline.hpp"
#include "finsight/utils/logging.hpp"
#include "finsight/utils/stats.hpp"

#include <algorithm>
#include <stdexcept>

namespace finsight::budget {

namespace stats = utils::stats;

namespace {

double interquartileRange(const std::vector<double> &values) {
	if (values.empty()) {
		return 0.0;
	}
	return std::max(stats::quantile(values, 0.75) - stats::quantile(values, 0.25), 0.0);
}

/// Average number of active days per calendar month over rows [begin, end).
double activeDaysPerMonth(const core::DailyTable &table, const std::vector<double> &series, std::size_t begin) {
	int months = 0;
	int active = 0;
	std::string current;
	for (std::size_t row = begin; row < series.size(); ++row) {
		const auto key = table.dates()[row].monthKey();
		if (key != current) {
			current = key;
			++months;
		}
		active += series[row] > 0.0 ? 1 : 0;
	}
	return months == 0 ? 0.0 : static_cast<double>(active) / static_cast<double>(months);
}

void roundAmounts(BudgetResult &result) {
	for (auto &entry : result.entries) {
		entry.amount = roundCents(entry.amount);
	}
	finalizeEntries(result);
	result.total = roundCents(result.total);
}

} // namespace

EmaBudgetGenerator::EmaBudgetGenerator(EmaBudgetConfig config, CategoryPolicy policy)
    : config_(std::move(config)), policy_(std::move(policy)) {
	if (config_.lookback_weeks == 0) {
		throw std::invalid_argument("EmaBudgetGenerator requires at least one lookback week.");
	}
	if (config_.alpha <= 0.0 || config_.alpha > 1.0) {
		throw std::invalid_argument("EmaBudgetGenerator alpha must be in (0, 1].");
	}
	if (config_.blend_weight < 0.0 || config_.blend_weight > 1.0) {
		throw std::invalid_argument("EmaBudgetGenerator blend weight must be in [0, 1].");
	}
	if (config_.monthly_span < 1.0 || config_.monthly_window < 2) {
		throw std::invalid_argument("EmaBudgetGenerator monthly span must be >= 1 and window >= 2.");
	}
	if (config_.weeks_per_month <= 0.0) {
		throw std::invalid_argument("EmaBudgetGenerator weeks_per_month must be positive.");
	}
}

BudgetResult EmaBudgetGenerator::generate(const BudgetRequest &request) const {
	if (request.period == BudgetPeriod::Weekly) {
		return weekly(request.table, request.savings_goal);
	}
	return monthly(request.table, request.savings_goal, request.target_month);
}

// --- Weekly plan ---

BudgetResult EmaBudgetGenerator::weekly(const core::DailyTable &table, std::optional<double> savings_goal) const {
	if (table.empty()) {
		FINSIGHT_WARN("No spending history; returning the default weekly budget.");
		return defaultWeekly();
	}

	const auto weeks = features::weeklyAggregates(table);
	const auto cutoff = weeks.back().week_end.addDays(-7 * static_cast<std::int64_t>(config_.lookback_weeks - 1));
	std::vector<features::WeeklyAggregate> recent;
	for (const auto &week : weeks) {
		if (week.week_end >= cutoff) {
			recent.push_back(week);
		}
	}

	std::size_t begin = 0;
	while (begin < table.rows() && table.dates()[begin] < recent.front().week_start) {
		++begin;
	}

	BudgetResult result;
	result.period = BudgetPeriod::Weekly;
	result.confidence = historyConfidence(table.rows());

	for (const auto &category : core::categories()) {
		const auto c = core::categoryIndex(category);
		std::vector<double> sums;
		sums.reserve(recent.size());
		for (const auto &week : recent) {
			sums.push_back(week.category_sum[c]);
		}
		const auto active = stats::positiveValues(sums);

		EmaDetails details;
		details.median_active = active.empty() ? 0.0 : stats::median(active);
		details.ema = stats::ewm(sums, config_.alpha).back();
		const double mean_active = stats::mean(active);
		details.volatility = mean_active > 0.0 ? stats::sampleStdDev(active) / mean_active : 0.0;
		details.iqr = interquartileRange(active);

		const auto daily = categorySeries(table, category);
		for (std::size_t row = daily.size(); row > begin; --row) {
			if (daily[row - 1] > 0.0) {
				details.days_since_last = static_cast<int>(daily.size() - row);
				break;
			}
		}
		details.hazard = details.days_since_last &&
		                 std::find(config_.hazard_days.begin(), config_.hazard_days.end(), *details.days_since_last) !=
		                     config_.hazard_days.end();

		double trailing = 0.0;
		const std::size_t memory_begin = std::max(begin, daily.size() - std::min(daily.size(), config_.spike_memory_days));
		for (std::size_t row = memory_begin; row < daily.size(); ++row) {
			trailing += daily[row];
		}
		details.spike_memory =
		    trailing > (details.median_active > 0.0 ? details.median_active : config_.spike_memory_default);

		const double days_per_month = activeDaysPerMonth(table, daily, begin);
		std::string activity = "regular";
		if (days_per_month < config_.inactive_days_per_month) {
			activity = "inactive";
		} else if (days_per_month < config_.occasional_days_per_month) {
			activity = "occasional";
		}

		const double blend = config_.blend_weight * details.ema + (1.0 - config_.blend_weight) * details.median_active;
		double factor = 1.0;
		if (activity == "inactive") {
			factor *= config_.inactive_multiplier;
		}
		if (details.hazard) {
			factor *= 1.0 + config_.hazard_boost;
		}
		if (details.spike_memory) {
			factor *= 1.0 + config_.spike_buffer;
		}
		factor *= 1.0 + config_.volatility_cushion * details.volatility;

		double amount = blend * factor;
		if (details.median_active > 0.0) {
			amount = std::min(amount, details.median_active + config_.iqr_cap * details.iqr);
		}
		const double floor = policy_.weeklyEssential(category);
		amount = std::max(amount, floor);
		details.raw_amount = roundCents(amount);

		BudgetEntry entry;
		entry.category = category;
		entry.amount = amount;
		entry.floor = floor;
		entry.elasticity = policy_.emaElasticity(category);
		entry.activity_level = activity;
		entry.adjustment_factor = factor;
		entry.confidence = result.confidence;
		entry.details = details;
		result.entries.push_back(std::move(entry));
	}

	result.methodology = {
	    {"approach", std::string("EMA-hazard weekly budgeting")},
	    {"ema_alpha", config_.alpha},
	    {"ema_weight", config_.blend_weight},
	    {"lookback_weeks", static_cast<double>(config_.lookback_weeks)},
	    {"weeks_analyzed", static_cast<double>(recent.size())},
	    {"volatility_cushion", config_.volatility_cushion},
	    {"iqr_cap", config_.iqr_cap},
	    {"hazard_boost", config_.hazard_boost},
	    {"spike_buffer", config_.spike_buffer},
	    {"categories_analyzed", static_cast<double>(result.entries.size())},
	};

	if (savings_goal && *savings_goal > 0.0) {
		applySavings(result, *savings_goal);
	}
	roundAmounts(result);

	FINSIGHT_DEBUG("Weekly budget from {} weeks: total {:.2f}.", recent.size(), result.total);
	return result;
}

// --- Monthly plan ---

BudgetResult EmaBudgetGenerator::monthly(const core::DailyTable &table, std::optional<double> savings_goal,
                                         std::optional<core::Date> target_month) const {
	if (table.empty()) {
		FINSIGHT_WARN("No spending history; returning the default monthly budget.");
		auto result = defaultMonthly();
		if (target_month) {
			result.month = target_month->monthKey();
		}
		return result;
	}

	const auto month_key = (target_month ? *target_month : table.lastDate()).monthKey();
	const auto months = features::monthlyAggregates(table);
	if (months.size() < 2) {
		FINSIGHT_DEBUG("Only {} month of history; scaling the weekly plan.", months.size());
		auto result = toMonthly(weekly(table));
		result.month = month_key;
		if (savings_goal && *savings_goal > 0.0) {
			applySavings(result, *savings_goal);
			roundAmounts(result);
		}
		return result;
	}

	BudgetResult result;
	result.period = BudgetPeriod::Monthly;
	result.month = month_key;
	result.confidence = historyConfidence(table.rows());

	const std::size_t window = std::min(config_.monthly_window, months.size());
	for (const auto &category : core::categories()) {
		const auto c = core::categoryIndex(category);
		std::vector<double> sums;
		sums.reserve(months.size());
		for (const auto &month : months) {
			sums.push_back(month.category_sum[c]);
		}
		const std::vector<double> trailing(sums.end() - static_cast<std::ptrdiff_t>(window), sums.end());

		EmaDetails details;
		details.ema = stats::ewm(sums, stats::alphaFromSpan(config_.monthly_span)).back();
		details.median_active = stats::median(trailing);
		details.iqr = interquartileRange(trailing);
		const double mean_month = stats::mean(trailing);
		details.volatility = mean_month > 0.0 ? stats::sampleStdDev(trailing) / mean_month : 0.0;

		const int recent_days =
		    months[months.size() - 1].category_active_days[c] + months[months.size() - 2].category_active_days[c];
		std::string activity = "active";
		double factor = config_.monthly_active_multiplier;
		if (recent_days <= config_.monthly_inactive_days) {
			activity = "inactive";
			factor = config_.monthly_inactive_multiplier;
		} else if (recent_days <= config_.monthly_regular_days) {
			activity = "regular";
			factor = 1.0;
		}

		double amount =
		    (config_.monthly_ema_weight * details.ema + (1.0 - config_.monthly_ema_weight) * details.median_active) *
		    factor;
		const double floor = policy_.weeklyEssential(category) * config_.weeks_per_month;
		amount = std::max(amount, floor);
		// The cap on the recent high wins over the essential minimum.
		const double high = *std::max_element(trailing.begin(), trailing.end());
		amount = std::min(amount, high * config_.monthly_cap);
		details.raw_amount = roundCents(amount);

		BudgetEntry entry;
		entry.category = category;
		entry.amount = amount;
		entry.floor = floor;
		entry.elasticity = policy_.emaElasticity(category);
		entry.activity_level = activity;
		entry.adjustment_factor = factor;
		entry.confidence = result.confidence;
		entry.details = details;
		result.entries.push_back(std::move(entry));
	}

	result.methodology = {
	    {"approach", std::string("EMA-Median blend with activity adjustment")},
	    {"months_analyzed", static_cast<double>(months.size())},
	    {"ema_span", config_.monthly_span},
	    {"median_window", static_cast<double>(window)},
	};

	if (savings_goal && *savings_goal > 0.0) {
		applySavings(result, *savings_goal);
	}
	roundAmounts(result);

	FINSIGHT_DEBUG("Monthly budget for {} from {} months: total {:.2f}.", month_key, months.size(), result.total);
	return result;
}

// --- Templates ---

BudgetResult EmaBudgetGenerator::defaultWeekly() const {
	BudgetResult result;
	result.period = BudgetPeriod::Weekly;
	result.confidence = 0.3;
	result.status = core::Status::Default;
	for (const auto &category : core::categories()) {
		const auto it = policy_.default_weekly.find(category);
		if (it == policy_.default_weekly.end()) {
			continue;
		}
		BudgetEntry entry;
		entry.category = category;
		entry.amount = it->second;
		entry.floor = policy_.weeklyEssential(category);
		entry.elasticity = policy_.emaElasticity(category);
		entry.activity_level = "default";
		entry.confidence = 0.3;
		result.entries.push_back(std::move(entry));
	}
	finalizeEntries(result);
	result.methodology = {{"approach", std::string("Default template")}};
	return result;
}

BudgetResult EmaBudgetGenerator::defaultMonthly() const {
	return toMonthly(defaultWeekly());
}

BudgetResult EmaBudgetGenerator::toMonthly(const BudgetResult &weekly) const {
	BudgetResult result = weekly;
	result.period = BudgetPeriod::Monthly;
	for (auto &entry : result.entries) {
		entry.amount = roundCents(entry.amount * config_.weeks_per_month);
		entry.floor *= config_.weeks_per_month;
		if (entry.details) {
			entry.details->raw_amount = roundCents(entry.details->raw_amount * config_.weeks_per_month);
		}
	}
	finalizeEntries(result);
	result.total = roundCents(result.total);
	result.methodology["weeks_per_month"] = config_.weeks_per_month;
	return result;
}

void EmaBudgetGenerator::applySavings(BudgetResult &result, double goal) const {
	std::vector<double> amounts;
	std::vector<double> floors;
	std::vector<double> elasticities;
	for (const auto &entry : result.entries) {
		amounts.push_back(entry.amount);
		floors.push_back(entry.floor);
		elasticities.push_back(entry.elasticity);
	}

	const auto allocation = redistributeSavings(amounts, floors, elasticities, goal);
	for (std::size_t i = 0; i < result.entries.size(); ++i) {
		auto &entry = result.entries[i];
		entry.adjusted = allocation.amounts[i] < entry.amount;
		entry.amount = allocation.amounts[i];
	}
	finalizeEntries(result);

	result.savings = SavingsSummary{goal, roundCents(allocation.achieved), allocation.successful};
	result.methodology["savings_goal"] = goal;
	if (!allocation.successful) {
		FINSIGHT_WARN("Savings goal {:.2f} exceeds the reducible headroom; cut {:.2f}.", goal, allocation.achieved);
	}
}

} // namespace finsight::budget
