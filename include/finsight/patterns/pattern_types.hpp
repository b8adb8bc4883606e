#pragma once

#include "finsight/core/date.hpp"
#include "finsight/core/status.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace finsight::patterns {

/// A periodic spend structure found by autocorrelation.
struct Recurrence {
	std::string category;  // "Total" for the daily total
	std::string pattern;   // "weekly", "bi-weekly" or "monthly"
	int period = 0;        // days
	double confidence = 0.0;
	double strength = 0.0;
	core::Date next_expected;
};

struct Spike {
	core::Date date;
	double amount = 0.0;
	double z_score = 0.0;  // infinite when the trailing baseline had no spread
	double expected = 0.0;
	std::vector<std::string> categories;
	bool recent = false;
};

struct Trend {
	std::string window;     // "short_term", "medium_term" or "long_term"
	std::string direction;  // "increasing", "decreasing" or "stable"
	double slope = 0.0;     // normalized by the window mean
	double confidence = 0.0;
	int window_days = 0;
};

struct DayOfWeekSeasonality {
	std::string peak_day;
	double peak_amount = 0.0;
	std::string low_day;
	double low_amount = 0.0;
	double weekend_vs_weekday = 1.0;
};

struct MonthlySeasonality {
	double start_month_avg = 0.0;
	double mid_month_avg = 0.0;
	double end_month_avg = 0.0;
	std::string pattern;  // "front-loaded", "mid-heavy" or "end-loaded"
};

struct Seasonality {
	std::optional<DayOfWeekSeasonality> day_of_week;
	std::optional<MonthlySeasonality> monthly;
};

struct PatternSummary {
	double avg_daily_spend = 0.0;
	double median_daily_spend = 0.0;
	double max_daily_spend = 0.0;
	int days_analyzed = 0;
	int recurrence_count = 0;
	int spike_count = 0;
	int recent_spikes = 0;
	int active_categories = 0;
	int inactive_categories = 0;
	std::optional<double> avg_volatility;
	int high_volatility_categories = 0;
};

/**
 * @brief Everything the detector found in one daily table.
 *
 * Immutable once returned. An InsufficientHistory status comes with empty
 * collections.
 */
struct PatternResult {
	core::Status status = core::Status::Ok;
	std::vector<Recurrence> recurrences;
	std::vector<Spike> spikes;
	std::map<std::string, double> volatility;           // "total" or category -> CV
	std::map<std::string, std::string> activity_levels;  // category -> tier
	std::vector<Trend> trends;
	Seasonality seasonality;
	PatternSummary summary;
	std::vector<std::string> insights;

	bool hasRecentSpike() const {
		for (const auto &spike : spikes) {
			if (spike.recent) {
				return true;
			}
		}
		return false;
	}
};

} // namespace finsight::patterns
