#pragma once

#include "finsight/core/daily_table.hpp"
#include "finsight/patterns/pattern_types.hpp"

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace finsight::patterns {

/**
 * @class PatternDetector
 * @brief Extracts recurrences, spikes, volatility, activity, trends and seasonality from a daily table.
 *
 * Every analysis is a pure function of the table. Each one is skipped on its
 * own when its precondition fails; the detector as a whole requires
 * Config::min_rows rows.
 */
class PatternDetector {
public:
	struct PeriodBand {
		std::string label;
		int min_period;
		int max_period;
	};

	struct Config {
		std::size_t min_rows = 14;
		double recurrence_threshold = 0.6;
		double min_active_rate = 0.1;
		std::vector<std::string> recurrence_categories{"Food", "Transport", "Shopping", "Bills"};
		std::vector<PeriodBand> period_bands{{"weekly", 6, 8}, {"bi-weekly", 13, 15}, {"monthly", 28, 31}};
		double strength_ratio = 0.5;

		double spike_threshold = 2.0;
		std::size_t spike_window = 7;
		std::size_t recent_rows = 7;
		double category_spike_ratio = 1.5;
		double flat_spike_ratio = 2.0;  // multiple of a zero-spread baseline that still counts
		std::vector<std::string> spike_categories{"Food", "Shopping", "Transport", "Entertainment", "Travel"};

		std::vector<std::string> volatility_categories{"Food", "Transport", "Shopping", "Entertainment", "Bills"};
		double high_volatility = 0.5;

		std::vector<std::string> activity_categories{"Food",   "Transport", "Shopping", "Entertainment", "Beauty",
		                                             "Sports", "Bills",     "Travel",   "Beverage",      "Home"};
		double clustering_threshold = 0.3;

		double stable_slope = 0.01;
		double insight_trend_confidence = 0.7;

		std::size_t weekday_seasonality_rows = 28;
		std::size_t monthly_seasonality_rows = 60;

		std::size_t max_insights = 5;
	};

	PatternDetector() : PatternDetector(Config{}) {
	}

	/// @throws std::invalid_argument If the configuration is inconsistent.
	explicit PatternDetector(Config config);

	/**
	 * @brief Runs every analysis and renders insights.
	 * @return A result with status InsufficientHistory when the table is too short.
	 */
	PatternResult detect(const core::DailyTable &table) const;

	std::vector<Recurrence> detectRecurrences(const core::DailyTable &table) const;
	std::vector<Spike> detectSpikes(const core::DailyTable &table) const;
	std::map<std::string, double> volatility(const core::DailyTable &table) const;
	std::map<std::string, std::string> activityLevels(const core::DailyTable &table) const;
	std::vector<Trend> trends(const core::DailyTable &table) const;
	Seasonality seasonality(const core::DailyTable &table) const;

	/// At most Config::max_insights strings: recurrence, recent spike, volatility, trend, peak weekday.
	std::vector<std::string> generateInsights(const PatternResult &result) const;

	/**
	 * @brief Run-length clustering score of an activity mask.
	 *
	 * Population std of run lengths over their mean, capped at 1. Zero for
	 * fewer than 7 entries or a single run.
	 */
	static double clusteringScore(const std::vector<bool> &active);

	const Config &config() const {
		return config_;
	}

private:
	struct Periodicity {
		int period = 0;
		double confidence = 0.0;
		double strength = 0.0;
	};

	Periodicity checkPeriodicity(const std::vector<double> &series, const std::vector<double> &acf,
	                             const PeriodBand &band) const;
	double patternStrength(const std::vector<double> &series, int period) const;
	PatternSummary summarize(const core::DailyTable &table, const PatternResult &result) const;

	Config config_;
};

} // namespace finsight::patterns
