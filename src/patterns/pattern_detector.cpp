#include "finsight/patterns/pattern_detector.hpp"

#include "finsight/features/feature_pipeline.hpp"
#include "finsight/utils/logging.hpp"
#include "finsight/utils/stats.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace finsight::patterns {

namespace stats = utils::stats;

namespace {

const std::array<const char *, 7> kDayNames{"Mon", "Tue", "Wed", "Thu", "Fri", "Sat", "Sun"};

const std::vector<double> &totalSeries(const core::DailyTable &table) {
	return table.column(features::columns::kTotal);
}

std::vector<double> trailingWindow(const std::vector<double> &series, std::size_t end, std::size_t window) {
	const std::size_t start = end >= window ? end - window : 0;
	return std::vector<double>(series.begin() + static_cast<std::ptrdiff_t>(start),
	                           series.begin() + static_cast<std::ptrdiff_t>(end));
}

std::string percent(double fraction) {
	std::ostringstream out;
	out << std::fixed << std::setprecision(0) << fraction * 100.0 << "%";
	return out.str();
}

} // namespace

PatternDetector::PatternDetector(Config config) : config_(std::move(config)) {
	if (config_.min_rows < 2) {
		throw std::invalid_argument("Pattern detection requires at least two rows.");
	}
	if (config_.spike_window < 2) {
		throw std::invalid_argument("Spike window must cover at least two days.");
	}
	if (config_.flat_spike_ratio <= 1.0) {
		throw std::invalid_argument("Flat-baseline spike ratio must exceed 1.");
	}
	for (const auto &band : config_.period_bands) {
		if (band.min_period < 1 || band.max_period < band.min_period) {
			throw std::invalid_argument("Invalid period band '" + band.label + "'.");
		}
	}
}

PatternResult PatternDetector::detect(const core::DailyTable &table) const {
	PatternResult result;
	if (table.rows() < config_.min_rows) {
		FINSIGHT_WARN("Insufficient data for pattern detection: {} days < {}.", table.rows(), config_.min_rows);
		result.status = core::Status::InsufficientHistory;
		return result;
	}

	result.recurrences = detectRecurrences(table);
	result.spikes = detectSpikes(table);
	result.volatility = volatility(table);
	result.activity_levels = activityLevels(table);
	result.trends = trends(table);
	result.seasonality = seasonality(table);
	result.summary = summarize(table, result);
	result.insights = generateInsights(result);

	FINSIGHT_DEBUG("Pattern detection over {} days: {} recurrences, {} spikes.", table.rows(),
	               result.recurrences.size(), result.spikes.size());
	return result;
}

// --- Recurrence ---

std::vector<Recurrence> PatternDetector::detectRecurrences(const core::DailyTable &table) const {
	std::vector<Recurrence> recurrences;
	if (table.empty()) {
		return recurrences;
	}

	std::vector<std::pair<std::string, std::string>> sources{{"Total", features::columns::kTotal}};
	for (const auto &category : config_.recurrence_categories) {
		if (table.hasColumn(category)) {
			sources.emplace_back(category, category);
		}
	}

	int max_lag = 0;
	for (const auto &band : config_.period_bands) {
		max_lag = std::max(max_lag, 2 * band.max_period);
	}

	for (const auto &[label, column] : sources) {
		const auto &series = table.column(column);
		if (stats::activeRate(series) < config_.min_active_rate) {
			continue;
		}
		const auto acf = stats::autocorrelation(stats::detrend(series), static_cast<std::size_t>(max_lag));
		if (acf.empty()) {
			FINSIGHT_DEBUG("Recurrence check skipped for {}: no variation after detrending.", label);
			continue;
		}
		for (const auto &band : config_.period_bands) {
			const Periodicity found = checkPeriodicity(series, acf, band);
			if (found.confidence > config_.recurrence_threshold) {
				Recurrence recurrence;
				recurrence.category = label;
				recurrence.pattern = band.label;
				recurrence.period = found.period;
				recurrence.confidence = found.confidence;
				recurrence.strength = found.strength;
				recurrence.next_expected = table.lastDate().addDays(found.period);
				recurrences.push_back(std::move(recurrence));
			}
		}
	}
	return recurrences;
}

PatternDetector::Periodicity PatternDetector::checkPeriodicity(const std::vector<double> &series,
                                                               const std::vector<double> &acf,
                                                               const PeriodBand &band) const {
	Periodicity best;
	for (int period = band.min_period; period <= band.max_period; ++period) {
		const auto p = static_cast<std::size_t>(period);
		if (p >= acf.size()) {
			continue;
		}
		double correlation = acf[p];
		if (2 * p < acf.size()) {
			correlation = (acf[p] + acf[2 * p]) / 2.0;
		}
		if (correlation > best.confidence) {
			best.confidence = correlation;
			best.period = period;
			best.strength = patternStrength(series, period);
		}
	}
	best.confidence = std::clamp(best.confidence, 0.0, 1.0);
	return best;
}

double PatternDetector::patternStrength(const std::vector<double> &series, int period) const {
	if (period <= 0 || static_cast<std::size_t>(period) >= series.size()) {
		return 0.0;
	}
	const auto p = static_cast<std::size_t>(period);
	int matches = 0;
	int comparisons = 0;
	for (std::size_t i = 0; i + p < series.size(); ++i) {
		const double a = series[i];
		const double b = series[i + p];
		if (a > 0.0 && b > 0.0) {
			if (std::min(a, b) / std::max(a, b) > config_.strength_ratio) {
				++matches;
			}
			++comparisons;
		}
	}
	return comparisons == 0 ? 0.0 : static_cast<double>(matches) / static_cast<double>(comparisons);
}

// --- Spikes ---

std::vector<Spike> PatternDetector::detectSpikes(const core::DailyTable &table) const {
	std::vector<Spike> spikes;
	if (!table.hasColumn(features::columns::kTotal)) {
		return spikes;
	}
	const auto &series = totalSeries(table);
	const std::size_t n = series.size();
	const std::size_t window = config_.spike_window;

	for (std::size_t i = window; i < n; ++i) {
		// Baseline as of the previous day: rows [i - window, i - 1].
		const auto previous = trailingWindow(series, i, window);
		const double mean = stats::mean(previous);
		const double sd = stats::sampleStdDev(previous);
		if (mean <= 0.0) {
			continue;
		}
		double z = std::numeric_limits<double>::infinity();
		if (sd > 1e-9 * mean) {
			z = (series[i] - mean) / sd;
			if (z <= config_.spike_threshold) {
				continue;
			}
		} else if (series[i] <= mean * config_.flat_spike_ratio) {
			// Zero spread: the z-score is undefined, only a multiple of the flat level counts.
			continue;
		}

		Spike spike;
		spike.date = table.dates()[i];
		spike.amount = series[i];
		spike.z_score = z;
		spike.expected = mean;
		spike.recent = i + config_.recent_rows >= n;
		for (const auto &category : config_.spike_categories) {
			if (!table.hasColumn(category)) {
				continue;
			}
			const auto &values = table.column(category);
			const double category_mean = stats::mean(trailingWindow(values, i, window));
			if (values[i] > category_mean * config_.category_spike_ratio) {
				spike.categories.push_back(category);
			}
		}
		spikes.push_back(std::move(spike));
	}
	return spikes;
}

// --- Volatility & activity ---

std::map<std::string, double> PatternDetector::volatility(const core::DailyTable &table) const {
	std::map<std::string, double> result;
	if (table.hasColumn(features::columns::kTotal)) {
		result["total"] = stats::coefficientOfVariation(totalSeries(table));
	}
	for (const auto &category : config_.volatility_categories) {
		if (!table.hasColumn(category)) {
			continue;
		}
		const auto &series = table.column(category);
		if (stats::activeRate(series) > config_.min_active_rate) {
			result[category] = stats::coefficientOfVariation(series);
		}
	}
	return result;
}

std::map<std::string, std::string> PatternDetector::activityLevels(const core::DailyTable &table) const {
	std::map<std::string, std::string> levels;
	for (const auto &category : config_.activity_categories) {
		if (!table.hasColumn(category)) {
			levels[category] = "inactive";
			continue;
		}
		const auto &series = table.column(category);
		const double rate = stats::activeRate(series);
		std::string level;
		if (rate < 0.1) {
			level = "inactive";
		} else if (rate < 0.3) {
			level = "occasional";
		} else if (rate < 0.6) {
			level = "regular";
		} else {
			level = "frequent";
		}
		if (level == "occasional" || level == "regular") {
			std::vector<bool> active(series.size());
			std::transform(series.begin(), series.end(), active.begin(), [](double v) { return v > 0.0; });
			if (clusteringScore(active) > config_.clustering_threshold) {
				level += "_clustered";
			}
		}
		levels[category] = level;
	}
	return levels;
}

double PatternDetector::clusteringScore(const std::vector<bool> &active) {
	if (active.size() < 7) {
		return 0.0;
	}
	std::vector<double> runs;
	double current = 1.0;
	for (std::size_t i = 1; i < active.size(); ++i) {
		if (active[i] == active[i - 1]) {
			current += 1.0;
		} else {
			runs.push_back(current);
			current = 1.0;
		}
	}
	runs.push_back(current);
	if (runs.size() < 2) {
		return 0.0;
	}
	return std::min(1.0, stats::populationStdDev(runs) / (stats::mean(runs) + 1e-6));
}

// --- Trends & seasonality ---

std::vector<Trend> PatternDetector::trends(const core::DailyTable &table) const {
	std::vector<Trend> result;
	if (!table.hasColumn(features::columns::kTotal) || table.rows() < config_.min_rows) {
		return result;
	}
	const auto &series = totalSeries(table);
	const std::array<std::pair<const char *, std::size_t>, 3> windows{
	    {{"short_term", 7}, {"medium_term", 14}, {"long_term", 30}}};

	for (const auto &[label, size] : windows) {
		if (series.size() < size) {
			continue;
		}
		const auto recent = trailingWindow(series, series.size(), size);
		const auto fit = stats::linearFit(recent);
		const double mean = stats::mean(recent);
		const double normalized = mean > 0.0 ? fit.slope / mean : 0.0;

		Trend trend;
		trend.window = label;
		trend.slope = normalized;
		trend.confidence = std::abs(fit.r);
		trend.window_days = static_cast<int>(size);
		if (std::abs(normalized) < config_.stable_slope) {
			trend.direction = "stable";
		} else if (normalized > 0.0) {
			trend.direction = "increasing";
		} else {
			trend.direction = "decreasing";
		}
		result.push_back(std::move(trend));
	}
	return result;
}

Seasonality PatternDetector::seasonality(const core::DailyTable &table) const {
	Seasonality result;
	if (!table.hasColumn(features::columns::kTotal) || table.rows() < config_.weekday_seasonality_rows) {
		return result;
	}
	const auto &series = totalSeries(table);

	std::array<double, 7> sums{};
	std::array<int, 7> counts{};
	std::vector<double> weekend;
	std::vector<double> weekday;
	for (std::size_t i = 0; i < series.size(); ++i) {
		const int dow = table.dates()[i].dayOfWeek();
		sums[static_cast<std::size_t>(dow)] += series[i];
		++counts[static_cast<std::size_t>(dow)];
		(dow >= 5 ? weekend : weekday).push_back(series[i]);
	}

	int peak = -1;
	int low = -1;
	std::array<double, 7> means{};
	for (int d = 0; d < 7; ++d) {
		const auto idx = static_cast<std::size_t>(d);
		if (counts[idx] == 0) {
			continue;
		}
		means[idx] = sums[idx] / counts[idx];
		if (peak < 0 || means[idx] > means[static_cast<std::size_t>(peak)]) {
			peak = d;
		}
		if (low < 0 || means[idx] < means[static_cast<std::size_t>(low)]) {
			low = d;
		}
	}

	DayOfWeekSeasonality dow;
	dow.peak_day = kDayNames[static_cast<std::size_t>(peak)];
	dow.peak_amount = means[static_cast<std::size_t>(peak)];
	dow.low_day = kDayNames[static_cast<std::size_t>(low)];
	dow.low_amount = means[static_cast<std::size_t>(low)];
	const double weekday_mean = stats::mean(weekday);
	dow.weekend_vs_weekday = weekday_mean > 0.0 ? stats::mean(weekend) / weekday_mean : 1.0;
	result.day_of_week = dow;

	if (table.rows() >= config_.monthly_seasonality_rows) {
		std::vector<double> start;
		std::vector<double> mid;
		std::vector<double> end;
		for (std::size_t i = 0; i < series.size(); ++i) {
			const unsigned dom = table.dates()[i].day();
			if (dom <= 5) {
				start.push_back(series[i]);
			}
			if (dom > 10 && dom <= 20) {
				mid.push_back(series[i]);
			}
			if (dom >= 25) {
				end.push_back(series[i]);
			}
		}
		MonthlySeasonality monthly;
		monthly.start_month_avg = stats::mean(start);
		monthly.mid_month_avg = stats::mean(mid);
		monthly.end_month_avg = stats::mean(end);
		if (monthly.start_month_avg >= monthly.mid_month_avg && monthly.start_month_avg >= monthly.end_month_avg) {
			monthly.pattern = "front-loaded";
		} else if (monthly.mid_month_avg >= monthly.end_month_avg) {
			monthly.pattern = "mid-heavy";
		} else {
			monthly.pattern = "end-loaded";
		}
		result.monthly = monthly;
	}
	return result;
}

// --- Summary & insights ---

PatternSummary PatternDetector::summarize(const core::DailyTable &table, const PatternResult &result) const {
	PatternSummary summary;
	const auto &series = totalSeries(table);
	summary.avg_daily_spend = stats::mean(series);
	summary.median_daily_spend = stats::median(series);
	summary.max_daily_spend = series.empty() ? 0.0 : *std::max_element(series.begin(), series.end());
	summary.days_analyzed = static_cast<int>(table.rows());

	summary.recurrence_count = static_cast<int>(result.recurrences.size());
	summary.spike_count = static_cast<int>(result.spikes.size());
	summary.recent_spikes =
	    static_cast<int>(std::count_if(result.spikes.begin(), result.spikes.end(), [](const Spike &s) { return s.recent; }));

	for (const auto &entry : result.activity_levels) {
		const auto &level = entry.second;
		if (level.rfind("regular", 0) == 0 || level == "frequent") {
			++summary.active_categories;
		} else if (level == "inactive") {
			++summary.inactive_categories;
		}
	}

	if (!result.volatility.empty()) {
		double sum = 0.0;
		for (const auto &entry : result.volatility) {
			sum += entry.second;
			if (entry.second > config_.high_volatility) {
				++summary.high_volatility_categories;
			}
		}
		summary.avg_volatility = sum / static_cast<double>(result.volatility.size());
	}
	return summary;
}

std::vector<std::string> PatternDetector::generateInsights(const PatternResult &result) const {
	std::vector<std::string> insights;

	for (const auto &recurrence : result.recurrences) {
		insights.push_back(recurrence.category + " spending occurs " + recurrence.pattern +
		                   " (confidence: " + percent(recurrence.confidence) + ")");
	}

	const auto recent = std::find_if(result.spikes.begin(), result.spikes.end(), [](const Spike &s) { return s.recent; });
	if (recent != result.spikes.end()) {
		std::ostringstream out;
		out << std::fixed << std::setprecision(0) << "Recent spending spike detected: " << recent->amount << " on "
		    << recent->date.toString() << std::setprecision(1);
		if (std::isinf(recent->z_score)) {
			out << " (" << recent->amount / recent->expected << "x a flat baseline)";
		} else {
			out << " (" << recent->z_score << " std above normal)";
		}
		insights.push_back(out.str());
	}

	std::vector<std::string> volatile_categories;
	for (const auto &entry : result.volatility) {
		if (entry.second > config_.high_volatility) {
			volatile_categories.push_back(entry.first);
		}
	}
	if (!volatile_categories.empty()) {
		std::string joined;
		for (std::size_t i = 0; i < volatile_categories.size(); ++i) {
			joined += (i == 0 ? "" : ", ") + volatile_categories[i];
		}
		insights.push_back("High spending volatility in: " + joined);
	}

	for (const auto &trend : result.trends) {
		if (trend.confidence > config_.insight_trend_confidence) {
			const std::string window = trend.window.substr(0, trend.window.find("_term"));
			insights.push_back("Spending is " + trend.direction + " (" + window + " trend)");
		}
	}

	if (result.seasonality.day_of_week) {
		std::ostringstream out;
		out << std::fixed << std::setprecision(0) << "Peak spending day: " << result.seasonality.day_of_week->peak_day
		    << " (" << result.seasonality.day_of_week->peak_amount << ")";
		insights.push_back(out.str());
	}

	if (insights.size() > config_.max_insights) {
		insights.resize(config_.max_insights);
	}
	return insights;
}

} // namespace finsight::patterns
