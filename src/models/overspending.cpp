#include "finsight/models/overspending.hpp"

#include "finsight/features/feature_pipeline.hpp"
#include "finsight/utils/logging.hpp"
#include "finsight/utils/stats.hpp"

#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace finsight::models {

namespace {

OverspendingResult failure(const std::string &message) {
	OverspendingResult result;
	result.message = message;
	return result;
}

} // namespace

OverspendingResult assessOverspending(const core::ForecastResult &weekly, double mean_daily,
                                      std::optional<double> monthly_budget_total) {
	if (weekly.points.empty()) {
		return failure("Unable to make prediction with current data.");
	}

	OverspendingResult result;
	result.predicted = weekly.points.front().predicted;
	result.confidence = weekly.confidence;

	std::ostringstream message;
	message << std::fixed << std::setprecision(0) << "Predicted: " << result.predicted;
	if (monthly_budget_total && *monthly_budget_total > 0.0) {
		result.reference = *monthly_budget_total / kWeeksPerMonth;
		result.overspending = result.predicted > result.reference;
		message << " vs budget " << result.reference << "/week";
	} else {
		result.reference = mean_daily * 7.0;
		result.overspending = result.predicted > result.reference * 1.2;
		message << " vs average " << result.reference << "/week";
	}
	result.message = message.str();
	return result;
}

OverspendingResult checkOverspending(const IForecaster &forecaster, const core::DailyTable &table,
                                     std::optional<double> monthly_budget_total) {
	try {
		const auto weekly = forecaster.forecast(core::ForecastRequest{1, core::Timeframe::Weekly});
		const double mean_daily = table.hasColumn(features::columns::kTotal)
		                              ? utils::stats::mean(table.column(features::columns::kTotal))
		                              : 0.0;
		return assessOverspending(weekly, mean_daily, monthly_budget_total);
	} catch (const std::exception &e) {
		FINSIGHT_ERROR("Overspending check failed: {}", e.what());
		return failure("Unable to check overspending at this time.");
	}
}

} // namespace finsight::models
