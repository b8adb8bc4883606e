#include "finsight/models/iforecaster.hpp"

#include "finsight/utils/logging.hpp"

#include <stdexcept>

namespace finsight::models {

namespace {

core::ForecastPoint sumPoints(const std::vector<core::ForecastPoint> &daily, std::size_t begin, std::size_t count) {
	core::ForecastPoint point;
	for (std::size_t i = begin; i < begin + count; ++i) {
		point.predicted += daily[i].predicted;
		point.lower += daily[i].lower;
		point.upper += daily[i].upper;
	}
	return point;
}

} // namespace

void validateRequest(const core::ForecastRequest &request) {
	if (request.horizon < 1) {
		throw std::invalid_argument("Forecast horizon must be positive.");
	}
}

std::optional<core::ForecastResult> historyShortfall(std::size_t history_days, const core::ForecastRequest &request,
                                                     const std::string &model) {
	const bool monthly = request.timeframe == core::Timeframe::Monthly;
	const std::size_t required = monthly ? kMinMonthlyHistory : kMinForecastHistory;
	if (history_days >= required) {
		return std::nullopt;
	}
	FINSIGHT_WARN("{}: {} days of history, {} forecast needs {}.", model, history_days, core::toString(request.timeframe),
	              required);
	core::ForecastResult result;
	result.status = core::Status::InsufficientHistory;
	result.confidence = kEmptyForecastConfidence;
	result.model = model;
	return result;
}

std::size_t dailySteps(const core::ForecastRequest &request, const core::Date &last_date) {
	validateRequest(request);
	const auto horizon = static_cast<std::size_t>(request.horizon);
	switch (request.timeframe) {
	case core::Timeframe::Daily:
		return horizon;
	case core::Timeframe::Weekly:
		return 7 * horizon;
	case core::Timeframe::Monthly: {
		std::size_t days = 0;
		for (int m = 1; m <= request.horizon; ++m) {
			const auto target = last_date.addMonths(m);
			days += core::Date::daysInMonth(target.year(), target.month());
		}
		return days;
	}
	}
	return horizon;
}

std::vector<core::ForecastPoint> shapeForecast(const std::vector<core::ForecastPoint> &daily,
                                               const core::ForecastRequest &request, const core::Date &last_date) {
	if (daily.size() < dailySteps(request, last_date)) {
		throw std::invalid_argument("Not enough daily points for the requested forecast shape.");
	}
	if (request.timeframe == core::Timeframe::Daily) {
		return std::vector<core::ForecastPoint>(daily.begin(), daily.begin() + request.horizon);
	}

	std::vector<core::ForecastPoint> shaped;
	shaped.reserve(static_cast<std::size_t>(request.horizon));
	std::size_t offset = 0;
	for (int step = 1; step <= request.horizon; ++step) {
		std::size_t count = 7;
		core::ForecastPoint point;
		if (request.timeframe == core::Timeframe::Weekly) {
			point = sumPoints(daily, offset, count);
			point.week_start = daily[offset].date;
			point.week_end = daily[offset + count - 1].date;
			point.date = point.week_start;
		} else {
			const auto target = last_date.addMonths(step);
			count = core::Date::daysInMonth(target.year(), target.month());
			point = sumPoints(daily, offset, count);
			point.month = target.monthKey();
			point.date = target.monthStart();
		}
		point.timeframe = request.timeframe;
		shaped.push_back(std::move(point));
		offset += count;
	}
	return shaped;
}

} // namespace finsight::models
