#include <catch2/catch.hpp>

#include "common/transaction_helpers.hpp"
#include "finsight/features/feature_pipeline.hpp"
#include "finsight/models/autoregressive_forecaster.hpp"

#include <stdexcept>

using namespace finsight;
using namespace tests::helpers;

namespace {

models::AutoRegressiveForecaster::Config smallConfig() {
	models::AutoRegressiveForecaster::Config config;
	config.n_trees = 10;
	return config;
}

core::Transactions weeklyRhythm(std::size_t days) {
	return generated(days, [](std::size_t i) {
		std::vector<std::pair<std::string, double>> items{{"Food", 80.0 + static_cast<double>((i * 37) % 50)}};
		if (i % 7 == 5) {
			items.emplace_back("Home", 600.0);
		}
		if (i % 7 < 5) {
			items.emplace_back("Transport", 40.0);
		}
		return items;
	});
}

} // namespace

TEST_CASE("AutoRegressiveForecaster reports short history", "[models][autoregressive]") {
	models::AutoRegressiveForecaster forecaster(smallConfig());
	REQUIRE_THROWS_AS(forecaster.forecast({}), std::runtime_error);

	forecaster.fit(constantSpend(10, 100.0));
	REQUIRE_FALSE(forecaster.isReady());
	const auto result = forecaster.forecast({});
	REQUIRE(result.status == core::Status::InsufficientHistory);
	REQUIRE(result.empty());
	REQUIRE(result.confidence == Catch::Detail::Approx(0.3));
	REQUIRE(result.model == "AutoRegressiveForecaster");
}

TEST_CASE("AutoRegressiveForecaster counts spending days, not calendar days", "[models][autoregressive]") {
	// Ten purchases spread over 37 calendar days.
	const auto sparse = generated(37, [](std::size_t i) {
		return std::vector<std::pair<std::string, double>>{{"Shopping", i % 4 == 0 ? 100.0 : 0.0}};
	});
	models::AutoRegressiveForecaster forecaster(smallConfig());
	forecaster.fit(sparse);

	REQUIRE(forecaster.historyDays() == 37);
	REQUIRE(forecaster.spendDays() == 10);
	REQUIRE_FALSE(forecaster.isReady());
	REQUIRE(forecaster.forecast({7, core::Timeframe::Daily}).status == core::Status::InsufficientHistory);
}

TEST_CASE("AutoRegressiveForecaster forecasts a constant spender", "[models][autoregressive]") {
	models::AutoRegressiveForecaster forecaster(smallConfig());
	forecaster.fit(constantSpend(40, 100.0));
	REQUIRE(forecaster.isReady());
	REQUIRE(forecaster.historyDays() == 40);

	const auto daily = forecaster.forecast({7, core::Timeframe::Daily});
	REQUIRE(daily.status == core::Status::Ok);
	REQUIRE(daily.points.size() == 7);
	REQUIRE(daily.confidence == Catch::Detail::Approx(0.7));
	for (std::size_t i = 0; i < daily.points.size(); ++i) {
		REQUIRE(daily.points[i].date == day(40 + static_cast<std::int64_t>(i)));
		REQUIRE(daily.points[i].predicted == Catch::Detail::Approx(100.0));
		REQUIRE(daily.points[i].lower <= daily.points[i].upper);
	}

	const auto weekly = forecaster.forecast({2, core::Timeframe::Weekly});
	REQUIRE(weekly.points.size() == 2);
	REQUIRE(weekly.points[0].week_start == day(40));
	REQUIRE(weekly.points[0].week_end == day(46));
	REQUIRE(weekly.points[1].week_start == day(47));
	REQUIRE(weekly.points[0].predicted == Catch::Detail::Approx(700.0));
	REQUIRE(weekly.totalPredicted() == Catch::Detail::Approx(1400.0));

	const auto monthly = forecaster.forecast({1, core::Timeframe::Monthly});
	REQUIRE(monthly.points.size() == 1);
	REQUIRE(monthly.points[0].month == "2024-03");
	REQUIRE(monthly.points[0].predicted == Catch::Detail::Approx(3100.0));

	REQUIRE(forecaster.backtest().has_value());
	REQUIRE(forecaster.backtest()->days.size() == 14);
	REQUIRE(forecaster.backtest()->mae == Catch::Detail::Approx(0.0).margin(1e-9));
	REQUIRE(forecaster.backtest()->rmse == Catch::Detail::Approx(0.0).margin(1e-9));
	REQUIRE(forecaster.backtest()->bias == Catch::Detail::Approx(0.0).margin(1e-9));
	REQUIRE(forecaster.backtest()->weeks.size() <= 2);

	REQUIRE_THROWS_AS(forecaster.forecast({0, core::Timeframe::Daily}), std::invalid_argument);
}

TEST_CASE("AutoRegressiveForecaster backtest reports undershooting", "[models][autoregressive][backtest]") {
	// Spending doubles for the 14 held-out days, which the refit never saw.
	const auto ledger = generated(40, [](std::size_t i) {
		return std::vector<std::pair<std::string, double>>{{"Food", i < 26 ? 100.0 : 200.0}};
	});
	models::AutoRegressiveForecaster forecaster(smallConfig());
	forecaster.fit(ledger);

	const auto &backtest = forecaster.backtest();
	REQUIRE(backtest.has_value());
	REQUIRE(backtest->under_days == 14);
	REQUIRE(backtest->over_days == 0);
	REQUIRE(backtest->mae == Catch::Detail::Approx(100.0));
	REQUIRE(backtest->rmse == Catch::Detail::Approx(100.0));
	REQUIRE(backtest->bias == Catch::Detail::Approx(100.0));
}

TEST_CASE("AutoRegressiveForecaster monthly needs thirty days", "[models][autoregressive]") {
	models::AutoRegressiveForecaster forecaster(smallConfig());
	forecaster.fit(constantSpend(20, 50.0));
	REQUIRE(forecaster.isReady());
	REQUIRE(forecaster.forecast({1, core::Timeframe::Monthly}).status == core::Status::InsufficientHistory);
	REQUIRE(forecaster.forecast({1, core::Timeframe::Weekly}).status == core::Status::Ok);
	REQUIRE_FALSE(forecaster.backtest().has_value());
}

TEST_CASE("AutoRegressiveForecaster training rows use only earlier days", "[models][autoregressive][leakage]") {
	const auto frame = features::aggregateDaily(weeklyRhythm(45));
	const auto design = models::AutoRegressiveForecaster::buildDesign(frame);
	REQUIRE(design.x.rows() == 42);
	REQUIRE(design.x.cols() == static_cast<Eigen::Index>(models::AutoRegressiveForecaster::featureNames().size()));
	REQUIRE(design.dates.front() == day(3));

	models::AutoRegressiveForecaster forecaster(smallConfig());
	for (std::size_t t : {3u, 10u, 40u}) {
		const auto state = forecaster.stateFrom(frame.head(t));
		const auto expected = models::AutoRegressiveForecaster::featureRow(state, frame.dates()[t]);
		const auto actual = design.x.row(static_cast<Eigen::Index>(t - 3));
		for (Eigen::Index j = 0; j < expected.size(); ++j) {
			REQUIRE(actual(j) == Catch::Detail::Approx(expected(j)));
		}
		REQUIRE(design.y(static_cast<Eigen::Index>(t - 3)) ==
		        Catch::Detail::Approx(frame.column(features::columns::kTotal)[t]));
	}
}

TEST_CASE("AutoRegressiveForecaster rollForward equals repeated steps", "[models][autoregressive]") {
	const auto frame = features::aggregateDaily(weeklyRhythm(50));
	models::AutoRegressiveForecaster forecaster(smallConfig());
	forecaster.fitFrame(frame);

	const auto start = frame.lastDate().addDays(1);
	const auto rolled = forecaster.rollForward(forecaster.stateFrom(frame), start, 5);

	auto state = forecaster.stateFrom(frame);
	const auto total = state.columnIndex("Total");
	for (std::size_t i = 0; i < rolled.size(); ++i) {
		const auto point = forecaster.step(state, start.addDays(static_cast<std::int64_t>(i)));
		REQUIRE(point.predicted == Catch::Detail::Approx(rolled[i].predicted));
		REQUIRE(state.last(total) == Catch::Detail::Approx(point.predicted));
	}

	// The synthetic day is split over categories in proportion to their trailing sums.
	double categories = 0.0;
	for (std::size_t c = 0; c < total; ++c) {
		categories += state.last(c);
	}
	REQUIRE(categories == Catch::Detail::Approx(state.last(total)));

	const auto result = forecaster.forecast({7, core::Timeframe::Daily});
	REQUIRE_FALSE(result.drivers.empty());
	REQUIRE(result.drivers.size() <= 5);
}

TEST_CASE("AutoRegressiveForecaster validates its input", "[models][autoregressive][validation]") {
	auto config = smallConfig();
	config.n_trees = 0;
	REQUIRE_THROWS_AS(models::AutoRegressiveForecaster(config), std::invalid_argument);
	config = smallConfig();
	config.buffer_size = 5;
	REQUIRE_THROWS_AS(models::AutoRegressiveForecaster(config), std::invalid_argument);

	std::vector<core::Date> dates;
	for (int i = 0; i < 20; ++i) {
		dates.push_back(day(i));
	}
	core::DailyTable partial(dates);
	partial.setColumn(features::columns::kTotal, repeated(20, 10.0));
	models::AutoRegressiveForecaster forecaster(smallConfig());
	REQUIRE_THROWS_AS(forecaster.fitFrame(partial), std::invalid_argument);
}

TEST_CASE("Forecast shaping folds daily points", "[models][forecast_shape]") {
	const auto last = core::Date::fromYmd(2024, 1, 31);
	REQUIRE(models::dailySteps({3, core::Timeframe::Daily}, last) == 3);
	REQUIRE(models::dailySteps({2, core::Timeframe::Weekly}, last) == 14);
	REQUIRE(models::dailySteps({2, core::Timeframe::Monthly}, last) == 60);

	std::vector<core::ForecastPoint> daily(60);
	for (std::size_t i = 0; i < daily.size(); ++i) {
		daily[i].date = last.addDays(static_cast<std::int64_t>(i) + 1);
		daily[i].predicted = 1.0;
		daily[i].lower = 0.5;
		daily[i].upper = 2.0;
	}
	const auto months = models::shapeForecast(daily, {2, core::Timeframe::Monthly}, last);
	REQUIRE(months.size() == 2);
	REQUIRE(months[0].month == "2024-02");
	REQUIRE(months[0].predicted == Catch::Detail::Approx(29.0));
	REQUIRE(months[1].upper == Catch::Detail::Approx(62.0));

	const auto weeks = models::shapeForecast(daily, {1, core::Timeframe::Weekly}, last);
	REQUIRE(weeks[0].lower == Catch::Detail::Approx(3.5));
	REQUIRE(weeks[0].week_end == last.addDays(7));

	REQUIRE_THROWS_AS(models::shapeForecast(daily, {3, core::Timeframe::Monthly}, last), std::invalid_argument);
	REQUIRE(models::historyShortfall(13, {}, "x").has_value());
	REQUIRE_FALSE(models::historyShortfall(14, {}, "x").has_value());
	REQUIRE(models::historyShortfall(29, {1, core::Timeframe::Monthly}, "x").has_value());
}
