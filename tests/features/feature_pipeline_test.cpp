#include <catch2/catch.hpp>

#include "common/transaction_helpers.hpp"
#include "finsight/features/feature_pipeline.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

using namespace finsight;
using namespace tests::helpers;

namespace {

core::Transactions mixedLedger(std::size_t days) {
	return generated(days, [](std::size_t i) {
		std::vector<std::pair<std::string, double>> items{{"Food", 100.0 + static_cast<double>(i % 5) * 10.0}};
		if (i % 7 == 5) {
			items.emplace_back("Shopping", 400.0);
		}
		if (i % 3 == 0) {
			items.emplace_back("Transport", 60.0);
		}
		return items;
	});
}

} // namespace

TEST_CASE("FeaturePipeline needs fourteen distinct expense days", "[features][pipeline]") {
	features::FeaturePipeline pipeline;
	REQUIRE(pipeline.build(constantSpend(13, 50.0)).empty());
	REQUIRE(pipeline.build({}).empty());

	auto ledger = constantSpend(13, 50.0);
	ledger.push_back(income(day(13), 5000.0));
	REQUIRE(pipeline.build(ledger).empty());

	ledger.push_back(expense(day(20), 50.0, "Food"));
	const auto table = pipeline.build(ledger);
	REQUIRE(table.rows() == 21);
}

TEST_CASE("FeaturePipeline produces a contiguous finite table", "[features][pipeline]") {
	features::FeaturePipeline pipeline;
	auto ledger = mixedLedger(45);
	// Leave a gap that must become zero rows.
	ledger.erase(std::remove_if(ledger.begin(), ledger.end(),
	                            [](const core::Transaction &tx) { return tx.date == day(10) || tx.date == day(11); }),
	             ledger.end());

	const auto table = pipeline.build(ledger);
	REQUIRE(table.rows() == 45);
	REQUIRE(table.isContiguous());
	REQUIRE(table.allFinite());
	REQUIRE(table.column(features::columns::kTotal)[10] == 0.0);

	for (const auto &category : core::categories()) {
		REQUIRE(table.hasColumn(category));
		REQUIRE(table.hasColumn(features::columns::perCategory(category, "days_since_spend")));
		REQUIRE(table.hasColumn(features::columns::perCategory(category, "activity_level")));
	}
	REQUIRE(table.hasColumn("total_lag_30"));
	REQUIRE(table.hasColumn("total_rolling_std_14"));
	REQUIRE(table.hasColumn("Food_rolling_mean_7"));
	REQUIRE(table.hasColumn(features::columns::kDowSin));
}

TEST_CASE("FeaturePipeline lag columns look strictly backwards", "[features][pipeline][lag]") {
	features::FeaturePipeline pipeline;
	const auto table = pipeline.build(mixedLedger(40));
	const auto &total = table.column(features::columns::kTotal);
	const auto &lag1 = table.column(features::columns::lag("total", 1));
	const auto &lag7 = table.column(features::columns::lag("total", 7));

	REQUIRE(lag1[0] == 0.0);
	for (std::size_t i = 1; i < table.rows(); ++i) {
		REQUIRE(lag1[i] == Catch::Detail::Approx(total[i - 1]));
	}
	for (std::size_t i = 7; i < table.rows(); ++i) {
		REQUIRE(lag7[i] == Catch::Detail::Approx(total[i - 7]));
	}
}

TEST_CASE("FeaturePipeline rolling windows ignore later days", "[features][pipeline][rolling]") {
	features::FeaturePipeline pipeline;
	const auto base = mixedLedger(40);
	auto changed = base;
	changed.push_back(expense(day(39), 5000.0, "Travel"));

	const auto a = pipeline.build(base);
	const auto b = pipeline.build(changed);
	const auto name = features::columns::rolling("total", "mean", 7);
	for (std::size_t i = 0; i < 39; ++i) {
		REQUIRE(a.column(name)[i] == Catch::Detail::Approx(b.column(name)[i]));
	}
	REQUIRE(b.column(name)[39] > a.column(name)[39]);

	const auto &mean7 = a.column(name);
	const auto &total = a.column(features::columns::kTotal);
	double window = 0.0;
	for (std::size_t i = 33; i < 40; ++i) {
		window += total[i];
	}
	REQUIRE(mean7[39] == Catch::Detail::Approx(window / 7.0));
}

TEST_CASE("FeaturePipeline behavioral features", "[features][pipeline][behavior]") {
	features::FeaturePipeline pipeline;
	auto ledger = constantSpend(30, 100.0);
	ledger.push_back(expense(day(20), 900.0, "Shopping"));
	const auto table = pipeline.build(ledger);

	const auto &spike = table.column(features::columns::kIsSpike);
	const auto &since_spike = table.column(features::columns::kDaysSinceSpike);
	REQUIRE(spike[20] == 1.0);
	REQUIRE(spike[19] == 0.0);
	REQUIRE(since_spike[20] == 0.0);
	REQUIRE(since_spike[25] == 5.0);
	REQUIRE(since_spike[5] > 900.0);

	const auto &since_shopping = table.column(features::columns::perCategory("Shopping", "days_since_spend"));
	REQUIRE(since_shopping[20] == 0.0);
	REQUIRE(since_shopping[23] == 3.0);

	const auto &diversity = table.column(features::columns::kDiversity);
	REQUIRE(diversity[20] == 2.0);
	REQUIRE(diversity[21] == 1.0);

	const auto &food_level = table.column(features::columns::perCategory("Food", "activity_level"));
	REQUIRE(food_level[29] == 2.0);
}

TEST_CASE("FeaturePipeline re-aggregation keeps daily totals", "[features][pipeline]") {
	features::FeaturePipeline pipeline;
	const auto table = pipeline.build(mixedLedger(30));
	const auto rebuilt = pipeline.build(features::toTransactions(table));

	REQUIRE(rebuilt.rows() == table.rows());
	for (std::size_t i = 0; i < table.rows(); ++i) {
		REQUIRE(rebuilt.column(features::columns::kTotal)[i] ==
		        Catch::Detail::Approx(table.column(features::columns::kTotal)[i]));
	}
}

TEST_CASE("FeaturePipeline category frames", "[features][pipeline]") {
	features::FeaturePipeline pipeline;
	const auto table = pipeline.build(mixedLedger(21));
	const auto frames = pipeline.categoryFrames(table);

	REQUIRE(frames.size() == core::kCategoryCount);
	const auto &food = frames.at("Food");
	REQUIRE(food.rows() == table.rows());
	REQUIRE(food.allFinite());
	REQUIRE(food.column("lag_1")[0] == 0.0);
	REQUIRE(food.column("lag_1")[1] == Catch::Detail::Approx(table.column("Food")[0]));
	REQUIRE(pipeline.categoryFrames(core::DailyTable{}).empty());
}

TEST_CASE("FeaturePipelineBuilder validates its configuration", "[features][pipeline][builder]") {
	auto pipeline = features::FeaturePipelineBuilder().withMinDistinctDays(7).withLags({1, 7}).build();
	REQUIRE(pipeline->config().min_distinct_days == 7);
	REQUIRE_FALSE(pipeline->build(constantSpend(7, 20.0)).empty());
	REQUIRE_FALSE(pipeline->build(constantSpend(7, 20.0)).hasColumn("total_lag_14"));

	REQUIRE_THROWS_AS(features::FeaturePipelineBuilder().withLags({0}).build(), std::invalid_argument);
	REQUIRE_THROWS_AS(features::FeaturePipelineBuilder().withKeyCategories({"Crypto"}).build(),
	                  std::invalid_argument);
	REQUIRE_THROWS_AS(features::FeaturePipelineBuilder().withMinDistinctDays(0).build(), std::invalid_argument);
}
