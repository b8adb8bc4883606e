#pragma once

#include "common/transaction_helpers.hpp"
#include "finsight/features/feature_pipeline.hpp"
#include "finsight/models/spending_predictor.hpp"

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace tests::helpers {

/// Household-like ledger: daily food, weekday transport, Saturday groceries and a bill on the 5th.
inline Transactions householdLedger(std::size_t days) {
	return generated(days, [](std::size_t i) {
		const auto date = day(static_cast<std::int64_t>(i));
		std::vector<std::pair<std::string, double>> items{{"Food", 120.0 + static_cast<double>((i * 29) % 60)}};
		if (date.dayOfWeek() < 5) {
			items.emplace_back("Transport", 45.0);
		}
		if (date.dayOfWeek() == 5) {
			items.emplace_back("Shopping", 350.0);
		}
		if (date.day() == 5) {
			items.emplace_back("Bills", 900.0);
		}
		return items;
	});
}

/// Small, fast predictor settings for tests.
inline finsight::models::SpendingPredictor::Config smallPredictorConfig() {
	finsight::models::SpendingPredictor::Config config;
	config.forest.n_trees = 12;
	config.forest.max_depth = 6;
	config.cv_splits = 3;
	return config;
}

inline finsight::core::DailyTable featureTable(std::size_t days) {
	return finsight::features::FeaturePipeline().build(householdLedger(days));
}

inline std::shared_ptr<finsight::models::SpendingPredictor> trainedPredictor(std::size_t days = 60) {
	auto predictor = std::make_shared<finsight::models::SpendingPredictor>(smallPredictorConfig());
	predictor->train(featureTable(days));
	return predictor;
}

} // namespace tests::helpers
