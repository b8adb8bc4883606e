#pragma once

#include "finsight/budget/budget_types.hpp"
#include "finsight/budget/category_policy.hpp"
#include "finsight/budget/ema_budget_generator.hpp"
#include "finsight/budget/statistical_budget_generator.hpp"
#include "finsight/core/forecast.hpp"
#include "finsight/core/transaction.hpp"
#include "finsight/features/feature_pipeline.hpp"
#include "finsight/models/autoregressive_forecaster.hpp"
#include "finsight/models/model_store.hpp"
#include "finsight/models/overspending.hpp"
#include "finsight/models/spending_predictor.hpp"
#include "finsight/patterns/pattern_detector.hpp"
#include "finsight/service/result_cache.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace finsight::service {

struct ServiceConfig {
	std::chrono::seconds cache_ttl{900};
	/// Clock used for cache expiry; steady_clock::now when empty.
	ResultCache<core::ForecastResult>::NowFn clock;

	/// Days of history from which forecasts use the trained predictor.
	std::size_t predictor_min_rows = 30;
	/// Below this many days monthly budgets use the statistical generator.
	std::size_t ema_min_rows = 28;
	std::size_t pattern_lookback_days = 90;

	features::FeaturePipeline::Config pipeline;
	patterns::PatternDetector::Config detector;
	models::SpendingPredictor::Config predictor;
	models::AutoRegressiveForecaster::Config autoregressive;
	budget::EmaBudgetConfig ema;
	budget::CategoryPolicy policy = budget::CategoryPolicy::defaults();
};

struct ServiceStats {
	std::size_t cache_hits = 0;
	std::size_t cache_misses = 0;
	std::size_t trainings = 0;
	std::size_t fallbacks = 0;
};

struct BudgetOptions {
	budget::BudgetPeriod period = budget::BudgetPeriod::Monthly;
	std::optional<core::Date> target_month;
	std::optional<double> savings_goal;
};

/**
 * @class AnalyticsService
 * @brief Per-user entry point over the pipeline, detector, forecasters and budget generators.
 *
 * Picks a strategy by history length, falls back to a simpler one when the
 * preferred strategy throws, and caches every result for the configured TTL.
 * Trained predictors are kept per user. The first request that needs a user's
 * model trains it (or loads it from the store) while concurrent requests for
 * the same user wait on that user's slot; other users are never blocked.
 */
class AnalyticsService {
public:
	using ModelPtr = models::IModelStore::ModelPtr;

	/// A null @p store is replaced by an InMemoryModelStore.
	explicit AnalyticsService(ServiceConfig config = {}, std::shared_ptr<models::IModelStore> store = nullptr);

	AnalyticsService(const AnalyticsService &) = delete;
	AnalyticsService &operator=(const AnalyticsService &) = delete;

	/**
	 * @brief Spending forecast for @p user.
	 *
	 * Fewer than 14 days (30 for monthly) yields an empty result with
	 * confidence 0.3. From predictor_min_rows days the user's SpendingPredictor
	 * answers; otherwise, or when it fails, the AutoRegressiveForecaster does.
	 *
	 * @throws std::invalid_argument If the horizon is not positive.
	 */
	core::ForecastResult forecast(const std::string &user, const core::Transactions &transactions,
	                              const core::ForecastRequest &request);

	/**
	 * @brief Budget recommendation for @p user.
	 *
	 * Weekly budgets come from the EMA generator. Monthly budgets use the EMA
	 * generator from ema_min_rows days and the statistical generator below
	 * that; a failing strategy falls back to the statistical generator and
	 * then to the default template.
	 */
	budget::BudgetResult recommendBudget(const std::string &user, const core::Transactions &transactions,
	                                     const BudgetOptions &options = {});

	/// Patterns over the last @p lookback_days days (pattern_lookback_days when 0).
	patterns::PatternResult detectPatterns(const std::string &user, const core::Transactions &transactions,
	                                       std::size_t lookback_days = 0);

	/// Next week's forecast against a monthly budget total or the historical weekly average.
	models::OverspendingResult overspending(const std::string &user, const core::Transactions &transactions,
	                                        std::optional<double> monthly_budget_total = std::nullopt);

	/**
	 * @brief Retrains the user's predictor, replaces the stored model and drops the user's cached results.
	 * @throws std::invalid_argument With fewer than 30 days of history.
	 */
	models::SpendingPredictor::TrainingMetrics train(const std::string &user, const core::Transactions &transactions);

	/// The user's model when one is loaded or stored, without training.
	ModelPtr model(const std::string &user);

	/// Drops cached results for @p user, or for everyone when @p user is empty.
	void clearCache(const std::string &user = "");

	ServiceStats stats() const;

	const ServiceConfig &config() const {
		return config_;
	}

private:
	struct ModelSlot {
		std::mutex mutex;
		ModelPtr model;
	};

	std::shared_ptr<ModelSlot> slotFor(const std::string &user);
	ModelPtr modelFor(const std::string &user, const core::DailyTable &table);

	core::ForecastResult computeForecast(const std::string &user, const core::Transactions &transactions,
	                                     const core::ForecastRequest &request);
	core::ForecastResult autoregressiveForecast(const core::Transactions &transactions,
	                                            const core::ForecastRequest &request) const;
	budget::BudgetResult computeBudget(const core::Transactions &transactions, const BudgetOptions &options);

	ServiceConfig config_;
	std::shared_ptr<models::IModelStore> store_;
	features::FeaturePipeline pipeline_;
	patterns::PatternDetector detector_;
	budget::EmaBudgetGenerator ema_;
	budget::StatisticalBudgetGenerator statistical_;

	ResultCache<core::ForecastResult> forecasts_;
	ResultCache<budget::BudgetResult> budgets_;
	ResultCache<patterns::PatternResult> patterns_;

	std::mutex slots_mutex_;
	std::unordered_map<std::string, std::shared_ptr<ModelSlot>> slots_;

	std::atomic<std::size_t> trainings_{0};
	std::atomic<std::size_t> fallbacks_{0};
};

} // namespace finsight::service
