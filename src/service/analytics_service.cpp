#include "finsight/service/analytics_service.hpp"

#include "finsight/models/iforecaster.hpp"
#include "finsight/utils/logging.hpp"
#include "finsight/utils/stats.hpp"

#include <cstdint>
#include <sstream>
#include <stdexcept>

namespace finsight::service {

namespace {

std::string budgetParams(const BudgetOptions &options) {
	std::ostringstream params;
	params << budget::toString(options.period) << ':'
	       << (options.target_month ? options.target_month->monthKey() : std::string("current"));
	if (options.savings_goal) {
		params << ":save=" << *options.savings_goal;
	}
	return params.str();
}

models::OverspendingResult overspendingFailure(const std::string &message) {
	models::OverspendingResult result;
	result.message = message;
	return result;
}

core::Transactions withinLookback(const core::Transactions &transactions, std::size_t days) {
	bool any = false;
	core::Date last;
	for (const auto &tx : transactions) {
		if (tx.type == core::TransactionType::Expense && (!any || tx.date > last)) {
			last = tx.date;
			any = true;
		}
	}
	if (!any) {
		return {};
	}
	const auto first = last.addDays(-static_cast<std::int64_t>(days) + 1);
	core::Transactions recent;
	for (const auto &tx : transactions) {
		if (tx.date >= first) {
			recent.push_back(tx);
		}
	}
	return recent;
}

} // namespace

AnalyticsService::AnalyticsService(ServiceConfig config, std::shared_ptr<models::IModelStore> store)
    : config_(std::move(config)), store_(store ? std::move(store) : std::make_shared<models::InMemoryModelStore>()),
      pipeline_(config_.pipeline), detector_(config_.detector), ema_(config_.ema, config_.policy),
      statistical_(config_.policy), forecasts_(config_.cache_ttl, config_.clock),
      budgets_(config_.cache_ttl, config_.clock), patterns_(config_.cache_ttl, config_.clock) {
	FINSIGHT_DEBUG("AnalyticsService: cache ttl {}s, predictor from {} days, EMA budgets from {} days.",
	               config_.cache_ttl.count(), config_.predictor_min_rows, config_.ema_min_rows);
}

// --- Forecasting ---

core::ForecastResult AnalyticsService::forecast(const std::string &user, const core::Transactions &transactions,
                                                const core::ForecastRequest &request) {
	models::validateRequest(request);
	const auto key = ResultCache<core::ForecastResult>::key(
	    user, "forecast", core::toString(request.timeframe) + ":" + std::to_string(request.horizon));
	return forecasts_.getOrCompute(key, [&] { return computeForecast(user, transactions, request); });
}

core::ForecastResult AnalyticsService::computeForecast(const std::string &user, const core::Transactions &transactions,
                                                       const core::ForecastRequest &request) {
	const auto table = pipeline_.build(transactions);
	if (auto shortfall = models::historyShortfall(table.rows(), request, "AnalyticsService")) {
		FINSIGHT_INFO("Forecast for {}: {} days of history is not enough.", user, table.rows());
		return *shortfall;
	}

	if (table.rows() < config_.predictor_min_rows) {
		return autoregressiveForecast(transactions, request);
	}

	try {
		const auto model = modelFor(user, table);
		return model->forecastFrom(table, request);
	} catch (const std::exception &e) {
		FINSIGHT_WARN("SpendingPredictor failed for {} ({}); falling back to the autoregressive forecaster.", user,
		              e.what());
		++fallbacks_;
	}
	auto result = autoregressiveForecast(transactions, request);
	if (result.status == core::Status::Ok) {
		result.status = core::Status::Fallback;
	}
	return result;
}

core::ForecastResult AnalyticsService::autoregressiveForecast(const core::Transactions &transactions,
                                                              const core::ForecastRequest &request) const {
	models::AutoRegressiveForecaster forecaster(config_.autoregressive);
	forecaster.fit(transactions);
	return forecaster.forecast(request);
}

// --- Model registry ---

std::shared_ptr<AnalyticsService::ModelSlot> AnalyticsService::slotFor(const std::string &user) {
	std::lock_guard<std::mutex> lock(slots_mutex_);
	auto &slot = slots_[user];
	if (!slot) {
		slot = std::make_shared<ModelSlot>();
	}
	return slot;
}

AnalyticsService::ModelPtr AnalyticsService::modelFor(const std::string &user, const core::DailyTable &table) {
	auto slot = slotFor(user);
	// Held while training so that concurrent requests for this user reuse the result.
	std::lock_guard<std::mutex> lock(slot->mutex);
	if (slot->model) {
		return slot->model;
	}
	if (auto stored = store_->load(user)) {
		FINSIGHT_DEBUG("Loaded stored model for {}.", user);
		slot->model = stored;
		return slot->model;
	}

	FINSIGHT_INFO("No trained model for {}; training on {} days.", user, table.rows());
	auto model = std::make_shared<models::SpendingPredictor>(config_.predictor);
	model->train(table);
	store_->save(user, model);
	++trainings_;
	slot->model = std::move(model);
	return slot->model;
}

AnalyticsService::ModelPtr AnalyticsService::model(const std::string &user) {
	auto slot = slotFor(user);
	std::lock_guard<std::mutex> lock(slot->mutex);
	if (!slot->model) {
		slot->model = store_->load(user);
	}
	return slot->model;
}

models::SpendingPredictor::TrainingMetrics AnalyticsService::train(const std::string &user,
                                                                   const core::Transactions &transactions) {
	const auto table = pipeline_.build(transactions);
	auto model = std::make_shared<models::SpendingPredictor>(config_.predictor);
	const auto metrics = model->train(table);

	auto slot = slotFor(user);
	{
		std::lock_guard<std::mutex> lock(slot->mutex);
		store_->save(user, model);
		slot->model = std::move(model);
	}
	++trainings_;
	clearCache(user);
	FINSIGHT_INFO("Retrained model for {}: MAE {:.2f} on {} samples.", user, metrics.mae, metrics.samples_trained);
	return metrics;
}

// --- Budgets ---

budget::BudgetResult AnalyticsService::recommendBudget(const std::string &user,
                                                      const core::Transactions &transactions,
                                                      const BudgetOptions &options) {
	const auto key = ResultCache<budget::BudgetResult>::key(user, "budget", budgetParams(options));
	return budgets_.getOrCompute(key, [&] { return computeBudget(transactions, options); });
}

budget::BudgetResult AnalyticsService::computeBudget(const core::Transactions &transactions,
                                                     const BudgetOptions &options) {
	const bool weekly = options.period == budget::BudgetPeriod::Weekly;
	const auto table = features::aggregateDaily(transactions);
	auto fallbackTemplate = [&] {
		auto result = weekly ? ema_.defaultWeekly() : ema_.defaultMonthly();
		if (!weekly && options.target_month) {
			result.month = options.target_month->monthKey();
		}
		return result;
	};
	if (table.empty()) {
		return fallbackTemplate();
	}

	const auto found = detector_.detect(table);
	const budget::BudgetRequest request{table, &found, options.target_month, options.savings_goal, options.period};
	const bool use_ema = weekly || table.rows() >= config_.ema_min_rows;

	try {
		return use_ema ? ema_.generate(request) : statistical_.generate(request);
	} catch (const std::exception &e) {
		FINSIGHT_WARN("{} failed: {}", use_ema ? ema_.getName() : statistical_.getName(), e.what());
		++fallbacks_;
	}

	if (use_ema && !weekly) {
		try {
			auto result = statistical_.generate(request);
			result.status = core::Status::Fallback;
			return result;
		} catch (const std::exception &e) {
			FINSIGHT_ERROR("{} failed: {}", statistical_.getName(), e.what());
		}
	}
	return fallbackTemplate();
}

// --- Patterns and overspending ---

patterns::PatternResult AnalyticsService::detectPatterns(const std::string &user,
                                                        const core::Transactions &transactions,
                                                        std::size_t lookback_days) {
	const std::size_t days = lookback_days == 0 ? config_.pattern_lookback_days : lookback_days;
	const auto key = ResultCache<patterns::PatternResult>::key(user, "patterns", std::to_string(days));
	return patterns_.getOrCompute(
	    key, [&] { return detector_.detect(pipeline_.build(withinLookback(transactions, days))); });
}

models::OverspendingResult AnalyticsService::overspending(const std::string &user,
                                                          const core::Transactions &transactions,
                                                          std::optional<double> monthly_budget_total) {
	try {
		const auto table = pipeline_.build(transactions);
		if (table.rows() < models::kMinForecastHistory) {
			return overspendingFailure("Need at least 14 days of transaction history for overspending analysis");
		}
		const auto weekly = forecast(user, transactions, core::ForecastRequest{1, core::Timeframe::Weekly});
		const double mean_daily = utils::stats::mean(table.column(features::columns::kTotal));
		return models::assessOverspending(weekly, mean_daily, monthly_budget_total);
	} catch (const std::exception &e) {
		FINSIGHT_ERROR("Overspending check for {} failed: {}", user, e.what());
		return overspendingFailure("Unable to check overspending at this time.");
	}
}

void AnalyticsService::clearCache(const std::string &user) {
	if (user.empty()) {
		forecasts_.clear();
		budgets_.clear();
		patterns_.clear();
		return;
	}
	const auto removed = forecasts_.invalidateUser(user) + budgets_.invalidateUser(user) + patterns_.invalidateUser(user);
	FINSIGHT_DEBUG("Dropped {} cached results for {}.", removed, user);
}

ServiceStats AnalyticsService::stats() const {
	ServiceStats result;
	result.cache_hits = forecasts_.hits() + budgets_.hits() + patterns_.hits();
	result.cache_misses = forecasts_.misses() + budgets_.misses() + patterns_.misses();
	result.trainings = trainings_.load();
	result.fallbacks = fallbacks_.load();
	return result;
}

} // namespace finsight::service
