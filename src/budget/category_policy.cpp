#include "finsight/budget/category_policy.hpp"

namespace finsight::budget {

namespace {

double lookup(const std::map<std::string, double> &table, const std::string &key, double fallback) {
	const auto it = table.find(key);
	return it == table.end() ? fallback : it->second;
}

} // namespace

double CategoryPolicy::floor(const std::string &category) const {
	return lookup(floors, category, 0.0);
}

double CategoryPolicy::elasticity(const std::string &category) const {
	return lookup(elasticities, category, default_elasticity);
}

double CategoryPolicy::weeklyEssential(const std::string &category) const {
	return lookup(weekly_essentials, category, 0.0);
}

double CategoryPolicy::emaElasticity(const std::string &category) const {
	return lookup(ema_elasticities, category, default_elasticity);
}

CategoryPolicy CategoryPolicy::defaults() {
	CategoryPolicy policy;
	policy.floors = {{"Food", 800},     {"Transport", 200},   {"Home", 100},         {"Personal", 50},
	                 {"Bills", 0},      {"Beverage", 100},    {"Shopping", 0},       {"Entertainment", 0},
	                 {"Beauty", 0},     {"Sports", 0},        {"Work", 50},          {"Other", 50},
	                 {"Travel", 0}};
	policy.elasticities = {{"Food", 0.6},     {"Transport", 0.7},     {"Home", 0.8},   {"Bills", 0.0},
	                       {"Personal", 0.9}, {"Work", 0.8},          {"Beverage", 1.1}, {"Shopping", 1.5},
	                       {"Entertainment", 1.4}, {"Beauty", 1.3},   {"Sports", 1.2}, {"Other", 1.0},
	                       {"Travel", 1.6}};
	policy.weekly_essentials = {{"Food", 800}, {"Transport", 200}, {"Bills", 0}, {"Home", 100}};
	policy.ema_elasticities = {{"Shopping", 1.5}, {"Entertainment", 1.4}, {"Beauty", 1.3}, {"Beverage", 1.2},
	                           {"Other", 1.2},    {"Travel", 1.2},        {"Food", 0.6},   {"Transport", 0.6},
	                           {"Bills", 0.3},    {"Home", 0.7},          {"Sports", 1.1}, {"Personal", 1.0},
	                           {"Work", 0.8}};
	policy.default_monthly = {{"Food", 5000},  {"Transport", 1500}, {"Home", 1000},    {"Shopping", 2000},
	                          {"Entertainment", 1000}, {"Personal", 500}, {"Bills", 2000}, {"Beverage", 800},
	                          {"Other", 500},  {"Beauty", 300},     {"Sports", 300},   {"Work", 200},
	                          {"Travel", 0}};
	policy.default_weekly = {{"Food", 1200}, {"Transport", 400}, {"Shopping", 500}, {"Entertainment", 300},
	                         {"Other", 200}};
	return policy;
}

} // namespace finsight::budget
