#include "finsight/core/transaction.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace finsight::core {

const std::array<std::string, kCategoryCount> &categories() {
	static const std::array<std::string, kCategoryCount> kCategories{
	    "Food",   "Beverage", "Home",     "Shopping", "Transport", "Entertainment", "Beauty",
	    "Sports", "Personal", "Work",     "Other",    "Bills",     "Travel"};
	return kCategories;
}

bool isKnownCategory(const std::string &category) {
	const auto &all = categories();
	return std::find(all.begin(), all.end(), category) != all.end();
}

std::size_t categoryIndex(const std::string &category) {
	const auto &all = categories();
	const auto it = std::find(all.begin(), all.end(), category);
	if (it == all.end()) {
		throw std::out_of_range("Unknown category '" + category + "'.");
	}
	return static_cast<std::size_t>(it - all.begin());
}

const std::string &normalizeCategory(const std::string &category) {
	const auto &all = categories();
	const auto it = std::find(all.begin(), all.end(), category);
	if (it != all.end()) {
		return *it;
	}
	return all[categoryIndex("Other")];
}

TransactionType parseTransactionType(const std::string &text) {
	std::string lowered(text);
	std::transform(lowered.begin(), lowered.end(), lowered.begin(),
	               [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
	if (lowered == "expense") {
		return TransactionType::Expense;
	}
	if (lowered == "income") {
		return TransactionType::Income;
	}
	throw std::invalid_argument("Unknown transaction type '" + text + "'.");
}

std::string toString(TransactionType type) {
	return type == TransactionType::Expense ? "expense" : "income";
}

} // namespace finsight::core
