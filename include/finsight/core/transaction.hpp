#pragma once

#include "finsight/core/date.hpp"

#include <array>
#include <cstddef>
#include <string>
#include <vector>

namespace finsight::core {

enum class TransactionType { Expense, Income };

/**
 * @struct Transaction
 * @brief A single ledger entry supplied by the caller.
 *
 * Amounts may be signed; the engine only ever reads the absolute value of
 * expense rows.
 */
struct Transaction {
	Date date;
	double amount = 0.0;
	std::string category;
	std::string description;
	TransactionType type = TransactionType::Expense;
};

using Transactions = std::vector<Transaction>;

constexpr std::size_t kCategoryCount = 13;

/// The fixed spending category set, in column order.
const std::array<std::string, kCategoryCount> &categories();

/// Maps a free-form category to a member of the fixed set ("Other" when unknown or empty).
const std::string &normalizeCategory(const std::string &category);

/// Position of @p category in categories(); throws std::out_of_range when not a member.
std::size_t categoryIndex(const std::string &category);

bool isKnownCategory(const std::string &category);

/// Parses "expense" / "income" (case-insensitive).
TransactionType parseTransactionType(const std::string &text);

std::string toString(TransactionType type);

} // namespace finsight::core
