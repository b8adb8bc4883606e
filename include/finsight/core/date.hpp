#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace finsight::core {

/**
 * @class Date
 * @brief A civil calendar day without time zone.
 *
 * Stored as a count of days since 1970-01-01 so that arithmetic and
 * ordering are plain integer operations. Day of week follows the
 * Monday = 0 ... Sunday = 6 convention used by every feature column.
 */
class Date {
public:
	using TimePoint = std::chrono::system_clock::time_point;

	Date() = default;

	/**
	 * @brief Builds a date from its calendar fields.
	 * @throws std::invalid_argument If the month or day is out of range.
	 */
	static Date fromYmd(int year, unsigned month, unsigned day);

	/**
	 * @brief Parses an ISO-8601 date ("YYYY-MM-DD").
	 *
	 * A trailing time component ("T..." or " ...") is accepted and ignored.
	 * @throws std::invalid_argument On malformed input.
	 */
	static Date parse(const std::string &text);

	static Date fromDayNumber(std::int64_t days) {
		Date date;
		date.days_ = days;
		return date;
	}

	static Date fromTimePoint(TimePoint tp);

	std::int64_t dayNumber() const {
		return days_;
	}

	int year() const;
	unsigned month() const;
	unsigned day() const;

	/// Monday = 0, Sunday = 6.
	int dayOfWeek() const;

	/// ISO-8601 week number (1..53).
	unsigned isoWeek() const;

	Date addDays(std::int64_t n) const {
		return fromDayNumber(days_ + n);
	}

	/// Adds calendar months, clamping the day to the target month's length.
	Date addMonths(int n) const;

	/// The Sunday that closes this date's Monday-Sunday week.
	Date weekEnd() const {
		return addDays(6 - dayOfWeek());
	}

	Date weekStart() const {
		return addDays(-dayOfWeek());
	}

	Date monthStart() const;
	Date monthEnd() const;

	static unsigned daysInMonth(int year, unsigned month);

	TimePoint toTimePoint() const;

	/// "YYYY-MM-DD"
	std::string toString() const;

	/// "YYYY-MM"
	std::string monthKey() const;

	friend std::int64_t operator-(const Date &lhs, const Date &rhs) {
		return lhs.days_ - rhs.days_;
	}
	friend bool operator==(const Date &lhs, const Date &rhs) {
		return lhs.days_ == rhs.days_;
	}
	friend bool operator!=(const Date &lhs, const Date &rhs) {
		return lhs.days_ != rhs.days_;
	}
	friend bool operator<(const Date &lhs, const Date &rhs) {
		return lhs.days_ < rhs.days_;
	}
	friend bool operator<=(const Date &lhs, const Date &rhs) {
		return lhs.days_ <= rhs.days_;
	}
	friend bool operator>(const Date &lhs, const Date &rhs) {
		return lhs.days_ > rhs.days_;
	}
	friend bool operator>=(const Date &lhs, const Date &rhs) {
		return lhs.days_ >= rhs.days_;
	}

private:
	std::int64_t days_ = 0;
};

} // namespace finsight::core
