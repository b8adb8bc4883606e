#include "finsight/core/date.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace finsight::core {

namespace {

struct Civil {
	int year;
	unsigned month;
	unsigned day;
};

// Days since 1970-01-01 for a proleptic Gregorian date.
std::int64_t daysFromCivil(int y, unsigned m, unsigned d) {
	y -= m <= 2 ? 1 : 0;
	const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
	const unsigned yoe = static_cast<unsigned>(y - era * 400);
	const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
	const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
	return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

Civil civilFromDays(std::int64_t z) {
	z += 719468;
	const std::int64_t era = (z >= 0 ? z : z - 146096) / 146097;
	const unsigned doe = static_cast<unsigned>(z - era * 146097);
	const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
	const std::int64_t y = static_cast<std::int64_t>(yoe) + era * 400;
	const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
	const unsigned mp = (5 * doy + 2) / 153;
	const unsigned d = doy - (153 * mp + 2) / 5 + 1;
	const unsigned m = mp < 10 ? mp + 3 : mp - 9;
	return Civil{static_cast<int>(y + (m <= 2 ? 1 : 0)), m, d};
}

bool isLeap(int year) {
	return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int parseField(const std::string &text, std::size_t pos, std::size_t len) {
	if (pos + len > text.size()) {
		throw std::invalid_argument("Malformed date '" + text + "'.");
	}
	int value = 0;
	for (std::size_t i = pos; i < pos + len; ++i) {
		if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
			throw std::invalid_argument("Malformed date '" + text + "'.");
		}
		value = value * 10 + (text[i] - '0');
	}
	return value;
}

} // namespace

unsigned Date::daysInMonth(int year, unsigned month) {
	static constexpr unsigned kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
	if (month < 1 || month > 12) {
		throw std::invalid_argument("Month must be in [1, 12].");
	}
	if (month == 2 && isLeap(year)) {
		return 29;
	}
	return kDays[month - 1];
}

Date Date::fromYmd(int year, unsigned month, unsigned day) {
	if (month < 1 || month > 12) {
		throw std::invalid_argument("Month must be in [1, 12].");
	}
	if (day < 1 || day > daysInMonth(year, month)) {
		throw std::invalid_argument("Day is out of range for the given month.");
	}
	return fromDayNumber(daysFromCivil(year, month, day));
}

Date Date::parse(const std::string &text) {
	if (text.size() < 10 || text[4] != '-' || text[7] != '-') {
		throw std::invalid_argument("Malformed date '" + text + "'.");
	}
	if (text.size() > 10 && text[10] != 'T' && text[10] != ' ') {
		throw std::invalid_argument("Malformed date '" + text + "'.");
	}
	const int year = parseField(text, 0, 4);
	const int month = parseField(text, 5, 2);
	const int day = parseField(text, 8, 2);
	return fromYmd(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
}

Date Date::fromTimePoint(TimePoint tp) {
	const auto days = std::chrono::duration_cast<std::chrono::hours>(tp.time_since_epoch()).count();
	std::int64_t day_number = days / 24;
	if (days < 0 && days % 24 != 0) {
		--day_number;
	}
	return fromDayNumber(day_number);
}

int Date::year() const {
	return civilFromDays(days_).year;
}

unsigned Date::month() const {
	return civilFromDays(days_).month;
}

unsigned Date::day() const {
	return civilFromDays(days_).day;
}

int Date::dayOfWeek() const {
	// 1970-01-01 was a Thursday.
	const std::int64_t shifted = (days_ + 3) % 7;
	return static_cast<int>(shifted < 0 ? shifted + 7 : shifted);
}

unsigned Date::isoWeek() const {
	const Date thursday = addDays(3 - dayOfWeek());
	const Date jan1 = fromYmd(thursday.year(), 1, 1);
	return static_cast<unsigned>((thursday - jan1) / 7 + 1);
}

Date Date::addMonths(int n) const {
	const Civil c = civilFromDays(days_);
	const int total = c.year * 12 + static_cast<int>(c.month) - 1 + n;
	const int year = total >= 0 ? total / 12 : (total - 11) / 12;
	const unsigned month = static_cast<unsigned>(total - year * 12 + 1);
	const unsigned day = std::min(c.day, daysInMonth(year, month));
	return fromYmd(year, month, day);
}

Date Date::monthStart() const {
	const Civil c = civilFromDays(days_);
	return fromYmd(c.year, c.month, 1);
}

Date Date::monthEnd() const {
	const Civil c = civilFromDays(days_);
	return fromYmd(c.year, c.month, daysInMonth(c.year, c.month));
}

Date::TimePoint Date::toTimePoint() const {
	return TimePoint{} + std::chrono::hours(24 * days_);
}

std::string Date::toString() const {
	const Civil c = civilFromDays(days_);
	std::ostringstream out;
	out << std::setfill('0') << std::setw(4) << c.year << '-' << std::setw(2) << c.month << '-' << std::setw(2)
	    << c.day;
	return out.str();
}

std::string Date::monthKey() const {
	return toString().substr(0, 7);
}

} // namespace finsight::core
