#include "finsight/core/forecast.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace finsight::core {

std::string toString(Timeframe timeframe) {
	switch (timeframe) {
	case Timeframe::Daily:
		return "daily";
	case Timeframe::Weekly:
		return "weekly";
	case Timeframe::Monthly:
		return "monthly";
	}
	return "daily";
}

Timeframe parseTimeframe(const std::string &text) {
	std::string lowered(text);
	std::transform(lowered.begin(), lowered.end(), lowered.begin(),
	               [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
	if (lowered == "daily") {
		return Timeframe::Daily;
	}
	if (lowered == "weekly") {
		return Timeframe::Weekly;
	}
	if (lowered == "monthly") {
		return Timeframe::Monthly;
	}
	throw std::invalid_argument("Unknown forecast timeframe '" + text + "'.");
}

} // namespace finsight::core
