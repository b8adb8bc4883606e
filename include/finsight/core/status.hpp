#pragma once

#include <string>

namespace finsight::core {

/**
 * @brief Outcome of an analytics operation.
 *
 * Insufficient data is reported through the status of an otherwise valid
 * (possibly empty) result rather than by throwing.
 */
enum class Status {
	Ok,
	InsufficientHistory, // Below the component's minimum number of days
	Fallback,            // Produced by a simpler strategy after the preferred one failed
	Default              // Template values; no user history was used
};

inline std::string toString(Status status) {
	switch (status) {
	case Status::Ok:
		return "ok";
	case Status::InsufficientHistory:
		return "insufficient_history";
	case Status::Fallback:
		return "fallback";
	case Status::Default:
		return "default";
	}
	return "unknown";
}

} // namespace finsight::core
