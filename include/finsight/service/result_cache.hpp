#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>

namespace finsight::service {

/**
 * @class ResultCache
 * @brief Thread-safe key/value store whose entries expire after a fixed time-to-live.
 *
 * Keys follow "user:operation:params" so that every entry of a user can be
 * dropped with invalidateUser(). The user id is percent-encoded ('%' and ':')
 * so that no id is a key prefix of another. The clock is injectable; tests
 * advance a fake clock instead of sleeping.
 */
template <typename T>
class ResultCache {
public:
	using Clock = std::chrono::steady_clock;
	using TimePoint = Clock::time_point;
	using NowFn = std::function<TimePoint()>;

	/// @throws std::invalid_argument If @p ttl is negative.
	explicit ResultCache(std::chrono::seconds ttl = std::chrono::seconds(900), NowFn now = {})
	    : ttl_(ttl), now_(now ? std::move(now) : NowFn([] { return Clock::now(); })) {
		if (ttl_.count() < 0) {
			throw std::invalid_argument("ResultCache ttl must not be negative.");
		}
	}

	ResultCache(const ResultCache &) = delete;
	ResultCache &operator=(const ResultCache &) = delete;

	static std::string key(const std::string &user, const std::string &operation, const std::string &params) {
		return encodeUser(user) + ":" + operation + ":" + params;
	}

	/// @p user with '%' and ':' replaced by "%25" and "%3A".
	static std::string encodeUser(const std::string &user) {
		std::string encoded;
		encoded.reserve(user.size());
		for (const char c : user) {
			if (c == '%') {
				encoded += "%25";
			} else if (c == ':') {
				encoded += "%3A";
			} else {
				encoded += c;
			}
		}
		return encoded;
	}

	/// The stored value when it is younger than the TTL; expired entries are dropped.
	std::optional<T> get(const std::string &key) {
		const auto now = now_();
		std::lock_guard<std::mutex> lock(mutex_);
		const auto it = entries_.find(key);
		if (it == entries_.end()) {
			++misses_;
			return std::nullopt;
		}
		if (now - it->second.stored >= ttl_) {
			entries_.erase(it);
			++misses_;
			return std::nullopt;
		}
		++hits_;
		return it->second.value;
	}

	void put(const std::string &key, T value) {
		const auto now = now_();
		std::lock_guard<std::mutex> lock(mutex_);
		entries_[key] = Entry{std::move(value), now};
	}

	/**
	 * @brief Returns the cached value or computes, stores and returns a new one.
	 *
	 * @p compute runs without the lock held. Two callers that miss at the same
	 * time both compute; the later put wins.
	 */
	template <typename Compute>
	T getOrCompute(const std::string &key, Compute &&compute) {
		if (auto cached = get(key)) {
			return std::move(*cached);
		}
		T value = compute();
		put(key, value);
		return value;
	}

	/// Drops every entry built by key() for @p user. @return The number removed.
	std::size_t invalidateUser(const std::string &user) {
		const std::string prefix = encodeUser(user) + ":";
		std::lock_guard<std::mutex> lock(mutex_);
		std::size_t removed = 0;
		for (auto it = entries_.begin(); it != entries_.end();) {
			if (it->first.compare(0, prefix.size(), prefix) == 0) {
				it = entries_.erase(it);
				++removed;
			} else {
				++it;
			}
		}
		return removed;
	}

	void clear() {
		std::lock_guard<std::mutex> lock(mutex_);
		entries_.clear();
	}

	/// Entries held, including expired ones not yet looked up.
	std::size_t size() const {
		std::lock_guard<std::mutex> lock(mutex_);
		return entries_.size();
	}

	std::size_t hits() const {
		return hits_.load();
	}

	std::size_t misses() const {
		return misses_.load();
	}

	std::chrono::seconds ttl() const {
		return ttl_;
	}

private:
	struct Entry {
		T value;
		TimePoint stored;
	};

	std::chrono::seconds ttl_;
	NowFn now_;
	mutable std::mutex mutex_;
	std::unordered_map<std::string, Entry> entries_;
	std::atomic<std::size_t> hits_{0};
	std::atomic<std::size_t> misses_{0};
};

} // namespace finsight::service
