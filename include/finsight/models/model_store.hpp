#pragma once

#include "finsight/models/spending_predictor.hpp"

#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace finsight::models {

/**
 * @class IModelStore
 * @brief Keeps one trained SpendingPredictor per user.
 *
 * Implementations must be safe to call from several threads.
 */
class IModelStore {
public:
	using ModelPtr = std::shared_ptr<const SpendingPredictor>;

	virtual ~IModelStore() = default;

	/// Stores @p model for @p user, replacing any previous one.
	virtual void save(const std::string &user, const ModelPtr &model) = 0;

	/// The user's model, or nullptr when none is stored.
	virtual ModelPtr load(const std::string &user) const = 0;

	/// @return true when a model was removed.
	virtual bool erase(const std::string &user) = 0;
};

class InMemoryModelStore final : public IModelStore {
public:
	void save(const std::string &user, const ModelPtr &model) override;
	ModelPtr load(const std::string &user) const override;
	bool erase(const std::string &user) override;

private:
	mutable std::mutex mutex_;
	std::unordered_map<std::string, ModelPtr> models_;
};

/**
 * @class FileModelStore
 * @brief One text file per user under a directory, written with SpendingPredictor::save().
 *
 * User ids are percent-encoded into file names so any id maps to a single
 * file inside the directory.
 */
class FileModelStore final : public IModelStore {
public:
	/// Creates @p directory when it does not exist.
	/// @throws std::runtime_error If the directory cannot be created.
	explicit FileModelStore(std::filesystem::path directory);

	/// @throws std::runtime_error If the model file cannot be written.
	void save(const std::string &user, const ModelPtr &model) override;

	/// @throws std::runtime_error If a stored file cannot be parsed.
	ModelPtr load(const std::string &user) const override;

	bool erase(const std::string &user) override;

	std::filesystem::path pathFor(const std::string &user) const;

private:
	std::filesystem::path directory_;
	mutable std::mutex mutex_;
};

} // namespace finsight::models
