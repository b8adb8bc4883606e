#include "finsight/models/model_store.hpp"

#include "finsight/utils/logging.hpp"

#include <cctype>
#include <cstdio>
#include <fstream>
#include <stdexcept>
#include <system_error>

namespace finsight::models {

// --- InMemoryModelStore ---

void InMemoryModelStore::save(const std::string &user, const ModelPtr &model) {
	if (!model) {
		throw std::invalid_argument("Cannot store a null model.");
	}
	std::lock_guard<std::mutex> lock(mutex_);
	models_[user] = model;
}

IModelStore::ModelPtr InMemoryModelStore::load(const std::string &user) const {
	std::lock_guard<std::mutex> lock(mutex_);
	const auto it = models_.find(user);
	return it == models_.end() ? nullptr : it->second;
}

bool InMemoryModelStore::erase(const std::string &user) {
	std::lock_guard<std::mutex> lock(mutex_);
	return models_.erase(user) > 0;
}

// --- FileModelStore ---

FileModelStore::FileModelStore(std::filesystem::path directory) : directory_(std::move(directory)) {
	std::error_code ec;
	std::filesystem::create_directories(directory_, ec);
	if (ec) {
		throw std::runtime_error("Cannot create model directory '" + directory_.string() + "': " + ec.message());
	}
}

std::filesystem::path FileModelStore::pathFor(const std::string &user) const {
	std::string name;
	for (unsigned char c : user) {
		if (std::isalnum(c) || c == '-' || c == '_') {
			name.push_back(static_cast<char>(c));
		} else {
			char encoded[4];
			std::snprintf(encoded, sizeof(encoded), "%%%02X", c);
			name += encoded;
		}
	}
	if (name.empty()) {
		name = "%";
	}
	return directory_ / (name + ".model");
}

void FileModelStore::save(const std::string &user, const ModelPtr &model) {
	if (!model) {
		throw std::invalid_argument("Cannot store a null model.");
	}
	const auto path = pathFor(user);
	const auto staging = path.string() + ".tmp";

	std::lock_guard<std::mutex> lock(mutex_);
	{
		std::ofstream out(staging, std::ios::trunc);
		if (!out) {
			throw std::runtime_error("Cannot open '" + staging + "' for writing.");
		}
		model->save(out);
		out.flush();
		if (!out) {
			throw std::runtime_error("Failed writing model file '" + staging + "'.");
		}
	}
	std::error_code ec;
	std::filesystem::rename(staging, path, ec);
	if (ec) {
		throw std::runtime_error("Cannot move model file into place at '" + path.string() + "': " + ec.message());
	}
	FINSIGHT_DEBUG("Stored model for user '{}' at {}.", user, path.string());
}

IModelStore::ModelPtr FileModelStore::load(const std::string &user) const {
	const auto path = pathFor(user);
	std::lock_guard<std::mutex> lock(mutex_);
	std::ifstream in(path);
	if (!in) {
		return nullptr;
	}
	return SpendingPredictor::load(in);
}

bool FileModelStore::erase(const std::string &user) {
	std::lock_guard<std::mutex> lock(mutex_);
	std::error_code ec;
	const bool removed = std::filesystem::remove(pathFor(user), ec);
	if (ec) {
		FINSIGHT_WARN("Cannot remove model file for user '{}': {}", user, ec.message());
		return false;
	}
	return removed;
}

} // namespace finsight::models
