#pragma once

#include "seacast/models/iforecaster.hpp"

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <tuple>

namespace seacast::pipeline {

/// Identifies a fitted model: the content fingerprint of a request plus the model's role.
struct ModelKey {
	std::string fingerprint;
	std::string role;

	std::string toString() const {
		return fingerprint + ":" + role;
	}

	bool operator<(const ModelKey &other) const {
		return std::tie(fingerprint, role) < std::tie(other.fingerprint, other.role);
	}

	bool operator==(const ModelKey &other) const {
		return fingerprint == other.fingerprint && role == other.role;
	}
};

/**
 * @class ModelRegistry
 * @brief Caller-owned cache of fitted models, shared across requests.
 *
 * Thread-safe. Fitting happens outside the lock; when two callers race on the same key
 * the first stored model wins and both receive it.
 */
class ModelRegistry {
public:
	using ModelPtr = std::shared_ptr<const models::IForecaster>;
	using FitFunction = std::function<ModelPtr()>;

	static constexpr const char *kHoldoutRole = "holdout";
	static constexpr const char *kFullRole = "full";

	/// Returns the cached model, fitting and storing it on first use.
	ModelPtr getOrFit(const ModelKey &key, const FitFunction &fit);

	/// The cached model, or nullptr.
	ModelPtr find(const ModelKey &key) const;

	/// Drops every role cached for @p fingerprint; returns how many models were removed.
	std::size_t invalidate(const std::string &fingerprint);

	void clear();

	std::size_t size() const;

private:
	mutable std::mutex mutex_;
	std::map<ModelKey, ModelPtr> models_;
};

/// Where a pipeline stage should look up and store its fitted model.
struct RegistryBinding {
	ModelRegistry *registry = nullptr;
	std::string fingerprint;

	bool enabled() const {
		return registry != nullptr && !fingerprint.empty();
	}
};

/**
 * @brief Fits a fresh model on @p history, or reuses the one bound under @p role.
 * @throws std::invalid_argument If @p factory is empty or yields no model.
 * Exceptions from the model itself propagate unchanged.
 */
ModelRegistry::ModelPtr fitModel(const models::ForecasterFactory &factory, const core::SeasonalityConfig &seasonality,
                                 const core::TimeSeries &history, const core::RegressorSet &regressors,
                                 const RegistryBinding &binding, const std::string &role);

} // namespace seacast::pipeline
