#include "seacast/pipeline/model_registry.hpp"

#include "seacast/utils/logging.hpp"

#include <stdexcept>
#include <utility>

namespace seacast::pipeline {

ModelRegistry::ModelPtr ModelRegistry::getOrFit(const ModelKey &key, const FitFunction &fit) {
	if (auto cached = find(key)) {
		SEACAST_DEBUG("Model registry hit for {}.", key.toString());
		return cached;
	}

	auto model = fit();
	if (!model) {
		throw std::runtime_error("Model registry fit function returned no model for " + key.toString());
	}

	std::lock_guard<std::mutex> lock(mutex_);
	const auto inserted = models_.emplace(key, std::move(model));
	SEACAST_DEBUG("Model registry {} {}.", inserted.second ? "stored" : "kept existing", key.toString());
	return inserted.first->second;
}

ModelRegistry::ModelPtr ModelRegistry::find(const ModelKey &key) const {
	std::lock_guard<std::mutex> lock(mutex_);
	const auto it = models_.find(key);
	return it == models_.end() ? nullptr : it->second;
}

std::size_t ModelRegistry::invalidate(const std::string &fingerprint) {
	std::lock_guard<std::mutex> lock(mutex_);
	std::size_t removed = 0;
	for (auto it = models_.begin(); it != models_.end();) {
		if (it->first.fingerprint == fingerprint) {
			it = models_.erase(it);
			++removed;
		} else {
			++it;
		}
	}
	return removed;
}

void ModelRegistry::clear() {
	std::lock_guard<std::mutex> lock(mutex_);
	models_.clear();
}

std::size_t ModelRegistry::size() const {
	std::lock_guard<std::mutex> lock(mutex_);
	return models_.size();
}

ModelRegistry::ModelPtr fitModel(const models::ForecasterFactory &factory, const core::SeasonalityConfig &seasonality,
                                 const core::TimeSeries &history, const core::RegressorSet &regressors,
                                 const RegistryBinding &binding, const std::string &role) {
	if (!factory) {
		throw std::invalid_argument("No forecaster factory configured.");
	}
	const auto fit = [&]() -> ModelRegistry::ModelPtr {
		auto model = factory(seasonality);
		if (!model) {
			throw std::invalid_argument("Forecaster factory returned no model.");
		}
		model->fit(history, regressors);
		return ModelRegistry::ModelPtr(std::move(model));
	};
	if (!binding.enabled()) {
		return fit();
	}
	return binding.registry->getOrFit(ModelKey{binding.fingerprint, role}, fit);
}

} // namespace seacast::pipeline
