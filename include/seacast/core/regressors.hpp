#pragma once

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace seacast::core {

/**
 * @class RegressorSet
 * @brief Named scalar regressors, broadcast as constant columns over every row.
 *
 * Keeps insertion order so reports list regressors the way they were derived.
 */
class RegressorSet {
public:
	using Entry = std::pair<std::string, double>;

	/// Adds or replaces a regressor.
	void set(const std::string &name, double value) {
		for (auto &entry : entries_) {
			if (entry.first == name) {
				entry.second = value;
				return;
			}
		}
		entries_.emplace_back(name, value);
	}

	bool contains(const std::string &name) const {
		return find(name).has_value();
	}

	std::optional<double> find(const std::string &name) const {
		for (const auto &entry : entries_) {
			if (entry.first == name) {
				return entry.second;
			}
		}
		return std::nullopt;
	}

	double at(const std::string &name) const {
		const auto value = find(name);
		if (!value) {
			throw std::out_of_range("Regressor '" + name + "' not found.");
		}
		return *value;
	}

	std::vector<std::string> names() const {
		std::vector<std::string> result;
		result.reserve(entries_.size());
		for (const auto &entry : entries_) {
			result.push_back(entry.first);
		}
		return result;
	}

	const std::vector<Entry> &entries() const {
		return entries_;
	}

	/// The regressor as a column of @p rows identical values.
	std::vector<double> broadcast(const std::string &name, std::size_t rows) const {
		return std::vector<double>(rows, at(name));
	}

	std::size_t size() const {
		return entries_.size();
	}

	bool empty() const {
		return entries_.empty();
	}

private:
	std::vector<Entry> entries_;
};

/**
 * @struct DepthProfile
 * @brief Representative rows of the auxiliary depth table, ordered by depth.
 *
 * Only used downstream for depth-profile charts; forecasting never reads it.
 */
struct DepthProfile {
	struct Sample {
		std::optional<double> depth;
		std::optional<double> salinity;
		std::optional<double> ph;
		std::optional<double> chlorophyl;
	};

	std::vector<Sample> samples;
	std::size_t source_rows = 0;

	bool empty() const {
		return samples.empty();
	}
};

/**
 * @struct SeasonalityConfig
 * @brief Which seasonal components the forecasting model may learn.
 */
struct SeasonalityConfig {
	bool yearly = false;
	bool weekly = false;
	bool daily = false;

	bool operator==(const SeasonalityConfig &other) const {
		return yearly == other.yearly && weekly == other.weekly && daily == other.daily;
	}

	bool operator!=(const SeasonalityConfig &other) const {
		return !(*this == other);
	}
};

} // namespace seacast::core
