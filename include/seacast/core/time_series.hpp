#pragma once

#include "seacast/core/frequency.hpp"
#include "seacast/core/timestamp.hpp"

#include <chrono>
#include <cmath>
#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace seacast::core {

/**
 * @class TimeSeries
 * @brief The canonical (timestamp, value) series every pipeline stage works on.
 *
 * Timestamps and values live in separate vectors for cache-efficient numerical
 * processing. Construction enforces the canonical invariants: equal lengths,
 * strictly increasing timestamps and finite values.
 */
class TimeSeries {
public:
	using TimePoint = core::TimePoint;
	using Value = double;
	using Metadata = std::unordered_map<std::string, std::string>;

	/**
	 * @brief Constructs a TimeSeries object.
	 * @param timestamps A vector of strictly increasing time points.
	 * @param values A vector of corresponding finite values.
	 * @param label Name of the measured quantity (the target column).
	 * @throws std::invalid_argument If the sizes differ, timestamps are not strictly
	 *         increasing or a value is not finite.
	 */
	TimeSeries(std::vector<TimePoint> timestamps, std::vector<Value> values, std::string label = {})
	    : timestamps_(std::move(timestamps)), values_(std::move(values)), label_(std::move(label)) {
		if (timestamps_.size() != values_.size()) {
			throw std::invalid_argument("Timestamps and values vectors must have the same size.");
		}
		validateTimestampOrder();
		for (double v : values_) {
			if (!std::isfinite(v)) {
				throw std::invalid_argument("TimeSeries values must be finite.");
			}
		}
	}

	const std::vector<TimePoint> &getTimestamps() const {
		return timestamps_;
	}

	const std::vector<Value> &getValues() const {
		return values_;
	}

	size_t size() const {
		return timestamps_.size();
	}

	bool isEmpty() const {
		return size() == 0;
	}

	const std::string &label() const {
		return label_;
	}

	void setLabel(std::string label) {
		label_ = std::move(label);
	}

	const Metadata &metadata() const {
		return metadata_;
	}

	void setMetadata(Metadata metadata) {
		metadata_ = std::move(metadata);
	}

	const TimePoint &front() const {
		if (isEmpty()) {
			throw std::out_of_range("TimeSeries is empty.");
		}
		return timestamps_.front();
	}

	const TimePoint &back() const {
		if (isEmpty()) {
			throw std::out_of_range("TimeSeries is empty.");
		}
		return timestamps_.back();
	}

	/**
	 * @brief Time covered by the series, max(ds) - min(ds). Zero for fewer than two points.
	 */
	std::chrono::nanoseconds span() const {
		if (size() < 2) {
			return std::chrono::nanoseconds::zero();
		}
		return std::chrono::duration_cast<std::chrono::nanoseconds>(timestamps_.back() - timestamps_.front());
	}

	const std::optional<Frequency> &frequency() const {
		return frequency_;
	}

	void setFrequency(Frequency frequency) {
		frequency_ = std::move(frequency);
	}

	void clearFrequency() {
		frequency_.reset();
	}

	/// Infers and stores the cadence; returns false (and clears it) when inference fails.
	bool setFrequencyFromTimestamps() {
		frequency_ = Frequency::infer(timestamps_);
		return frequency_.has_value();
	}

	/// The inferred cadence, or daily when none was inferred.
	Frequency effectiveFrequency() const {
		return frequency_ ? *frequency_ : Frequency::daily();
	}

	TimeSeries slice(std::size_t start, std::size_t end) const {
		if (start > end) {
			throw std::invalid_argument("Slice start index must not exceed end index.");
		}
		if (end > size()) {
			throw std::out_of_range("Slice end index exceeds the length of the time series.");
		}

		std::vector<TimePoint> sliced_timestamps(timestamps_.begin() + static_cast<std::ptrdiff_t>(start),
		                                         timestamps_.begin() + static_cast<std::ptrdiff_t>(end));
		std::vector<Value> sliced_values(values_.begin() + static_cast<std::ptrdiff_t>(start),
		                                 values_.begin() + static_cast<std::ptrdiff_t>(end));

		TimeSeries result(std::move(sliced_timestamps), std::move(sliced_values), label_);
		result.metadata_ = metadata_;
		result.frequency_ = frequency_;
		return result;
	}

	bool operator==(const TimeSeries &other) const {
		return timestamps_ == other.timestamps_ && values_ == other.values_;
	}

	bool operator!=(const TimeSeries &other) const {
		return !(*this == other);
	}

private:
	void validateTimestampOrder() const {
		for (std::size_t i = 1; i < timestamps_.size(); ++i) {
			if (!(timestamps_[i] > timestamps_[i - 1])) {
				throw std::invalid_argument("TimeSeries timestamps must be strictly increasing and unique.");
			}
		}
	}

	std::vector<TimePoint> timestamps_;
	std::vector<Value> values_;
	std::string label_;
	Metadata metadata_;
	std::optional<Frequency> frequency_;
};

} // namespace seacast::core
