#pragma once

#include "seacast/core/timestamp.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace seacast::core {

/**
 * @class Frequency
 * @brief Sampling cadence of a series: a fixed duration or a calendar month step.
 *
 * Renders as a pandas-style offset alias ("D", "W", "H", "MS", "QS", ...), which is
 * what the diagnostics report as the inferred frequency.
 */
class Frequency {
public:
	enum class Kind { Fixed, Monthly };

	static Frequency fixed(std::chrono::seconds step);
	static Frequency months(int step, bool month_end);
	static Frequency daily() {
		return fixed(std::chrono::hours(24));
	}

	/**
	 * @brief Infers the cadence of sorted, unique timestamps.
	 *
	 * Needs at least three timestamps. Either every gap is identical (a whole number of
	 * seconds), or every timestamp is a midnight on the first (or last) day of the month
	 * and the month gap is constant. Anything else yields std::nullopt.
	 */
	static std::optional<Frequency> infer(const std::vector<TimePoint> &timestamps);

	Kind kind() const {
		return kind_;
	}

	std::chrono::seconds fixedStep() const {
		return fixed_step_;
	}

	int monthStep() const {
		return month_step_;
	}

	bool monthEnd() const {
		return month_end_;
	}

	std::string code() const;

	/// Moves @p tp forward by @p steps periods. Throws std::out_of_range past the TimePoint range.
	TimePoint advance(const TimePoint &tp, std::int64_t steps) const;

	/// The @p periods timestamps following @p last.
	std::vector<TimePoint> following(const TimePoint &last, std::size_t periods) const;

	bool operator==(const Frequency &other) const {
		return kind_ == other.kind_ && fixed_step_ == other.fixed_step_ && month_step_ == other.month_step_ &&
		       month_end_ == other.month_end_;
	}

	bool operator!=(const Frequency &other) const {
		return !(*this == other);
	}

private:
	Frequency() = default;

	Kind kind_ = Kind::Fixed;
	std::chrono::seconds fixed_step_{86400};
	int month_step_ = 0;
	bool month_end_ = false;
};

} // namespace seacast::core
