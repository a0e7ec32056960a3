#pragma once

#include "seacast/core/raw_table.hpp"
#include "seacast/core/time_series.hpp"
#include "seacast/pipeline/schema_detector.hpp"

namespace seacast::pipeline {

/**
 * @class FramePreparer
 * @brief Turns the resolved columns of a raw table into the canonical series.
 *
 * Invalid timestamps and values become nulls and their rows are dropped. The rest is
 * sorted, duplicate timestamps are averaged and the cadence is inferred (it may stay
 * unknown). The result carries the target name as label and the row counts as metadata
 * ("rows_read", "rows_kept", "duplicates_collapsed").
 */
class FramePreparer {
public:
	/**
	 * @throws DataPreparationError When a column is missing or no usable row remains.
	 */
	static core::TimeSeries prepare(const core::RawTable &table, const ResolvedSchema &schema);

	/// Re-applies the cleaning steps to an existing series; a prepared series comes back unchanged.
	static core::TimeSeries prepare(const core::TimeSeries &series);
};

} // namespace seacast::pipeline
