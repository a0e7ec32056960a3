#pragma once

#include "seacast/core/raw_table.hpp"
#include "seacast/core/regressors.hpp"
#include "seacast/io/delimited_reader.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace seacast::pipeline {

struct SynthesisResult {
	core::RegressorSet regressors;
	std::optional<core::DepthProfile> profile;
};

/**
 * @class RegressorSynthesizer
 * @brief Derives scalar regressors from an auxiliary depth-profile table.
 *
 * Each of Salinity, pH and Chlorophyl present in the table yields its column mean as
 * mean_salinity, mean_ph and mean_chlorophyl. A depth-ordered sample of at most
 * kMaxSamples rows is kept as the DepthProfile.
 */
class RegressorSynthesizer {
public:
	static constexpr std::size_t kMaxSamples = 20;

	/// Replaces spaces and periods in a header with underscores.
	static std::string normalizeColumnName(const std::string &name);

	/// floor(i * (rows - 1) / (k - 1)) for i in [0, k), k = min(max_samples, rows).
	static std::vector<std::size_t> sampleIndices(std::size_t rows, std::size_t max_samples = kMaxSamples);

	/**
	 * @brief Derives the regressors and the depth profile.
	 * @throws RegressorSynthesisFailure When there is no Depth column, no row or no usable parameter.
	 */
	static SynthesisResult synthesizeStrict(const core::RawTable &table);

	/// Like synthesizeStrict but logs any failure and returns an empty result.
	static SynthesisResult synthesize(const core::RawTable &table);

	/// Reads the table first; unreadable files are handled like any other failure.
	static SynthesisResult synthesizeFromFile(const std::string &path, const io::ReadOptions &options = {});
};

} // namespace seacast::pipeline
