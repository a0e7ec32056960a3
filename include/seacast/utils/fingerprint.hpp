#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace seacast::utils {

/**
 * @class Fingerprint
 * @brief Incremental 64-bit FNV-1a hash used to key cached models by input content.
 */
class Fingerprint {
public:
	Fingerprint &update(const void *data, std::size_t length);
	Fingerprint &update(const std::string &text);

	/// Hashes the whole content of a file.
	/// @throws std::runtime_error If the file cannot be read.
	Fingerprint &updateFromFile(const std::string &path);

	std::uint64_t value() const {
		return state_;
	}

	/// 16 lower-case hex digits.
	std::string hex() const;

private:
	static constexpr std::uint64_t kOffsetBasis = 14695981039346656037ULL;
	static constexpr std::uint64_t kPrime = 1099511628211ULL;

	std::uint64_t state_ = kOffsetBasis;
};

} // namespace seacast::utils
