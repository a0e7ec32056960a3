#include "seacast/utils/fingerprint.hpp"

#include <array>
#include <fstream>
#include <stdexcept>

namespace seacast::utils {

Fingerprint &Fingerprint::update(const void *data, std::size_t length) {
	const auto *bytes = static_cast<const unsigned char *>(data);
	for (std::size_t i = 0; i < length; ++i) {
		state_ ^= static_cast<std::uint64_t>(bytes[i]);
		state_ *= kPrime;
	}
	return *this;
}

Fingerprint &Fingerprint::update(const std::string &text) {
	update(text.data(), text.size());
	// Length separator keeps ("ab","c") and ("a","bc") apart.
	const std::uint64_t length = text.size();
	return update(&length, sizeof(length));
}

Fingerprint &Fingerprint::updateFromFile(const std::string &path) {
	std::ifstream in(path, std::ios::binary);
	if (!in) {
		throw std::runtime_error("Cannot open '" + path + "' for fingerprinting.");
	}
	std::array<char, 8192> buffer{};
	while (in) {
		in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
		const auto got = in.gcount();
		if (got > 0) {
			update(buffer.data(), static_cast<std::size_t>(got));
		}
	}
	if (in.bad()) {
		throw std::runtime_error("I/O error while fingerprinting '" + path + "'.");
	}
	return *this;
}

std::string Fingerprint::hex() const {
	static const char digits[] = "0123456789abcdef";
	std::string out(16, '0');
	std::uint64_t v = state_;
	for (int i = 15; i >= 0; --i) {
		out[static_cast<std::size_t>(i)] = digits[v & 0xF];
		v >>= 4;
	}
	return out;
}

} // namespace seacast::utils
