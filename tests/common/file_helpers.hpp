#pragma once

#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

namespace tests::helpers {

/// Temporary directory removed when the object goes out of scope.
class TempDir {
public:
	TempDir() {
		static int counter = 0;
		const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
		path_ = std::filesystem::temp_directory_path() /
		        ("seacast_test_" + std::to_string(stamp) + "_" + std::to_string(counter++));
		std::filesystem::create_directories(path_);
	}

	~TempDir() {
		std::error_code ec;
		std::filesystem::remove_all(path_, ec);
	}

	TempDir(const TempDir &) = delete;
	TempDir &operator=(const TempDir &) = delete;

	std::string file(const std::string &name) const {
		return (path_ / name).string();
	}

	std::string write(const std::string &name, const std::string &content) const {
		const auto target = file(name);
		std::ofstream out(target, std::ios::binary);
		out << content;
		return target;
	}

private:
	std::filesystem::path path_;
};

inline std::string readFile(const std::string &path) {
	std::ifstream in(path, std::ios::binary);
	std::ostringstream buffer;
	buffer << in.rdbuf();
	return buffer.str();
}

} // namespace tests::helpers
