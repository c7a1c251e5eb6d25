#pragma once

#include "fingerprint.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <variant>

struct app_options {
	std::filesystem::path left;
	std::filesystem::path right;
	attribute_config attributes = {};
	int workers = 6;
	bool text = false;
	bool annotate = false;
	bool file_count = true;
	bool debug = false;
	std::optional<std::uint64_t> seed = std::nullopt;
};

// Either the parsed options or the exit status to leave with (help, usage
// errors).
std::variant<int,app_options> get_opts(int argc, const char* argv[]);
