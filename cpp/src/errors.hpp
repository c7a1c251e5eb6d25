#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>
#include <system_error>

// bad roots or worker counts, raised before any scanning starts
struct configuration_error : public std::invalid_argument {
	using std::invalid_argument::invalid_argument;
};

// a listing or lstat failed mid-scan, aborts the whole run
struct filesystem_access_error : public std::filesystem::filesystem_error {
	filesystem_access_error(
		const std::string& what,
		const std::filesystem::path& path,
		std::error_code code
	);
};

// a scan stopped early because another scan of the same run failed
struct scan_cancelled : public std::runtime_error {
	using std::runtime_error::runtime_error;
};

// a defect in tree construction, never an external condition
struct internal_consistency_error : public std::logic_error {
	using std::logic_error::logic_error;
};
