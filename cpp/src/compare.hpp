#pragma once

#include "diff.hpp"
#include "diff_tree.hpp"
#include "directory_index.hpp"
#include "opts.hpp"
#include "scanner.hpp"

#include <cstdint>
#include <filesystem>
#include <ostream>

struct comparison {
	directory_index left;
	directory_index right;
	diff_tree only_left;
	diff_tree only_right;
};

// Throws configuration_error for a bad worker count or root.
scan_options scan_options_for(
	const app_options& opts,
	const std::filesystem::path& root,
	std::uint64_t seed
);

// Scans both roots at once, then diffs them both ways. Progress goes to
// log. When one scan fails the other is stopped and the failure rethrown.
comparison compare(const app_options& opts, std::ostream& log);

// The whole run after option parsing: compare, then browse or print the
// text report to out. Errors are reported to err; returns the exit code.
int run(const app_options& opts, std::ostream& out, std::ostream& err);
