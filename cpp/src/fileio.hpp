#pragma once

#include "fingerprint.hpp"

#include <filesystem>
#include <string>
#include <vector>

struct dir_child {
	std::string name;
	bool is_dir;
};

// Lists path without following symlinks: a link to a directory is a leaf.
// Throws filesystem_access_error.
std::vector<dir_child> list_directory(const std::filesystem::path& path);

// lstat of base / relpath. Throws filesystem_access_error.
leaf_metadata read_leaf_metadata(
	const std::filesystem::path& base,
	const std::string& relpath
);
