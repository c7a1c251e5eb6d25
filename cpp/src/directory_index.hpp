#pragma once

#include "entry.hpp"

#include <filesystem>
#include <memory>
#include <string_view>
#include <unordered_map>
#include <vector>

// The frozen result of one scan: the entry tree of a root directory and
// its leaves bucketed by fingerprint. Only a scanner fills it in.
struct directory_index {
	directory_index(directory_index&&) = default;
	directory_index& operator =(directory_index&&) = default;

	const std::filesystem::path& base_path() const { return this->base; }
	const entry& root() const { return *this->tree; }

	// Empty when no leaf carries fp.
	const std::vector<const entry*>& lookup_by_fingerprint(fingerprint_t fp) const;
	// Throws internal_consistency_error for a directory.
	fingerprint_t fingerprint_of(const entry& leaf) const;
	const entry* entry_at(std::string_view relpath) const;
	std::vector<const entry*> children(const entry& node) const;

	std::size_t leaf_count() const;
	std::size_t bucketed_leaf_count() const;
	std::size_t bucket_count() const { return this->buckets.size(); }
	// Every leaf, ordered by path.
	std::vector<const entry*> leaves() const;

	private:
	friend struct scanner;

	explicit directory_index(std::filesystem::path base);

	std::filesystem::path base;
	std::unique_ptr<entry> tree;
	std::unordered_map<fingerprint_t, std::vector<const entry*>> buckets;
};
