#pragma once

#include "entry.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

// Sparse tree of the unmatched leaves of one comparison direction, with
// only the directories needed to reach them.
struct diff_tree {
	diff_tree(diff_tree&&) = default;
	diff_tree& operator =(diff_tree&&) = default;

	const entry& root() const { return *this->tree; }
	bool empty() const { return this->root().children().empty(); }

	std::vector<std::string> list(const entry& node) const { return node.list(); }
	const entry* child(const entry& node, const std::string& name) const {
		return node.child(name);
	}
	const std::string& path(const entry& node) const { return node.path; }
	const entry* entry_at(std::string_view relpath) const;

	// Unmatched leaves at or below node.
	std::size_t leaf_count(const entry& node) const;
	// Every unmatched leaf path, depth first, names in order.
	std::vector<std::string> leaf_paths() const;

	private:
	friend struct diff_tree_builder;

	diff_tree();

	std::unique_ptr<entry> tree;
	std::unordered_map<const entry*, std::size_t> counts;
};

struct diff_tree_builder {
	diff_tree_builder() = default;

	// Adds leaf at its source path, creating missing ancestor directories.
	void insert(const entry& leaf);
	diff_tree build() &&;

	private:
	diff_tree result;
};
