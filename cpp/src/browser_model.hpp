#pragma once

#include "diff_tree.hpp"

#include <cstddef>
#include <set>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

struct browser_row {
	const entry* node;
	std::size_t depth;
	bool expanded;
	// the same path is unmatched in the other direction as well
	bool shared;
	// unmatched leaves below a directory that are not hidden
	std::size_t count;
};

// Expansion and visibility state of one diff tree in the browser. The
// entries themselves belong to the tree and are never changed.
struct browser_page {
	browser_page(std::string title, const diff_tree& tree, const diff_tree& other);

	const std::string& title() const { return this->name; }
	const entry& root() const { return this->tree.root(); }

	// Visible rows, root first, directories before files.
	std::vector<browser_row> rows() const;
	int row_of(const entry& node) const;

	bool is_expanded(const entry& node) const;
	bool is_shared(const entry& node) const;
	std::size_t visible_count(const entry& node) const;
	std::vector<const entry*> visible_children(const entry& node) const;
	const entry* parent_of(const entry& node) const;
	const entry* first_child_directory(const entry& node) const;

	void expand(const entry& node);
	void collapse(const entry& node);
	// Expands or collapses node and, when recursive, its whole subtree.
	void toggle(const entry& node, bool recursive);
	void expand_to_depth(const entry& node, int depth);
	// Removes node from view; the root cannot be hidden.
	void hide(const entry& node);
	// Expands the directories along relpath and returns the deepest one
	// still visible on this page.
	const entry& reveal(std::string_view relpath);

	private:
	void set_expanded(const entry& node, bool expanded, bool recursive);

	std::string name;
	const diff_tree& tree;
	const diff_tree& other;
	std::set<const entry*> expanded;
	std::set<const entry*> hidden;
	mutable std::unordered_map<const entry*, std::size_t> counts;
};
