#include "diff_tree.hpp"
#include "errors.hpp"

#include <functional>

diff_tree::diff_tree() : tree(entry::make_root()), counts() { }

const entry* diff_tree::entry_at(std::string_view relpath) const {
	return find_entry(*this->tree, relpath);
}

std::size_t diff_tree::leaf_count(const entry& node) const {
	auto found = this->counts.find(&node);
	if(found == this->counts.end())
		throw internal_consistency_error(
			"entry '" + node.path + "' is not part of this diff");
	return found->second;
}

std::vector<std::string> diff_tree::leaf_paths() const {
	std::vector<std::string> paths;
	std::function<void(const entry&)> walk = [&] (const entry& node) {
		if(node.is_leaf()) { paths.push_back(node.path); return; }
		for(auto child : node.children()) walk(*child);
	};
	walk(*this->tree);
	return paths;
}

void diff_tree_builder::insert(const entry& leaf) {
	auto parts = split_path(leaf.path);
	if(parts.empty())
		throw internal_consistency_error("cannot insert the root as a leaf");
	entry* node = this->result.tree.get();
	for(std::size_t i = 0; i + 1 < parts.size(); ++i)
		node = &node->ensure_directory(parts[i]);
	node->add_leaf(parts.back(), leaf.fingerprint());
}

diff_tree diff_tree_builder::build() && {
	auto& counts = this->result.counts;
	std::function<std::size_t(const entry&)> count = [&] (const entry& node) {
		std::size_t total = node.is_leaf() ? 1 : 0;
		for(auto child : node.children()) total += count(*child);
		counts[&node] = total;
		return total;
	};
	count(*this->result.tree);
	return std::move(this->result);
}
