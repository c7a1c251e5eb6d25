#include "directory_index.hpp"

#include <algorithm>
#include <functional>

directory_index::directory_index(std::filesystem::path base)
	: base(std::move(base)), tree(entry::make_root()), buckets() { }

const std::vector<const entry*>& directory_index::lookup_by_fingerprint(
	fingerprint_t fp
) const {
	static const std::vector<const entry*> none;
	auto found = this->buckets.find(fp);
	if(found == this->buckets.end()) return none;
	return found->second;
}

fingerprint_t directory_index::fingerprint_of(const entry& leaf) const {
	return leaf.fingerprint();
}

const entry* directory_index::entry_at(std::string_view relpath) const {
	return find_entry(*this->tree, relpath);
}

std::vector<const entry*> directory_index::children(const entry& node) const {
	return node.children();
}

std::size_t directory_index::leaf_count() const {
	std::size_t count = 0;
	std::function<void(const entry&)> walk = [&] (const entry& node) {
		if(node.is_leaf()) { ++count; return; }
		for(auto child : node.children()) walk(*child);
	};
	walk(*this->tree);
	return count;
}

std::size_t directory_index::bucketed_leaf_count() const {
	std::size_t count = 0;
	for(const auto& [_, bucket] : this->buckets)
		count += bucket.size();
	return count;
}

std::vector<const entry*> directory_index::leaves() const {
	std::vector<const entry*> result;
	result.reserve(this->bucketed_leaf_count());
	for(const auto& [_, bucket] : this->buckets)
		result.insert(result.end(), bucket.begin(), bucket.end());
	std::sort(result.begin(), result.end(),
		[] (const entry* x, const entry* y) { return x->path < y->path; });
	return result;
}
