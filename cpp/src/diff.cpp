#include "diff.hpp"
#include "trace.hpp"

#include <ostream>

std::ostream& operator <<(std::ostream& out, match_status status) {
	switch(status) {
		case match_status::matched:             out << "matched";             break;
		case match_status::unmatched:           out << "unmatched";           break;
		case match_status::matched_by_path:     out << "matched_by_path";     break;
		case match_status::unmatched_collision: out << "unmatched_collision"; break;
	}
	return out;
}

bool is_matched(match_status status) {
	return status == match_status::matched
		|| status == match_status::matched_by_path;
}

match_status match_leaf(
	const directory_index& source,
	const entry& leaf,
	const directory_index& target
) {
	const auto& candidates =
		target.lookup_by_fingerprint(source.fingerprint_of(leaf));
	if(candidates.empty())
		return match_status::unmatched;
	if(candidates.size() == 1)
		return match_status::matched;
	for(auto candidate : candidates)
		if(candidate->path == leaf.path)
			return match_status::matched_by_path;
	return match_status::unmatched_collision;
}

namespace {

struct matcher {
	const directory_index& source;
	const directory_index& target;
	diff_tree_builder builder = {};
	std::size_t collisions = 0;

	void walk(const entry& node) {
		if(node.is_directory()) {
			for(auto child : this->source.children(node))
				this->walk(*child);
			return;
		}
		auto status = match_leaf(this->source, node, this->target);
		if(status == match_status::unmatched_collision)
			++this->collisions;
		if(!is_matched(status))
			this->builder.insert(node);
	}
};

}

diff_tree diff(const directory_index& source, const directory_index& target) {
	matcher match{ .source = source, .target = target };
	match.walk(source.root());
	auto result = std::move(match.builder).build();
	trace(now, "diff:", source.base_path(), "->", target.base_path(),
		"unmatched", result.leaf_count(result.root()),
		"unresolved collisions", match.collisions);
	return result;
}
