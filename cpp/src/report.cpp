#include "report.hpp"

#include <functional>
#include <ostream>

void print_diff(std::ostream& out, const std::string& title, const diff_tree& diff) {
	out << "========== Only in " << title << " ==========\n";
	std::function<void(const entry&)> walk = [&] (const entry& node) {
		if(node.is_leaf()) {
			out << diff.path(node) << '\n';
			return;
		}
		for(const auto& name : diff.list(node))
			walk(*diff.child(node, name));
	};
	walk(diff.root());
}

void print_debug(std::ostream& out, const std::string& title, const directory_index& index) {
	out << "========== Debug for " << title << " ==========\n";
	for(auto leaf : index.leaves())
		out << leaf->path << ' ' << index.fingerprint_of(*leaf) << '\n';
}

std::ostream& operator <<(std::ostream& out, entry_status status) {
	switch(status) {
		case entry_status::matched:         out << ' '; break;
		case entry_status::unmatched:       out << '-'; break;
		case entry_status::clean_directory: out << ' '; break;
		case entry_status::dirty_directory: out << '*'; break;
	}
	return out;
}

entry_status classify(const entry& node, const diff_tree& diff) {
	bool present = diff.entry_at(node.path) != nullptr;
	if(node.is_directory()) {
		bool dirty = node.path.empty() ? !diff.empty() : present;
		return dirty ? entry_status::dirty_directory : entry_status::clean_directory;
	}
	return present ? entry_status::unmatched : entry_status::matched;
}

void print_annotated(
	std::ostream& out,
	const std::string& title,
	const directory_index& index,
	const diff_tree& diff
) {
	out << "========== Annotated " << title << " ==========\n";
	std::function<void(const entry&, std::size_t)> walk =
		[&] (const entry& node, std::size_t depth) {
			for(auto child : index.children(node)) {
				out << classify(*child, diff) << ' '
					<< std::string(2 * depth, ' ') << child->name
					<< (child->is_directory() ? "/" : "") << '\n';
				if(child->is_directory())
					walk(*child, depth + 1);
			}
		};
	walk(index.root(), 0);
}
