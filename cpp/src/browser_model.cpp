#include "browser_model.hpp"
#include "natkey.hpp"

#include <functional>

browser_page::browser_page(
	std::string title,
	const diff_tree& tree,
	const diff_tree& other
) : name(std::move(title)), tree(tree), other(other) {
	this->expanded.insert(&tree.root());
}

std::vector<browser_row> browser_page::rows() const {
	std::vector<browser_row> result;
	std::function<void(const entry&, std::size_t)> walk =
		[&] (const entry& node, std::size_t depth) {
			bool open = this->is_expanded(node);
			result.push_back(browser_row
				{ .node = &node
				, .depth = depth
				, .expanded = open
				, .shared = this->is_shared(node)
				, .count = this->visible_count(node)
				});
			if(!open) return;
			for(auto child : this->visible_children(node))
				walk(*child, depth + 1);
		};
	walk(this->tree.root(), 0);
	return result;
}

int browser_page::row_of(const entry& node) const {
	auto all = this->rows();
	for(std::size_t i = 0; i < all.size(); ++i)
		if(all[i].node == &node) return int(i);
	return -1;
}

bool browser_page::is_expanded(const entry& node) const {
	return node.is_directory() && this->expanded.count(&node);
}

bool browser_page::is_shared(const entry& node) const {
	return this->other.entry_at(node.path) != nullptr;
}

std::size_t browser_page::visible_count(const entry& node) const {
	auto cached = this->counts.find(&node);
	if(cached != this->counts.end()) return cached->second;
	std::size_t total = 0;
	if(node.is_leaf())
		total = 1;
	else
		for(auto child : this->visible_children(node))
			total += this->visible_count(*child);
	this->counts[&node] = total;
	return total;
}

std::vector<const entry*> browser_page::visible_children(const entry& node) const {
	std::vector<const entry*> result;
	for(auto child : node.children())
		if(!this->hidden.count(child))
			result.push_back(child);
	sort_for_display(result);
	return result;
}

const entry* browser_page::parent_of(const entry& node) const {
	if(node.path.empty()) return nullptr;
	auto slash = node.path.rfind('/');
	if(slash == std::string::npos) return &this->tree.root();
	return this->tree.entry_at(std::string_view(node.path).substr(0, slash));
}

const entry* browser_page::first_child_directory(const entry& node) const {
	for(auto child : this->visible_children(node))
		if(child->is_directory()) return child;
	return nullptr;
}

void browser_page::expand(const entry& node) {
	this->set_expanded(node, true, false);
}

void browser_page::collapse(const entry& node) {
	this->set_expanded(node, false, false);
}

void browser_page::toggle(const entry& node, bool recursive) {
	this->set_expanded(node, !this->is_expanded(node), recursive);
}

void browser_page::set_expanded(const entry& node, bool open, bool recursive) {
	if(!node.is_directory()) return;
	if(open)
		this->expanded.insert(&node);
	else
		this->expanded.erase(&node);
	if(!recursive) return;
	for(auto child : node.children())
		this->set_expanded(*child, open, true);
}

void browser_page::expand_to_depth(const entry& node, int depth) {
	if(depth < 1) {
		this->set_expanded(node, false, true);
		return;
	}
	this->set_expanded(node, true, false);
	for(auto child : node.children())
		this->expand_to_depth(*child, depth - 1);
}

void browser_page::hide(const entry& node) {
	if(&node == &this->tree.root()) return;
	this->hidden.insert(&node);
	this->counts.clear();
}

const entry& browser_page::reveal(std::string_view relpath) {
	const entry* node = &this->tree.root();
	for(const auto& part : split_path(relpath)) {
		auto next = node->child(part);
		if(next == nullptr || this->hidden.count(next)) break;
		this->expand(*node);
		node = next;
	}
	return *node;
}
