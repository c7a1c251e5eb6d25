#include "entry.hpp"
#include "errors.hpp"

#include <algorithm>
#include <ostream>

#include <boost/algorithm/string.hpp>

std::ostream& operator <<(std::ostream& out, entry_kind kind) {
	switch(kind) {
		case entry_kind::directory: out << "directory"; break;
		case entry_kind::leaf:      out << "leaf";      break;
	}
	return out;
}

std::unique_ptr<entry> entry::make_root() {
	return std::unique_ptr<entry>(new entry
		{ .name = ""
		, .path = ""
		, .data = directory_data{}
		});
}

entry_kind entry::kind() const {
	return std::holds_alternative<directory_data>(this->data)
		? entry_kind::directory : entry_kind::leaf;
}

fingerprint_t entry::fingerprint() const {
	auto leaf = std::get_if<leaf_data>(&this->data);
	if(leaf == nullptr)
		throw internal_consistency_error(
			"fingerprint requested for directory '" + this->path + "'");
	return leaf->fingerprint;
}

entry::directory_data& entry::directory() {
	auto dir = std::get_if<directory_data>(&this->data);
	if(dir == nullptr)
		throw internal_consistency_error(
			"leaf '" + this->path + "' cannot have children");
	return *dir;
}

const entry::directory_data& entry::directory() const {
	auto dir = std::get_if<directory_data>(&this->data);
	if(dir == nullptr)
		throw internal_consistency_error(
			"leaf '" + this->path + "' cannot have children");
	return *dir;
}

const entry* entry::child(const std::string& name) const {
	auto dir = std::get_if<directory_data>(&this->data);
	if(dir == nullptr) return nullptr;
	auto found = dir->children.find(name);
	if(found == dir->children.end()) return nullptr;
	return found->second.get();
}

std::vector<std::string> entry::list() const {
	std::vector<std::string> names;
	auto dir = std::get_if<directory_data>(&this->data);
	if(dir == nullptr) return names;
	names.reserve(dir->children.size());
	for(const auto& [name, _] : dir->children)
		names.push_back(name);
	return names;
}

std::vector<const entry*> entry::children() const {
	std::vector<const entry*> nodes;
	auto dir = std::get_if<directory_data>(&this->data);
	if(dir == nullptr) return nodes;
	nodes.reserve(dir->children.size());
	for(const auto& [_, node] : dir->children)
		nodes.push_back(node.get());
	return nodes;
}

entry& entry::adopt(std::unique_ptr<entry> node) {
	auto& children = this->directory().children;
	auto [it, inserted] = children.emplace(node->name, std::move(node));
	if(!inserted)
		throw internal_consistency_error(
			"duplicate entry '" + it->second->path + "'");
	return *it->second;
}

entry& entry::add_directory(const std::string& name) {
	return this->adopt(std::unique_ptr<entry>(new entry
		{ .name = name
		, .path = join_path(this->path, name)
		, .data = directory_data{}
		}));
}

entry& entry::add_leaf(const std::string& name, fingerprint_t fingerprint) {
	return this->adopt(std::unique_ptr<entry>(new entry
		{ .name = name
		, .path = join_path(this->path, name)
		, .data = leaf_data{ .fingerprint = fingerprint }
		}));
}

entry& entry::ensure_directory(const std::string& name) {
	auto& children = this->directory().children;
	auto found = children.find(name);
	if(found == children.end())
		return this->add_directory(name);
	if(!found->second->is_directory())
		throw internal_consistency_error(
			"leaf '" + found->second->path + "' cannot have children");
	return *found->second;
}

std::string join_path(std::string_view parent, std::string_view name) {
	if(parent.empty()) return std::string(name);
	std::string path;
	path.reserve(parent.size() + 1 + name.size());
	path.append(parent).append("/").append(name);
	return path;
}

std::vector<std::string> split_path(std::string_view path) {
	std::vector<std::string> parts;
	std::string joined(path);
	boost::split(parts, joined, boost::is_any_of("/"));
	parts.erase(std::remove(parts.begin(), parts.end(), ""), parts.end());
	return parts;
}

const entry* find_entry(const entry& root, std::string_view path) {
	const entry* node = &root;
	for(const auto& part : split_path(path)) {
		node = node->child(part);
		if(node == nullptr) return nullptr;
	}
	return node;
}
