#pragma once

#include <cstdint>
#include <iosfwd>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

typedef std::uint64_t fingerprint_t;

enum struct entry_kind {
	directory,
	leaf,
};

std::ostream& operator <<(std::ostream& out, entry_kind kind);

// One filesystem object. The kind is fixed when the node is created;
// directories own their children, leaves carry their fingerprint.
struct entry {
	struct directory_data {
		std::map<std::string, std::unique_ptr<entry>> children;
	};
	struct leaf_data {
		fingerprint_t fingerprint;
	};

	std::string name;
	// root-relative, '/'-separated, empty for the root
	std::string path;
	std::variant<directory_data, leaf_data> data;

	static std::unique_ptr<entry> make_root();

	entry_kind kind() const;
	bool is_directory() const { return kind() == entry_kind::directory; }
	bool is_leaf() const { return kind() == entry_kind::leaf; }

	fingerprint_t fingerprint() const;

	const entry* child(const std::string& name) const;
	std::vector<std::string> list() const;
	std::vector<const entry*> children() const;

	// Both throw internal_consistency_error when the name is taken.
	entry& add_directory(const std::string& name);
	entry& add_leaf(const std::string& name, fingerprint_t fingerprint);
	// Returns the existing directory or creates it; throws if a leaf
	// already holds the name.
	entry& ensure_directory(const std::string& name);

	private:
	directory_data& directory();
	const directory_data& directory() const;
	entry& adopt(std::unique_ptr<entry> node);
};

std::string join_path(std::string_view parent, std::string_view name);

// Splits a root-relative path on '/', dropping empty segments.
std::vector<std::string> split_path(std::string_view path);

// Walks the segments of path below root; null when any segment is missing
// or a leaf is met before the end.
const entry* find_entry(const entry& root, std::string_view path);
