#pragma once

#include "directory_index.hpp"
#include "diff_tree.hpp"

#include <iosfwd>
#include <string>

// "========== Only in <title> ==========" then one unmatched leaf per line.
void print_diff(std::ostream& out, const std::string& title, const diff_tree& diff);

// "<path> <fingerprint>" for every leaf of index, ordered by path.
void print_debug(std::ostream& out, const std::string& title, const directory_index& index);

enum struct entry_status {
	matched,
	unmatched,
	clean_directory,
	dirty_directory,
};

std::ostream& operator <<(std::ostream& out, entry_status status);

// How an entry of index fares in the diff that index was the source of.
entry_status classify(const entry& node, const diff_tree& diff);

// Every entry of index, indented, with a status marker column.
void print_annotated(
	std::ostream& out,
	const std::string& title,
	const directory_index& index,
	const diff_tree& diff
);
