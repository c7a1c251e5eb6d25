#pragma once

#include "diff_tree.hpp"

#include <string>

#include <ftxui/component/event.hpp>

std::ostream& operator <<(
	std::ostream& out,
	ftxui::Event event
);

// Full-screen tree view of both diffs, one page per side. Returns when the
// user quits.
void browse(
	const std::string& left_title,
	const diff_tree& left,
	const std::string& right_title,
	const diff_tree& right,
	bool file_count
);
