#pragma once

#include "directory_index.hpp"
#include "diff_tree.hpp"

#include <iosfwd>

enum struct match_status {
	matched,
	unmatched,
	// several candidates, one at the same path
	matched_by_path,
	// several candidates, none at the same path
	unmatched_collision,
};

std::ostream& operator <<(std::ostream& out, match_status status);

bool is_matched(match_status status);

match_status match_leaf(
	const directory_index& source,
	const entry& leaf,
	const directory_index& target
);

// Leaves of source with no counterpart in target. Reads both indexes only,
// so diff(a, b) and diff(b, a) may run concurrently.
diff_tree diff(const directory_index& source, const directory_index& target);
