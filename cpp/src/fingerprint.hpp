#pragma once

#include "entry.hpp"

#include <cstdint>
#include <iosfwd>
#include <string>

// Which leaf attributes take part in the fingerprint.
struct attribute_config {
	bool mod_time = true;
	bool size = true;
	bool mode = false;
	bool name = false;
	bool path = false;

	bool operator ==(const attribute_config&) const = default;
};

std::ostream& operator <<(std::ostream& out, const attribute_config& attrs);

// What lstat tells us about a leaf, plus where it sits in the tree.
struct leaf_metadata {
	std::uint32_t mode = 0;
	std::int64_t mtime_ns = 0;
	std::uint64_t size = 0;
	std::string name;
	// root-relative path of the containing directory, empty at the top
	std::string directory;
};

// Fingerprints are only comparable between indexes built with one seed.
std::uint64_t make_seed();

fingerprint_t fingerprint(
	const leaf_metadata& meta,
	const attribute_config& attrs,
	std::uint64_t seed
);
