#include <gtest/gtest.h>

#include "fingerprint.hpp"

#include <sstream>

namespace {

leaf_metadata sample() {
	return leaf_metadata
		{ .mode = 0100644
		, .mtime_ns = 1700000000123456789
		, .size = 10
		, .name = "1.txt"
		, .directory = "x"
		};
}

}

TEST(Fingerprint, DeterministicForSameSeed) {
	attribute_config attrs;
	EXPECT_EQ(fingerprint(sample(), attrs, 42), fingerprint(sample(), attrs, 42));
}

TEST(Fingerprint, SeedChangesValue) {
	attribute_config attrs;
	EXPECT_NE(fingerprint(sample(), attrs, 1), fingerprint(sample(), attrs, 2));
}

TEST(Fingerprint, DisabledAttributesAreIgnored) {
	attribute_config attrs;
	auto moved = sample();
	moved.name = "renamed.txt";
	moved.directory = "y/z";
	moved.mode = 0100755;
	EXPECT_EQ(fingerprint(sample(), attrs, 7), fingerprint(moved, attrs, 7));
}

TEST(Fingerprint, EnabledAttributesMatter) {
	auto base = sample();
	auto bigger = base;
	bigger.size = 11;
	auto touched = base;
	touched.mtime_ns += 1;
	EXPECT_NE(fingerprint(base, {}, 7), fingerprint(bigger, {}, 7));
	EXPECT_NE(fingerprint(base, {}, 7), fingerprint(touched, {}, 7));

	attribute_config mode_only = { .mod_time = false, .size = false, .mode = true };
	auto chmodded = base;
	chmodded.mode = 0100755;
	EXPECT_NE(fingerprint(base, mode_only, 7), fingerprint(chmodded, mode_only, 7));
}

TEST(Fingerprint, NameOnlyIgnoresSizeAndTime) {
	attribute_config name_only = { .mod_time = false, .size = false, .name = true };
	auto other = sample();
	other.size = 999;
	other.mtime_ns = 5;
	other.directory = "elsewhere";
	EXPECT_EQ(fingerprint(sample(), name_only, 3), fingerprint(other, name_only, 3));
	other.name = "2.txt";
	EXPECT_NE(fingerprint(sample(), name_only, 3), fingerprint(other, name_only, 3));
}

TEST(Fingerprint, DirectoryAndNameAreSeparated) {
	attribute_config both = { .mod_time = false, .size = false, .name = true, .path = true };
	auto x = sample();
	x.directory = "ab";
	x.name = "c";
	auto y = sample();
	y.directory = "a";
	y.name = "bc";
	EXPECT_NE(fingerprint(x, both, 3), fingerprint(y, both, 3));
}

TEST(Fingerprint, ConfigPrintsEnabledFlags) {
	std::ostringstream out;
	out << attribute_config{} << ' ' << attribute_config{ .mod_time = false, .size = false };
	EXPECT_EQ(out.str(), "mtime+size none");
}
