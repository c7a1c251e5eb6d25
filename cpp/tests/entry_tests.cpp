#include <gtest/gtest.h>

#include "entry.hpp"
#include "errors.hpp"

TEST(Entry, RootIsAnEmptyDirectory) {
	auto root = entry::make_root();
	EXPECT_TRUE(root->is_directory());
	EXPECT_EQ(root->path, "");
	EXPECT_TRUE(root->list().empty());
}

TEST(Entry, PathsAreSlashJoined) {
	auto root = entry::make_root();
	auto& dir = root->add_directory("a");
	auto& sub = dir.add_directory("b");
	auto& leaf = sub.add_leaf("c.txt", 7);
	EXPECT_EQ(dir.path, "a");
	EXPECT_EQ(leaf.path, "a/b/c.txt");
	EXPECT_EQ(leaf.kind(), entry_kind::leaf);
	EXPECT_EQ(leaf.fingerprint(), 7u);
}

TEST(Entry, ChildrenAreOrderedByName) {
	auto root = entry::make_root();
	root->add_leaf("zeta", 1);
	root->add_directory("alpha");
	root->add_leaf("mid", 2);
	EXPECT_EQ(root->list(), (std::vector<std::string>{ "alpha", "mid", "zeta" }));
	auto children = root->children();
	ASSERT_EQ(children.size(), 3u);
	EXPECT_EQ(children[0]->name, "alpha");
	EXPECT_EQ(children[2]->name, "zeta");
}

TEST(Entry, DuplicateNameIsADefect) {
	auto root = entry::make_root();
	root->add_leaf("f", 1);
	EXPECT_THROW(root->add_leaf("f", 2), internal_consistency_error);
	EXPECT_THROW(root->add_directory("f"), internal_consistency_error);
}

TEST(Entry, EnsureDirectoryReusesExisting) {
	auto root = entry::make_root();
	auto& first = root->ensure_directory("d");
	auto& second = root->ensure_directory("d");
	EXPECT_EQ(&first, &second);
	root->add_leaf("f", 1);
	EXPECT_THROW(root->ensure_directory("f"), internal_consistency_error);
}

TEST(Entry, LeavesHaveNoChildren) {
	auto root = entry::make_root();
	auto& leaf = root->add_leaf("f", 1);
	EXPECT_TRUE(leaf.list().empty());
	EXPECT_EQ(leaf.child("x"), nullptr);
	EXPECT_THROW(leaf.add_leaf("x", 2), internal_consistency_error);
	EXPECT_THROW(root->fingerprint(), internal_consistency_error);
}

TEST(Entry, SplitPathDropsEmptySegments) {
	EXPECT_EQ(split_path("a//b/"), (std::vector<std::string>{ "a", "b" }));
	EXPECT_TRUE(split_path("").empty());
}

TEST(Entry, FindEntryWalksSegments) {
	auto root = entry::make_root();
	root->add_directory("a").add_leaf("b", 3);
	EXPECT_EQ(find_entry(*root, "")->path, "");
	EXPECT_EQ(find_entry(*root, "a/b")->path, "a/b");
	EXPECT_EQ(find_entry(*root, "a/c"), nullptr);
	EXPECT_EQ(find_entry(*root, "a/b/c"), nullptr);
}
