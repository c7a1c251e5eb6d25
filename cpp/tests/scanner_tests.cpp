#include <gtest/gtest.h>

#include "errors.hpp"
#include "scanner.hpp"
#include "temp_tree.hpp"

#include <atomic>
#include <cerrno>
#include <climits>
#include <cstring>
#include <functional>
#include <memory>
#include <set>
#include <unistd.h>

namespace {

struct ScannerTest : public ::testing::Test {
	temp_tree tree;

	scan_options options(unsigned workers = 4) const {
		return scan_options
			{ .root = this->tree.root()
			, .workers = workers
			, .seed = 99
			};
	}

	void populate() const {
		this->tree.file("a.txt", 3, 1000);
		this->tree.file("x/1.txt", 10, 2000);
		this->tree.file("x/2.txt", 20, 2000);
		this->tree.file("x/y/deep.bin", 5, 3000);
		this->tree.mkdir("empty");
		this->tree.mkdir("x/also-empty");
	}
};

// A chain of directories whose full paths run past PATH_MAX. Returns the
// relative path of the first directory that can no longer be opened.
std::string overlong_chain(const temp_tree& tree) {
	std::string name(200, 'd');
	auto deepest = tree.chain("deep", name, 30);
	std::string path = "deep";
	while((tree.root() / path).string().size() < PATH_MAX)
		path += "/" + name;
	EXPECT_LE(path.size(), deepest.size());
	return path;
}

std::set<std::string> all_paths(const directory_index& index) {
	std::set<std::string> paths;
	std::function<void(const entry&)> walk = [&] (const entry& node) {
		for(auto child : index.children(node)) {
			EXPECT_TRUE(paths.insert(child->path).second) << child->path;
			walk(*child);
		}
	};
	walk(index.root());
	return paths;
}

}

TEST_F(ScannerTest, EveryObjectAppearsOnce) {
	this->populate();
	auto index = scan(this->options());
	EXPECT_EQ(all_paths(index), (std::set<std::string>
		{ "a.txt", "empty", "x", "x/1.txt", "x/2.txt", "x/also-empty"
		, "x/y", "x/y/deep.bin" }));
	EXPECT_EQ(index.leaf_count(), 4u);
	EXPECT_EQ(index.bucketed_leaf_count(), index.leaf_count());
	EXPECT_TRUE(index.entry_at("empty")->is_directory());
	EXPECT_TRUE(index.entry_at("x/also-empty")->is_directory());
}

TEST_F(ScannerTest, EmptyRootGivesEmptyIndex) {
	auto index = scan(this->options());
	EXPECT_TRUE(index.root().children().empty());
	EXPECT_EQ(index.bucketed_leaf_count(), 0u);
}

TEST_F(ScannerTest, FullQueueFallsBackToRecursion) {
	this->populate();
	for(int i = 0; i < 50; ++i)
		this->tree.file("wide/f" + std::to_string(i), i, 4000);
	auto opts = this->options(3);
	opts.queue_capacity = 1;
	auto index = scan(opts);
	EXPECT_EQ(index.leaf_count(), 54u);
	EXPECT_EQ(index.bucketed_leaf_count(), 54u);
	EXPECT_EQ(all_paths(index).size(), 59u);
}

TEST_F(ScannerTest, WorkerCountDoesNotChangeResult) {
	this->populate();
	for(int i = 0; i < 30; ++i)
		this->tree.file("d" + std::to_string(i % 5) + "/f" + std::to_string(i), i, 4000);
	auto reference = scan(this->options(1));
	for(unsigned workers : { 2u, 8u }) {
		auto index = scan(this->options(workers));
		EXPECT_EQ(all_paths(index), all_paths(reference));
		for(auto leaf : reference.leaves())
			EXPECT_EQ(index.fingerprint_of(*index.entry_at(leaf->path)),
				reference.fingerprint_of(*leaf)) << leaf->path;
	}
}

TEST_F(ScannerTest, SymlinksAreLeaves) {
	this->tree.mkdir("real");
	this->tree.file("real/f", 1, 100);
	std::filesystem::create_directory_symlink("real", this->tree.root() / "link");
	auto index = scan(this->options());
	ASSERT_NE(index.entry_at("link"), nullptr);
	EXPECT_TRUE(index.entry_at("link")->is_leaf());
	EXPECT_EQ(index.entry_at("link/f"), nullptr);
}

TEST_F(ScannerTest, MissingRootIsAConfigurationError) {
	auto opts = this->options();
	opts.root = this->tree.root() / "nope";
	EXPECT_THROW(scan(opts), configuration_error);
}

TEST_F(ScannerTest, FileRootIsAConfigurationError) {
	this->tree.file("plain", 1, 1);
	auto opts = this->options();
	opts.root = this->tree.root() / "plain";
	EXPECT_THROW(scan(opts), configuration_error);
}

TEST_F(ScannerTest, ZeroWorkersIsAConfigurationError) {
	EXPECT_THROW(scan(this->options(0)), configuration_error);
	auto opts = this->options();
	opts.queue_capacity = 0;
	EXPECT_THROW(validate(opts), configuration_error);
}

TEST_F(ScannerTest, UnreadableDirectoryAbortsTheScan) {
	if(geteuid() == 0)
		GTEST_SKIP() << "permissions are not enforced for root";
	this->populate();
	this->tree.file("locked/secret", 1, 1);
	std::filesystem::permissions(this->tree.root() / "locked",
		std::filesystem::perms::none);
	try {
		scan(this->options());
		FAIL() << "scan should have failed";
	} catch(const filesystem_access_error& err) {
		EXPECT_EQ(err.path1().string(), (this->tree.root() / "locked").string());
		EXPECT_EQ(err.code(), std::errc::permission_denied);
	}
	std::filesystem::permissions(this->tree.root() / "locked",
		std::filesystem::perms::owner_all);
}

TEST_F(ScannerTest, OverlongPathAbortsTheScan) {
	this->populate();
	auto failing = (this->tree.root() / overlong_chain(this->tree)).string();
	for(unsigned workers : { 1u, 6u }) {
		for(std::size_t capacity : { std::size_t(1), std::size_t(1024) }) {
			auto opts = this->options(workers);
			opts.queue_capacity = capacity;
			EXPECT_THROW(scan(opts), filesystem_access_error)
				<< workers << " workers, capacity " << capacity;
			try {
				scan(opts);
			} catch(const filesystem_access_error& err) {
				EXPECT_EQ(err.path1().string(), failing);
				EXPECT_EQ(err.code(), std::errc::filename_too_long);
			}
		}
	}
}

TEST_F(ScannerTest, OverlongRootIsAConfigurationError) {
	auto opts = this->options();
	opts.root = this->tree.root() / std::string(NAME_MAX + 10, 'n');
	try {
		validate(opts);
		FAIL() << "validate should have failed";
	} catch(const configuration_error& err) {
		EXPECT_NE(std::string(err.what()).find(std::strerror(ENAMETOOLONG)),
			std::string::npos) << err.what();
	}
}

TEST_F(ScannerTest, RaisedStopFlagCancelsTheScan) {
	this->populate();
	auto opts = this->options();
	opts.stop = std::make_shared<std::atomic<bool>>(true);
	EXPECT_THROW(scan(opts), scan_cancelled);
}

TEST_F(ScannerTest, FailureRaisesTheSharedStopFlag) {
	this->populate();
	overlong_chain(this->tree);
	auto opts = this->options();
	opts.stop = std::make_shared<std::atomic<bool>>(false);
	EXPECT_THROW(scan(opts), filesystem_access_error);
	EXPECT_TRUE(*opts.stop);
}

TEST_F(ScannerTest, UnraisedStopFlagLeavesTheScanAlone) {
	this->populate();
	auto opts = this->options();
	opts.stop = std::make_shared<std::atomic<bool>>(false);
	auto index = scan(opts);
	EXPECT_EQ(index.leaf_count(), 4u);
	EXPECT_FALSE(*opts.stop);
}
