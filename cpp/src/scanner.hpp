#pragma once

#include "directory_index.hpp"
#include "fingerprint.hpp"
#include "work_queue.hpp"

#include <atomic>
#include <cstddef>
#include <exception>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>

struct scan_options {
	std::filesystem::path root;
	unsigned workers = 6;
	attribute_config attributes = {};
	std::uint64_t seed = 0;
	std::size_t queue_capacity = 1024;
	// Shared between the scans of one run: set by the first scan that
	// fails, and every scan holding it stops at its next check.
	std::shared_ptr<std::atomic<bool>> stop = nullptr;
};

// Throws configuration_error when root is not an existing directory or
// workers / queue_capacity is zero.
void validate(const scan_options& opts);

// Walks opts.root with opts.workers threads. The first unreadable path
// cancels the scan and is rethrown as filesystem_access_error; a scan
// stopped through opts.stop by another one throws scan_cancelled.
directory_index scan(const scan_options& opts);

struct scan_task {
	std::string path;
	bool is_dir;
};

// State shared by the workers of one scan. Use scan() instead.
struct scanner {
	explicit scanner(const scan_options& opts);

	scanner(const scanner&) = delete;
	scanner& operator =(const scanner&) = delete;

	directory_index run();

	private:
	void work();
	void visit(const scan_task& task);
	void visit_directory(const std::string& relpath);
	void visit_leaf(const std::string& relpath);
	entry& ensure_ancestors(const std::vector<std::string>& parts, std::size_t count);
	bool stopping() const;
	void finish_task();
	void fail(std::exception_ptr error);

	const scan_options opts;
	work_queue<scan_task> queue;
	std::atomic<std::size_t> pending = 0;
	std::atomic<bool> cancelled = false;
	std::mutex error_mutex;
	std::exception_ptr error;
	std::mutex tree_mutex;
	std::mutex bucket_mutex;
	directory_index index;
};
