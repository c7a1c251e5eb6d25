#include "scanner.hpp"
#include "errors.hpp"
#include "fileio.hpp"
#include "trace.hpp"

#include <boost/asio.hpp>

namespace fs = std::filesystem;
namespace asio = boost::asio;

void validate(const scan_options& opts) {
	std::error_code err;
	auto status = fs::status(opts.root, err);
	if(status.type() == fs::file_type::not_found)
		throw configuration_error(
			"'" + opts.root.string() + "' does not exist");
	if(err)
		throw configuration_error(
			"'" + opts.root.string() + "': " + err.message());
	if(status.type() != fs::file_type::directory)
		throw configuration_error(
			"'" + opts.root.string() + "' is not a directory");
	if(opts.workers == 0)
		throw configuration_error("worker count must be positive");
	if(opts.queue_capacity == 0)
		throw configuration_error("queue capacity must be positive");
}

directory_index scan(const scan_options& opts) {
	validate(opts);
	scanner walker(opts);
	return walker.run();
}

scanner::scanner(const scan_options& opts)
	: opts(opts), queue(opts.queue_capacity), index(opts.root) { }

directory_index scanner::run() {
	trace(now, "scan:", this->opts.root, "workers", this->opts.workers,
		"attributes", this->opts.attributes);
	this->pending = 1;
	if(!this->queue.try_push(scan_task{ .path = "", .is_dir = true }))
		throw internal_consistency_error("scan queue rejected the root task");
	{
		asio::thread_pool pool(this->opts.workers);
		for(unsigned i = 0; i < this->opts.workers; ++i)
			asio::post(pool, [this] () { this->work(); });
		pool.join();
	}
	if(this->error)
		std::rethrow_exception(this->error);
	if(this->stopping()) {
		trace(now, "scan stopped:", this->opts.root);
		throw scan_cancelled("scan of '" + this->opts.root.string()
			+ "' stopped after another scan failed");
	}
	trace(now, "scan done:", this->opts.root,
		"leaves", this->index.bucketed_leaf_count(),
		"buckets", this->index.bucket_count());
	return std::move(this->index);
}

void scanner::work() {
	while(auto task = this->queue.pop()) {
		try {
			this->visit(*task);
		} catch(...) {
			this->fail(std::current_exception());
			return;
		}
		this->finish_task();
	}
}

bool scanner::stopping() const {
	return this->cancelled || (this->opts.stop && *this->opts.stop);
}

void scanner::finish_task() {
	if(this->pending.fetch_sub(1) == 1)
		this->queue.close();
}

void scanner::fail(std::exception_ptr error) {
	{
		const std::lock_guard<std::mutex> lock(this->error_mutex);
		if(!this->error) this->error = error;
	}
	this->cancelled = true;
	if(this->opts.stop) *this->opts.stop = true;
	this->queue.close();
}

void scanner::visit(const scan_task& task) {
	if(this->stopping()) {
		this->queue.close();
		return;
	}
	if(task.is_dir)
		this->visit_directory(task.path);
	else
		this->visit_leaf(task.path);
}

void scanner::visit_directory(const std::string& relpath) {
	auto children = list_directory(this->opts.root / relpath);
	if(!relpath.empty()) {
		auto parts = split_path(relpath);
		const std::lock_guard<std::mutex> lock(this->tree_mutex);
		this->ensure_ancestors(parts, parts.size());
	}
	this->pending += children.size();
	for(std::size_t i = 0; i < children.size(); ++i) {
		if(this->stopping()) {
			this->pending -= children.size() - i;
			return;
		}
		scan_task task
			{ .path = join_path(relpath, children[i].name)
			, .is_dir = children[i].is_dir
			};
		if(this->queue.try_push(task)) continue;
		this->visit(task);
		this->finish_task();
	}
}

void scanner::visit_leaf(const std::string& relpath) {
	auto meta = read_leaf_metadata(this->opts.root, relpath);
	auto fp = fingerprint(meta, this->opts.attributes, this->opts.seed);
	auto parts = split_path(relpath);
	const entry* leaf;
	{
		const std::lock_guard<std::mutex> lock(this->tree_mutex);
		leaf = &this->ensure_ancestors(parts, parts.size() - 1)
			.add_leaf(parts.back(), fp);
	}
	{
		const std::lock_guard<std::mutex> lock(this->bucket_mutex);
		this->index.buckets[fp].push_back(leaf);
	}
}

// Caller holds tree_mutex.
entry& scanner::ensure_ancestors(
	const std::vector<std::string>& parts,
	std::size_t count
) {
	entry* node = this->index.tree.get();
	for(std::size_t i = 0; i < count; ++i)
		node = &node->ensure_directory(parts[i]);
	return *node;
}
