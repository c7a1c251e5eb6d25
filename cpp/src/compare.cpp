#include "compare.hpp"
#include "browser.hpp"
#include "errors.hpp"
#include "report.hpp"
#include "trace.hpp"

#include <atomic>
#include <exception>
#include <future>
#include <optional>
#include <memory>
#include <mutex>

#include <boost/asio.hpp>

namespace asio = boost::asio;

template<typename F>
auto submit(asio::thread_pool& pool, F func) {
	auto task = std::make_shared<std::packaged_task<decltype(func())()>>(
		std::move(func));
	auto result = task->get_future();
	asio::post(pool, [task] () { (*task)(); });
	return result;
}

scan_options scan_options_for(
	const app_options& opts,
	const std::filesystem::path& root,
	std::uint64_t seed
) {
	if(opts.workers <= 0)
		throw configuration_error("worker count must be positive, got "
			+ std::to_string(opts.workers));
	scan_options scan_opts =
		{ .root = root
		, .workers = unsigned(opts.workers)
		, .attributes = opts.attributes
		, .seed = seed
		};
	validate(scan_opts);
	return scan_opts;
}

// Waits for a scan. A scan_cancelled is only the echo of the other scan's
// failure, so the first real error wins.
static std::optional<directory_index> collect(
	std::future<directory_index>& scan,
	std::exception_ptr& error
) {
	try {
		return scan.get();
	} catch(const scan_cancelled& err) {
		trace(now, "scan cancelled:", err.what());
	} catch(...) {
		if(!error) error = std::current_exception();
	}
	return std::nullopt;
}

comparison compare(const app_options& opts, std::ostream& log) {
	auto seed = opts.seed.has_value() ? *opts.seed : make_seed();
	auto stop = std::make_shared<std::atomic<bool>>(false);
	auto left_opts = scan_options_for(opts, opts.left, seed);
	auto right_opts = scan_options_for(opts, opts.right, seed);
	left_opts.stop = right_opts.stop = stop;

	log << "Mapping directories..." << std::endl;
	std::mutex log_mutex;
	auto finished = [&] (const std::filesystem::path& root) {
		std::lock_guard<std::mutex> lock(log_mutex);
		log << "Finished " << root.string() << std::endl;
	};
	asio::thread_pool pool(2);
	auto left_scan = submit(pool, [&] () {
		auto index = scan(left_opts);
		finished(opts.left);
		return index;
	});
	auto right_scan = submit(pool, [&] () {
		auto index = scan(right_opts);
		finished(opts.right);
		return index;
	});
	std::exception_ptr error;
	auto left = collect(left_scan, error);
	auto right = collect(right_scan, error);
	pool.join();
	if(error)
		std::rethrow_exception(error);
	if(!left || !right)
		throw internal_consistency_error("scan cancelled without a failure");

	log << "Comparing..." << std::endl;
	asio::thread_pool workers(2);
	auto left_diff = submit(workers, [&] () { return diff(*left, *right); });
	auto right_diff = submit(workers, [&] () { return diff(*right, *left); });
	auto only_left = left_diff.get();
	auto only_right = right_diff.get();
	workers.join();
	log << "Done" << std::endl;

	return
		{ .left = std::move(*left)
		, .right = std::move(*right)
		, .only_left = std::move(only_left)
		, .only_right = std::move(only_right)
		};
}

int run(const app_options& opts, std::ostream& out, std::ostream& err) {
	try {
		auto result = compare(opts, err);
		if(!opts.text) {
			browse(opts.left.string(), result.only_left,
				opts.right.string(), result.only_right, opts.file_count);
			return 0;
		}
		if(opts.debug) {
			print_debug(out, opts.left.string(), result.left);
			print_debug(out, opts.right.string(), result.right);
		}
		if(opts.annotate) {
			print_annotated(out, opts.left.string(), result.left, result.only_left);
			print_annotated(out, opts.right.string(), result.right, result.only_right);
		}
		print_diff(out, opts.left.string(), result.only_left);
		print_diff(out, opts.right.string(), result.only_right);
		out << std::flush;
	} catch(const configuration_error& e) {
		trace(now, "configuration error:", e.what());
		err << "naivecmp: " << e.what() << std::endl;
		return 2;
	} catch(const filesystem_access_error& e) {
		trace(now, "filesystem error:", e.what());
		err << "naivecmp: " << e.what() << std::endl;
		return 1;
	}
	return 0;
}
