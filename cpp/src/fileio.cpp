#include "fileio.hpp"
#include "errors.hpp"

#include <cerrno>
#include <sys/stat.h>

namespace fs = std::filesystem;

std::vector<dir_child> list_directory(const fs::path& path) {
	std::vector<dir_child> children;
	std::error_code err;
	fs::directory_iterator it(path, err);
	if(err)
		throw filesystem_access_error("read directory", path, err);
	for(; it != fs::directory_iterator(); it.increment(err)) {
		if(err)
			throw filesystem_access_error("read directory", path, err);
		auto type = it->symlink_status(err).type();
		if(err)
			throw filesystem_access_error("stat", it->path(), err);
		children.push_back(dir_child
			{ .name = it->path().filename().string()
			, .is_dir = type == fs::file_type::directory
			});
	}
	if(err)
		throw filesystem_access_error("read directory", path, err);
	return children;
}

leaf_metadata read_leaf_metadata(
	const fs::path& base,
	const std::string& relpath
) {
	fs::path path = base / relpath;
	struct stat fstat;
	if(lstat(path.c_str(), &fstat))
		throw filesystem_access_error("stat", path,
			std::error_code(errno, std::generic_category()));
	auto slash = relpath.rfind('/');
	return leaf_metadata
		{ .mode = std::uint32_t(fstat.st_mode)
		, .mtime_ns = std::int64_t(fstat.st_mtim.tv_sec) * 1000000000
			+ fstat.st_mtim.tv_nsec
		, .size = std::uint64_t(fstat.st_size)
		, .name = slash == std::string::npos ? relpath : relpath.substr(slash + 1)
		, .directory = slash == std::string::npos ? "" : relpath.substr(0, slash)
		};
}
