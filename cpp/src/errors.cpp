#include "errors.hpp"

filesystem_access_error::filesystem_access_error(
	const std::string& what,
	const std::filesystem::path& path,
	std::error_code code
) : std::filesystem::filesystem_error(what, path, code) { }
