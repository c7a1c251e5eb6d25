#include "compare.hpp"
#include "opts.hpp"
#include "trace.hpp"

#include <iostream>
#include <unistd.h>

int main(int argc, const char* argv[]) {
	trace("------------------------------------------------------------");
	trace(now, "pid", getpid());

	auto opts_alt = get_opts(argc, argv);
	if(std::holds_alternative<int>(opts_alt))
		return std::get<int>(opts_alt);
	return run(std::get<app_options>(opts_alt), std::cout, std::cerr);
}
