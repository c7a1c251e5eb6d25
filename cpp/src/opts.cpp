#include "opts.hpp"

#include <iostream>

#include <boost/program_options.hpp>

namespace opt = boost::program_options;

std::variant<int,app_options> get_opts(int argc, const char* argv[]) {
	opt::options_description opts_desc(
		"usage: naivecmp [options] DIR_A DIR_B\n"
		"Compare directories by fuzzy-matching file attributes"
		" without checking contents.\noptions");
	opts_desc.add_options()
		( "help,h"
		, "show this help message" )
		( "use-mod-time"
		, opt::value<bool>()->default_value(true)->implicit_value(true)
		, "use file mod time" )
		( "use-size"
		, opt::value<bool>()->default_value(true)->implicit_value(true)
		, "use file size" )
		( "use-mode"
		, opt::value<bool>()->default_value(false)->implicit_value(true)
		, "use file mode" )
		( "use-name"
		, opt::value<bool>()->default_value(false)->implicit_value(true)
		, "use file name even when there is no collision" )
		( "use-path"
		, opt::value<bool>()->default_value(false)->implicit_value(true)
		, "use file directory path" )
		( "workers,j"
		, opt::value<int>()->default_value(6)
		, "count of parallel workers per directory" )
		( "text"
		, opt::bool_switch()
		, "print results in text instead of the browser" )
		( "annotate"
		, opt::bool_switch()
		, "text mode: list both trees annotated by match status" )
		( "file-count"
		, opt::value<bool>()->default_value(true)->implicit_value(true)
		, "show file counts in the browser" )
		( "debug"
		, opt::bool_switch()
		, "text mode: print every fingerprint first" )
		( "seed"
		, opt::value<std::uint64_t>()
		, "fingerprint seed, random when absent" )
		( "left"
		, opt::value<std::string>()->required()
		, "directory A" )
		( "right"
		, opt::value<std::string>()->required()
		, "directory B" )
		;
	opt::positional_options_description posn_desc;
	posn_desc.add("left", 1);
	posn_desc.add("right", 1);

	opt::variables_map args;
	try {
		opt::store(opt::command_line_parser(argc, argv)
			.options(opts_desc).positional(posn_desc).run(), args);
		if(args.count("help")) {
			std::cout << opts_desc << std::flush;
			return 0;
		}
		opt::notify(args);
	} catch(opt::error& err) {
		std::cerr << err.what() << '\n' << opts_desc << std::flush;
		return 1;
	}

	app_options opts
		{ .left = args["left"].as<std::string>()
		, .right = args["right"].as<std::string>()
		, .attributes =
			{ .mod_time = args["use-mod-time"].as<bool>()
			, .size = args["use-size"].as<bool>()
			, .mode = args["use-mode"].as<bool>()
			, .name = args["use-name"].as<bool>()
			, .path = args["use-path"].as<bool>()
			}
		, .workers = args["workers"].as<int>()
		, .text = args["text"].as<bool>()
		, .annotate = args["annotate"].as<bool>()
		, .file_count = args["file-count"].as<bool>()
		, .debug = args["debug"].as<bool>()
		};
	auto seed = args.find("seed");
	if(seed != args.end())
		opts.seed = seed->second.as<std::uint64_t>();
	return opts;
}
