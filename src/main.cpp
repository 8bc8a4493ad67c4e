/*
Copyright (c) 2026 Tearnote (Hubert Maraszek)

Licensed under the Mozilla Public License Version 2.0 <LICENSE-MPL-2.0.txt
or https://www.mozilla.org/en-US/MPL/2.0/> or the Boost Software License <LICENSE-BSL-1.0.txt
or https://www.boost.org/LICENSE_1_0.txt>, at your option. This file may not be copied, modified,
or distributed except according to those terms.
*/


#include <cstdlib>
#include <clocale>
#include <cstdio>
#include "preamble.hpp"
#include "utils/task_pool.hpp"
#include "utils/assert.hpp"
#include "utils/config.hpp"
#include "utils/logger.hpp"
#include "io/file.hpp"
#include "conv/transcoder.hpp"
#include "conv/script.hpp"
#include "conv/errors.hpp"
#include "conv/batch.hpp"
#include "conv/entry.hpp"

using namespace tcepub; // Can't namespace main()

auto run(span<char const* const> args) -> int
{
	auto const& config = *globals::config;
	auto const output_path = fs::path{args[1]};

	// Inputs stay mapped until the bundle is written
	auto files = vector<io::ReadFile>{};
	files.reserve(args.size() - 2);
	for (auto const* arg: args.subspan(2)) {
		auto path = fs::path{arg};
		if (!iends_with(path.filename().string(), ".epub"))
			WARN("\"{}\" does not have an .epub extension, converting anyway", path);
		files.emplace_back(io::read_file(path));
	}
	auto inputs = vector<conv::InputArchive>{};
	inputs.reserve(files.size());
	for (auto const& file: files) {
		inputs.emplace_back(conv::InputArchive{
			.name = file.path.filename().string(),
			.contents = file.contents,
		});
	}

	auto const thread_count = config.get_entry<int>("batch", "thread_count");
	if (thread_count < 0) throw runtime_error_fmt("Invalid thread count: {}", thread_count);
	auto pool_stub = globals::pool.provide(make_pool(static_cast<uint>(thread_count)));
	auto const cat = globals::logger->create_category("Transcode",
		Logger::parse_level(config.get_entry<string>("logging", "transcode")));

	auto const converter = conv::IcuScriptConverter{config.get_entry<string>("conversion", "transliterator")};
	auto processor = conv::BatchProcessor{cat, *globals::pool, converter,
		conv::MetadataPatch{
			.source_language = config.get_entry<string>("conversion", "source_language"),
			.target_language = config.get_entry<string>("conversion", "target_language"),
		},
		conv::BatchOptions{.atomic = config.get_entry<bool>("batch", "atomic")},
	};

	try {
		auto const bundle = sync_wait(processor.process(inputs));
		io::write_file(output_path, bundle);
		INFO("Wrote \"{}\" ({} bytes)", output_path, bundle.size());
	} catch (conv::EntryError const& e) {
		ERROR("Conversion failed at entry \"{}\": {}", e.path(), e.what());
		return EXIT_FAILURE;
	} catch (runtime_error const& e) {
		ERROR("Conversion failed: {}", e.what());
		return EXIT_FAILURE;
	}
	return EXIT_SUCCESS;
}

auto main(int argc, char const* argv[]) -> int
try {
	auto const args = span{argv, static_cast<usize>(argc)};
	if (args.size() < 3) {
		print(stderr, "Usage: {} <output bundle> <input archive>...\n", args.empty()? AppTitle : args[0]);
		return EXIT_FAILURE;
	}

	std::setlocale(LC_ALL, "C.UTF-8");
	set_assert_handler();
	auto config_stub = globals::config.provide();
	globals::config->load_from_file();
	auto logger_stub = globals::logger.provide(LogfilePath,
		Logger::parse_level(globals::config->get_entry<string>("logging", "global")));
	INFO("{} {}.{}.{} starting up", AppTitle, AppVersion[0], AppVersion[1], AppVersion[2]);
	return run(args);
}
catch (exception const& e) {
	if (globals::logger)
		CRIT("Uncaught exception: {}", e.what());
	else
		print(stderr, "Uncaught exception: {}\n", e.what());
	return EXIT_FAILURE;
}
