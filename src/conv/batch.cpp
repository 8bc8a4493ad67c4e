/*
Copyright (c) 2026 Tearnote (Hubert Maraszek)

Licensed under the Mozilla Public License Version 2.0 <LICENSE-MPL-2.0.txt
or https://www.mozilla.org/en-US/MPL/2.0/> or the Boost Software License <LICENSE-BSL-1.0.txt
or https://www.boost.org/LICENSE_1_0.txt>, at your option. This file may not be copied, modified,
or distributed except according to those terms.
*/


#include "conv/batch.hpp"

#include "preamble.hpp"
#include "utils/task_pool.hpp"
#include "utils/logger.hpp"
#include "lib/archive.hpp"
#include "conv/transcoder.hpp"
#include "conv/script.hpp"
#include "conv/errors.hpp"

namespace tcepub::conv {

auto output_name(ScriptConverter const& converter, string_view display_name) -> string
{
	auto stem = display_name;
	if (iends_with(stem, ".epub")) stem.remove_suffix(".epub"sv.size());
	return format("{}{}", converter.convert_name(stem), ConvertedSuffix);
}

// Return the name, or if it's already taken, the name with the lowest free counter inserted
// before the extension. The result is marked as taken.
static auto claim_name(string name, unordered_set<string, string_hash>& taken) -> string
{
	if (taken.emplace(name).second) return name;
	auto const stem = string_view{name}.substr(0, name.size() - ".epub"sv.size());
	for (auto n = 2u;; n += 1) {
		auto candidate = format("{} ({}).epub", stem, n);
		if (taken.emplace(candidate).second) return candidate;
	}
}

BatchProcessor::BatchProcessor(Logger::Category cat, unique_ptr<thread_pool>& pool,
	ScriptConverter const& converter, MetadataPatch patch, BatchOptions options):
	cat{cat},
	pool{pool},
	converter{converter},
	transcoder{cat, pool, converter, move(patch)},
	options{options}
{}

auto BatchProcessor::process(span<InputArchive const> inputs, stop_token stop) -> task<vector<byte>>
{
	if (inputs.empty()) throw EmptyBatchError{"No archives were provided"};
	return process_archives(inputs, move(stop));
}

auto BatchProcessor::process_archives(span<InputArchive const> inputs, stop_token stop)
	-> task<vector<byte>>
{
	INFO_AS(cat, "Converting {} archive{}", inputs.size(), inputs.size() == 1? "" : "s");
	auto const started = steady_clock::now();

	auto tasks = vector<task<vector<byte>>>{};
	tasks.reserve(inputs.size());
	for (auto const& input: inputs)
		tasks.emplace_back(schedule_task_on(pool, transcoder.transcode(input, stop)));
	auto results = co_await when_all(move(tasks));

	auto items = vector<BundleItem>{};
	auto failures = vector<string>{};
	auto taken = unordered_set<string, string_hash>{};
	for (auto [input, result]: views::zip(inputs, results)) {
		try {
			auto contents = move(result.return_value());
			items.emplace_back(BundleItem{
				.name = claim_name(output_name(converter, input.name), taken),
				.contents = move(contents),
			});
		} catch (CancelledError const&) {
			throw;
		} catch (exception const& e) {
			ERROR_AS(cat, "Failed to convert \"{}\": {}", input.name, e.what());
			if (options.atomic) throw;
			failures.emplace_back(format("{}: {}", input.name, e.what()));
		}
	}
	if (stop.stop_requested()) throw CancelledError{"Batch conversion was cancelled"};

	if (!failures.empty()) {
		WARN_AS(cat, "{} of {} archives failed to convert", failures.size(), inputs.size());
		auto manifest = string{};
		for (auto const& failure: failures) {
			manifest.append(failure);
			manifest.push_back('\n');
		}
		auto const bytes = as_bytes(manifest);
		items.emplace_back(BundleItem{
			.name = string{FailureManifestName},
			.contents = {bytes.begin(), bytes.end()},
		});
	}

	auto bundle = write_bundle(items);
	INFO_AS(cat, "Batch finished in {:.1f} ms, bundle is {} bytes", elapsed_ms(started), bundle.size());
	co_return bundle;
}

auto BatchProcessor::write_bundle(span<BundleItem const> items) -> vector<byte>
try {
	auto bundle = vector<byte>{};
	auto archive = lib::archive::open_write(bundle);
	for (auto const& item: items)
		lib::archive::write_entry(archive, item.name, item.contents);
	lib::archive::close(archive);
	return bundle;
}
catch (runtime_error const& e) {
	throw typed_error_fmt<BundleError>("Failed to assemble the output bundle: {}", e.what());
}

}
