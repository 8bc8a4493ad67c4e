/*
Copyright (c) 2026 Tearnote (Hubert Maraszek)

Licensed under the Mozilla Public License Version 2.0 <LICENSE-MPL-2.0.txt
or https://www.mozilla.org/en-US/MPL/2.0/> or the Boost Software License <LICENSE-BSL-1.0.txt
or https://www.boost.org/LICENSE_1_0.txt>, at your option. This file may not be copied, modified,
or distributed except according to those terms.
*/


#include "conv/transcoder.hpp"

#include "preamble.hpp"
#include "utils/task_pool.hpp"
#include "utils/assert.hpp"
#include "utils/logger.hpp"
#include "lib/archive.hpp"
#include "conv/script.hpp"
#include "conv/errors.hpp"
#include "conv/entry.hpp"

namespace tcepub::conv {

Transcoder::Transcoder(Logger::Category cat, unique_ptr<thread_pool>& pool,
	ScriptConverter const& converter, MetadataPatch patch):
	cat{cat},
	pool{pool},
	converter{converter},
	patch{move(patch)}
{}

auto Transcoder::transcode(InputArchive const& input, stop_token stop) -> task<vector<byte>>
{
	if (stop.stop_requested())
		throw typed_error_fmt<CancelledError>("Conversion of \"{}\" was cancelled", input.name);
	auto const started = steady_clock::now();

	auto entries = read_entries(input);
	auto const entry_count = entries.size();
	INFO_AS(cat, "Converting \"{}\": {} entries", input.name, entry_count);

	auto classes = vector<EntryClass>{};
	classes.reserve(entry_count);
	auto tasks = vector<task<TransformedEntry>>{};
	tasks.reserve(entry_count);
	for (auto& entry: entries) {
		auto const entry_class = classify(entry.path, entry.is_directory);
		classes.emplace_back(entry_class);
		tasks.emplace_back(schedule_task_on(pool, transform_entry(move(entry), entry_class, stop)));
	}

	auto transformed = vector<TransformedEntry>{};
	transformed.reserve(entry_count);
	if (!tasks.empty()) {
		auto results = co_await when_all(move(tasks));
		for (auto& result: results)
			transformed.emplace_back(move(result.return_value()));
	}
	ASSERT(transformed.size() == entry_count);
	if (stop.stop_requested())
		throw typed_error_fmt<CancelledError>("Conversion of \"{}\" was cancelled", input.name);

	auto output = write_entries(input, transformed);
	INFO_AS(cat, "Converted \"{}\" in {:.1f} ms: {} text, {} binary, {} directories",
		input.name, elapsed_ms(started),
		count_if(classes, [](auto c) { return c == EntryClass::TextTarget; }),
		count_if(classes, [](auto c) { return c == EntryClass::BinaryPassthrough; }),
		count_if(classes, [](auto c) { return c == EntryClass::Directory; }));
	co_return output;
}

auto Transcoder::transform_entry(ArchiveEntry entry, EntryClass entry_class, stop_token stop)
	-> task<TransformedEntry>
{
	if (stop.stop_requested())
		throw typed_error_fmt<CancelledError>("Conversion of \"{}\" was cancelled", entry.path);
	TRACE_AS(cat, "\"{}\": {}", entry.path, enum_name(entry_class));
	auto result = transform(move(entry), entry_class, converter, patch);
	if (result.patch_outcome == PatchOutcome::DeclarationMissing)
		DEBUG_AS(cat, "\"{}\" has no {} declaration, language left as-is", result.path, patch.source_language);
	co_return result;
}

auto Transcoder::read_entries(InputArchive const& input) -> vector<ArchiveEntry>
try {
	auto archive = lib::archive::open_read(input.contents);
	auto entries = vector<ArchiveEntry>{};
	for (auto header: lib::archive::for_each_entry(archive)) {
		entries.emplace_back(ArchiveEntry{
			.path = string{header.pathname},
			.is_directory = header.is_directory,
			.contents = header.is_directory? vector<byte>{} : lib::archive::read_data(archive),
		});
	}
	return entries;
}
catch (runtime_error const& e) {
	throw typed_error_fmt<ArchiveError>("\"{}\" is not a readable archive: {}", input.name, e.what());
}

auto Transcoder::write_entries(InputArchive const& input, span<TransformedEntry const> entries) -> vector<byte>
try {
	auto output = vector<byte>{};
	auto archive = lib::archive::open_write(output);
	for (auto const& entry: entries) {
		visit(visitor{
			[&](vector<byte> const& data) { lib::archive::write_entry(archive, entry.path, data); },
			[&](DirectoryMarker) { lib::archive::write_directory(archive, entry.path); },
		}, entry.contents);
	}
	lib::archive::close(archive);
	return output;
}
catch (runtime_error const& e) {
	throw typed_error_fmt<ArchiveError>("Failed to write the converted copy of \"{}\": {}", input.name, e.what());
}

}
