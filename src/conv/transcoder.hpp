/*
Copyright (c) 2026 Tearnote (Hubert Maraszek)

Licensed under the Mozilla Public License Version 2.0 <LICENSE-MPL-2.0.txt
or https://www.mozilla.org/en-US/MPL/2.0/> or the Boost Software License <LICENSE-BSL-1.0.txt
or https://www.boost.org/LICENSE_1_0.txt>, at your option. This file may not be copied, modified,
or distributed except according to those terms.
*/


#pragma once
#include "preamble.hpp"
#include "utils/logger.hpp"
#include "conv/script.hpp"
#include "conv/entry.hpp"

namespace tcepub::conv {

// An archive submitted for conversion. The contents are not owned, and must remain valid
// until conversion completes.
struct InputArchive {
	string name;
	span<byte const> contents;
};

// Converts a single archive, entry by entry. Entries are transformed in parallel on the thread
// pool, and written out in their original order.
class Transcoder {
public:
	Transcoder(Logger::Category, unique_ptr<thread_pool>&, ScriptConverter const&, MetadataPatch = {});

	// Produce a converted copy of the archive, serialized as a ZIP container.
	// The returned task must be awaited before the input goes out of scope.
	// Throws ArchiveError if the input is not a readable archive or the output can't be encoded,
	// EntryError on the first entry that fails to convert, and CancelledError if a stop
	// is requested.
	auto transcode(InputArchive const&, stop_token = {}) -> task<vector<byte>>;

private:
	Logger::Category cat;
	unique_ptr<thread_pool>& pool;
	ScriptConverter const& converter;
	MetadataPatch patch;

	auto transform_entry(ArchiveEntry, EntryClass, stop_token) -> task<TransformedEntry>;
	auto read_entries(InputArchive const&) -> vector<ArchiveEntry>;
	auto write_entries(InputArchive const&, span<TransformedEntry const>) -> vector<byte>;
};

}
