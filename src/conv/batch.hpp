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
#include "conv/transcoder.hpp"
#include "conv/script.hpp"
#include "conv/entry.hpp"

namespace tcepub::conv {

// Suffix replacing the extension of every converted archive.
inline constexpr auto ConvertedSuffix = "-converted.epub"sv;

// Name of the bundle entry listing archives that failed in partial mode.
inline constexpr auto FailureManifestName = "failures.txt"sv;

struct BatchOptions {
	// If true, any failing archive fails the whole batch. Otherwise, failing archives are
	// skipped and listed in a manifest inside the bundle.
	bool atomic = true;
};

// Compute the name of a converted archive within the bundle.
// Throws runtime_error if the name cannot be converted.
auto output_name(ScriptConverter const&, string_view display_name) -> string;

// Runs a set of archives through the transcoder, and packages the results into a single
// ZIP bundle.
class BatchProcessor {
public:
	BatchProcessor(Logger::Category, unique_ptr<thread_pool>&, ScriptConverter const&,
		MetadataPatch = {}, BatchOptions = {});

	// Convert all archives, returning the bundle. Archives are converted concurrently, and appear
	// in the bundle in input order.
	// Throws EmptyBatchError immediately if no archives are provided. The returned task throws
	// the first failure in input order if the batch is atomic, BundleError if the bundle can't be
	// assembled, and CancelledError if a stop is requested.
	auto process(span<InputArchive const>, stop_token = {}) -> task<vector<byte>>;

private:
	struct BundleItem {
		string name;
		vector<byte> contents;
	};

	Logger::Category cat;
	unique_ptr<thread_pool>& pool;
	ScriptConverter const& converter;
	Transcoder transcoder;
	BatchOptions options;

	auto process_archives(span<InputArchive const>, stop_token) -> task<vector<byte>>;
	auto write_bundle(span<BundleItem const>) -> vector<byte>;
};

}
