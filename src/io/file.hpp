/*
Copyright (c) 2026 Tearnote (Hubert Maraszek)

Licensed under the Mozilla Public License Version 2.0 <LICENSE-MPL-2.0.txt
or https://www.mozilla.org/en-US/MPL/2.0/> or the Boost Software License <LICENSE-BSL-1.0.txt
or https://www.boost.org/LICENSE_1_0.txt>, at your option. This file may not be copied, modified,
or distributed except according to those terms.
*/


#pragma once
#include "preamble.hpp"
#include "lib/mio.hpp"

namespace tcepub::io {

// Suffix of the temporary file that receives output before it's moved into place.
inline constexpr auto PartialFileSuffix = ".part"sv;

// An input file mapped into memory. Contents remain valid for as long as the instance lives.
struct ReadFile {
	fs::path path;
	lib::mio::ReadMapping map;
	span<byte const> contents;
};

// A utility that will delete a file at the end of scope, unless disarmed.
class FileDeleter {
public:
	explicit FileDeleter(fs::path path): path{move(path)} {}
	~FileDeleter() { if (!disarmed) fs::remove(path, ignored_error); }
	void disarm() { disarmed = true; }

	FileDeleter(FileDeleter const&) = delete;
	auto operator=(FileDeleter const&) -> FileDeleter& = delete;
	FileDeleter(FileDeleter&&) = delete;
	auto operator=(FileDeleter&&) -> FileDeleter& = delete;

private:
	fs::path path;
	bool disarmed = false;
	std::error_code ignored_error;
};

// Map a file for reading. Empty files are valid, and have empty contents.
// Throws runtime_error if the provided path doesn't exist or isn't a regular file, or
// system_error if it can't be mapped.
auto read_file(fs::path const&) -> ReadFile;

// Write contents to a file, replacing it if it already exists. The data is written to
// a sibling file first, so the destination is never left partially written.
// Throws std::ios::failure or filesystem_error on I/O error.
void write_file(fs::path const&, span<byte const> contents);

}
