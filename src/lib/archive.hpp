/*
Copyright (c) 2026 Tearnote (Hubert Maraszek)

Licensed under the Mozilla Public License Version 2.0 <LICENSE-MPL-2.0.txt
or https://www.mozilla.org/en-US/MPL/2.0/> or the Boost Software License <LICENSE-BSL-1.0.txt
or https://www.boost.org/LICENSE_1_0.txt>, at your option. This file may not be copied, modified,
or distributed except according to those terms.
*/

#pragma once
#include "preamble.hpp"

// Forward declarations

struct archive;

namespace tcepub::lib::archive {

namespace detail {
struct ReadArchiveDeleter {
	static void operator()(::archive*) noexcept;
};
struct WriteArchiveDeleter {
	static void operator()(::archive*) noexcept;
};
}

using ReadArchive = unique_resource<::archive*, detail::ReadArchiveDeleter>;
using WriteArchive = unique_resource<::archive*, detail::WriteArchiveDeleter>;

// Header of an archive entry, as seen during iteration. The pathname is only valid until
// the next entry is requested.
struct EntryHeader {
	string_view pathname;
	bool is_directory;
};

// Open a ZIP archive for reading. The data must outlive the returned archive.
// Throws runtime_error if the data is empty or not recognized as a ZIP container.
auto open_read(span<byte const>) -> ReadArchive;

// Open a ZIP archive for writing into a memory buffer, using deflate compression.
// The buffer is appended to, and must outlive the returned archive.
auto open_write(vector<byte>& output) -> WriteArchive;

// Yield the header of each entry in the archive, in stored order. While an entry is current,
// read_data() can be called to retrieve its contents.
// Throws runtime_error on a damaged archive.
auto for_each_entry(ReadArchive&) -> generator<EntryHeader>;

// Read the contents of the current entry. To be used from within for_each_entry() iteration.
auto read_data(ReadArchive&) -> vector<byte>;

// Write a regular file entry into the archive.
void write_entry(WriteArchive&, string_view pathname, span<byte const> data);

// Write a directory entry into the archive. A trailing slash is added if missing.
void write_directory(WriteArchive&, string_view pathname);

// Write the central directory and flush all remaining data into the output buffer.
// The archive cannot be written to afterwards.
void close(WriteArchive&);

}
