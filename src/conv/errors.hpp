/*
Copyright (c) 2026 Tearnote (Hubert Maraszek)

Licensed under the Mozilla Public License Version 2.0 <LICENSE-MPL-2.0.txt
or https://www.mozilla.org/en-US/MPL/2.0/> or the Boost Software License <LICENSE-BSL-1.0.txt
or https://www.boost.org/LICENSE_1_0.txt>, at your option. This file may not be copied, modified,
or distributed except according to those terms.
*/


#pragma once
#include "preamble.hpp"

namespace tcepub::conv {

// An input archive could not be opened, read or re-encoded.
class ArchiveError: public runtime_error {
public:
	using runtime_error::runtime_error;
};

// A single entry could not be decoded, converted or encoded.
class EntryError: public runtime_error {
public:
	EntryError(string path, string const& message): runtime_error{message}, entry_path{move(path)} {}

	// Path of the failing entry, as stored in the input archive.
	[[nodiscard]] auto path() const -> string const& { return entry_path; }

private:
	string entry_path;
};

// A batch was submitted with no archives.
class EmptyBatchError: public runtime_error {
public:
	using runtime_error::runtime_error;
};

// The output bundle could not be assembled.
class BundleError: public runtime_error {
public:
	using runtime_error::runtime_error;
};

// Work was abandoned because a stop was requested.
class CancelledError: public runtime_error {
public:
	using runtime_error::runtime_error;
};

}
