/*
Copyright (c) 2026 Tearnote (Hubert Maraszek)

Licensed under the Mozilla Public License Version 2.0 <LICENSE-MPL-2.0.txt
or https://www.mozilla.org/en-US/MPL/2.0/> or the Boost Software License <LICENSE-BSL-1.0.txt
or https://www.boost.org/LICENSE_1_0.txt>, at your option. This file may not be copied, modified,
or distributed except according to those terms.
*/


#pragma once
#include "mio/mmap.hpp"
#include "preamble.hpp"

namespace tcepub::lib::mio {

// Read-only mapping of a whole file.
using ReadMapping = ::mio::basic_mmap_source<byte>;

// Map a file for reading. An empty file yields an unmapped instance, as zero-length mappings
// are not possible.
// Throws std::system_error on failure.
inline auto map_for_reading(fs::path const& path) -> ReadMapping
{
	if (fs::file_size(path) == 0) return {};
	return ReadMapping{path.string()};
}

// View the mapped bytes. An unmapped instance has no contents.
inline auto contents(ReadMapping const& mapping) -> span<byte const>
{
	if (!mapping.is_mapped()) return {};
	return {mapping.data(), mapping.size()};
}

}
