/*
Copyright (c) 2026 Tearnote (Hubert Maraszek)

Licensed under the Mozilla Public License Version 2.0 <LICENSE-MPL-2.0.txt
or https://www.mozilla.org/en-US/MPL/2.0/> or the Boost Software License <LICENSE-BSL-1.0.txt
or https://www.boost.org/LICENSE_1_0.txt>, at your option. This file may not be copied, modified,
or distributed except according to those terms.
*/


#include "io/file.hpp"

#include <fstream>
#include <ios>
#include "preamble.hpp"
#include "lib/mio.hpp"

namespace tcepub::io {

auto read_file(fs::path const& path) -> ReadFile
{
	auto const status = fs::status(path);
	if (!fs::exists(status))
		throw runtime_error_fmt("\"{}\" does not exist", path);
	if (!fs::is_regular_file(status))
		throw runtime_error_fmt("\"{}\" is not a regular file", path);

	auto file = ReadFile{
		.path = path,
		.map = lib::mio::map_for_reading(path),
	};
	file.contents = lib::mio::contents(file.map); // Can't refer to .map in the same initializer
	return file;
}

void write_file(fs::path const& path, span<byte const> contents)
{
	auto partial_path = path;
	partial_path += PartialFileSuffix;
	auto partial_deleter = FileDeleter{partial_path};
	{
		auto file = std::ofstream{};
		file.exceptions(std::ios::failbit | std::ios::badbit);
		file.open(partial_path, std::ios::binary | std::ios::trunc);
		file.write(reinterpret_cast<char const*>(contents.data()), contents.size());
	}
	fs::rename(partial_path, path);
	partial_deleter.disarm();
}

}
