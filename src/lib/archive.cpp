/*
Copyright (c) 2026 Tearnote (Hubert Maraszek)

Licensed under the Mozilla Public License Version 2.0 <LICENSE-MPL-2.0.txt
or https://www.mozilla.org/en-US/MPL/2.0/> or the Boost Software License <LICENSE-BSL-1.0.txt
or https://www.boost.org/LICENSE_1_0.txt>, at your option. This file may not be copied, modified,
or distributed except according to those terms.
*/

#include "lib/archive.hpp"

#include <archive_entry.h>
#include <archive.h>
#include "preamble.hpp"
#include "utils/logger.hpp"

namespace tcepub::lib::archive {

using Entry = unique_resource<archive_entry*, decltype([](archive_entry* e) noexcept {
	archive_entry_free(e);
})>;

// Helper function for error handling. Warnings are logged and otherwise ignored.
template<typename T>
requires same_as<T, ReadArchive> || same_as<T, WriteArchive>
static void ret_check(int ret, T& archive)
{
	if (ret == ARCHIVE_OK) return;
	auto const* message = archive_error_string(archive.get());
	if (!message) message = "libarchive error";
	if (ret == ARCHIVE_WARN) {
		WARN("libarchive: {}", message);
		return;
	}
	throw runtime_error_fmt("{}", message);
}

static auto write_callback(::archive*, void* client_data, void const* buffer, size_t length) -> la_ssize_t
{
	auto& output = *static_cast<vector<byte>*>(client_data);
	auto const* data = static_cast<byte const*>(buffer);
	output.insert(output.end(), data, data + length);
	return static_cast<la_ssize_t>(length);
}

auto open_read(span<byte const> data) -> ReadArchive
{
	if (data.empty()) throw runtime_error{"Cannot open archive from an empty buffer"};
	auto* archive = archive_read_new();
	if (!archive) throw runtime_error{"Failed to allocate archive reader"};
	auto result = ReadArchive{archive};
	ret_check(archive_read_support_format_zip(archive), result);
	ret_check(archive_read_open_memory(archive, data.data(), data.size()), result);
	return result;
}

void detail::ReadArchiveDeleter::operator()(::archive* ar) noexcept
{
	archive_read_free(ar);
}

auto open_write(vector<byte>& output) -> WriteArchive
{
	auto* archive = archive_write_new();
	if (!archive) throw runtime_error{"Failed to allocate archive writer"};
	auto result = WriteArchive{archive};
	ret_check(archive_write_set_format_zip(archive), result);
	ret_check(archive_write_zip_set_compression_deflate(archive), result);
	ret_check(archive_write_set_option(archive, "zip", "hdrcharset", "UTF-8"), result);
	ret_check(archive_write_set_bytes_in_last_block(archive, 1), result); // No padding after the central directory
	ret_check(archive_write_open(archive, &output, nullptr, write_callback, nullptr), result);
	return result;
}

void detail::WriteArchiveDeleter::operator()(::archive* ar) noexcept
{
	archive_write_free(ar);
}

auto for_each_entry(ReadArchive& archive) -> generator<EntryHeader>
{
	while (true) {
		auto* entry = static_cast<archive_entry*>(nullptr);
		auto const ret = archive_read_next_header(archive.get(), &entry);
		if (ret == ARCHIVE_EOF) co_return;
		ret_check(ret, archive);

		auto const* pathname = archive_entry_pathname_utf8(entry);
		if (!pathname) pathname = archive_entry_pathname(entry);
		if (!pathname) throw runtime_error{"Archive entry has no pathname"};
		auto const pathname_sv = string_view{pathname};
		co_yield EntryHeader{
			.pathname = pathname_sv,
			.is_directory = archive_entry_filetype(entry) == AE_IFDIR || pathname_sv.ends_with('/'),
		};
	}
}

auto read_data(ReadArchive& archive) -> vector<byte>
{
	auto result = vector<byte>{};
	auto* buf = static_cast<byte const*>(nullptr);
	auto size = 0zu;
	auto offset = la_int64_t{0};
	while (true) {
		auto const ret = archive_read_data_block(archive.get(), reinterpret_cast<void const**>(&buf),
			&size, &offset);
		if (ret == ARCHIVE_EOF) break;
		ret_check(ret, archive);

		result.resize(offset + size);
		if (size > 0) copy(span{buf, size}, &result[offset]);
	}
	return result;
}

void write_entry(WriteArchive& archive, string_view pathname, span<byte const> data)
{
	auto entry = Entry{archive_entry_new()};
	archive_entry_set_pathname_utf8(entry.get(), string{pathname}.c_str());
	archive_entry_set_filetype(entry.get(), AE_IFREG);
	archive_entry_set_perm(entry.get(), 0644);
	archive_entry_set_size(entry.get(), data.size());
	ret_check(archive_write_header(archive.get(), entry.get()), archive);
	if (data.empty()) return;

	auto const written = archive_write_data(archive.get(), data.data(), data.size());
	if (written < 0) ret_check(ARCHIVE_FATAL, archive);
	if (static_cast<size_t>(written) != data.size())
		throw runtime_error_fmt("Short write of \"{}\": {} of {} bytes", pathname, written, data.size());
}

void write_directory(WriteArchive& archive, string_view pathname)
{
	auto dirname = string{pathname};
	if (!dirname.ends_with('/')) dirname.push_back('/');
	auto entry = Entry{archive_entry_new()};
	archive_entry_set_pathname_utf8(entry.get(), dirname.c_str());
	archive_entry_set_filetype(entry.get(), AE_IFDIR);
	archive_entry_set_perm(entry.get(), 0755);
	archive_entry_set_size(entry.get(), 0);
	ret_check(archive_write_header(archive.get(), entry.get()), archive);
}

void close(WriteArchive& archive)
{
	ret_check(archive_write_close(archive.get()), archive);
}

}
