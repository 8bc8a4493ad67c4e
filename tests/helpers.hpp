/*
Copyright (c) 2026 Tearnote (Hubert Maraszek)

Licensed under the Mozilla Public License Version 2.0 <LICENSE-MPL-2.0.txt
or https://www.mozilla.org/en-US/MPL/2.0/> or the Boost Software License <LICENSE-BSL-1.0.txt
or https://www.boost.org/LICENSE_1_0.txt>, at your option. This file may not be copied, modified,
or distributed except according to those terms.
*/


#pragma once
#include <boost/algorithm/string/replace.hpp>
#include <gtest/gtest.h>
#include "preamble.hpp"
#include "utils/logger.hpp"
#include "lib/archive.hpp"
#include "conv/script.hpp"

namespace tcepub::test {

// Converts a few simplified characters to their traditional forms, leaving everything else.
class TableConverter: public conv::ScriptConverter {
public:
	static constexpr auto Table = to_array<pair<string_view, string_view>>({
		{"书", "書"},
		{"马", "馬"},
		{"简", "簡"},
		{"体", "體"},
	});

	[[nodiscard]] auto convert(string_view text) const -> string override
	{
		auto result = string{text};
		for (auto [from, to]: Table)
			boost::replace_all(result, from, to);
		return result;
	}
};

// Fails on any text containing "FAIL".
class FailingConverter: public TableConverter {
public:
	[[nodiscard]] auto convert(string_view text) const -> string override
	{
		if (text.contains("FAIL")) throw runtime_error{"Refusing to convert"};
		return TableConverter::convert(text);
	}
};

// Requests a stop the first time it's used, then converts like TableConverter.
class StoppingConverter: public TableConverter {
public:
	explicit StoppingConverter(stop_source& source): source{source} {}

	[[nodiscard]] auto convert(string_view text) const -> string override
	{
		source.request_stop();
		return TableConverter::convert(text);
	}

private:
	stop_source& source;
};

// A member of a test archive. Directories have no contents.
struct ZipEntry {
	string path;
	optional<string> contents;

	auto operator==(ZipEntry const&) const -> bool = default;
};

inline auto make_zip(initializer_list<ZipEntry> entries) -> vector<byte>
{
	auto output = vector<byte>{};
	auto archive = lib::archive::open_write(output);
	for (auto const& entry: entries) {
		if (entry.contents)
			lib::archive::write_entry(archive, entry.path, as_bytes(*entry.contents));
		else
			lib::archive::write_directory(archive, entry.path);
	}
	lib::archive::close(archive);
	return output;
}

inline auto read_zip(span<byte const> data) -> vector<ZipEntry>
{
	auto archive = lib::archive::open_read(data);
	auto result = vector<ZipEntry>{};
	for (auto header: lib::archive::for_each_entry(archive)) {
		auto path = string{header.pathname};
		if (header.is_directory) {
			result.emplace_back(ZipEntry{move(path), nullopt});
			continue;
		}
		auto const contents = lib::archive::read_data(archive);
		result.emplace_back(ZipEntry{move(path), string{as_text(contents)}});
	}
	return result;
}

inline auto text_bytes(string_view text) -> vector<byte>
{
	auto const bytes = as_bytes(text);
	return {bytes.begin(), bytes.end()};
}

// Provides an empty directory that is removed after the test.
class ScratchDirTest: public testing::Test {
protected:
	fs::path dir = fs::path{testing::TempDir()} /
		format("tcepub-{}", testing::UnitTest::GetInstance()->current_test_info()->name());

	void SetUp() override { fs::create_directories(dir); }
	void TearDown() override { fs::remove_all(dir); }
};

// A logger that captures output of the current test only.
inline auto make_test_logger() -> unique_ptr<Logger::StringLogger>
{
	auto const* info = testing::UnitTest::GetInstance()->current_test_info();
	return globals::logger->create_string_logger(format("{}.{}", info->test_suite_name(), info->name()));
}

}
