/*
Copyright (c) 2026 Tearnote (Hubert Maraszek)

Licensed under the Mozilla Public License Version 2.0 <LICENSE-MPL-2.0.txt
or https://www.mozilla.org/en-US/MPL/2.0/> or the Boost Software License <LICENSE-BSL-1.0.txt
or https://www.boost.org/LICENSE_1_0.txt>, at your option. This file may not be copied, modified,
or distributed except according to those terms.
*/


#include <gtest/gtest.h>
#include "preamble.hpp"
#include "lib/archive.hpp"
#include "helpers.hpp"

namespace tcepub {

TEST(Archive, PreservesEntriesAndOrder)
{
	auto const zip = test::make_zip({
		{"mimetype", "application/epub+zip"},
		{"OEBPS/", nullopt},
		{"OEBPS/書.xhtml", "<p>書</p>"},
		{"OEBPS/empty.css", ""},
	});
	auto const expected = vector<test::ZipEntry>{
		{"mimetype", "application/epub+zip"},
		{"OEBPS/", nullopt},
		{"OEBPS/書.xhtml", "<p>書</p>"},
		{"OEBPS/empty.css", ""},
	};
	EXPECT_EQ(test::read_zip(zip), expected);
}

TEST(Archive, ReadsEntriesSpanningManyBlocks)
{
	auto large = string{};
	for (auto i: views::iota(0, 200000))
		large.append(format("{:08x}", i * 2654435761u));
	auto const zip = test::make_zip({{"OEBPS/large.bin", large}});
	auto const entries = test::read_zip(zip);
	ASSERT_EQ(entries.size(), 1zu);
	ASSERT_TRUE(entries[0].contents);
	EXPECT_EQ(entries[0].contents->size(), large.size());
	EXPECT_TRUE(*entries[0].contents == large);
}

TEST(Archive, AddsSlashToDirectories)
{
	auto const zip = test::make_zip({{"images", nullopt}});
	auto const entries = test::read_zip(zip);
	ASSERT_EQ(entries.size(), 1zu);
	EXPECT_EQ(entries[0].path, "images/");
	EXPECT_FALSE(entries[0].contents);
}

TEST(Archive, EmptyArchiveHasNoEntries)
{
	auto const zip = test::make_zip({});
	EXPECT_FALSE(zip.empty());
	EXPECT_TRUE(test::read_zip(zip).empty());
}

TEST(Archive, RejectsEmptyBuffer)
{
	EXPECT_THROW(lib::archive::open_read({}), runtime_error);
}

TEST(Archive, RejectsGarbage)
{
	auto const garbage = test::text_bytes("This is not a ZIP file, just some text that goes on for a while.");
	EXPECT_THROW(test::read_zip(garbage), runtime_error);
}

}
