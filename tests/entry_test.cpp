/*
Copyright (c) 2026 Tearnote (Hubert Maraszek)

Licensed under the Mozilla Public License Version 2.0 <LICENSE-MPL-2.0.txt
or https://www.mozilla.org/en-US/MPL/2.0/> or the Boost Software License <LICENSE-BSL-1.0.txt
or https://www.boost.org/LICENSE_1_0.txt>, at your option. This file may not be copied, modified,
or distributed except according to those terms.
*/


#include <gtest/gtest.h>
#include "preamble.hpp"
#include "conv/errors.hpp"
#include "conv/entry.hpp"
#include "helpers.hpp"

namespace tcepub {

using conv::EntryClass;

TEST(EntryExtension, TakesTextAfterLastDot)
{
	EXPECT_EQ(conv::entry_extension("OEBPS/Text/ch01.xhtml"), "xhtml");
	EXPECT_EQ(conv::entry_extension("archive.tar.gz"), "gz");
	EXPECT_EQ(conv::entry_extension("OEBPS/Text/CH01.XHTML"), "xhtml");
	EXPECT_EQ(conv::entry_extension("trailing."), "");
}

TEST(EntryExtension, EmptyWithoutDot)
{
	EXPECT_EQ(conv::entry_extension("mimetype"), "");
	EXPECT_EQ(conv::entry_extension(""), "");
}

TEST(Classify, DirectoryFlagTakesPrecedence)
{
	EXPECT_EQ(conv::classify("OEBPS/", true), EntryClass::Directory);
	EXPECT_EQ(conv::classify("weird.xhtml", true), EntryClass::Directory);
}

TEST(Classify, RecognizesTextTargets)
{
	for (auto path: {"a.htm", "a.html", "a.xhtml", "toc.ncx", "content.opf", "A.XHTML", "B.Opf"})
		EXPECT_EQ(conv::classify(path, false), EntryClass::TextTarget) << path;
}

TEST(Classify, EverythingElseIsBinary)
{
	for (auto path: {"style.css", "cover.jpg", "mimetype", "META-INF/container.xml", "font.ttf", "page.xhtml.bak"})
		EXPECT_EQ(conv::classify(path, false), EntryClass::BinaryPassthrough) << path;
}

TEST(Classify, IsStable)
{
	for (auto path: {"a.xhtml", "b.PNG", "c/", "noext"}) {
		auto const is_directory = string_view{path}.ends_with('/');
		EXPECT_EQ(conv::classify(path, is_directory), conv::classify(path, is_directory)) << path;
	}
	EXPECT_EQ(conv::classify("page.HTML", false), conv::classify("page.html", false));
}

using conv::PatchOutcome;

TEST(PatchMetadata, ReplacesLanguageInPackageDocument)
{
	auto text = "<metadata><dc:language>zh-CN</dc:language></metadata>"s;
	EXPECT_EQ(conv::patch_metadata(text, "opf"), PatchOutcome::Patched);
	EXPECT_EQ(text, "<metadata><dc:language>zh-TW</dc:language></metadata>");
}

TEST(PatchMetadata, ReplacesOnlyFirstOccurrence)
{
	auto text = "<dc:language>zh-CN</dc:language><dc:language>zh-CN</dc:language>"s;
	EXPECT_EQ(conv::patch_metadata(text, "opf"), PatchOutcome::Patched);
	EXPECT_EQ(text, "<dc:language>zh-TW</dc:language><dc:language>zh-CN</dc:language>");
}

TEST(PatchMetadata, LeavesOtherDocumentsAlone)
{
	auto const original = "<dc:language>zh-CN</dc:language>"s;
	for (auto ext: {"xhtml", "ncx", ""}) {
		auto text = original;
		EXPECT_EQ(conv::patch_metadata(text, ext), PatchOutcome::NotApplicable) << ext;
		EXPECT_EQ(text, original);
	}
}

TEST(PatchMetadata, LeavesDocumentWithoutDeclaration)
{
	auto const original = "<dc:language>en</dc:language> <dc:language>zh-CN </dc:language>"s;
	auto text = original;
	EXPECT_EQ(conv::patch_metadata(text, "opf"), PatchOutcome::DeclarationMissing);
	EXPECT_EQ(text, original);
}

TEST(PatchMetadata, UsesConfiguredLanguages)
{
	auto const patch = conv::MetadataPatch{.source_language = "zh-Hans", .target_language = "zh-Hant"};
	auto text = "<dc:language>zh-Hans</dc:language>"s;
	EXPECT_EQ(conv::patch_metadata(text, "opf", patch), PatchOutcome::Patched);
	EXPECT_EQ(text, "<dc:language>zh-Hant</dc:language>");
}

TEST(Transform, ConvertsTextAndPath)
{
	auto const converter = test::TableConverter{};
	auto const result = conv::transform(conv::ArchiveEntry{
		.path = "OEBPS/简体.xhtml",
		.is_directory = false,
		.contents = test::text_bytes("<p>简体书</p>"),
	}, EntryClass::TextTarget, converter);
	EXPECT_EQ(result.path, "OEBPS/簡體.xhtml");
	auto const* contents = get_if<vector<byte>>(&result.contents);
	ASSERT_NE(contents, nullptr);
	EXPECT_EQ(as_text(*contents), "<p>簡體書</p>");
}

TEST(Transform, PatchesPackageDocumentAfterConversion)
{
	auto const converter = test::TableConverter{};
	auto const result = conv::transform(conv::ArchiveEntry{
		.path = "content.opf",
		.is_directory = false,
		.contents = test::text_bytes("<dc:title>马</dc:title><dc:language>zh-CN</dc:language>"),
	}, EntryClass::TextTarget, converter);
	EXPECT_EQ(as_text(get<vector<byte>>(result.contents)), "<dc:title>馬</dc:title><dc:language>zh-TW</dc:language>");
}

TEST(Transform, ReportsPatchOutcome)
{
	auto const converter = test::TableConverter{};
	auto const patched = conv::transform(conv::ArchiveEntry{
		.path = "content.opf",
		.is_directory = false,
		.contents = test::text_bytes("<dc:language>zh-CN</dc:language>"),
	}, EntryClass::TextTarget, converter);
	EXPECT_EQ(patched.patch_outcome, PatchOutcome::Patched);

	auto const chapter = conv::transform(conv::ArchiveEntry{
		.path = "ch01.xhtml",
		.is_directory = false,
		.contents = test::text_bytes("<dc:language>zh-CN</dc:language>"),
	}, EntryClass::TextTarget, converter);
	EXPECT_EQ(chapter.patch_outcome, PatchOutcome::NotApplicable);
}

TEST(Transform, MatchesDeclarationAgainstConvertedText)
{
	// The converter rewrites the declared language itself, so the declaration no longer matches
	auto const converter = test::TableConverter{};
	auto const patch = conv::MetadataPatch{.source_language = "简体", .target_language = "zh-TW"};
	auto const result = conv::transform(conv::ArchiveEntry{
		.path = "content.opf",
		.is_directory = false,
		.contents = test::text_bytes("<dc:language>简体</dc:language>"),
	}, EntryClass::TextTarget, converter, patch);
	EXPECT_EQ(result.patch_outcome, PatchOutcome::DeclarationMissing);
	EXPECT_EQ(as_text(get<vector<byte>>(result.contents)), "<dc:language>簡體</dc:language>");
}

TEST(Transform, PassesBinaryBytesThrough)
{
	auto bytes = vector<byte>{};
	for (auto i: views::iota(0, 256))
		bytes.emplace_back(static_cast<byte>(i));
	auto const converter = test::TableConverter{};
	auto const result = conv::transform(conv::ArchiveEntry{
		.path = "images/书.png",
		.is_directory = false,
		.contents = bytes,
	}, EntryClass::BinaryPassthrough, converter);
	EXPECT_EQ(result.path, "images/書.png");
	EXPECT_EQ(get<vector<byte>>(result.contents), bytes);
}

TEST(Transform, KeepsDirectoriesAsDirectories)
{
	auto const converter = test::TableConverter{};
	auto const result = conv::transform(conv::ArchiveEntry{
		.path = "书/",
		.is_directory = true,
		.contents = {},
	}, EntryClass::Directory, converter);
	EXPECT_EQ(result.path, "書/");
	EXPECT_TRUE(holds_alternative<conv::DirectoryMarker>(result.contents));
}

TEST(Transform, RejectsInvalidText)
{
	auto const converter = test::TableConverter{};
	try {
		static_cast<void>(conv::transform(conv::ArchiveEntry{
			.path = "broken.xhtml",
			.is_directory = false,
			.contents = test::text_bytes("\xff\xfe<p>"),
		}, EntryClass::TextTarget, converter));
		FAIL() << "Invalid UTF-8 was accepted";
	} catch (conv::EntryError const& e) {
		EXPECT_EQ(e.path(), "broken.xhtml");
	}
}

TEST(Transform, DoesNotDecodeBinaryEntries)
{
	auto const converter = test::TableConverter{};
	auto const result = conv::transform(conv::ArchiveEntry{
		.path = "raw.bin",
		.is_directory = false,
		.contents = test::text_bytes("\xff\xfe"),
	}, EntryClass::BinaryPassthrough, converter);
	EXPECT_EQ(as_text(get<vector<byte>>(result.contents)), "\xff\xfe");
}

TEST(Transform, WrapsConverterFailures)
{
	auto const converter = test::FailingConverter{};
	try {
		static_cast<void>(conv::transform(conv::ArchiveEntry{
			.path = "ch01.html",
			.is_directory = false,
			.contents = test::text_bytes("FAIL"),
		}, EntryClass::TextTarget, converter));
		FAIL() << "Converter failure was not reported";
	} catch (conv::EntryError const& e) {
		EXPECT_EQ(e.path(), "ch01.html");
		EXPECT_TRUE(string_view{e.what()}.contains("Refusing to convert"));
	}
}

}
