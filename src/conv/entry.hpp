/*
Copyright (c) 2026 Tearnote (Hubert Maraszek)

Licensed under the Mozilla Public License Version 2.0 <LICENSE-MPL-2.0.txt
or https://www.mozilla.org/en-US/MPL/2.0/> or the Boost Software License <LICENSE-BSL-1.0.txt
or https://www.boost.org/LICENSE_1_0.txt>, at your option. This file may not be copied, modified,
or distributed except according to those terms.
*/


#pragma once
#include "preamble.hpp"
#include "conv/script.hpp"

namespace tcepub::conv {

// Extensions of entries holding convertible markup; lowercase, without the dot.
static constexpr auto TextTargetExtensions = {"htm"sv, "html"sv, "xhtml"sv, "ncx"sv, "opf"sv};

// Extension of the package document, which carries the language declaration.
static constexpr auto MetadataExtension = "opf"sv;

enum class EntryClass {
	Directory,
	TextTarget,
	BinaryPassthrough,
};

// One member of an input archive, with its contents fully read.
struct ArchiveEntry {
	string path;
	bool is_directory;
	vector<byte> contents;
};

// Contents of a directory entry in the output.
struct DirectoryMarker {};
using EntryContents = variant<vector<byte>, DirectoryMarker>;

// Result of the language declaration rewrite.
enum class PatchOutcome {
	NotApplicable, // Not a package document
	Patched,
	DeclarationMissing,
};

// One member of an output archive.
struct TransformedEntry {
	string path;
	EntryContents contents;
	PatchOutcome patch_outcome = PatchOutcome::NotApplicable;
};

// Language declaration rewrite applied to package documents.
struct MetadataPatch {
	string source_language = "zh-CN";
	string target_language = "zh-TW";

	[[nodiscard]] auto source_tag() const -> string { return format("<dc:language>{}</dc:language>", source_language); }
	[[nodiscard]] auto target_tag() const -> string { return format("<dc:language>{}</dc:language>", target_language); }
};

// Return the lowercased text after the last '.' in the path, or an empty string if there
// is no dot.
auto entry_extension(string_view path) -> string;

// Decide how an entry is to be handled. Only the extension and the directory flag are
// considered.
auto classify(string_view path, bool is_directory) -> EntryClass;

// Replace the first source language declaration with the target one, in place. Only applies
// to package documents; other text is left unchanged.
auto patch_metadata(string& text, string_view extension, MetadataPatch const& = {}) -> PatchOutcome;

// Produce the output counterpart of an entry. The path is always converted; text targets
// also have their contents converted and patched, while other entries keep their bytes.
// Throws EntryError if the entry's contents or path cannot be converted.
auto transform(ArchiveEntry, EntryClass, ScriptConverter const&, MetadataPatch const& = {})
	-> TransformedEntry;

}
