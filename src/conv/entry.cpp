/*
Copyright (c) 2026 Tearnote (Hubert Maraszek)

Licensed under the Mozilla Public License Version 2.0 <LICENSE-MPL-2.0.txt
or https://www.mozilla.org/en-US/MPL/2.0/> or the Boost Software License <LICENSE-BSL-1.0.txt
or https://www.boost.org/LICENSE_1_0.txt>, at your option. This file may not be copied, modified,
or distributed except according to those terms.
*/


#include "conv/entry.hpp"

#include "preamble.hpp"
#include "lib/icu.hpp"
#include "conv/script.hpp"
#include "conv/errors.hpp"

namespace tcepub::conv {

auto entry_extension(string_view path) -> string
{
	auto const dot = path.rfind('.');
	if (dot == string_view::npos) return {};
	return to_lower_copy(string{path.substr(dot + 1)});
}

auto classify(string_view path, bool is_directory) -> EntryClass
{
	if (is_directory) return EntryClass::Directory;
	auto const ext = entry_extension(path);
	if (contains(TextTargetExtensions, ext)) return EntryClass::TextTarget;
	return EntryClass::BinaryPassthrough;
}

auto patch_metadata(string& text, string_view extension, MetadataPatch const& patch) -> PatchOutcome
{
	if (extension != MetadataExtension) return PatchOutcome::NotApplicable;
	auto const source_tag = patch.source_tag();
	auto const pos = text.find(source_tag);
	if (pos == string::npos) return PatchOutcome::DeclarationMissing;
	text.replace(pos, source_tag.size(), patch.target_tag());
	return PatchOutcome::Patched;
}

static auto convert_text(ArchiveEntry const& entry, ScriptConverter const& converter,
	MetadataPatch const& patch, PatchOutcome& outcome) -> vector<byte>
{
	auto const text = as_text(entry.contents);
	if (!lib::icu::is_valid_utf8(text))
		throw EntryError{entry.path, format("\"{}\" is not valid UTF-8 text", entry.path)};
	auto converted = converter.convert(text);
	outcome = patch_metadata(converted, entry_extension(entry.path), patch);
	auto const bytes = as_bytes(converted);
	return {bytes.begin(), bytes.end()};
}

auto transform(ArchiveEntry entry, EntryClass entry_class, ScriptConverter const& converter,
	MetadataPatch const& patch) -> TransformedEntry
try {
	auto path = converter.convert_name(entry.path);
	switch (entry_class) {
	case EntryClass::Directory:
		return {.path = move(path), .contents = DirectoryMarker{}};
	case EntryClass::TextTarget: {
		auto outcome = PatchOutcome::NotApplicable;
		auto contents = convert_text(entry, converter, patch, outcome);
		return {.path = move(path), .contents = move(contents), .patch_outcome = outcome};
	}
	case EntryClass::BinaryPassthrough:
		return {.path = move(path), .contents = move(entry.contents)};
	}
	throw logic_error_fmt("Unknown entry class {}", +entry_class);
}
catch (EntryError const&) {
	throw;
}
catch (runtime_error const& e) {
	throw EntryError{entry.path, format("Failed to convert \"{}\": {}", entry.path, e.what())};
}

}
