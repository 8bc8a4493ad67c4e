/*
Copyright (c) 2026 Tearnote (Hubert Maraszek)

Licensed under the Mozilla Public License Version 2.0 <LICENSE-MPL-2.0.txt
or https://www.mozilla.org/en-US/MPL/2.0/> or the Boost Software License <LICENSE-BSL-1.0.txt
or https://www.boost.org/LICENSE_1_0.txt>, at your option. This file may not be copied, modified,
or distributed except according to those terms.
*/

#include "utils/config.hpp"

#include <toml++/toml.hpp>
#include <sstream>
#include "preamble.hpp"
#include "utils/logger.hpp"
#include "utils/assert.hpp"
#include "io/file.hpp"

namespace tcepub {

Config::~Config() noexcept
try {
	if (loaded) save_to_file();
} catch (exception const& e) {
	if (globals::logger) ERROR("Failed to flush config to file: {}", e.what());
}

void Config::load_from_file()
{
	if (!fs::exists(path)) {
		loaded = true;
		return;
	}
	auto const file = io::read_file(path);
	auto const toml_data = toml::parse(as_text(file.contents), path.string());

	for (auto& entry: entries) {
		auto const* category_table = toml_data[entry.category].as_table();
		if (!category_table || !category_table->contains(entry.name)) continue;
		visit([&](auto& v) {
			auto const toml_entry = (*category_table)[entry.name].value<remove_cvref_t<decltype(v)>>();
			if (!toml_entry) return;
			v = *toml_entry;
		}, entry.value);
	}
	loaded = true;
}

void Config::save_to_file() const
{
	auto toml_data = toml::table{};
	for (auto const& entry: entries) {
		if (!toml_data.contains(entry.category))
			toml_data.insert(entry.category, toml::table{});
		auto& category_table = *toml_data[entry.category].as_table();
		visit([&](auto const& v) { category_table.insert_or_assign(entry.name, v); }, entry.value);
	}

	auto file_content = std::stringstream{};
	file_content << toml_data;
	io::write_file(path, as_bytes(file_content.view()));
}

auto Config::find_entry(string_view category, string_view name) const -> Entry const&
{
	auto iter = find_if(entries, [&](auto const& e) { return e.category == category && e.name == name; });
	ASSERT(iter != entries.end());
	return *iter;
}

// Consult this function for the list of registered config entries.
void Config::create_defaults()
{
	entries.emplace_back(Entry{
		.category = "logging",
		.name = "global",
		.value = "Info",
	});
	entries.emplace_back(Entry{
		.category = "logging",
		.name = "transcode",
		.value = "Info",
	});

	entries.emplace_back(Entry{
		.category = "conversion",
		.name = "transliterator",
		.value = "Simplified-Traditional",
	});
	entries.emplace_back(Entry{
		.category = "conversion",
		.name = "source_language",
		.value = "zh-CN",
	});
	entries.emplace_back(Entry{
		.category = "conversion",
		.name = "target_language",
		.value = "zh-TW",
	});

	entries.emplace_back(Entry{
		.category = "batch",
		.name = "atomic",
		.value = true,
	});
	entries.emplace_back(Entry{
		.category = "batch",
		.name = "thread_count",
		.value = 0,
	});
}

}
