/*
Copyright (c) 2026 Tearnote (Hubert Maraszek)

Licensed under the Mozilla Public License Version 2.0 <LICENSE-MPL-2.0.txt
or https://www.mozilla.org/en-US/MPL/2.0/> or the Boost Software License <LICENSE-BSL-1.0.txt
or https://www.boost.org/LICENSE_1_0.txt>, at your option. This file may not be copied, modified,
or distributed except according to those terms.
*/

#pragma once
#include "preamble.hpp"
#include "utils/service.hpp"

namespace tcepub {
inline constexpr auto AppTitle = "tcepub";
inline constexpr auto AppVersion = to_array({0u, 2u, 0u});

#if !defined(BUILD_DEBUG) && !defined(BUILD_RELDEB) && !defined(BUILD_RELEASE)
#error Build type incorrectly defined
#endif

// Logfile location
#ifdef BUILD_DEBUG
inline constexpr auto LogfilePath = "tcepub-debug.log"sv;
#elifdef BUILD_RELDEB
inline constexpr auto LogfilePath = "tcepub-reldeb.log"sv;
#else
inline constexpr auto LogfilePath = "tcepub.log"sv;
#endif

// Config file location
inline constexpr auto DefaultConfigPath = "config.toml"sv;

// Global runtime configuration, kept in sync with the config file.
class Config {
public:
	using Value = variant<int, bool, string>;
	struct Entry {
		string category;
		string name;
		Value value;
	};

	// Create the config object, with entries at their default values.
	explicit Config(fs::path path = DefaultConfigPath): path{move(path)} { create_defaults(); }

	// Overwrite the config file with current entries. Nothing is written unless
	// load_from_file() succeeded.
	~Config() noexcept;

	// Update all entries with values from the config file. A missing file is not an error.
	// Throws toml::parse_error on malformed files.
	void load_from_file();

	// Flush the config to file, overwriting it.
	void save_to_file() const;

	// Get the value of an entry.
	template <variant_alternative<Value> T>
	[[nodiscard]] auto get_entry(string_view category, string_view name) const -> T const&
	{ return get<T>(find_entry(category, name).value); }

	Config(Config const&) = delete;
	auto operator=(Config const&) -> Config& = delete;
	Config(Config&&) = delete;
	auto operator=(Config&&) -> Config& = delete;

private:
	fs::path path;
	vector<Entry> entries;
	bool loaded = false;

	[[nodiscard]] auto find_entry(string_view category, string_view name) const -> Entry const&;
	void create_defaults();
};

namespace globals {
inline auto config = Service<Config>{};
}

}
