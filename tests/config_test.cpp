/*
Copyright (c) 2026 Tearnote (Hubert Maraszek)

Licensed under the Mozilla Public License Version 2.0 <LICENSE-MPL-2.0.txt
or https://www.mozilla.org/en-US/MPL/2.0/> or the Boost Software License <LICENSE-BSL-1.0.txt
or https://www.boost.org/LICENSE_1_0.txt>, at your option. This file may not be copied, modified,
or distributed except according to those terms.
*/


#include <gtest/gtest.h>
#include <toml++/toml.hpp>
#include "preamble.hpp"
#include "utils/config.hpp"
#include "io/file.hpp"
#include "helpers.hpp"

namespace tcepub {

using ConfigTest = test::ScratchDirTest;

TEST_F(ConfigTest, LoadsValuesFromFile)
{
	auto const path = dir / "config.toml";
	io::write_file(path, as_bytes("[batch]\natomic = false\nthread_count = 3\n"));
	auto config = Config{path};
	config.load_from_file();
	EXPECT_FALSE(config.get_entry<bool>("batch", "atomic"));
	EXPECT_EQ(config.get_entry<int>("batch", "thread_count"), 3);
	EXPECT_EQ(config.get_entry<string>("conversion", "transliterator"), "Simplified-Traditional");
}

TEST_F(ConfigTest, CreatesFileWithDefaults)
{
	auto const path = dir / "config.toml";
	{
		auto config = Config{path};
		config.load_from_file();
	}
	ASSERT_TRUE(fs::exists(path));
	auto config = Config{path};
	config.load_from_file();
	EXPECT_TRUE(config.get_entry<bool>("batch", "atomic"));
	EXPECT_EQ(config.get_entry<string>("conversion", "source_language"), "zh-CN");
	EXPECT_EQ(config.get_entry<string>("conversion", "target_language"), "zh-TW");
}

TEST_F(ConfigTest, KeepsMalformedFile)
{
	auto const path = dir / "config.toml";
	auto const malformed = "[batch]\natomic = false\nthread_count = = 4\n"sv;
	io::write_file(path, as_bytes(malformed));
	{
		auto config = Config{path};
		EXPECT_THROW(config.load_from_file(), toml::parse_error);
	}
	EXPECT_EQ(as_text(io::read_file(path).contents), malformed);
}

TEST_F(ConfigTest, WritesNothingIfNeverLoaded)
{
	auto const path = dir / "config.toml";
	{
		auto config = Config{path};
	}
	EXPECT_FALSE(fs::exists(path));
}

}
