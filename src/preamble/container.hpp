/*
Copyright (c) 2026 Tearnote (Hubert Maraszek)

Licensed under the Mozilla Public License Version 2.0 <LICENSE-MPL-2.0.txt
or https://www.mozilla.org/en-US/MPL/2.0/> or the Boost Software License <LICENSE-BSL-1.0.txt
or https://www.boost.org/LICENSE_1_0.txt>, at your option. This file may not be copied, modified,
or distributed except according to those terms.
*/

#pragma once
#include <string_view>
#include <functional>
#include <string>
#include <array>
#include <span>
#include <boost/container_hash/hash.hpp>
#include <boost/unordered/unordered_flat_set.hpp>
#include <boost/container/vector.hpp>
#include "preamble/types.hpp"

namespace tcepub {

using boost::container::vector;
using std::array;
using std::to_array;
template<typename Key, typename Hash = boost::hash<Key>>
using unordered_set = boost::unordered_flat_set<Key, Hash, std::equal_to<>>;
using std::span;

// Custom hash function that enables heterogenous lookup.
// https://www.cppstories.com/2021/heterogeneous-access-cpp20/
struct string_hash {
	using is_transparent = void;
	[[nodiscard]] auto operator()(char const* text) const -> size_t {
		return boost::hash<std::string_view>{}(text);
	}
	[[nodiscard]] auto operator()(std::string_view text) const -> size_t {
		return boost::hash<std::string_view>{}(text);
	}
	[[nodiscard]] auto operator()(std::string const& text) const -> size_t {
		return boost::hash<std::string>{}(text);
	}
};

}
