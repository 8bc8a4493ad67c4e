/*
Copyright (c) 2026 Tearnote (Hubert Maraszek)

Licensed under the Mozilla Public License Version 2.0 <LICENSE-MPL-2.0.txt
or https://www.mozilla.org/en-US/MPL/2.0/> or the Boost Software License <LICENSE-BSL-1.0.txt
or https://www.boost.org/LICENSE_1_0.txt>, at your option. This file may not be copied, modified,
or distributed except according to those terms.
*/

#pragma once
#include <string_view> // IWYU pragma: export
#include <filesystem>
#include <string> // IWYU pragma: export
#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include "quill/bundled/fmt/format.h"
#include "quill/DeferredFormatCodec.h"
#include "preamble/algorithm.hpp"
#include "preamble/container.hpp"
#include "preamble/concepts.hpp"
#include "preamble/types.hpp"
#include "preamble/os.hpp"

namespace tcepub {

using std::string;
using std::string_view;
using std::literals::operator""s;
using std::literals::operator""sv;
using fmtquill::format;
using fmtquill::print;
using boost::iends_with;
using boost::to_lower_copy;

// View a byte buffer as text, without any decoding.
inline auto as_text(span<byte const> bytes) -> string_view
{
	return {reinterpret_cast<char const*>(bytes.data()), bytes.size()};
}

// View text as a byte buffer.
inline auto as_bytes(string_view text) -> span<byte const>
{
	return {reinterpret_cast<byte const*>(text.data()), text.size()};
}

}

template<>
struct fmtquill::formatter<tcepub::fs::path>: formatter<std::string_view> {
	auto format(tcepub::fs::path const& c, format_context& ctx) const -> format_context::iterator
	{
		return formatter<std::string_view>::format(c.string(), ctx);
	}
};
template<>
struct quill::Codec<tcepub::fs::path>: DeferredFormatCodec<tcepub::fs::path> {};
