/*
Copyright (c) 2026 Tearnote (Hubert Maraszek)

Licensed under the Mozilla Public License Version 2.0 <LICENSE-MPL-2.0.txt
or https://www.mozilla.org/en-US/MPL/2.0/> or the Boost Software License <LICENSE-BSL-1.0.txt
or https://www.boost.org/LICENSE_1_0.txt>, at your option. This file may not be copied, modified,
or distributed except according to those terms.
*/


#include "conv/script.hpp"

#include "preamble.hpp"
#include "lib/icu.hpp"

namespace tcepub::conv {

IcuScriptConverter::IcuScriptConverter(string_view transform_id):
	transform_id{transform_id},
	transliterator{lib::icu::create_transliterator(transform_id)}
{}

auto IcuScriptConverter::convert(string_view text) const -> string
{
	return lib::icu::transliterate(*transliterator, text);
}

}
