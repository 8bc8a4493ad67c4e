/*
Copyright (c) 2026 Tearnote (Hubert Maraszek)

Licensed under the Mozilla Public License Version 2.0 <LICENSE-MPL-2.0.txt
or https://www.mozilla.org/en-US/MPL/2.0/> or the Boost Software License <LICENSE-BSL-1.0.txt
or https://www.boost.org/LICENSE_1_0.txt>, at your option. This file may not be copied, modified,
or distributed except according to those terms.
*/

#include "lib/icu.hpp"

#include <unicode/translit.h>
#include <unicode/unistr.h>
#include <unicode/utf8.h>
#include <limits>
#include "preamble.hpp"

namespace tcepub::lib::icu {

static auto to_unicode(string_view input) -> ::icu::UnicodeString
{
	if (input.size() > static_cast<size_t>(std::numeric_limits<int32_t>::max()))
		throw runtime_error_fmt("Text of {} bytes is too large to convert", input.size());
	auto result = ::icu::UnicodeString::fromUTF8(
		::icu::StringPiece{input.data(), static_cast<int32_t>(input.size())});
	if (result.isBogus()) throw runtime_error{"ICU error: failed to allocate string"};
	return result;
}

void detail::TransliteratorDeleter::operator()(::icu::Transliterator* t) noexcept
{
	delete t;
}

auto create_transliterator(string_view id) -> Transliterator
{
	auto err = U_ZERO_ERROR;
	auto result = Transliterator{::icu::Transliterator::createInstance(to_unicode(id), UTRANS_FORWARD, err)};
	if (U_FAILURE(err) || !result)
		throw runtime_error_fmt("Unknown transform \"{}\": {}", id, u_errorName(err));
	return result;
}

auto is_valid_utf8(string_view input) -> bool
{
	if (input.size() > static_cast<size_t>(std::numeric_limits<int32_t>::max())) return false;
	auto const* src = reinterpret_cast<uint8_t const*>(input.data());
	auto const len = static_cast<int32_t>(input.size());

	auto i = 0;
	while (i < len) {
		auto c = UChar32{};
		U8_NEXT(src, i, len, c);
		if (c < 0) return false;
	}
	return true;
}

auto transliterate(::icu::Transliterator const& prototype, string_view input) -> string
{
	if (!is_valid_utf8(input)) throw runtime_error{"Text is not valid UTF-8"};
	auto text = to_unicode(input);

	// The prototype may be shared between threads; only the clone is mutated
	auto instance = Transliterator{prototype.clone()};
	if (!instance) throw runtime_error{"ICU error: failed to clone transform"};
	instance->transliterate(text);
	if (text.isBogus()) throw runtime_error{"ICU error: transform produced an invalid string"};

	auto result = string{};
	text.toUTF8String(result);
	return result;
}

}
