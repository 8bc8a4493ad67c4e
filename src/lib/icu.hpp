/*
Copyright (c) 2026 Tearnote (Hubert Maraszek)

Licensed under the Mozilla Public License Version 2.0 <LICENSE-MPL-2.0.txt
or https://www.mozilla.org/en-US/MPL/2.0/> or the Boost Software License <LICENSE-BSL-1.0.txt
or https://www.boost.org/LICENSE_1_0.txt>, at your option. This file may not be copied, modified,
or distributed except according to those terms.
*/

#pragma once
#include "preamble.hpp"

// Forward declarations

#include <unicode/uversion.h>
U_NAMESPACE_BEGIN
class Transliterator;
U_NAMESPACE_END

namespace tcepub::lib::icu {

namespace detail {
struct TransliteratorDeleter {
	static void operator()(::icu::Transliterator*) noexcept;
};
}

// A compiled ICU transform, such as "Simplified-Traditional".
using Transliterator = unique_ptr<::icu::Transliterator, detail::TransliteratorDeleter>;

// Instantiate a system transform by its ID.
// Throws runtime_error if the ID is unknown or the ICU data is missing.
auto create_transliterator(string_view id) -> Transliterator;

// Return true if the input is well-formed UTF-8.
auto is_valid_utf8(string_view input) -> bool;

// Apply a transform to UTF-8 text, returning UTF-8 text. The transform is cloned for the call,
// so one instance can be shared between threads.
// Throws runtime_error if the input is not well-formed UTF-8, or on ICU failure.
auto transliterate(::icu::Transliterator const&, string_view input) -> string;

}
