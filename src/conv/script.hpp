/*
Copyright (c) 2026 Tearnote (Hubert Maraszek)

Licensed under the Mozilla Public License Version 2.0 <LICENSE-MPL-2.0.txt
or https://www.mozilla.org/en-US/MPL/2.0/> or the Boost Software License <LICENSE-BSL-1.0.txt
or https://www.boost.org/LICENSE_1_0.txt>, at your option. This file may not be copied, modified,
or distributed except according to those terms.
*/


#pragma once
#include "preamble.hpp"
#include "lib/icu.hpp"

namespace tcepub::conv {

// A mapping between two written forms of the same language. Implementations must be pure,
// returning the same output for the same input, and safe to call from multiple threads.
class ScriptConverter {
public:
	virtual ~ScriptConverter() = default;

	// Convert a run of UTF-8 text.
	// Throws runtime_error if the text cannot be converted.
	[[nodiscard]] virtual auto convert(string_view text) const -> string = 0;

	// Convert an entry path or a file name. Path separators are regular characters to
	// the conversion, and must come out unchanged.
	[[nodiscard]] virtual auto convert_name(string_view name) const -> string { return convert(name); }
};

// Converter backed by a system ICU transform.
class IcuScriptConverter: public ScriptConverter {
public:
	static constexpr auto DefaultTransform = "Simplified-Traditional"sv;

	// Throws runtime_error if the transform is not available.
	explicit IcuScriptConverter(string_view transform_id = DefaultTransform);

	[[nodiscard]] auto convert(string_view text) const -> string override;

	[[nodiscard]] auto get_transform_id() const -> string const& { return transform_id; }

private:
	string transform_id;
	lib::icu::Transliterator transliterator;
};

}
