/*
Copyright (c) 2026 Tearnote (Hubert Maraszek)

Licensed under the Mozilla Public License Version 2.0 <LICENSE-MPL-2.0.txt
or https://www.mozilla.org/en-US/MPL/2.0/> or the Boost Software License <LICENSE-BSL-1.0.txt
or https://www.boost.org/LICENSE_1_0.txt>, at your option. This file may not be copied, modified,
or distributed except according to those terms.
*/

#pragma once
#include <algorithm>
#include <ranges>

namespace tcepub {

namespace views {
	using std::ranges::views::iota;
	using std::ranges::views::zip;
	using std::ranges::views::enumerate;
}
using std::ranges::contains;
using std::ranges::copy;
using std::ranges::find;
using std::ranges::find_if;
using std::ranges::count_if;
using std::min;
using std::max;

}
