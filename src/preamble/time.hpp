/*
Copyright (c) 2026 Tearnote (Hubert Maraszek)

Licensed under the Mozilla Public License Version 2.0 <LICENSE-MPL-2.0.txt
or https://www.mozilla.org/en-US/MPL/2.0/> or the Boost Software License <LICENSE-BSL-1.0.txt
or https://www.boost.org/LICENSE_1_0.txt>, at your option. This file may not be copied, modified,
or distributed except according to those terms.
*/

#pragma once
#include <chrono> // IWYU pragma: export

namespace tcepub {

using std::literals::operator ""ns;
using std::chrono::duration;
using std::chrono::duration_cast;
using std::chrono::steady_clock;

// Milliseconds elapsed since the provided time point, as a floating-point number.
inline auto elapsed_ms(steady_clock::time_point since) -> double
{
	return duration_cast<duration<double, std::milli>>(steady_clock::now() - since).count();
}

}
