/*
Copyright (c) 2026 Tearnote (Hubert Maraszek)

Licensed under the Mozilla Public License Version 2.0 <LICENSE-MPL-2.0.txt
or https://www.mozilla.org/en-US/MPL/2.0/> or the Boost Software License <LICENSE-BSL-1.0.txt
or https://www.boost.org/LICENSE_1_0.txt>, at your option. This file may not be copied, modified,
or distributed except according to those terms.
*/

#include "lib/os.hpp"

#ifdef __linux__
#include <pthread.h>
#endif
#include "preamble.hpp"

namespace tcepub::lib::os {

void name_current_thread(string_view name)
{
#ifdef __linux__
	static constexpr auto MaxNameLength = 15zu; // Excluding the terminator
	auto const truncated = string{name.substr(0, MaxNameLength)};
	auto const err = pthread_setname_np(pthread_self(), truncated.c_str());
	if (err != 0)
		throw runtime_error_fmt("Failed to set thread name: error {}", err);
#endif
}

}
