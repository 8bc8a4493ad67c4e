/*
Copyright (c) 2026 Tearnote (Hubert Maraszek)

Licensed under the Mozilla Public License Version 2.0 <LICENSE-MPL-2.0.txt
or https://www.mozilla.org/en-US/MPL/2.0/> or the Boost Software License <LICENSE-BSL-1.0.txt
or https://www.boost.org/LICENSE_1_0.txt>, at your option. This file may not be copied, modified,
or distributed except according to those terms.
*/

#pragma once
#include <generator>
#include "coro/coro.hpp"

namespace tcepub {

template<typename T = void>
using task = coro::task<T>;
using coro::when_all;
using coro::sync_wait;
using coro::thread_pool;
using std::generator;

}
