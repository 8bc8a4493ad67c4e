/*
Copyright (c) 2026 Tearnote (Hubert Maraszek)

Licensed under the Mozilla Public License Version 2.0 <LICENSE-MPL-2.0.txt
or https://www.mozilla.org/en-US/MPL/2.0/> or the Boost Software License <LICENSE-BSL-1.0.txt
or https://www.boost.org/LICENSE_1_0.txt>, at your option. This file may not be copied, modified,
or distributed except according to those terms.
*/

#pragma once
#include "preamble.hpp"
#include "utils/service.hpp"
#include "lib/os.hpp"

namespace tcepub::globals {
inline auto pool = Service<unique_ptr<thread_pool>>{};
}

namespace tcepub {

// Create a thread pool for transcoding work. A thread count of 0 creates one worker
// per hardware thread.
inline auto make_pool(uint thread_count = 0) -> unique_ptr<thread_pool>
{
	if (thread_count == 0) thread_count = max(1u, jthread::hardware_concurrency());
	return thread_pool::make_unique({
		.thread_count = thread_count,
		.on_thread_start_functor = [](auto worker_idx) {
			lib::os::name_current_thread(format("worker{}", worker_idx));
		},
	});
}

// Schedule a task on the thread pool. The task will execute once the returned task is awaited.
template<typename T>
auto schedule_task_on(unique_ptr<thread_pool>& pool, task<T>&& t) -> task<T>
{
	return pool->schedule(move(t));
}

}
