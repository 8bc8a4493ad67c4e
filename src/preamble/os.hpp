/*
Copyright (c) 2026 Tearnote (Hubert Maraszek)

Licensed under the Mozilla Public License Version 2.0 <LICENSE-MPL-2.0.txt
or https://www.mozilla.org/en-US/MPL/2.0/> or the Boost Software License <LICENSE-BSL-1.0.txt
or https://www.boost.org/LICENSE_1_0.txt>, at your option. This file may not be copied, modified,
or distributed except according to those terms.
*/

#pragma once
#include <stop_token>
#include <filesystem>
#include <thread>
#include <mutex>

namespace tcepub {

namespace fs {
	using std::filesystem::path;
	using std::filesystem::status;
	using std::filesystem::exists;
	using std::filesystem::is_regular_file;
	using std::filesystem::remove;
	using std::filesystem::remove_all;
	using std::filesystem::rename;
	using std::filesystem::file_size;
	using std::filesystem::create_directories;
}
using std::jthread;
using std::stop_token;
using std::stop_source;
using std::mutex;
using std::lock_guard;

}
