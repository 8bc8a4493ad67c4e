/*
Copyright (c) 2026 Tearnote (Hubert Maraszek)

Licensed under the Mozilla Public License Version 2.0 <LICENSE-MPL-2.0.txt
or https://www.mozilla.org/en-US/MPL/2.0/> or the Boost Software License <LICENSE-BSL-1.0.txt
or https://www.boost.org/LICENSE_1_0.txt>, at your option. This file may not be copied, modified,
or distributed except according to those terms.
*/

#pragma once
#include <typeinfo>
#include "preamble.hpp"

namespace tcepub {

// A wrapper for RAII-managed global services. Stubs nest: providing a service while another
// instance is live shadows it until the newer stub goes out of scope.
template<typename T>
class Service {
	class Stub;
public:
	// Create an instance of the underlying service. The service will be destroyed once
	// the returned stub goes out of scope.
	template<typename... Args>
	[[nodiscard]] auto provide(Args&&... args) -> Stub {
		return Stub(*this, forward<Args>(args)...);
	}

	// Gain access to the currently provisioned instance.
	// Throws logic_error if nothing is provisioned.
	auto operator*() -> T& { return get(); }
	auto operator->() -> T* { return &get(); }

	// Check if instance exists
	explicit operator bool() const { return handle != nullptr; }

private:
	class Stub {
	public:
		~Stub() { service.handle = prev_instance; }

		template<typename... Args>
		explicit Stub(Service<T>& service, Args&&... args):
			service{service},
			instance(forward<Args>(args)...),
			prev_instance{service.handle}
		{
			service.handle = &instance;
		}

		Stub(Stub const&) = delete;
		auto operator=(Stub const&) -> Stub& = delete;

	private:
		Service<T>& service;
		T instance;
		T* prev_instance;
	};

	T* handle = nullptr;

	auto get() -> T&
	{
		if (!handle) throw logic_error_fmt("Service {} used before being provided", typeid(T).name());
		return *handle;
	}
};

}
