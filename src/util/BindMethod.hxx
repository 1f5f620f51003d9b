// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <cstddef>
#include <type_traits>
#include <utility>

/**
 * This object stores a function pointer wrapping a method, and a
 * reference to an instance of the method's class.  It can be used to
 * wrap instance methods as callback functions.
 *
 * @param S the plain function signature type
 */
template<typename S=void()>
class BoundMethod;

template<bool NoExcept, typename R, typename... Args>
class BoundMethod<R(Args...) noexcept(NoExcept)> {
	using function_pointer = R (*)(void *, Args...) noexcept(NoExcept);

	void *instance_;
	function_pointer function;

public:
	/**
	 * Non-initializing trivial constructor
	 */
	BoundMethod() = default;

	constexpr
	BoundMethod(void *_instance, function_pointer _function) noexcept
		:instance_(_instance), function(_function) {}

	/**
	 * Construct an "undefined" object.  It must not be called,
	 * and its "bool" operator returns false.
	 */
	constexpr BoundMethod(std::nullptr_t) noexcept
		:instance_(nullptr), function(nullptr) {}

	/**
	 * Was this object initialized with a valid function pointer?
	 */
	constexpr operator bool() const noexcept {
		return function != nullptr;
	}

	R operator()(Args... args) const noexcept(NoExcept) {
		return function(instance_, std::forward<Args>(args)...);
	}
};

namespace BindMethodDetail {

/**
 * Helper class which decomposes a method pointer type into the
 * class type and the plain function signature.
 */
template<typename M>
struct MethodSignatureHelper;

template<typename R, bool NoExcept, typename T, typename... Args>
struct MethodSignatureHelper<R (T::*)(Args...) noexcept(NoExcept)> {
	using class_type = T;
	using plain_signature = R(Args...) noexcept(NoExcept);
};

/**
 * Generates a wrapper function for a method; the instance pointer
 * is passed as the first (void *) parameter.
 */
template<typename M, M method>
struct MethodWrapperGenerator;

template<typename T, bool NoExcept, typename R, typename... Args,
	 R (T::*method)(Args...) noexcept(NoExcept)>
struct MethodWrapperGenerator<R (T::*)(Args...) noexcept(NoExcept), method> {
	static R Invoke(void *_instance, Args... args) noexcept(NoExcept) {
		auto &t = *(T *)_instance;
		return (t.*method)(std::forward<Args>(args)...);
	}
};

} /* namespace BindMethodDetail */

/**
 * Construct a #BoundMethod instance.
 *
 * @param method the method pointer
 * @param instance the instance of the class the method belongs to
 */
template<auto method>
constexpr auto
BindMethod(typename BindMethodDetail::MethodSignatureHelper<decltype(method)>::class_type &instance) noexcept
{
	using H = BindMethodDetail::MethodSignatureHelper<decltype(method)>;
	using S = typename H::plain_signature;
	using W = BindMethodDetail::MethodWrapperGenerator<decltype(method), method>;
	return BoundMethod<S>(&instance, &W::Invoke);
}

/**
 * Shortcut macro which takes an instance and a method pointer and
 * constructs a #BoundMethod instance.
 */
#define BIND_METHOD(instance, method) \
	BindMethod<method>(instance)

/**
 * Shortcut wrapper for BIND_METHOD() which assumes "*this" is the
 * instance to be bound.
 */
#define BIND_THIS_METHOD(method) \
	BIND_METHOD(*this, &std::remove_reference_t<decltype(*this)>::method)
