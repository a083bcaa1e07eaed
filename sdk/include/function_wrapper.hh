// Copyright Microsoft and CHERIoT Contributors.
// SPDX-License-Identifier: MIT

#pragma once

#include <cdefs.h>
#include <memory>
#include <type_traits>
#include <utility>

template<typename FnType>
class FunctionWrapper;

/**
 * A non-owning reference to a callable object, used to pass lambdas down the
 * stack without making the callee a template.  This is two words: a pointer
 * to the callable and a pointer to a function that invokes it.
 *
 * Instances must not outlive the callable that they were built from, so they
 * should only ever appear as by-value parameters.
 */
template<class R, class... Args>
class FunctionWrapper<R(Args...)>
{
	/// The callable, with its type erased.
	void *callable;

	/// Invokes `callable` with its real type restored.
	R (*invoke)(void *, Args...);

	public:
	FunctionWrapper(const FunctionWrapper &)            = delete;
	FunctionWrapper(FunctionWrapper &&)                 = delete;
	FunctionWrapper &operator=(const FunctionWrapper &) = delete;
	FunctionWrapper &operator=(FunctionWrapper &&)      = delete;

	/**
	 * Capture a reference to `fn`.
	 */
	template<typename T>
	    requires(!std::is_same_v<std::remove_cvref_t<T>, FunctionWrapper>)
	__always_inline FunctionWrapper(T &&fn)
	  : callable(const_cast<void *>(
	      static_cast<const void *>(std::addressof(fn)))),
	    invoke([](void *erased, Args... args) -> R {
		    return (*static_cast<std::remove_reference_t<T> *>(erased))(
		      std::forward<Args>(args)...);
	    })
	{
	}

	/**
	 * Call the referenced callable.
	 */
	__always_inline R operator()(Args... args) const
	{
		return invoke(callable, std::forward<Args>(args)...);
	}
};
