// Copyright Microsoft and CHERIoT Contributors.
// SPDX-License-Identifier: MIT

#pragma once

#include <cdefs.h>
#include <cstddef>
#include <type_traits>

namespace utils
{
	/**
	 * Base for objects that are referred to by address (tables, machines,
	 * policies registered with a queue) and so must stay where they were
	 * built.
	 */
	class NoCopyNoMove
	{
		public:
		NoCopyNoMove()                                = default;
		NoCopyNoMove(const NoCopyNoMove &)            = delete;
		NoCopyNoMove &operator=(const NoCopyNoMove &) = delete;
		NoCopyNoMove(NoCopyNoMove &&)                 = delete;
		NoCopyNoMove &operator=(NoCopyNoMove &&)      = delete;
		~NoCopyNoMove()                               = default;
	};

	/**
	 * A `T&` that may be absent.  Lookups that can fail return this instead
	 * of a bare pointer.  There is no unchecked accessor: the
	 * value is reached through `and_then` or `value_or`.
	 */
	template<typename T>
	class OptionalReference
	{
		T *target = nullptr;

		public:
		__always_inline OptionalReference(T &value) : target(&value) {}

		OptionalReference(std::nullptr_t) {}

		[[nodiscard]] bool has_value() const
		{
			return target != nullptr;
		}

		/**
		 * Returns the referenced object, or `fallback` if there is none.
		 */
		T &value_or(T &fallback)
		{
			return has_value() ? *target : fallback;
		}

		/**
		 * Call `f` with the referenced object if there is one.  Returns what
		 * `f` returns, or a value-initialised result if there is no object.
		 * `f` may return `void`.
		 */
		template<typename F>
		__always_inline auto and_then(F &&f) -> std::invoke_result_t<F, T &>
		{
			using Result = std::invoke_result_t<F, T &>;
			if (!has_value())
			{
				if constexpr (!std::is_void_v<Result>)
				{
					return Result{};
				}
				else
				{
					return;
				}
			}
			return f(*target);
		}
	};
} // namespace utils
