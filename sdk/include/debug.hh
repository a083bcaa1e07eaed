// Copyright Microsoft and CHERIoT Contributors.
// SPDX-License-Identifier: MIT

#pragma once
#include <algorithm>
#include <array>
#include <cdefs.h>
#include <charconv>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <magic_enum/magic_enum.hpp>
#include <source_location>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>

namespace DebugConcepts
{
	/// Matches `bool` exactly, not things that convert to it.
	template<typename T>
	concept IsBool = std::is_same_v<T, bool>;

	/// Matches scoped and unscoped enumerations.
	template<typename T>
	concept IsEnum = std::is_enum_v<T>;

	/// A callable that is evaluated lazily to produce the asserted condition.
	template<typename T>
	concept LazyAssertion = requires(T v) {
		{
			v()
		} -> IsBool;
	};

	/// Integers printed as hexadecimal.  Characters and booleans are not.
	template<typename T>
	concept IsHexInteger =
	  std::unsigned_integral<T> && !IsBool<T> && !std::is_same_v<T, char>;

	/// Integers printed as decimal.
	template<typename T>
	concept IsDecimalInteger =
	  std::signed_integral<T> && !std::is_same_v<T, char>;

	template<typename T>
	concept IsPointerButNotCString =
	  std::is_pointer_v<T> && !std::is_same_v<T, const char *> &&
	  !std::is_same_v<T, char *>;
} // namespace DebugConcepts

/**
 * Severity of a log message.  Informational messages are written only when
 * the component is being debugged.  Warnings and errors are always written.
 */
enum class DebugLevel
{
	Information,
	Warning,
	Error,
};

/**
 * Sink for debug output.  Implementations provide the string case, the other
 * overloads are built on it.  Subclasses that override `write` must pull the
 * rest of the overload set in with `using DebugWriter::write`.
 */
struct DebugWriter
{
	virtual ~DebugWriter() = default;

	/// Write a run of characters.
	virtual void write(std::string_view) = 0;

	/// Write a single character.
	void write(char c)
	{
		write(std::string_view{&c, 1});
	}

	/// Write a null-terminated string.
	void write(const char *str)
	{
		write(std::string_view{str});
	}

	/// Write an unsigned value as `0x` followed by lower-case hex digits.
	void write_hex(uint64_t value)
	{
		std::array<char, 2 + 16> buffer{'0', 'x'};
		auto result =
		  std::to_chars(buffer.data() + 2, buffer.data() + buffer.size(), value, 16);
		write(std::string_view{buffer.data(), result.ptr});
	}

	/// Write a signed value in decimal.
	void write_decimal(int64_t value)
	{
		std::array<char, 20> buffer;
		auto                 result =
		  std::to_chars(buffer.data(), buffer.data() + buffer.size(), value);
		write(std::string_view{buffer.data(), result.ptr});
	}
};

/**
 * Prints a type-erased argument.  The first parameter is whatever the
 * adaptor stored in `DebugFormatArgument::value`.
 */
using DebugCallback = void (*)(uintptr_t, DebugWriter &);

/**
 * One format argument: a word of data and the function that prints it.
 */
struct DebugFormatArgument
{
	/// The value, or a pointer to it for types larger than a word.
	uintptr_t value;
	/// Prints `value`.
	DebugCallback print;
};

static_assert(sizeof(uintptr_t) == sizeof(uint64_t),
              "64-bit arguments are stored directly in the value word");

/**
 * Write a message built from `format` and `arguments`, prefixed with
 * `context`, as a single line on the console.  Each `{}` in `format` is
 * replaced with the next argument.
 */
void debug_log_message_write(const char                          *context,
                             DebugLevel                           level,
                             const char                          *format,
                             std::span<const DebugFormatArgument> arguments);

/**
 * Write the report for a failed invariant or assertion.  `kind` names the
 * check.  The location is that of the failing check.
 */
void debug_report_failure(const char                          *kind,
                          const std::source_location          &location,
                          const char                          *format,
                          std::span<const DebugFormatArgument> arguments);

/**
 * Turns an argument of type `T` into a `DebugFormatArgument`.  Specialise
 * this, with a `construct` method, to log other types.
 */
template<typename T>
struct DebugFormatArgumentAdaptor;

template<>
struct DebugFormatArgumentAdaptor<bool>
{
	static void print(uintptr_t value, DebugWriter &writer)
	{
		writer.write(value != 0 ? "true" : "false");
	}

	__always_inline static DebugFormatArgument construct(bool value)
	{
		return {static_cast<uintptr_t>(value), &print};
	}
};

template<>
struct DebugFormatArgumentAdaptor<char>
{
	static void print(uintptr_t value, DebugWriter &writer)
	{
		writer.write(static_cast<char>(value));
	}

	__always_inline static DebugFormatArgument construct(char value)
	{
		return {static_cast<uintptr_t>(value), &print};
	}
};

/**
 * Unsigned integers of any width, printed in hex.
 */
template<DebugConcepts::IsHexInteger T>
struct DebugFormatArgumentAdaptor<T>
{
	static void print(uintptr_t value, DebugWriter &writer)
	{
		writer.write_hex(value);
	}

	__always_inline static DebugFormatArgument construct(T value)
	{
		return {static_cast<uintptr_t>(value), &print};
	}
};

/**
 * Signed integers of any width, printed in decimal.  The value is sign
 * extended to 64 bits before it is stored.
 */
template<DebugConcepts::IsDecimalInteger T>
struct DebugFormatArgumentAdaptor<T>
{
	static void print(uintptr_t value, DebugWriter &writer)
	{
		writer.write_decimal(static_cast<int64_t>(value));
	}

	__always_inline static DebugFormatArgument construct(T value)
	{
		return {static_cast<uintptr_t>(static_cast<int64_t>(value)), &print};
	}
};

template<>
struct DebugFormatArgumentAdaptor<const char *>
{
	static void print(uintptr_t value, DebugWriter &writer)
	{
		auto *str = reinterpret_cast<const char *>(value);
		writer.write(str == nullptr ? "(null)" : str);
	}

	__always_inline static DebugFormatArgument construct(const char *value)
	{
		return {reinterpret_cast<uintptr_t>(value), &print};
	}
};

template<>
struct DebugFormatArgumentAdaptor<char *>
{
	__always_inline static DebugFormatArgument construct(char *value)
	{
		return DebugFormatArgumentAdaptor<const char *>::construct(value);
	}
};

/**
 * String views are passed by address, so the view must outlive the call.
 */
template<>
struct DebugFormatArgumentAdaptor<std::string_view>
{
	static void print(uintptr_t value, DebugWriter &writer)
	{
		writer.write(*reinterpret_cast<const std::string_view *>(value));
	}

	__always_inline static DebugFormatArgument
	construct(const std::string_view &value)
	{
		return {reinterpret_cast<uintptr_t>(&value), &print};
	}
};

template<>
struct DebugFormatArgumentAdaptor<std::string>
{
	__always_inline static DebugFormatArgument
	construct(const std::string &value)
	{
		return DebugFormatArgumentAdaptor<const char *>::construct(
		  value.c_str());
	}
};

/**
 * Enumerations are printed by name, followed by the numeric value.
 */
template<DebugConcepts::IsEnum T>
struct DebugFormatArgumentAdaptor<T>
{
	static void print(uintptr_t value, DebugWriter &writer)
	{
		writer.write(magic_enum::enum_name<T>(static_cast<T>(value)));
		writer.write('(');
		writer.write_hex(value);
		writer.write(')');
	}

	__always_inline static DebugFormatArgument construct(T value)
	{
		using Underlying = std::underlying_type_t<T>;
		return {static_cast<uintptr_t>(static_cast<Underlying>(value)), &print};
	}
};

template<>
struct DebugFormatArgumentAdaptor<std::nullptr_t>
{
	static void print(uintptr_t, DebugWriter &writer)
	{
		writer.write("nullptr");
	}

	__always_inline static DebugFormatArgument construct(std::nullptr_t)
	{
		return {0, &print};
	}
};

/**
 * Other pointers are printed as addresses.
 */
template<DebugConcepts::IsPointerButNotCString T>
struct DebugFormatArgumentAdaptor<T>
{
	static void print(uintptr_t value, DebugWriter &writer)
	{
		writer.write_hex(value);
	}

	__always_inline static DebugFormatArgument construct(T value)
	{
		return {reinterpret_cast<uintptr_t>(
		          static_cast<const volatile void *>(value)),
		        &print};
	}
};

/**
 * Capture a string literal as a template argument.  Used for the context
 * prefix of `ConditionalDebug`.
 */
template<size_t N>
struct DebugContext
{
	constexpr DebugContext(const char (&str)[N])
	{
		std::copy_n(str, N, value);
	}

	constexpr operator const char *() const
	{
		return value;
	}

	/// Public so that this is a structural type.
	char value[N];
};

/**
 * A format string together with the location of the code that wrote it.
 * The implicit conversion from a literal records the caller's location even
 * when a parameter pack follows.
 */
struct LocatedFormat
{
	const char          *format;
	std::source_location location;

	constexpr LocatedFormat(
	  const char          *fmt,
	  std::source_location loc = std::source_location::current())
	  : format(fmt), location(loc)
	{
	}
};

/**
 * Logging and checks for one component.  Informational logging and
 * assertions are compiled in only when `Enabled` is true.  Every line is
 * prefixed with `Context`.  Components declare an alias:
 *
 * ```c++
 * using Debug = ConditionalDebug<config::DebugLoader, "Loader">;
 * ```
 */
template<bool Enabled, DebugContext Context>
class ConditionalDebug
{
	template<typename... Args>
	static void report_failure(const char  *kind,
	                           LocatedFormat fmt,
	                           Args &...args)
	{
		const DebugFormatArgument arguments[] = {
		  DebugFormatArgumentAdaptor<Args>::construct(args)..., {0, nullptr}};
		debug_report_failure(
		  kind,
		  fmt.location,
		  fmt.format,
		  std::span<const DebugFormatArgument>{arguments, sizeof...(Args)});
	}

	public:
	/**
	 * Write a message at `Level`.
	 */
	template<DebugLevel Level = DebugLevel::Information, typename... Args>
	static void log(const char *fmt, Args... args)
	{
		if constexpr (Enabled || (Level != DebugLevel::Information))
		{
			const DebugFormatArgument arguments[] = {
			  DebugFormatArgumentAdaptor<Args>::construct(args)...,
			  {0, nullptr}};
			debug_log_message_write(
			  Context,
			  Level,
			  fmt,
			  std::span<const DebugFormatArgument>{arguments, sizeof...(Args)});
		}
	}

	/**
	 * Check a condition that must hold whether or not the component is
	 * being debugged, and trap if it does not.  The message is written only
	 * when debugging is enabled.
	 */
	template<typename... Args>
	__always_inline static void
	Invariant(bool condition, LocatedFormat fmt, Args... args)
	{
		if (__predict_false(!condition))
		{
			if constexpr (Enabled)
			{
				report_failure("Invariant", fmt, args...);
			}
			__builtin_trap();
		}
	}

	/**
	 * Check a condition only when the component is being debugged.
	 */
	template<typename T, typename... Args>
	    requires DebugConcepts::IsBool<T>
	__always_inline static void
	Assert(T condition, LocatedFormat fmt, Args... args)
	{
		if constexpr (Enabled)
		{
			if (__predict_false(!condition))
			{
				report_failure("Assertion", fmt, args...);
				__builtin_trap();
			}
		}
	}

	/**
	 * As above, but the condition is a callable that is not evaluated at all
	 * when debugging is disabled.
	 */
	template<typename T, typename... Args>
	    requires DebugConcepts::LazyAssertion<T>
	__always_inline static void
	Assert(T &&condition, LocatedFormat fmt, Args... args)
	{
		if constexpr (Enabled)
		{
			if (__predict_false(!condition()))
			{
				report_failure("Assertion", fmt, args...);
				__builtin_trap();
			}
		}
	}
};
