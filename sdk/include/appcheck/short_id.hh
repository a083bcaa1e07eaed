// Copyright Microsoft and CHERIoT Contributors.
// SPDX-License-Identifier: MIT

#pragma once

#include <cstdint>
#include <debug.hh>
#include <optional>

namespace appcheck
{
	/**
	 * A compressed, 32-bit identifier for the application that a process is
	 * an execution of.
	 *
	 * A `ShortId` is either a non-zero fixed value or the `LocallyUnique`
	 * sentinel.  The sentinel carries no value and compares unequal to every
	 * `ShortId`, including itself, so platforms with no use for numeric short
	 * identifiers can still meet the requirement that running processes have
	 * distinct short identifiers.  Zero is never a valid fixed value.
	 *
	 * Short identifiers are assigned by a `Compress` implementation when a
	 * process's credentials are approved.  The mapping from application to
	 * short identifier is stable, but may be lossy: two applications can
	 * share a fixed value.  The kernel will not run two processes with equal
	 * short identifiers at the same time.
	 */
	class ShortId
	{
		/// The fixed value, or zero for the locally unique sentinel.
		uint32_t value;

		constexpr explicit ShortId(uint32_t rawValue) : value(rawValue) {}

		public:
		/**
		 * Returns the locally unique sentinel.
		 */
		static constexpr ShortId locally_unique()
		{
			return ShortId{0};
		}

		/**
		 * Returns a fixed short identifier.  A value of zero is reserved and
		 * produces the locally unique sentinel.
		 */
		static constexpr ShortId fixed(uint32_t fixedValue)
		{
			return ShortId{fixedValue};
		}

		/**
		 * Default constructor, produces the locally unique sentinel.
		 */
		constexpr ShortId() : value(0) {}

		/**
		 * Returns true if this is the locally unique sentinel.
		 */
		[[nodiscard]] constexpr bool is_locally_unique() const
		{
			return value == 0;
		}

		/**
		 * Returns the fixed value, or nothing for the locally unique
		 * sentinel.
		 */
		[[nodiscard]] constexpr std::optional<uint32_t> fixed_value() const
		{
			if (is_locally_unique())
			{
				return std::nullopt;
			}
			return value;
		}

		/**
		 * Two short identifiers are equal only if both are fixed and carry
		 * the same value.  Any comparison involving the locally unique
		 * sentinel is false, including comparing the sentinel with itself.
		 */
		constexpr bool operator==(const ShortId &other) const
		{
			if (is_locally_unique() || other.is_locally_unique())
			{
				return false;
			}
			return value == other.value;
		}

		/**
		 * Inequality is the negation of equality, so the sentinel is unequal
		 * to everything.
		 */
		constexpr bool operator!=(const ShortId &other) const
		{
			return !(*this == other);
		}
	};

	/**
	 * Build a fixed short identifier from four bytes of identity data, with
	 * the top bit forced on so that the result is never zero.  Only 31 bits
	 * of the input survive, so these do not provide collision resistance.
	 */
	constexpr ShortId short_id_from_prefix(uint8_t b0,
	                                       uint8_t b1,
	                                       uint8_t b2,
	                                       uint8_t b3)
	{
		return ShortId::fixed(0x80000000U | (uint32_t(b0) << 24) |
		                      (uint32_t(b1) << 16) | (uint32_t(b2) << 8) |
		                      uint32_t(b3));
	}
} // namespace appcheck

/**
 * Short identifiers are printed as their fixed value, or `Unique` for the
 * sentinel.
 */
template<>
struct DebugFormatArgumentAdaptor<appcheck::ShortId>
{
	static void print(uintptr_t value, DebugWriter &writer)
	{
		if (value == 0)
		{
			writer.write("Unique");
			return;
		}
		writer.write_hex(value);
	}

	__always_inline static DebugFormatArgument construct(appcheck::ShortId id)
	{
		return {id.fixed_value().value_or(0), &print};
	}
};
