// Copyright Microsoft and CHERIoT Contributors.
// SPDX-License-Identifier: MIT

#pragma once

#include <algorithm>
#include <array>
#include <cstdint>
#include <debug.hh>
#include <span>

namespace appcheck
{
	/**
	 * The identity of an application.
	 *
	 * A global identifier is a byte string chosen by the identifier policy
	 * (for example a public key, a digest, or a package name).  It is the
	 * same for every binary and version of the application under a fixed
	 * pair of checking and identifier policies, and is re-derived to the same
	 * value each time the application is loaded.
	 *
	 * A locally unique identifier carries no value and is, by definition,
	 * different from every other identifier, including other locally unique
	 * identifiers and itself.  Policies return it when the deployment does
	 * not need to track identity.
	 */
	class ApplicationIdentifier
	{
		public:
		/// The largest identity that can be stored, an RSA-4096 public key.
		static constexpr size_t MaxLength = 512;

		private:
		/// Storage for a global identifier.
		std::array<uint8_t, MaxLength> bytes{};
		/// Number of valid bytes in `bytes`.
		uint16_t length = 0;
		/// Is this a global identifier?
		bool global = false;

		public:
		/**
		 * Default constructor, produces a locally unique identifier.
		 */
		ApplicationIdentifier() = default;

		/**
		 * Returns a new locally unique identifier.
		 */
		static ApplicationIdentifier locally_unique()
		{
			return {};
		}

		/**
		 * Returns a global identifier holding a copy of `identity`.
		 * Identities longer than `MaxLength` are truncated, and an empty
		 * identity produces a locally unique identifier because there is
		 * nothing to compare.
		 */
		static ApplicationIdentifier global_from(std::span<const uint8_t> identity)
		{
			ApplicationIdentifier id;
			if (identity.empty())
			{
				return id;
			}
			id.length =
			  static_cast<uint16_t>(std::min(identity.size(), MaxLength));
			std::copy_n(identity.begin(), id.length, id.bytes.begin());
			id.global = true;
			return id;
		}

		/**
		 * Returns true if this is a global identifier.
		 */
		[[nodiscard]] bool is_global() const
		{
			return global;
		}

		/**
		 * Returns the identity bytes.  Empty for a locally unique identifier.
		 */
		[[nodiscard]] std::span<const uint8_t> data() const
		{
			return {bytes.data(), length};
		}

		/**
		 * Global identifiers are equal if their bytes are equal.  Any
		 * comparison involving a locally unique identifier is false.
		 */
		bool operator==(const ApplicationIdentifier &other) const
		{
			if (!global || !other.global)
			{
				return false;
			}
			return std::ranges::equal(data(), other.data());
		}

		bool operator!=(const ApplicationIdentifier &other) const
		{
			return !(*this == other);
		}
	};
} // namespace appcheck

/**
 * Identifiers are printed as their length and the first few bytes, which is
 * enough to tell them apart in a boot log.
 */
template<>
struct DebugFormatArgumentAdaptor<appcheck::ApplicationIdentifier>
{
	static void print(uintptr_t value, DebugWriter &writer)
	{
		auto *id = reinterpret_cast<const appcheck::ApplicationIdentifier *>(
		  value);
		if (!id->is_global())
		{
			writer.write("LocallyUnique");
			return;
		}
		auto data = id->data();
		writer.write("Global[");
		writer.write_hex(data.size());
		writer.write("]:");
		const char Hexdigits[] = "0123456789abcdef";
		for (size_t i = 0; i < std::min<size_t>(data.size(), 8); i++)
		{
			writer.write(Hexdigits[data[i] >> 4]);
			writer.write(Hexdigits[data[i] & 0xf]);
		}
	}

	/**
	 * Note that this relies on the identifier persisting for the duration of
	 * the call.  It passes a pointer to the argument.
	 */
	__always_inline static DebugFormatArgument
	construct(const appcheck::ApplicationIdentifier &id)
	{
		return {reinterpret_cast<uintptr_t>(&id), &print};
	}
};
