// Copyright Microsoft and CHERIoT Contributors.
// SPDX-License-Identifier: MIT

#pragma once

#include "credentials.hh"
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>

namespace appcheck
{
	/**
	 * Reasons that an entry in flash could not be turned into a
	 * `ProcessBinary`.
	 */
	enum class ProcessBinaryError : uint8_t
	{
		/// The remaining flash is too small to hold the entry.
		NotEnoughFlash,
		/// There is no header here: this is the end of the binaries.
		HeaderNotFound,
		/// The header is present but could not be parsed.
		HeaderParseFailure,
		/// The binary is marked as disabled.
		NotEnabledProcess,
		/// The entry is padding between binaries, not an application.
		Padding,
	};

	/**
	 * TLV types that may appear in a binary header.  Entries of any other
	 * type are skipped.
	 */
	enum class HeaderTlvType : uint16_t
	{
		Main        = 1,
		PackageName = 3,
		Program     = 9,
	};

	/**
	 * A userspace binary found in flash, with the header fields that the
	 * credential checking core depends on.  The binary holds views into the
	 * flash image and so must not outlive it.
	 *
	 * The layout of an entry is:
	 *
	 * ```
	 * [header | application binary | credential footers]
	 * 0       headerSize           binaryEndOffset      totalSize
	 * ```
	 */
	struct ProcessBinary
	{
		/// Header flag indicating that the binary should be loaded.
		static constexpr uint32_t FlagEnabled = 1U << 0;

		/// The entire entry, header through footers.
		std::span<const uint8_t> flash;
		/// Length of the header in bytes.
		uint16_t headerSize = 0;
		/// End of the region covered by integrity credentials.
		uint32_t binaryEndOffset = 0;
		/// Version of the binary, used to choose between colliding binaries.
		uint32_t binaryVersion = 0;
		/// Header flags.
		uint32_t flags = 0;
		/// Package name, empty if the header did not provide one.
		std::string_view packageName;

		/**
		 * Returns the application binary: the bytes from the end of the header
		 * to the binary end offset.  This is exactly the input to any
		 * integrity check; footers are never included.
		 */
		[[nodiscard]] std::span<const uint8_t> binary() const
		{
			return flash.subspan(headerSize, binaryEndOffset - headerSize);
		}

		/**
		 * Returns the footer region that holds the credentials.
		 */
		[[nodiscard]] std::span<const uint8_t> footers() const
		{
			return flash.subspan(binaryEndOffset);
		}

		/**
		 * Returns the total length of the entry in flash.
		 */
		[[nodiscard]] size_t total_size() const
		{
			return flash.size();
		}

		/**
		 * Returns true if the header marks this binary as enabled.
		 */
		[[nodiscard]] bool is_enabled() const
		{
			return (flags & FlagEnabled) != 0;
		}
	};

	/**
	 * Parse the entry at the start of `flash`.
	 *
	 * On success, `binary` describes the entry and nothing is returned.  On
	 * failure the error is returned.  In both cases `flash` is advanced past
	 * the entry if its length could be determined, so that the caller can
	 * continue with the next entry; if it could not (`HeaderNotFound`,
	 * `NotEnoughFlash`) there is nothing more to discover.
	 */
	std::optional<ProcessBinaryError>
	discover_process_binary(std::span<const uint8_t> &flash,
	                        ProcessBinary            &binary);

	/**
	 * Parse a single header.  `header` must cover exactly `headerSize` bytes
	 * and `totalSize` is the length of the whole entry.  Exposed for the
	 * discovery code and for tests.
	 */
	std::optional<ParseError> parse_header(std::span<const uint8_t> header,
	                                       uint32_t                 totalSize,
	                                       ProcessBinary           &binary);
} // namespace appcheck
