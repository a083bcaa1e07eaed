// Copyright Microsoft and CHERIoT Contributors.
// SPDX-License-Identifier: MIT

#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

/**
 * Layout of the binary container in flash.  All fields are little endian.
 */
namespace appcheck::tbf
{
	/// The only header version that we understand.
	constexpr uint16_t HeaderVersion = 2;

	/// Size of the base header.  A header of exactly this size is padding.
	constexpr size_t BaseHeaderSize = 16;

	/// Offsets of the base header fields.
	constexpr size_t VersionOffset    = 0;
	constexpr size_t HeaderSizeOffset = 2;
	constexpr size_t TotalSizeOffset  = 4;
	constexpr size_t FlagsOffset      = 8;
	constexpr size_t ChecksumOffset   = 12;

	/// Size of a TLV header: a 16-bit type and a 16-bit length.
	constexpr size_t TlvHeaderSize = 4;

	/// Size of the format word at the start of a credentials footer.
	constexpr size_t CredentialsFormatSize = 4;

	/// Length of the `Main` TLV.
	constexpr size_t MainLength = 12;

	/// Length of the `Program` TLV and the offsets of the fields we use.
	constexpr size_t ProgramLength                = 20;
	constexpr size_t ProgramBinaryEndOffsetOffset = 12;
	constexpr size_t ProgramVersionOffset         = 16;

	/**
	 * Read a little-endian 16-bit value.  The caller checks the bounds.
	 */
	inline uint16_t read16(std::span<const uint8_t> bytes, size_t offset)
	{
		return static_cast<uint16_t>(bytes[offset] |
		                             (uint16_t(bytes[offset + 1]) << 8));
	}

	/**
	 * Read a little-endian 32-bit value.  The caller checks the bounds.
	 */
	inline uint32_t read32(std::span<const uint8_t> bytes, size_t offset)
	{
		return uint32_t(bytes[offset]) | (uint32_t(bytes[offset + 1]) << 8) |
		       (uint32_t(bytes[offset + 2]) << 16) |
		       (uint32_t(bytes[offset + 3]) << 24);
	}

	/**
	 * Round `length` up to the next multiple of four.  TLV entries are
	 * word-aligned.
	 */
	constexpr size_t align4(size_t length)
	{
		return (length + 3) & ~size_t(3);
	}
} // namespace appcheck::tbf
