// Copyright Microsoft and CHERIoT Contributors.
// SPDX-License-Identifier: MIT

#include "tbf.hh"
#include <algorithm>
#include <appcheck/config.hh>
#include <appcheck/process_binary.hh>
#include <debug.hh>

using namespace appcheck;

namespace
{
	using Debug = ConditionalDebug<config::DebugLoader, "Loader">;
} // namespace

std::optional<ParseError> appcheck::parse_header(
  std::span<const uint8_t> header,
  uint32_t                 totalSize,
  ProcessBinary           &binary)
{
	if (header.size() < tbf::BaseHeaderSize)
	{
		return ParseError::NotEnoughFlash;
	}
	if (tbf::read16(header, tbf::VersionOffset) != tbf::HeaderVersion)
	{
		return ParseError::UnsupportedVersion;
	}

	// The checksum covers every whole word of the header except itself.
	uint32_t checksum = 0;
	for (size_t offset = 0; offset + 4 <= header.size(); offset += 4)
	{
		if (offset != tbf::ChecksumOffset)
		{
			checksum ^= tbf::read32(header, offset);
		}
	}
	uint32_t expected = tbf::read32(header, tbf::ChecksumOffset);
	if (checksum != expected)
	{
		Debug::log("Header checksum {} does not match computed {}",
		           expected,
		           checksum);
		return ParseError::ChecksumMismatch;
	}

	binary.headerSize      = static_cast<uint16_t>(header.size());
	binary.flags           = tbf::read32(header, tbf::FlagsOffset);
	binary.binaryEndOffset = totalSize;
	binary.binaryVersion   = 0;
	binary.packageName     = {};

	bool seenMain    = false;
	bool seenProgram = false;
	auto remaining   = header.subspan(tbf::BaseHeaderSize);
	while (!remaining.empty())
	{
		if (remaining.size() < tbf::TlvHeaderSize)
		{
			return ParseError::NotEnoughFlash;
		}
		auto   type   = static_cast<HeaderTlvType>(tbf::read16(remaining, 0));
		size_t length = tbf::read16(remaining, 2);
		remaining     = remaining.subspan(tbf::TlvHeaderSize);
		if (remaining.size() < length)
		{
			return ParseError::NotEnoughFlash;
		}
		auto value = remaining.first(length);
		switch (type)
		{
			case HeaderTlvType::Main:
				if (length != tbf::MainLength)
				{
					return ParseError::BadTlvEntry;
				}
				seenMain = true;
				break;
			case HeaderTlvType::Program:
				if (length != tbf::ProgramLength)
				{
					return ParseError::BadTlvEntry;
				}
				// Only the first program entry counts.
				if (!seenProgram)
				{
					binary.binaryEndOffset =
					  tbf::read32(value, tbf::ProgramBinaryEndOffsetOffset);
					binary.binaryVersion =
					  tbf::read32(value, tbf::ProgramVersionOffset);
					seenProgram = true;
				}
				break;
			case HeaderTlvType::PackageName:
				binary.packageName = {reinterpret_cast<const char *>(value.data()),
				                      value.size()};
				break;
			default:
				Debug::log("Skipping header TLV of type {}",
				           static_cast<uint16_t>(type));
				break;
		}
		// Entries are padded to a word boundary, the last may end early.
		remaining = remaining.subspan(
		  std::min(tbf::align4(length), remaining.size()));
	}

	if ((binary.binaryEndOffset < binary.headerSize) ||
	    (binary.binaryEndOffset > totalSize))
	{
		Debug::log("Binary end offset {} outside [{}, {}]",
		           binary.binaryEndOffset,
		           binary.headerSize,
		           totalSize);
		return ParseError::InvalidHeader;
	}
	Debug::log("Parsed header for '{}': main {}, program {}, version {}",
	           binary.packageName,
	           seenMain,
	           seenProgram,
	           binary.binaryVersion);
	return std::nullopt;
}

std::optional<ProcessBinaryError>
appcheck::discover_process_binary(std::span<const uint8_t> &flash,
                                  ProcessBinary            &binary)
{
	// The version, header size and total size come first.
	if (flash.size() < 8)
	{
		return ProcessBinaryError::NotEnoughFlash;
	}
	if (tbf::read16(flash, tbf::VersionOffset) != tbf::HeaderVersion)
	{
		// Erased flash or some other data: no more binaries.
		return ProcessBinaryError::HeaderNotFound;
	}
	uint16_t headerSize = tbf::read16(flash, tbf::HeaderSizeOffset);
	uint32_t totalSize  = tbf::read32(flash, tbf::TotalSizeOffset);
	if (totalSize < tbf::BaseHeaderSize)
	{
		// There is no way to find the next entry.
		return ProcessBinaryError::HeaderNotFound;
	}
	if (totalSize > flash.size())
	{
		Debug::log("Binary of {} bytes but only {} bytes of flash left",
		           totalSize,
		           flash.size());
		return ProcessBinaryError::NotEnoughFlash;
	}
	auto entry = flash.first(totalSize);
	flash      = flash.subspan(totalSize);

	if ((headerSize < tbf::BaseHeaderSize) || (headerSize > totalSize))
	{
		Debug::log("Header size {} invalid for binary of {} bytes",
		           headerSize,
		           totalSize);
		return ProcessBinaryError::HeaderParseFailure;
	}

	ProcessBinary parsed;
	if (auto error = parse_header(entry.first(headerSize), totalSize, parsed))
	{
		Debug::log("Failed to parse header: {}", *error);
		return ProcessBinaryError::HeaderParseFailure;
	}
	parsed.flash = entry;
	if (headerSize == tbf::BaseHeaderSize)
	{
		return ProcessBinaryError::Padding;
	}
	if (!parsed.is_enabled())
	{
		Debug::log("Binary '{}' is disabled", parsed.packageName);
		return ProcessBinaryError::NotEnabledProcess;
	}
	binary = parsed;
	return std::nullopt;
}
