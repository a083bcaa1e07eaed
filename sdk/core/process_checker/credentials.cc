// Copyright Microsoft and CHERIoT Contributors.
// SPDX-License-Identifier: MIT

#include "../loader/tbf.hh"
#include <appcheck/config.hh>
#include <appcheck/credentials.hh>
#include <debug.hh>

using namespace appcheck;

namespace
{
	using Debug = ConditionalDebug<config::DebugProcessChecker, "Credentials">;
} // namespace

CredentialsFooterIterator::Status
CredentialsFooterIterator::next(CredentialsRecord &record, ParseError &error)
{
	while (!remaining.empty())
	{
		if (remaining.size() < tbf::TlvHeaderSize)
		{
			Debug::log("Footer region has {} trailing bytes", remaining.size());
			error = ParseError::NotEnoughFlash;
			return Status::Malformed;
		}
		uint16_t type   = tbf::read16(remaining, 0);
		uint16_t length = tbf::read16(remaining, 2);
		if (remaining.size() - tbf::TlvHeaderSize < length)
		{
			Debug::log("Footer of type {} and length {} runs past the end of "
			           "the binary",
			           type,
			           length);
			error = ParseError::NotEnoughFlash;
			return Status::Malformed;
		}
		auto value = remaining.subspan(tbf::TlvHeaderSize, length);
		remaining  = remaining.subspan(tbf::TlvHeaderSize + length);

		if (type != CredentialsFooterType)
		{
			Debug::log("Skipping footer of type {}", type);
			continue;
		}
		if (value.size() < tbf::CredentialsFormatSize)
		{
			error = ParseError::BadTlvEntry;
			return Status::Malformed;
		}
		auto format = static_cast<CredentialsFormat>(tbf::read32(value, 0));
		auto data   = value.subspan(tbf::CredentialsFormatSize);
		if (!magic_enum::enum_contains(format))
		{
			Debug::log("Skipping credentials in unknown format {}",
			           static_cast<uint32_t>(format));
			continue;
		}
		if (auto expected = credentials_data_length(format))
		{
			if (data.size() < *expected)
			{
				Debug::log("{} credentials have {} bytes, expected {}",
				           format,
				           data.size(),
				           *expected);
				error = ParseError::BadTlvEntry;
				return Status::Malformed;
			}
			data = data.first(*expected);
		}
		record = {format, data};
		recordIndex++;
		return Status::Record;
	}
	return Status::End;
}
