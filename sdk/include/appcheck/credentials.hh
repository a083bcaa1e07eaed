// Copyright Microsoft and CHERIoT Contributors.
// SPDX-License-Identifier: MIT

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>

namespace appcheck
{
	/**
	 * Errors that can be produced while parsing a binary's header or its
	 * credential footers.
	 */
	enum class ParseError : uint8_t
	{
		/// The region ended before the structure being parsed.
		NotEnoughFlash,
		/// The header checksum does not match the header contents.
		ChecksumMismatch,
		/// A TLV entry had a length that is invalid for its type.
		BadTlvEntry,
		/// The header version is not one that we understand.
		UnsupportedVersion,
		/// The header lengths are inconsistent.
		InvalidHeader,
	};

	/// The TLV type of a credentials footer.
	constexpr uint16_t CredentialsFooterType = 128;

	/**
	 * The format of a credentials record.  Each format other than `Reserved`
	 * has a fixed data length.
	 */
	enum class CredentialsFormat : uint32_t
	{
		/// Padding, the data is variable-length filler.
		Reserved = 0,
		/// 384-byte RSA public key, 384-byte PKCS#1 v1.5 SHA-512 signature.
		Rsa3072Key = 1,
		/// 512-byte RSA public key, 512-byte PKCS#1 v1.5 SHA-512 signature.
		Rsa4096Key = 2,
		/// SHA-256 digest of the binary.
		SHA256 = 3,
		/// SHA-384 digest of the binary.
		SHA384 = 4,
		/// SHA-512 digest of the binary.
		SHA512 = 5,
	};

	/**
	 * Returns the number of data bytes that a record of the given format
	 * carries, or nothing for the variable-length `Reserved` format.
	 */
	constexpr std::optional<size_t>
	credentials_data_length(CredentialsFormat format)
	{
		switch (format)
		{
			case CredentialsFormat::Reserved:
				return std::nullopt;
			case CredentialsFormat::Rsa3072Key:
				return 768;
			case CredentialsFormat::Rsa4096Key:
				return 1024;
			case CredentialsFormat::SHA256:
				return 32;
			case CredentialsFormat::SHA384:
				return 48;
			case CredentialsFormat::SHA512:
				return 64;
		}
		return std::nullopt;
	}

	/**
	 * Returns the size of the public key in an RSA record of the given
	 * format, or zero if the format is not an RSA format.  The signature that
	 * follows the key is the same size.
	 */
	constexpr size_t rsa_key_length(CredentialsFormat format)
	{
		switch (format)
		{
			case CredentialsFormat::Rsa3072Key:
				return 384;
			case CredentialsFormat::Rsa4096Key:
				return 512;
			default:
				return 0;
		}
	}

	/**
	 * A credential extracted from a binary's footer region: a format and a
	 * view of the data bytes in the binary image.
	 */
	struct CredentialsRecord
	{
		/// The format of the record.
		CredentialsFormat format = CredentialsFormat::Reserved;
		/// The data, pointing into the binary image.
		std::span<const uint8_t> data;

		/**
		 * For RSA records, the public key.  Empty for other formats.
		 */
		[[nodiscard]] std::span<const uint8_t> public_key() const
		{
			size_t keyLength = rsa_key_length(format);
			if ((keyLength == 0) || (data.size() < keyLength * 2))
			{
				return {};
			}
			return data.first(keyLength);
		}

		/**
		 * For RSA records, the signature.  Empty for other formats.
		 */
		[[nodiscard]] std::span<const uint8_t> signature() const
		{
			size_t keyLength = rsa_key_length(format);
			if ((keyLength == 0) || (data.size() < keyLength * 2))
			{
				return {};
			}
			return data.subspan(keyLength, keyLength);
		}
	};

	/**
	 * Iterator over the credentials records in a footer region, in physical
	 * order.  Footer entries that are not credentials, and credentials in a
	 * format that we do not know, are skipped: their TLV length lets us step
	 * over them.  A credentials entry that is too short for its format, or a
	 * TLV that runs off the end of the region, is malformed.
	 */
	class CredentialsFooterIterator
	{
		/// The part of the footer region that has not been consumed yet.
		std::span<const uint8_t> remaining;
		/// Number of records returned so far.
		size_t recordIndex = 0;

		public:
		/**
		 * Outcome of a `next` call.
		 */
		enum class Status : uint8_t
		{
			/// A record was found.
			Record,
			/// There are no more records.
			End,
			/// The footer region is malformed.
			Malformed,
		};

		/**
		 * Construct an iterator over the footer region, which runs from the
		 * binary end offset to the end of the binary.
		 */
		explicit CredentialsFooterIterator(std::span<const uint8_t> footers)
		  : remaining(footers)
		{
		}

		/**
		 * Find the next credentials record.  On `Status::Record`, `record`
		 * holds the record.  On `Status::Malformed`, `error` holds the
		 * reason.
		 */
		Status next(CredentialsRecord &record, ParseError &error);

		/**
		 * Returns the index that the next record returned will have.
		 */
		[[nodiscard]] size_t index() const
		{
			return recordIndex;
		}
	};
} // namespace appcheck
