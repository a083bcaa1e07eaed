// Copyright Microsoft and CHERIoT Contributors.
// SPDX-License-Identifier: MIT

#pragma once

#include "credentials.hh"
#include <cstdint>
#include <span>

/**
 * Interfaces to the asynchronous crypto engines that the checking policies
 * use.  An engine accepts one request at a time and reports the result
 * through a client callback, which is never called from inside the request.
 */
namespace appcheck
{
	/**
	 * Receives the result of a digest verification.
	 */
	class DigestVerifierClient
	{
		public:
		virtual ~DigestVerifierClient() = default;

		/**
		 * `error` is 0 if `matches` is valid, or a negative errno value if the
		 * engine failed.
		 */
		virtual void verification_done(int error, bool matches) = 0;
	};

	/**
	 * Computes a digest of some data and compares it with an expected value.
	 */
	class DigestVerifier
	{
		public:
		virtual ~DigestVerifier() = default;

		/**
		 * Start computing the `algorithm` digest of `data` and comparing it
		 * with `expected`.  `algorithm` must be one of the SHA formats.  Both
		 * views must remain valid until the client is called.  Returns 0 if
		 * the request was accepted, -EBUSY if a request is outstanding,
		 * -ENOTSUP if the algorithm is not supported, or -EINVAL if
		 * `expected` is the wrong length.
		 */
		virtual int verify_digest(CredentialsFormat         algorithm,
		                          std::span<const uint8_t>  data,
		                          std::span<const uint8_t>  expected,
		                          DigestVerifierClient     &client) = 0;
	};

	/**
	 * Receives the result of a signature verification.
	 */
	class SignatureVerifierClient
	{
		public:
		virtual ~SignatureVerifierClient() = default;

		/**
		 * `error` is 0 if `valid` is meaningful, or a negative errno value if
		 * the engine failed.
		 */
		virtual void signature_done(int error, bool valid) = 0;
	};

	/**
	 * Verifies RSA PKCS#1 v1.5 signatures over the SHA-512 digest of a
	 * message.
	 */
	class SignatureVerifier
	{
		public:
		virtual ~SignatureVerifier() = default;

		/**
		 * Start verifying `signature` over `message` with the RSA public key
		 * whose big-endian modulus is `modulus` and whose exponent is 65537.
		 * All views must remain valid until the client is called.  Returns 0
		 * if the request was accepted, -EBUSY if a request is outstanding, or
		 * -EINVAL if the key or signature lengths are unusable.
		 */
		virtual int verify_signature(std::span<const uint8_t>  modulus,
		                             std::span<const uint8_t>  signature,
		                             std::span<const uint8_t>  message,
		                             SignatureVerifierClient  &client) = 0;
	};
} // namespace appcheck
