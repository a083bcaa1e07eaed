// Copyright Microsoft and CHERIoT Contributors.
// SPDX-License-Identifier: MIT

#pragma once

#include "crypto.hh"
#include "deferred_call.hh"
#include <utils.hh>

namespace appcheck
{
	/**
	 * A crypto engine that computes digests and verifies signatures in
	 * software with OpenSSL.  It behaves like an accelerator: a request is
	 * queued, the work is done from a deferred call, and the client is then
	 * notified.  One request may be outstanding at a time across both
	 * interfaces.
	 */
	class SoftwareCryptoEngine : public DigestVerifier,
	                             public SignatureVerifier,
	                             public DeferredCallClient,
	                             private utils::NoCopyNoMove
	{
		/**
		 * The kind of request that is outstanding.
		 */
		enum class Request : uint8_t
		{
			None,
			Digest,
			Signature,
		};

		/// Used to do the work from the kernel loop.
		DeferredCall deferredCall;
		/// The outstanding request.
		Request request = Request::None;
		/// The digest algorithm for a digest request.
		CredentialsFormat algorithm = CredentialsFormat::Reserved;
		/// The data to digest, or the message that was signed.
		std::span<const uint8_t> data;
		/// The expected digest, or the signature.
		std::span<const uint8_t> expected;
		/// The RSA modulus for a signature request.
		std::span<const uint8_t> modulus;
		/// The client for a digest request.
		DigestVerifierClient *digestClient = nullptr;
		/// The client for a signature request.
		SignatureVerifierClient *signatureClient = nullptr;

		public:
		explicit SoftwareCryptoEngine(DeferredCallQueue &queue);

		int verify_digest(CredentialsFormat         algorithm,
		                  std::span<const uint8_t>  data,
		                  std::span<const uint8_t>  expected,
		                  DigestVerifierClient     &client) override;

		int verify_signature(std::span<const uint8_t>  modulus,
		                     std::span<const uint8_t>  signature,
		                     std::span<const uint8_t>  message,
		                     SignatureVerifierClient  &client) override;

		void handle_deferred_call() override;

		private:
		/**
		 * Compute the digest and compare it.  Returns 1 for a match, 0 for a
		 * mismatch, or a negative errno value if OpenSSL failed.
		 */
		int compute_digest();

		/**
		 * Verify the signature.  Returns 1 if it is valid, 0 if not, or a
		 * negative errno value if OpenSSL failed.
		 */
		int compute_signature();
	};
} // namespace appcheck
