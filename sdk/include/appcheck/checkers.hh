// Copyright Microsoft and CHERIoT Contributors.
// SPDX-License-Identifier: MIT

#pragma once

#include "checker.hh"
#include "crypto.hh"
#include "deferred_call.hh"
#include <optional>
#include <span>
#include <string_view>
#include <utils.hh>

/**
 * Sample checking and identifier policies.  Each one implements all of the
 * policy interfaces so that a board can pick one object and pass it as every
 * member of a `PolicySet`.
 */
namespace appcheck
{
	/**
	 * Loads every binary without looking at its credentials.  Every record
	 * passes and no credentials are required.  The application identifier is
	 * the package name, so two binaries with the same name cannot run at the
	 * same time.  Short identifiers are locally unique.
	 */
	class AppCheckerSimulated : public CredentialsChecker,
	                            public AppIdPolicy,
	                            public DeferredCallClient,
	                            private utils::NoCopyNoMove
	{
		DeferredCall              deferredCall;
		CredentialsCheckerClient *client      = nullptr;
		bool                      outstanding = false;

		public:
		explicit AppCheckerSimulated(DeferredCallQueue &queue);

		[[nodiscard]] bool require_credentials() const override
		{
			return false;
		}
		int  check_credentials(const CredentialsRecord &record,
		                       std::span<const uint8_t> binary) override;
		void set_client(CredentialsCheckerClient &newClient) override
		{
			client = &newClient;
		}

		ApplicationIdentifier
		derive_identifier(const CredentialsRecord *accepted,
		                  const ProcessBinary     &binary) const override;
		[[nodiscard]] ShortId to_short_id(const Process &process) const override;
		[[nodiscard]] bool    different_identifier(
		     const Process &processA,
		     const Process &processB) const override;

		void handle_deferred_call() override;
	};

	/**
	 * Accepts the first record of any binary and loads binaries with no
	 * records.  Every process is a different application, and the short
	 * identifier is a hash of the package name computed by a function that
	 * the board supplies.  Two binaries whose names hash to the same value
	 * can therefore not run together.
	 */
	class AppCheckerNames : public CredentialsChecker,
	                        public AppIdPolicy,
	                        public DeferredCallClient,
	                        private utils::NoCopyNoMove
	{
		public:
		/// Hash function for package names.  Zero maps to locally unique.
		using NameHasher = uint32_t (*)(std::string_view);

		private:
		DeferredCall              deferredCall;
		NameHasher                hasher;
		CredentialsCheckerClient *client      = nullptr;
		bool                      outstanding = false;

		public:
		AppCheckerNames(DeferredCallQueue &queue, NameHasher hasher);

		[[nodiscard]] bool require_credentials() const override
		{
			return false;
		}
		int  check_credentials(const CredentialsRecord &record,
		                       std::span<const uint8_t> binary) override;
		void set_client(CredentialsCheckerClient &newClient) override
		{
			client = &newClient;
		}

		ApplicationIdentifier
		derive_identifier(const CredentialsRecord *accepted,
		                  const ProcessBinary     &binary) const override;
		[[nodiscard]] ShortId to_short_id(const Process &process) const override;
		[[nodiscard]] bool    different_identifier(
		     const Process &processA,
		     const Process &processB) const override;

		void handle_deferred_call() override;
	};

	/**
	 * Loads only binaries that carry a SHA-256, SHA-384 or SHA-512 digest
	 * that matches the binary.  A mismatching digest rejects the binary.
	 * Records in other formats pass.  The application identifier is the
	 * digest, so each build of an application is a different application.
	 * The short identifier is built from the first four digest bytes.
	 */
	class AppCheckerDigest : public CredentialsChecker,
	                         public AppIdPolicy,
	                         public DigestVerifierClient,
	                         private utils::NoCopyNoMove
	{
		DigestVerifier           &verifier;
		CredentialsCheckerClient *client      = nullptr;
		bool                      outstanding = false;

		public:
		explicit AppCheckerDigest(DigestVerifier &verifier);

		[[nodiscard]] bool require_credentials() const override
		{
			return true;
		}
		int  check_credentials(const CredentialsRecord &record,
		                       std::span<const uint8_t> binary) override;
		void set_client(CredentialsCheckerClient &newClient) override
		{
			client = &newClient;
		}

		ApplicationIdentifier
		derive_identifier(const CredentialsRecord *accepted,
		                  const ProcessBinary     &binary) const override;
		[[nodiscard]] ShortId to_short_id(const Process &process) const override;
		[[nodiscard]] bool    different_identifier(
		     const Process &processA,
		     const Process &processB) const override;

		void verification_done(int error, bool matches) override;
	};

	/**
	 * Accepts any RSA-3072 or RSA-4096 record without verifying the
	 * signature, and passes everything else.  For exercising the loader
	 * only: this provides neither integrity nor authenticity.  The
	 * application identifier is the public key and the short identifier is
	 * built from its first four bytes.
	 */
	class AppCheckerRsaSimulated : public CredentialsChecker,
	                               public AppIdPolicy,
	                               public DeferredCallClient,
	                               private utils::NoCopyNoMove
	{
		DeferredCall              deferredCall;
		CredentialsCheckerClient *client      = nullptr;
		bool                      outstanding = false;
		CredentialsFormat         format      = CredentialsFormat::Reserved;

		public:
		explicit AppCheckerRsaSimulated(DeferredCallQueue &queue);

		[[nodiscard]] bool require_credentials() const override
		{
			return true;
		}
		int  check_credentials(const CredentialsRecord &record,
		                       std::span<const uint8_t> binary) override;
		void set_client(CredentialsCheckerClient &newClient) override
		{
			client = &newClient;
		}

		ApplicationIdentifier
		derive_identifier(const CredentialsRecord *accepted,
		                  const ProcessBinary     &binary) const override;
		[[nodiscard]] ShortId to_short_id(const Process &process) const override;
		[[nodiscard]] bool    different_identifier(
		     const Process &processA,
		     const Process &processB) const override;

		void handle_deferred_call() override;
	};

	/**
	 * Loads binaries signed with RSA PKCS#1 v1.5 over SHA-512.  A valid
	 * signature accepts the binary and an invalid one rejects it.
	 *
	 * If a list of trusted keys is given, records signed with any other key
	 * pass, and the short identifier of an application is one more than the
	 * index of its key in the list.  Without a list any key is accepted and
	 * the short identifier is built from the first four bytes of the key.
	 * Either way the application identifier is the public key, so every
	 * binary signed with one key is the same application.
	 */
	class AppCheckerRsa : public CredentialsChecker,
	                      public AppIdPolicy,
	                      public SignatureVerifierClient,
	                      private utils::NoCopyNoMove
	{
		SignatureVerifier                          &verifier;
		std::span<const std::span<const uint8_t>>   trustedKeys;
		CredentialsCheckerClient                   *client      = nullptr;
		bool                                        outstanding = false;

		public:
		/**
		 * Construct a checker that uses `verifier`.  The key list, if any,
		 * must outlive the checker.
		 */
		explicit AppCheckerRsa(
		  SignatureVerifier                        &verifier,
		  std::span<const std::span<const uint8_t>> trustedKeys = {});

		[[nodiscard]] bool require_credentials() const override
		{
			return true;
		}
		int  check_credentials(const CredentialsRecord &record,
		                       std::span<const uint8_t> binary) override;
		void set_client(CredentialsCheckerClient &newClient) override
		{
			client = &newClient;
		}

		ApplicationIdentifier
		derive_identifier(const CredentialsRecord *accepted,
		                  const ProcessBinary     &binary) const override;
		[[nodiscard]] ShortId to_short_id(const Process &process) const override;
		[[nodiscard]] bool    different_identifier(
		     const Process &processA,
		     const Process &processB) const override;

		void signature_done(int error, bool valid) override;

		private:
		/**
		 * Returns the index of `key` in the trusted key list, or nothing if it
		 * is not in the list.
		 */
		[[nodiscard]] std::optional<size_t>
		trusted_key_index(std::span<const uint8_t> key) const;
	};
} // namespace appcheck
