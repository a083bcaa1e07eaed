// Copyright Microsoft and CHERIoT Contributors.
// SPDX-License-Identifier: MIT

#pragma once

#include "app_id.hh"
#include "credentials.hh"
#include "process.hh"
#include "process_binary.hh"
#include "short_id.hh"
#include <cstdint>
#include <span>

/**
 * The pluggable policies that decide whether a binary may be loaded and what
 * application it belongs to.
 *
 * A deployment supplies one of each.  The three identifier concerns
 * (derivation, compression and comparison) are separate interfaces so that
 * they can be mixed freely, but an implementation that wants to share state
 * between them (for example, a list of trusted keys) can implement all of
 * them in one class by deriving from `AppIdPolicy`.
 */
namespace appcheck
{
	/**
	 * The decision of a credentials checker about one record.
	 */
	enum class CheckResult : uint8_t
	{
		/// The binary is accepted, stop scanning.
		Accept,
		/// The binary is rejected, stop scanning.
		Reject,
		/// This record says nothing about the binary, try the next one.
		Pass,
	};

	/**
	 * Receives the result of a `check_credentials` call.
	 */
	class CredentialsCheckerClient
	{
		public:
		virtual ~CredentialsCheckerClient() = default;

		/**
		 * Called exactly once for each `check_credentials` call that returned
		 * 0.  `error` is 0 if `result` is valid, or a negative errno value if
		 * the check failed (for example, the crypto engine reported an
		 * error), in which case `result` is ignored.
		 */
		virtual void check_done(int error, CheckResult result) = 0;
	};

	/**
	 * A credentials checking policy.  Classifies a binary from its
	 * credentials records, one record at a time.
	 */
	class CredentialsChecker
	{
		public:
		virtual ~CredentialsChecker() = default;

		/**
		 * Returns true if binaries for which no record produced a decision
		 * must be rejected, false if they should be accepted.
		 */
		[[nodiscard]] virtual bool require_credentials() const = 0;

		/**
		 * Start checking `record` against `binary`, the bytes from the end of
		 * the header to the binary end offset.  Both views remain valid until
		 * the check completes.
		 *
		 * Returns 0 if the check has started, in which case the client's
		 * `check_done` will be called exactly once, from a deferred call and
		 * not from inside this call.  Returns -ENOTSUP if this policy does
		 * not handle records of this format (the caller moves on to the next
		 * record), -EBUSY if a check is already outstanding, or another
		 * negative errno value if the check could not be started.
		 */
		virtual int check_credentials(const CredentialsRecord &record,
		                              std::span<const uint8_t> binary) = 0;

		/**
		 * Set the client that receives completions.
		 */
		virtual void set_client(CredentialsCheckerClient &client) = 0;
	};

	/**
	 * Derives the application identifier of a binary.
	 */
	class IdentifierPolicy
	{
		public:
		virtual ~IdentifierPolicy() = default;

		/**
		 * Derive the identifier for `binary`, given the credential that
		 * approved it, or null if it was approved without one.  Must return
		 * the same global identifier for the same inputs every time, or a
		 * locally unique identifier if this deployment does not track
		 * identity.
		 */
		virtual ApplicationIdentifier
		derive_identifier(const CredentialsRecord *accepted,
		                  const ProcessBinary     &binary) const = 0;
	};

	/**
	 * Compresses an application identifier into a short identifier.
	 */
	class Compress
	{
		public:
		virtual ~Compress() = default;

		/**
		 * Returns the short identifier for `process`.  Called once, when the
		 * process's credentials are approved; the process's accepted
		 * credential and application identifier are already set.  The
		 * mapping may be lossy but must be deterministic.
		 */
		[[nodiscard]] virtual ShortId
		to_short_id(const Process &process) const = 0;
	};

	/**
	 * Decides whether two processes are executions of different
	 * applications.
	 */
	class AppUniqueness
	{
		public:
		virtual ~AppUniqueness() = default;

		/**
		 * Returns true if `processA` and `processB` belong to different
		 * applications.  Must return false for two processes whose
		 * identifiers were derived from the same global identity.
		 *
		 * Precondition: `processA` and `processB` are different processes.
		 * The result of comparing a process with itself is unspecified:
		 * callers never rely on it, and the uniqueness scan only compares a
		 * candidate against running processes, which never include the
		 * candidate itself.
		 */
		[[nodiscard]] virtual bool
		different_identifier(const Process &processA,
		                     const Process &processB) const = 0;
	};

	/**
	 * All of the identifier concerns in one object.
	 */
	class AppIdPolicy : public IdentifierPolicy,
	                    public Compress,
	                    public AppUniqueness
	{
	};

	/**
	 * References to the policies that a deployment uses.  The checker machine
	 * and the loader take one of these rather than a single object so that
	 * the concerns can come from different implementations.
	 */
	struct PolicySet
	{
		/// Decides whether binaries are accepted.
		CredentialsChecker &checker;
		/// Derives application identifiers.
		IdentifierPolicy &identifier;
		/// Compresses application identifiers.
		Compress &compress;
		/// Compares application identities.
		AppUniqueness &uniqueness;
	};
} // namespace appcheck
