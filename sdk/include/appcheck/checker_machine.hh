// Copyright Microsoft and CHERIoT Contributors.
// SPDX-License-Identifier: MIT

#pragma once

#include "checker.hh"
#include "credentials.hh"
#include "deferred_call.hh"
#include "process.hh"
#include <optional>
#include <utils.hh>

namespace appcheck
{
	/**
	 * Reasons that a process's credentials were not approved.
	 */
	enum class ProcessCheckError : uint8_t
	{
		/// No record was accepted and the policy requires credentials.
		CredentialsNoAccept,
		/// A record was rejected.
		CredentialsReject,
		/// The policy reported an error while checking a record.
		CheckerError,
		/// The footer region could not be parsed.
		MalformedCredentials,
		/// The process was removed while its check was outstanding.
		ProcessRemoved,
	};

	/**
	 * Receives the outcome of checking a process.
	 */
	class ProcessCheckerMachineClient
	{
		public:
		virtual ~ProcessCheckerMachineClient() = default;

		/**
		 * Called once for each `check` that returned 0.  `error` is empty if
		 * the process's credentials were approved.
		 */
		virtual void done(ProcessId                        process,
		                  std::optional<ProcessCheckError> error) = 0;
	};

	/**
	 * Drives a credentials checking policy over the credentials records of a
	 * single process.
	 *
	 * Records are checked one at a time, in the order they appear in the
	 * footer region, stopping at the first `Accept` or `Reject`.  If every
	 * record passes, the policy's `require_credentials` decides the outcome.
	 * The verdict is applied to the process: on approval the identifier
	 * policy derives the application identifier and the compress policy the
	 * short identifier.
	 *
	 * Moving from one record to the next always goes through a deferred call,
	 * so a policy that completes immediately cannot make the scan recurse.
	 */
	class ProcessCheckerMachine : public DeferredCallClient,
	                              public CredentialsCheckerClient,
	                              private utils::NoCopyNoMove
	{
		/**
		 * Where the machine is in its scan.
		 */
		enum class State : uint8_t
		{
			/// Not checking anything.
			Idle,
			/// A deferred call will look at the next record.
			NextRecord,
			/// Waiting for the policy to call `check_done`.
			Checking,
		};

		/// The processes being checked.
		ProcessTable &processes;
		/// The policies to apply.
		PolicySet policies;
		/// Used to move to the next record from the kernel loop.
		DeferredCall deferredCall;
		/// The client to notify.
		ProcessCheckerMachineClient *client = nullptr;
		/// Current state.
		State state = State::Idle;
		/// The process being checked.
		ProcessId process;
		/// The footer records that have not yet been checked.
		std::optional<CredentialsFooterIterator> footers;
		/// The record that is being checked.
		CredentialsRecord record;
		/// The binary region of the process being checked.
		std::span<const uint8_t> binary;

		public:
		/**
		 * Construct a machine that checks processes in `processes` with
		 * `policies`.  The machine registers itself as the checker's client.
		 */
		ProcessCheckerMachine(DeferredCallQueue &queue,
		                      ProcessTable      &processes,
		                      PolicySet          policies);

		/**
		 * Set the client that is notified when a check finishes.
		 */
		void set_client(ProcessCheckerMachineClient &newClient)
		{
			client = &newClient;
		}

		/**
		 * Start checking the credentials of `id`, which must be in the
		 * `CredentialsUnchecked` state.  Returns 0 on success, -EBUSY if a
		 * check is already in progress, -ENOENT if the handle is stale, or
		 * -EINVAL if the process is in the wrong state.
		 */
		int check(ProcessId id);

		/**
		 * Returns true if a check is in progress.
		 */
		[[nodiscard]] bool is_busy() const
		{
			return state != State::Idle;
		}

		/**
		 * Returns the index of the record that is being checked.  Exposed for
		 * diagnostics and tests.
		 */
		[[nodiscard]] size_t record_index() const;

		void handle_deferred_call() override;

		void check_done(int error, CheckResult result) override;

		private:
		/**
		 * Find the next record and hand it to the policy, or apply the
		 * default if there are none left.
		 */
		void next_record();

		/**
		 * Apply a verdict to the process and notify the client.
		 */
		void finish(std::optional<ProcessCheckError> error,
		            const CredentialsRecord         *accepted);
	};
} // namespace appcheck
