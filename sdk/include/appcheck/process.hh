// Copyright Microsoft and CHERIoT Contributors.
// SPDX-License-Identifier: MIT

#pragma once

#include "app_id.hh"
#include "config.hh"
#include "credentials.hh"
#include "process_binary.hh"
#include "short_id.hh"
#include <array>
#include <cstdint>
#include <function_wrapper.hh>
#include <optional>
#include <span>
#include <utils.hh>

namespace appcheck
{
	/**
	 * The credential state of a process.  Exactly one state holds at a time.
	 *
	 * ```
	 * Unloaded -> CredentialsUnchecked -> CredentialsFailed
	 *                                  -> CredentialsApproved -> Running
	 *                                                 |           ^  |
	 *                                                 v           |  v
	 *                                                 +------> Terminated
	 * ```
	 *
	 * Loading moves a slot out of `Unloaded`.  The credentials checker's
	 * verdict moves it to `CredentialsFailed` or `CredentialsApproved`.  The
	 * uniqueness check gates `CredentialsApproved` (or `Terminated`) to
	 * `Running`.  External management may terminate an approved or running
	 * process at any time.
	 */
	enum class ProcessState : uint8_t
	{
		Unloaded,
		CredentialsUnchecked,
		CredentialsFailed,
		CredentialsApproved,
		Running,
		Terminated,
	};

	/**
	 * Handle for a process: the slot that it occupies and the generation of
	 * that slot.  The generation changes every time a slot is reused, so a
	 * stale handle never refers to a newer process.
	 */
	struct ProcessId
	{
		/// Index of the slot in the process table.
		uint16_t index = 0;
		/// Generation of the slot when the process was loaded.
		uint32_t generation = 0;

		bool operator==(const ProcessId &) const = default;
	};

	/**
	 * A loaded userspace binary and its credential state.
	 */
	class Process
	{
		/// The handle for this process.
		ProcessId id;
		/// Current state.
		ProcessState state = ProcessState::Unloaded;
		/// The binary that this process runs.
		ProcessBinary binary;
		/// The credential that was accepted, if any.
		std::optional<CredentialsRecord> credential;
		/// Identity assigned when the credentials were approved.
		ApplicationIdentifier applicationId;
		/// Compressed identity assigned when the credentials were approved.
		ShortId shortId;

		friend class ProcessTable;

		public:
		/// Returns the handle for this process.
		[[nodiscard]] ProcessId id_get() const
		{
			return id;
		}

		/// Returns the current credential state.
		[[nodiscard]] ProcessState state_get() const
		{
			return state;
		}

		/// Returns true if this process is running.
		[[nodiscard]] bool is_running() const
		{
			return state == ProcessState::Running;
		}

		/// Returns the binary that this process was loaded from.
		[[nodiscard]] const ProcessBinary &binary_get() const
		{
			return binary;
		}

		/// Returns the package name from the binary header.
		[[nodiscard]] std::string_view name() const
		{
			return binary.packageName;
		}

		/// Returns the version from the binary header.
		[[nodiscard]] uint32_t binary_version() const
		{
			return binary.binaryVersion;
		}

		/**
		 * Returns the credential that approved this process, or nothing if it
		 * was approved without one (or has not been approved).
		 */
		[[nodiscard]] const std::optional<CredentialsRecord> &
		credential_get() const
		{
			return credential;
		}

		/// Returns the application identifier.
		[[nodiscard]] const ApplicationIdentifier &application_id() const
		{
			return applicationId;
		}

		/// Returns the short identifier.
		[[nodiscard]] ShortId short_id() const
		{
			return shortId;
		}

		/**
		 * Returns the ownership tag that persistent storage must use for
		 * records written by this process: the fixed short identifier.  A
		 * process with a locally unique short identifier has no stable tag
		 * and may not write owned records.
		 */
		[[nodiscard]] std::optional<uint32_t> storage_write_id() const
		{
			return shortId.fixed_value();
		}

		/**
		 * Record a passed credential check.  The identity is assigned by the
		 * caller from the identifier policy.  Returns -EINVAL if the process
		 * is not waiting for its credentials to be checked.
		 */
		int credentials_approved(std::optional<CredentialsRecord> accepted);

		/**
		 * Record the application identifier derived by the identifier policy.
		 * Only valid while the credentials are approved and the process has
		 * not run.
		 */
		int application_id_set(const ApplicationIdentifier &identifier);

		/**
		 * Record the short identifier computed by the compress policy.  Only
		 * valid while the credentials are approved and the process has not
		 * run.
		 */
		int short_id_set(ShortId compressed);

		/**
		 * Record a failed credential check.  Returns -EINVAL if the process is
		 * not waiting for its credentials to be checked.
		 */
		int credentials_failed();

		/**
		 * Move to running.  Valid only from `CredentialsApproved` or
		 * `Terminated`, and only after the caller has performed the uniqueness
		 * check.  Returns -EINVAL for any other state.
		 */
		int run();

		/**
		 * Terminate the process.  Valid from `CredentialsApproved` or
		 * `Running`.  Returns -EINVAL for any other state.
		 */
		int terminate();
	};

	/**
	 * The fixed-size table of process slots.  Slots are handed out in index
	 * order, so at boot the slot order is the order in which binaries were
	 * discovered in flash.
	 */
	class ProcessTable : private utils::NoCopyNoMove
	{
		/// The slots.
		std::array<Process, config::ProcessSlots> slots;

		public:
		ProcessTable();

		/**
		 * Load a binary into a free slot, moving it from `Unloaded` to
		 * `CredentialsUnchecked`.  Returns the new process, or nothing if
		 * every slot is in use.
		 */
		utils::OptionalReference<Process> load(const ProcessBinary &binary);

		/**
		 * Look up a process by handle.  Returns nothing if the slot is empty
		 * or has been reused since the handle was issued.
		 */
		utils::OptionalReference<Process> get(ProcessId id);

		/**
		 * Free the slot occupied by a process.  Returns -ENOENT if the handle
		 * is stale.  The process is treated as no longer running from this
		 * point on.
		 */
		int remove(ProcessId id);

		/**
		 * Returns all slots, including empty ones.  Empty slots are never
		 * running and so take no part in uniqueness checks.
		 */
		std::span<const Process> processes() const
		{
			return slots;
		}

		/**
		 * Call `visitor` for each loaded process in slot order.
		 */
		void for_each(FunctionWrapper<void(Process &)> visitor);

		/**
		 * Returns the number of occupied slots.
		 */
		[[nodiscard]] size_t loaded_count() const;
	};
} // namespace appcheck
