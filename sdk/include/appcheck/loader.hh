// Copyright Microsoft and CHERIoT Contributors.
// SPDX-License-Identifier: MIT

#pragma once

#include "checker.hh"
#include "checker_machine.hh"
#include "deferred_call.hh"
#include "process.hh"
#include "process_binary.hh"
#include <optional>
#include <span>
#include <utils.hh>

namespace appcheck
{
	/**
	 * Reasons that a binary in flash did not become a runnable process.
	 */
	enum class ProcessLoadError : uint8_t
	{
		/// The binary could not be parsed.
		BinaryError,
		/// The binary's credentials were not approved.
		CheckError,
		/// There was no free slot in the process table.
		NoProcessSlot,
		/// The binary was approved but another process with the same
		/// identity is running.
		Blocked,
	};

	/**
	 * Receives notifications from the loader.
	 */
	class ProcessLoaderClient
	{
		public:
		virtual ~ProcessLoaderClient() = default;

		/**
		 * Called once for each binary that the loader has finished with.
		 * `process` is set if the binary was given a slot.  `error` is empty
		 * if the binary's credentials were approved (and, for a binary loaded
		 * at run time, it was started).
		 */
		virtual void process_loaded(std::optional<ProcessId>        process,
		                            std::optional<ProcessLoadError> error) = 0;

		/**
		 * Called once after boot, when every binary has been checked and the
		 * approved ones that can run have been started.
		 */
		virtual void process_loading_finished() = 0;
	};

	/**
	 * Loads the binaries in a flash image, one at a time.
	 *
	 * At boot, `start` walks flash from the lowest address, loads each
	 * enabled binary into the next free slot and runs the checker machine on
	 * it, waiting for each check to finish before moving on.  When flash is
	 * exhausted, the approved processes are started.  A process does not
	 * start if another approved or running process is the same application
	 * with a strictly higher version, or if `has_unique_identifiers` says no.
	 *
	 * After boot, processes can be started, stopped and removed, and single
	 * binaries can be loaded.
	 */
	class SequentialProcessLoader : public DeferredCallClient,
	                                public ProcessCheckerMachineClient,
	                                private utils::NoCopyNoMove
	{
		/**
		 * What the loader is doing.
		 */
		enum class State : uint8_t
		{
			/// Waiting for work.
			Idle,
			/// Looking for the next binary at boot.
			Discovering,
			/// Waiting for the checker machine at boot.
			Checking,
			/// Starting processes at the end of boot.
			Resolving,
			/// Waiting for the checker machine for a binary loaded at run time.
			CheckingRuntime,
		};

		/// The process table.
		ProcessTable &processes;
		/// The credentials checker machine.
		ProcessCheckerMachine &checker;
		/// Identity comparison for starting processes.
		const AppUniqueness &uniqueness;
		/// Used to continue work from the kernel loop.
		DeferredCall deferredCall;
		/// The part of flash that has not been discovered yet.
		std::span<const uint8_t> flash;
		/// The client to notify.
		ProcessLoaderClient *client = nullptr;
		/// Current state.
		State state = State::Idle;

		public:
		/**
		 * Construct a loader for the binaries in `flash`.  The loader
		 * registers itself as the checker machine's client.
		 */
		SequentialProcessLoader(DeferredCallQueue       &queue,
		                        ProcessTable            &processes,
		                        ProcessCheckerMachine   &checker,
		                        const AppUniqueness     &uniqueness,
		                        std::span<const uint8_t> flash);

		/**
		 * Set the client to notify.
		 */
		void set_client(ProcessLoaderClient &newClient)
		{
			client = &newClient;
		}

		/**
		 * Start loading the binaries in flash.  The work happens from
		 * deferred calls.  Returns 0 on success or -EBUSY if the loader is
		 * already working.
		 */
		int start();

		/**
		 * Load a single binary at run time.  `entry` must hold exactly one
		 * binary and must outlive the process.  Once approved, the process is
		 * started if no process with the same identity is running.  Returns
		 * 0 if the binary was loaded and is being checked, -EBUSY if the
		 * loader is already working, -EINVAL if the binary could not be
		 * parsed or is disabled, or -ENOSPC if there are no free slots.
		 */
		int load_binary(std::span<const uint8_t> entry);

		/**
		 * Start a process that has approved credentials, or restart a
		 * terminated one.  Returns 0 if it is now running, -ENOENT if the
		 * handle is stale, -EINVAL if the process is in the wrong state, or
		 * -EEXIST if a process with the same identity is running.
		 */
		int try_start(ProcessId id);

		/**
		 * Terminate a process.  Returns 0 on success, -ENOENT if the handle
		 * is stale, or -EINVAL if the process is neither approved nor
		 * running.
		 */
		int terminate(ProcessId id);

		/**
		 * Terminate a running process and start it again.  Return values are
		 * as for `try_start`.
		 */
		int restart(ProcessId id);

		/**
		 * Remove a process and free its slot.  Returns 0 on success or
		 * -ENOENT if the handle is stale.  A check in progress for the
		 * process is abandoned.
		 */
		int remove(ProcessId id);

		/**
		 * Returns true if the loader is working.
		 */
		[[nodiscard]] bool is_busy() const
		{
			return state != State::Idle;
		}

		void handle_deferred_call() override;

		void done(ProcessId                        process,
		          std::optional<ProcessCheckError> error) override;

		private:
		/**
		 * Load the next binary in flash and start checking it.
		 */
		void discover_next();

		/**
		 * Start every approved process that is allowed to run.
		 */
		void resolve_boot();

		/**
		 * Notify the client, if there is one.
		 */
		void notify_loaded(std::optional<ProcessId>        process,
		                   std::optional<ProcessLoadError> error);
	};
} // namespace appcheck
