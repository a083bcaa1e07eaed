// Copyright Microsoft and CHERIoT Contributors.
// SPDX-License-Identifier: MIT

#pragma once

#include "config.hh"
#include <array>
#include <cstddef>
#include <cstdint>
#include <utils.hh>

namespace appcheck
{
	/**
	 * Interface for components that want to be called back from the kernel
	 * loop rather than from the stack of whoever asked them to do work.
	 */
	class DeferredCallClient
	{
		public:
		virtual ~DeferredCallClient() = default;

		/**
		 * Called from the kernel loop once for each time the client's
		 * deferred call was set.  Setting it again from inside this callback
		 * schedules another call, it does not recurse.
		 */
		virtual void handle_deferred_call() = 0;
	};

	/**
	 * The kernel's cooperative work queue.  Clients register once and are
	 * given a slot in a pending mask.  Setting a deferred call marks the slot
	 * pending and `service_next` runs the lowest pending slot, so pending
	 * calls are serviced in registration order and each runs on a fresh
	 * stack from the kernel loop.
	 */
	class DeferredCallQueue : private utils::NoCopyNoMove
	{
		/// Registered clients, indexed by handle.
		std::array<DeferredCallClient *, config::DeferredCalls> clients{};
		/// Number of registered clients.
		size_t registered = 0;
		/// Bit `n` is set if client `n` has a call pending.
		uint32_t pending = 0;

		public:
		/**
		 * Register a client.  Returns a handle for the client, or -ENOSPC if
		 * there are no free slots.
		 */
		int register_client(DeferredCallClient &client);

		/**
		 * Mark the call for `handle` as pending.  Setting a pending call again
		 * has no effect: the client is called once.
		 */
		void set(int handle);

		/**
		 * Returns true if the call for `handle` is pending.
		 */
		[[nodiscard]] bool is_pending(int handle) const;

		/**
		 * Returns true if any call is pending.
		 */
		[[nodiscard]] bool has_tasks() const
		{
			return pending != 0;
		}

		/**
		 * Run the lowest-numbered pending call.  Returns false if nothing was
		 * pending.
		 */
		bool service_next();

		/**
		 * Run pending calls until there are none left or `limit` calls have
		 * been made.  Returns the number of calls made.
		 */
		size_t run_until_idle(size_t limit = SIZE_MAX);
	};

	/**
	 * A deferred call owned by a client.  This wraps the registration so
	 * that clients can hold one as a member and call `set()` when they need
	 * to complete work asynchronously.
	 */
	class DeferredCall
	{
		/// The queue that this call is registered with.
		DeferredCallQueue &queue;
		/// The handle returned by registration.
		int handle;

		public:
		/**
		 * Register `client` with `queue`.  Running out of deferred call slots
		 * is a build configuration error and is fatal.
		 */
		DeferredCall(DeferredCallQueue &queue, DeferredCallClient &client);

		/// Request a call to the client's `handle_deferred_call`.
		void set()
		{
			queue.set(handle);
		}

		/// Returns true if a call is pending.
		[[nodiscard]] bool is_pending() const
		{
			return queue.is_pending(handle);
		}
	};
} // namespace appcheck
