// Copyright Microsoft and CHERIoT Contributors.
// SPDX-License-Identifier: MIT

#include <appcheck/deferred_call.hh>
#include <debug.hh>
#include <errno.h>

using namespace appcheck;

namespace
{
	using Debug = ConditionalDebug<config::DebugProcessChecker, "Deferred call">;
} // namespace

int DeferredCallQueue::register_client(DeferredCallClient &client)
{
	if (registered == clients.size())
	{
		return -ENOSPC;
	}
	clients[registered] = &client;
	return static_cast<int>(registered++);
}

void DeferredCallQueue::set(int handle)
{
	Debug::Assert(
	  (handle >= 0) && (static_cast<size_t>(handle) < registered),
	  "Setting unregistered deferred call {}",
	  handle);
	pending |= 1U << handle;
}

bool DeferredCallQueue::is_pending(int handle) const
{
	return (pending & (1U << handle)) != 0;
}

bool DeferredCallQueue::service_next()
{
	if (pending == 0)
	{
		return false;
	}
	int handle = __builtin_ctz(pending);
	// Clear before calling so that the client can set it again.
	pending &= ~(1U << handle);
	clients[handle]->handle_deferred_call();
	return true;
}

size_t DeferredCallQueue::run_until_idle(size_t limit)
{
	size_t calls = 0;
	while ((calls < limit) && service_next())
	{
		calls++;
	}
	return calls;
}

DeferredCall::DeferredCall(DeferredCallQueue &queue, DeferredCallClient &client)
  : queue(queue), handle(queue.register_client(client))
{
	Debug::Invariant(handle >= 0,
	                 "Out of deferred call slots, increase "
	                 "APPCHECK_DEFERRED_CALLS");
}
