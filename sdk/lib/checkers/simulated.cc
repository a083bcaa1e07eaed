// Copyright Microsoft and CHERIoT Contributors.
// SPDX-License-Identifier: MIT

#include <appcheck/checkers.hh>
#include <appcheck/config.hh>
#include <debug.hh>
#include <errno.h>

using namespace appcheck;

namespace
{
	using Debug = ConditionalDebug<config::DebugProcessChecker, "Simulated">;
} // namespace

AppCheckerSimulated::AppCheckerSimulated(DeferredCallQueue &queue)
  : deferredCall(queue, *this)
{
}

int AppCheckerSimulated::check_credentials(const CredentialsRecord &record,
                                           std::span<const uint8_t>)
{
	if (outstanding)
	{
		return -EBUSY;
	}
	Debug::log("Passing {} record", record.format);
	outstanding = true;
	deferredCall.set();
	return 0;
}

void AppCheckerSimulated::handle_deferred_call()
{
	outstanding = false;
	if (client != nullptr)
	{
		client->check_done(0, CheckResult::Pass);
	}
}

ApplicationIdentifier
AppCheckerSimulated::derive_identifier(const CredentialsRecord *,
                                       const ProcessBinary &binary) const
{
	return ApplicationIdentifier::global_from(
	  {reinterpret_cast<const uint8_t *>(binary.packageName.data()),
	   binary.packageName.size()});
}

ShortId AppCheckerSimulated::to_short_id(const Process &) const
{
	return ShortId::locally_unique();
}

bool AppCheckerSimulated::different_identifier(const Process &processA,
                                               const Process &processB) const
{
	return processA.name() != processB.name();
}
