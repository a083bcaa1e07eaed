// Copyright Microsoft and CHERIoT Contributors.
// SPDX-License-Identifier: MIT

#include <appcheck/checkers.hh>
#include <appcheck/config.hh>
#include <debug.hh>
#include <errno.h>

using namespace appcheck;

namespace
{
	using Debug = ConditionalDebug<config::DebugProcessChecker, "Names">;
} // namespace

AppCheckerNames::AppCheckerNames(DeferredCallQueue &queue, NameHasher hasher)
  : deferredCall(queue, *this), hasher(hasher)
{
}

int AppCheckerNames::check_credentials(const CredentialsRecord &record,
                                       std::span<const uint8_t>)
{
	if (outstanding)
	{
		return -EBUSY;
	}
	Debug::log("Accepting {} record", record.format);
	outstanding = true;
	deferredCall.set();
	return 0;
}

void AppCheckerNames::handle_deferred_call()
{
	outstanding = false;
	if (client != nullptr)
	{
		client->check_done(0, CheckResult::Accept);
	}
}

ApplicationIdentifier
AppCheckerNames::derive_identifier(const CredentialsRecord *,
                                   const ProcessBinary &) const
{
	return ApplicationIdentifier::locally_unique();
}

ShortId AppCheckerNames::to_short_id(const Process &process) const
{
	// A hash of zero is not a valid fixed value and becomes locally unique.
	return ShortId::fixed(hasher(process.name()));
}

bool AppCheckerNames::different_identifier(const Process &,
                                           const Process &) const
{
	return true;
}
