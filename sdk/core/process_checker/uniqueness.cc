// Copyright Microsoft and CHERIoT Contributors.
// SPDX-License-Identifier: MIT

#include <appcheck/config.hh>
#include <appcheck/uniqueness.hh>
#include <debug.hh>

using namespace appcheck;

namespace
{
	using Debug = ConditionalDebug<config::DebugUniqueness, "Uniqueness">;
} // namespace

bool appcheck::has_unique_identifiers(const Process           &candidate,
                                      std::span<const Process> processes,
                                      const AppUniqueness     &policy)
{
	// Only a process that could start is a candidate.  In particular, a
	// running process is never unique, which stops an identity from being
	// admitted twice.
	if ((candidate.state_get() != ProcessState::CredentialsApproved) &&
	    (candidate.state_get() != ProcessState::Terminated))
	{
		Debug::log("'{}' is {}, not a candidate",
		           candidate.name(),
		           candidate.state_get());
		return false;
	}
	// `processes` usually contains the candidate.  It is not running, so it is
	// skipped below and never compared with itself.
	for (const Process &other : processes)
	{
		if (!other.is_running())
		{
			continue;
		}
		bool differentId    = policy.different_identifier(candidate, other);
		bool differentShort = candidate.short_id() != other.short_id();
		if (!differentId || !differentShort)
		{
			Debug::log("'{}' collides with running '{}' (different ID: {}, "
			           "different short ID: {})",
			           candidate.name(),
			           other.name(),
			           differentId,
			           differentShort);
			return false;
		}
	}
	return true;
}

bool appcheck::is_same_application(const Process       &candidate,
                                   const Process       &other,
                                   const AppUniqueness &policy)
{
	return !policy.different_identifier(candidate, other) ||
	       (candidate.short_id() == other.short_id());
}

bool appcheck::is_blocked_from_starting_by(const Process       &candidate,
                                           const Process       &other,
                                           const AppUniqueness &policy)
{
	if (!is_same_application(candidate, other, policy))
	{
		return false;
	}
	bool blocked = other.binary_version() > candidate.binary_version();
	if (blocked)
	{
		Debug::log("'{}' version {} blocked by '{}' version {}",
		           candidate.name(),
		           candidate.binary_version(),
		           other.name(),
		           other.binary_version());
	}
	return blocked;
}
