// Copyright Microsoft and CHERIoT Contributors.
// SPDX-License-Identifier: MIT

#pragma once

#include "checker.hh"
#include "process.hh"
#include <span>

namespace appcheck
{
	/**
	 * Returns true if `candidate` may start running given the processes in
	 * `processes`.
	 *
	 * The candidate must have approved credentials (or have been terminated
	 * after running).  It may start if every running process both has a
	 * different identifier according to `policy` and has a different short
	 * identifier.  `processes` may include the candidate itself: it is not
	 * running and so is never compared.
	 *
	 * Short identifiers are the ones assigned when each process was approved.
	 */
	bool has_unique_identifiers(const Process           &candidate,
	                            std::span<const Process> processes,
	                            const AppUniqueness     &policy);

	/**
	 * Returns true if `candidate` and `other` are the same application: they
	 * have the same application identifier or the same short identifier.
	 * `other` must be a different process.
	 */
	bool is_same_application(const Process       &candidate,
	                         const Process       &other,
	                         const AppUniqueness &policy);

	/**
	 * Returns true if `candidate` should not start at boot because `other` is
	 * the same application with a strictly higher version.  Equal versions
	 * do not block: the first one started wins.
	 */
	bool is_blocked_from_starting_by(const Process       &candidate,
	                                 const Process       &other,
	                                 const AppUniqueness &policy);
} // namespace appcheck
