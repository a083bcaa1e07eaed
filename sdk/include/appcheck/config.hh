// Copyright Microsoft and CHERIoT Contributors.
// SPDX-License-Identifier: MIT

#pragma once

#include <cstddef>

/*
 * Build-time configuration.  The build system defines these from its options;
 * the defaults below are used for anything it leaves unset.
 */

#ifndef APPCHECK_PROCESS_SLOTS
#	define APPCHECK_PROCESS_SLOTS 8
#endif

#ifndef APPCHECK_DEFERRED_CALLS
#	define APPCHECK_DEFERRED_CALLS 16
#endif

#ifndef DEBUG_PROCESS_CHECKER
#	define DEBUG_PROCESS_CHECKER false
#endif

#ifndef DEBUG_LOADER
#	define DEBUG_LOADER false
#endif

#ifndef DEBUG_UNIQUENESS
#	define DEBUG_UNIQUENESS false
#endif

#ifndef DEBUG_CRYPTO_ENGINE
#	define DEBUG_CRYPTO_ENGINE false
#endif

namespace appcheck::config
{
	/// The number of process slots in the process table.
	constexpr size_t ProcessSlots = APPCHECK_PROCESS_SLOTS;

	/// The maximum number of clients that can register for deferred calls.
	constexpr size_t DeferredCalls = APPCHECK_DEFERRED_CALLS;

	static_assert(DeferredCalls <= 32,
	              "Pending deferred calls are tracked in a 32-bit mask");

	/// Is the credential checker machine being debugged?
	constexpr bool DebugProcessChecker = DEBUG_PROCESS_CHECKER;

	/// Is the process loader being debugged?
	constexpr bool DebugLoader = DEBUG_LOADER;

	/// Is the uniqueness scan being debugged?
	constexpr bool DebugUniqueness = DEBUG_UNIQUENESS;

	/// Is the software crypto engine being debugged?
	constexpr bool DebugCryptoEngine = DEBUG_CRYPTO_ENGINE;
} // namespace appcheck::config
