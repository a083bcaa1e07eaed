// Copyright Microsoft and CHERIoT Contributors.
// SPDX-License-Identifier: MIT

#include <appcheck/config.hh>
#include <appcheck/loader.hh>
#include <appcheck/uniqueness.hh>
#include <debug.hh>
#include <errno.h>

using namespace appcheck;

namespace
{
	using Debug = ConditionalDebug<config::DebugLoader, "Loader">;
} // namespace

SequentialProcessLoader::SequentialProcessLoader(
  DeferredCallQueue       &queue,
  ProcessTable            &processes,
  ProcessCheckerMachine   &checker,
  const AppUniqueness     &uniqueness,
  std::span<const uint8_t> flash)
  : processes(processes),
    checker(checker),
    uniqueness(uniqueness),
    deferredCall(queue, *this),
    flash(flash)
{
	checker.set_client(*this);
}

int SequentialProcessLoader::start()
{
	if (state != State::Idle)
	{
		return -EBUSY;
	}
	Debug::log("Loading binaries from {} bytes of flash", flash.size());
	state = State::Discovering;
	deferredCall.set();
	return 0;
}

void SequentialProcessLoader::handle_deferred_call()
{
	switch (state)
	{
		case State::Discovering:
			discover_next();
			break;
		case State::Resolving:
			resolve_boot();
			break;
		default:
			break;
	}
}

void SequentialProcessLoader::discover_next()
{
	while (true)
	{
		ProcessBinary binary;
		if (auto error = discover_process_binary(flash, binary))
		{
			switch (*error)
			{
				case ProcessBinaryError::NotEnoughFlash:
				case ProcessBinaryError::HeaderNotFound:
					Debug::log("End of binaries ({})", *error);
					state = State::Resolving;
					deferredCall.set();
					return;
				case ProcessBinaryError::Padding:
				case ProcessBinaryError::NotEnabledProcess:
					continue;
				case ProcessBinaryError::HeaderParseFailure:
					Debug::log<DebugLevel::Warning>(
					  "Skipping binary with invalid header");
					notify_loaded(std::nullopt, ProcessLoadError::BinaryError);
					continue;
			}
		}

		auto loaded = processes.load(binary);
		if (!loaded.has_value())
		{
			Debug::log<DebugLevel::Warning>(
			  "No process slot for '{}', not loading any more binaries",
			  binary.packageName);
			notify_loaded(std::nullopt, ProcessLoadError::NoProcessSlot);
			state = State::Resolving;
			deferredCall.set();
			return;
		}
		ProcessId id =
		  loaded.and_then([](Process &process) { return process.id_get(); });
		int ret = checker.check(id);
		if (ret != 0)
		{
			Debug::log<DebugLevel::Error>(
			  "Failed to start checking '{}': {}", binary.packageName, ret);
			ret = processes.remove(id);
			Debug::Invariant(ret == 0, "Failed to free unchecked slot: {}", ret);
			notify_loaded(std::nullopt, ProcessLoadError::CheckError);
			continue;
		}
		state = State::Checking;
		return;
	}
}

void SequentialProcessLoader::done(ProcessId                        process,
                                   std::optional<ProcessCheckError> error)
{
	std::optional<ProcessLoadError> loadError;
	if (error)
	{
		loadError = ProcessLoadError::CheckError;
	}
	switch (state)
	{
		case State::Checking:
			notify_loaded(process, loadError);
			state = State::Discovering;
			deferredCall.set();
			return;
		case State::CheckingRuntime:
			state = State::Idle;
			if (!loadError && (try_start(process) != 0))
			{
				loadError = ProcessLoadError::Blocked;
			}
			notify_loaded(process, loadError);
			return;
		default:
			Debug::log<DebugLevel::Warning>(
			  "Check finished for slot {} while {}", process.index, state);
			return;
	}
}

void SequentialProcessLoader::resolve_boot()
{
	auto all = processes.processes();
	processes.for_each([&](Process &candidate) {
		if (candidate.state_get() != ProcessState::CredentialsApproved)
		{
			return;
		}
		// A newer version of the same application takes precedence, whether
		// or not it has started yet.
		for (const Process &other : all)
		{
			if ((&other == &candidate) ||
			    ((other.state_get() != ProcessState::CredentialsApproved) &&
			     !other.is_running()))
			{
				continue;
			}
			if (is_blocked_from_starting_by(candidate, other, uniqueness))
			{
				return;
			}
		}
		if (!has_unique_identifiers(candidate, all, uniqueness))
		{
			Debug::log("Not starting '{}': identifier in use",
			           candidate.name());
			return;
		}
		int ret = candidate.run();
		Debug::Invariant(ret == 0, "Failed to run approved process: {}", ret);
	});
	state = State::Idle;
	Debug::log("Finished loading, {} processes loaded",
	           processes.loaded_count());
	if (client != nullptr)
	{
		client->process_loading_finished();
	}
}

int SequentialProcessLoader::load_binary(std::span<const uint8_t> entry)
{
	if (state != State::Idle)
	{
		return -EBUSY;
	}
	ProcessBinary binary;
	if (auto error = discover_process_binary(entry, binary))
	{
		Debug::log("Cannot load binary: {}", *error);
		return -EINVAL;
	}
	auto loaded = processes.load(binary);
	if (!loaded.has_value())
	{
		return -ENOSPC;
	}
	ProcessId id =
	  loaded.and_then([](Process &process) { return process.id_get(); });
	int ret = checker.check(id);
	if (ret != 0)
	{
		int removed = processes.remove(id);
		Debug::Invariant(
		  removed == 0, "Failed to free unchecked slot: {}", removed);
		return ret;
	}
	state = State::CheckingRuntime;
	return 0;
}

int SequentialProcessLoader::try_start(ProcessId id)
{
	auto found = processes.get(id);
	if (!found.has_value())
	{
		return -ENOENT;
	}
	return found.and_then([&](Process &process) {
		if ((process.state_get() != ProcessState::CredentialsApproved) &&
		    (process.state_get() != ProcessState::Terminated))
		{
			return -EINVAL;
		}
		if (!has_unique_identifiers(
		      process, processes.processes(), uniqueness))
		{
			Debug::log("Not starting '{}': identifier in use", process.name());
			return -EEXIST;
		}
		return process.run();
	});
}

int SequentialProcessLoader::terminate(ProcessId id)
{
	auto found = processes.get(id);
	if (!found.has_value())
	{
		return -ENOENT;
	}
	return found.and_then([](Process &process) { return process.terminate(); });
}

int SequentialProcessLoader::restart(ProcessId id)
{
	auto found = processes.get(id);
	if (!found.has_value())
	{
		return -ENOENT;
	}
	int ret = found.and_then([](Process &process) {
		return process.is_running() ? process.terminate() : 0;
	});
	if (ret != 0)
	{
		return ret;
	}
	return try_start(id);
}

int SequentialProcessLoader::remove(ProcessId id)
{
	return processes.remove(id);
}

void SequentialProcessLoader::notify_loaded(
  std::optional<ProcessId>        process,
  std::optional<ProcessLoadError> error)
{
	if (client != nullptr)
	{
		client->process_loaded(process, error);
	}
}
