// Copyright Microsoft and CHERIoT Contributors.
// SPDX-License-Identifier: MIT

#include <appcheck/config.hh>
#include <appcheck/process.hh>
#include <debug.hh>
#include <errno.h>

using namespace appcheck;

namespace
{
	using Debug = ConditionalDebug<config::DebugProcessChecker, "Process">;
} // namespace

int Process::credentials_approved(std::optional<CredentialsRecord> accepted)
{
	if (state != ProcessState::CredentialsUnchecked)
	{
		return -EINVAL;
	}
	credential = accepted;
	state      = ProcessState::CredentialsApproved;
	return 0;
}

int Process::application_id_set(const ApplicationIdentifier &identifier)
{
	if (state != ProcessState::CredentialsApproved)
	{
		return -EINVAL;
	}
	applicationId = identifier;
	return 0;
}

int Process::short_id_set(ShortId compressed)
{
	if (state != ProcessState::CredentialsApproved)
	{
		return -EINVAL;
	}
	shortId = compressed;
	return 0;
}

int Process::credentials_failed()
{
	if (state != ProcessState::CredentialsUnchecked)
	{
		return -EINVAL;
	}
	state = ProcessState::CredentialsFailed;
	return 0;
}

int Process::run()
{
	if ((state != ProcessState::CredentialsApproved) &&
	    (state != ProcessState::Terminated))
	{
		return -EINVAL;
	}
	Debug::log("{} '{}' now running", id.index, name());
	state = ProcessState::Running;
	return 0;
}

int Process::terminate()
{
	if ((state != ProcessState::CredentialsApproved) &&
	    (state != ProcessState::Running))
	{
		return -EINVAL;
	}
	Debug::log("{} '{}' terminated", id.index, name());
	state = ProcessState::Terminated;
	return 0;
}

ProcessTable::ProcessTable()
{
	for (uint16_t i = 0; i < slots.size(); i++)
	{
		slots[i].id = {i, 0};
	}
}

utils::OptionalReference<Process> ProcessTable::load(const ProcessBinary &binary)
{
	for (auto &slot : slots)
	{
		if (slot.state != ProcessState::Unloaded)
		{
			continue;
		}
		// Bump the generation so that handles to the previous occupant of
		// this slot are stale.
		slot.id.generation++;
		slot.state         = ProcessState::CredentialsUnchecked;
		slot.binary        = binary;
		slot.credential    = std::nullopt;
		slot.applicationId = ApplicationIdentifier::locally_unique();
		slot.shortId       = ShortId::locally_unique();
		Debug::log("Loaded '{}' into slot {}", binary.packageName, slot.id.index);
		return slot;
	}
	return nullptr;
}

utils::OptionalReference<Process> ProcessTable::get(ProcessId id)
{
	if (id.index >= slots.size())
	{
		return nullptr;
	}
	auto &slot = slots[id.index];
	if ((slot.state == ProcessState::Unloaded) || (slot.id != id))
	{
		return nullptr;
	}
	return slot;
}

int ProcessTable::remove(ProcessId id)
{
	auto found = get(id);
	if (!found.has_value())
	{
		return -ENOENT;
	}
	found.and_then([](Process &process) {
		Debug::log(
		  "Removing '{}' from slot {}", process.name(), process.id.index);
		process.state      = ProcessState::Unloaded;
		process.binary     = {};
		process.credential = std::nullopt;
	});
	return 0;
}

void ProcessTable::for_each(FunctionWrapper<void(Process &)> visitor)
{
	for (auto &slot : slots)
	{
		if (slot.state != ProcessState::Unloaded)
		{
			visitor(slot);
		}
	}
}

size_t ProcessTable::loaded_count() const
{
	size_t count = 0;
	for (auto &slot : slots)
	{
		if (slot.state != ProcessState::Unloaded)
		{
			count++;
		}
	}
	return count;
}
