// Copyright Microsoft and CHERIoT Contributors.
// SPDX-License-Identifier: MIT

#include <appcheck/checker_machine.hh>
#include <appcheck/config.hh>
#include <debug.hh>
#include <errno.h>

using namespace appcheck;

namespace
{
	using Debug = ConditionalDebug<config::DebugProcessChecker, "Checker">;
} // namespace

ProcessCheckerMachine::ProcessCheckerMachine(DeferredCallQueue &queue,
                                             ProcessTable      &processes,
                                             PolicySet          policies)
  : processes(processes), policies(policies), deferredCall(queue, *this)
{
	policies.checker.set_client(*this);
}

int ProcessCheckerMachine::check(ProcessId id)
{
	if (state != State::Idle)
	{
		return -EBUSY;
	}
	auto found = processes.get(id);
	if (!found.has_value())
	{
		return -ENOENT;
	}
	int ret = found.and_then([&](Process &candidate) {
		if (candidate.state_get() != ProcessState::CredentialsUnchecked)
		{
			return -EINVAL;
		}
		binary = candidate.binary_get().binary();
		footers.emplace(candidate.binary_get().footers());
		Debug::log("Checking '{}': {} byte binary, {} bytes of footers",
		           candidate.name(),
		           binary.size(),
		           candidate.binary_get().footers().size());
		return 0;
	});
	if (ret != 0)
	{
		return ret;
	}
	process = id;
	state   = State::NextRecord;
	// Start from the kernel loop, not the caller's stack.
	deferredCall.set();
	return 0;
}

size_t ProcessCheckerMachine::record_index() const
{
	if (!footers.has_value() || (footers->index() == 0))
	{
		return 0;
	}
	return footers->index() - 1;
}

void ProcessCheckerMachine::handle_deferred_call()
{
	if (state == State::NextRecord)
	{
		next_record();
	}
}

void ProcessCheckerMachine::next_record()
{
	if (!processes.get(process).has_value())
	{
		finish(ProcessCheckError::ProcessRemoved, nullptr);
		return;
	}
	while (true)
	{
		ParseError        parseError = ParseError::NotEnoughFlash;
		CredentialsRecord next;
		switch (footers->next(next, parseError))
		{
			case CredentialsFooterIterator::Status::End:
				Debug::log("No more records, credentials required: {}",
				           policies.checker.require_credentials());
				if (policies.checker.require_credentials())
				{
					finish(ProcessCheckError::CredentialsNoAccept, nullptr);
				}
				else
				{
					finish(std::nullopt, nullptr);
				}
				return;
			case CredentialsFooterIterator::Status::Malformed:
				Debug::log("Malformed footer: {}", parseError);
				finish(ProcessCheckError::MalformedCredentials, nullptr);
				return;
			case CredentialsFooterIterator::Status::Record:
				break;
		}
		record = next;
		state  = State::Checking;
		Debug::log("Checking record {} ({})", record_index(), record.format);
		int ret = policies.checker.check_credentials(record, binary);
		if (ret == 0)
		{
			return;
		}
		if (ret == -ENOTSUP)
		{
			// The policy does not handle this format.
			Debug::log("Record {} not supported, passing", record_index());
			state = State::NextRecord;
			continue;
		}
		Debug::log<DebugLevel::Warning>(
		  "Checker failed to start on record {}: {}", record_index(), ret);
		finish(ProcessCheckError::CheckerError, nullptr);
		return;
	}
}

void ProcessCheckerMachine::check_done(int error, CheckResult result)
{
	if (state != State::Checking)
	{
		Debug::log<DebugLevel::Warning>(
		  "Ignoring unexpected check completion ({}, {})", error, result);
		return;
	}
	if (error != 0)
	{
		Debug::log<DebugLevel::Warning>(
		  "Checker reported error {} on record {}", error, record_index());
		finish(ProcessCheckError::CheckerError, nullptr);
		return;
	}
	Debug::log("Record {}: {}", record_index(), result);
	switch (result)
	{
		case CheckResult::Accept:
			finish(std::nullopt, &record);
			return;
		case CheckResult::Reject:
			finish(ProcessCheckError::CredentialsReject, nullptr);
			return;
		case CheckResult::Pass:
			// Move on from the kernel loop so that a policy that completes
			// immediately cannot make this recurse.
			state = State::NextRecord;
			deferredCall.set();
			return;
	}
}

void ProcessCheckerMachine::finish(std::optional<ProcessCheckError> error,
                                   const CredentialsRecord         *accepted)
{
	ProcessId id = process;
	state        = State::Idle;
	footers.reset();

	auto found = processes.get(id);
	if (!found.has_value())
	{
		Debug::log("Process in slot {} removed during check, discarding result",
		           id.index);
		error = ProcessCheckError::ProcessRemoved;
	}
	found.and_then([&](Process &checked) {
		if (error)
		{
			Debug::log("'{}' failed: {}", checked.name(), *error);
			int ret = checked.credentials_failed();
			Debug::Invariant(ret == 0, "Process left unchecked state early");
			return;
		}
		std::optional<CredentialsRecord> credential;
		if (accepted != nullptr)
		{
			credential = *accepted;
		}
		int ret = checked.credentials_approved(credential);
		Debug::Invariant(ret == 0, "Process left unchecked state early");
		auto identifier = policies.identifier.derive_identifier(
		  accepted, checked.binary_get());
		ret = checked.application_id_set(identifier);
		Debug::Invariant(ret == 0, "Failed to set application identifier");
		ret = checked.short_id_set(policies.compress.to_short_id(checked));
		Debug::Invariant(ret == 0, "Failed to set short identifier");
		Debug::log("'{}' approved: {}, short ID {}",
		           checked.name(),
		           checked.application_id(),
		           checked.short_id());
	});
	if (client != nullptr)
	{
		client->done(id, error);
	}
}
