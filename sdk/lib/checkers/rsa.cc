// Copyright Microsoft and CHERIoT Contributors.
// SPDX-License-Identifier: MIT

#include <algorithm>
#include <appcheck/checkers.hh>
#include <appcheck/config.hh>
#include <debug.hh>
#include <errno.h>

using namespace appcheck;

namespace
{
	using Debug = ConditionalDebug<config::DebugProcessChecker, "RSA">;

	bool is_rsa(CredentialsFormat format)
	{
		return rsa_key_length(format) != 0;
	}

	/**
	 * The identity of an RSA-signed binary is its public key.
	 */
	ApplicationIdentifier key_identity(const CredentialsRecord *accepted)
	{
		if ((accepted == nullptr) || !is_rsa(accepted->format))
		{
			return ApplicationIdentifier::locally_unique();
		}
		return ApplicationIdentifier::global_from(accepted->public_key());
	}

	ShortId key_prefix_short_id(const Process &process)
	{
		auto key = process.application_id().data();
		if (key.size() < 4)
		{
			return ShortId::locally_unique();
		}
		return short_id_from_prefix(key[0], key[1], key[2], key[3]);
	}
} // namespace

AppCheckerRsaSimulated::AppCheckerRsaSimulated(DeferredCallQueue &queue)
  : deferredCall(queue, *this)
{
}

int AppCheckerRsaSimulated::check_credentials(const CredentialsRecord &record,
                                              std::span<const uint8_t>)
{
	if (outstanding)
	{
		return -EBUSY;
	}
	outstanding = true;
	format      = record.format;
	deferredCall.set();
	return 0;
}

void AppCheckerRsaSimulated::handle_deferred_call()
{
	outstanding = false;
	// The signature is not checked: any RSA record is accepted.
	CheckResult result = is_rsa(format) ? CheckResult::Accept : CheckResult::Pass;
	Debug::log("{} record: {}", format, result);
	if (client != nullptr)
	{
		client->check_done(0, result);
	}
}

ApplicationIdentifier
AppCheckerRsaSimulated::derive_identifier(const CredentialsRecord *accepted,
                                          const ProcessBinary &) const
{
	return key_identity(accepted);
}

ShortId AppCheckerRsaSimulated::to_short_id(const Process &process) const
{
	return key_prefix_short_id(process);
}

bool AppCheckerRsaSimulated::different_identifier(
  const Process &processA,
  const Process &processB) const
{
	// Processes without a key have a locally unique identity and so are
	// always different.
	return processA.application_id() != processB.application_id();
}

AppCheckerRsa::AppCheckerRsa(
  SignatureVerifier                        &verifier,
  std::span<const std::span<const uint8_t>> trustedKeys)
  : verifier(verifier), trustedKeys(trustedKeys)
{
}

std::optional<size_t>
AppCheckerRsa::trusted_key_index(std::span<const uint8_t> key) const
{
	for (size_t i = 0; i < trustedKeys.size(); i++)
	{
		if (std::ranges::equal(trustedKeys[i], key))
		{
			return i;
		}
	}
	return std::nullopt;
}

int AppCheckerRsa::check_credentials(const CredentialsRecord &record,
                                     std::span<const uint8_t> binary)
{
	if (outstanding)
	{
		return -EBUSY;
	}
	if (!is_rsa(record.format))
	{
		return -ENOTSUP;
	}
	if (!trustedKeys.empty() && !trusted_key_index(record.public_key()))
	{
		Debug::log("{} record signed with an untrusted key", record.format);
		return -ENOTSUP;
	}
	int ret = verifier.verify_signature(
	  record.public_key(), record.signature(), binary, *this);
	if (ret == 0)
	{
		outstanding = true;
	}
	return ret;
}

void AppCheckerRsa::signature_done(int error, bool valid)
{
	outstanding = false;
	Debug::log("Signature verification finished: {} {}", error, valid);
	if (client != nullptr)
	{
		client->check_done(error,
		                   valid ? CheckResult::Accept : CheckResult::Reject);
	}
}

ApplicationIdentifier
AppCheckerRsa::derive_identifier(const CredentialsRecord *accepted,
                                 const ProcessBinary &) const
{
	return key_identity(accepted);
}

ShortId AppCheckerRsa::to_short_id(const Process &process) const
{
	if (!trustedKeys.empty())
	{
		if (auto index = trusted_key_index(process.application_id().data()))
		{
			return ShortId::fixed(static_cast<uint32_t>(*index) + 1);
		}
	}
	return key_prefix_short_id(process);
}

bool AppCheckerRsa::different_identifier(const Process &processA,
                                         const Process &processB) const
{
	return processA.application_id() != processB.application_id();
}
