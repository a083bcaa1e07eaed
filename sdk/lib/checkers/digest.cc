// Copyright Microsoft and CHERIoT Contributors.
// SPDX-License-Identifier: MIT

#include <appcheck/checkers.hh>
#include <appcheck/config.hh>
#include <debug.hh>
#include <errno.h>

using namespace appcheck;

namespace
{
	using Debug = ConditionalDebug<config::DebugProcessChecker, "Digest">;
} // namespace

AppCheckerDigest::AppCheckerDigest(DigestVerifier &verifier)
  : verifier(verifier)
{
}

int AppCheckerDigest::check_credentials(const CredentialsRecord &record,
                                        std::span<const uint8_t> binary)
{
	if (outstanding)
	{
		return -EBUSY;
	}
	switch (record.format)
	{
		case CredentialsFormat::SHA256:
		case CredentialsFormat::SHA384:
		case CredentialsFormat::SHA512:
			break;
		default:
			return -ENOTSUP;
	}
	int ret = verifier.verify_digest(record.format, binary, record.data, *this);
	if (ret == 0)
	{
		outstanding = true;
	}
	return ret;
}

void AppCheckerDigest::verification_done(int error, bool matches)
{
	outstanding = false;
	Debug::log("Digest verification finished: {} {}", error, matches);
	if (client != nullptr)
	{
		client->check_done(error,
		                   matches ? CheckResult::Accept : CheckResult::Reject);
	}
}

ApplicationIdentifier
AppCheckerDigest::derive_identifier(const CredentialsRecord *accepted,
                                    const ProcessBinary &) const
{
	if (accepted == nullptr)
	{
		return ApplicationIdentifier::locally_unique();
	}
	return ApplicationIdentifier::global_from(accepted->data);
}

ShortId AppCheckerDigest::to_short_id(const Process &process) const
{
	auto id = process.application_id().data();
	if (id.size() < 4)
	{
		return ShortId::locally_unique();
	}
	return short_id_from_prefix(id[0], id[1], id[2], id[3]);
}

bool AppCheckerDigest::different_identifier(const Process &processA,
                                            const Process &processB) const
{
	return processA.application_id() != processB.application_id();
}
