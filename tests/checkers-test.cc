// Copyright Microsoft and CHERIoT Contributors.
// SPDX-License-Identifier: MIT

#define TEST_NAME "Checkers"
#include "rsa_signer.hh"
#include "tbf_builder.hh"
#include "test_policies.hh"
#include "tests.hh"
#include <algorithm>
#include <appcheck/checker_machine.hh>
#include <appcheck/checkers.hh>
#include <appcheck/software_crypto.hh>
#include <appcheck/uniqueness.hh>
#include <openssl/evp.h>
#include <string_view>
#include <vector>

using namespace appcheck;
using test::TbfBuilder;

namespace
{
	/**
	 * A checker machine and process table driven by one sample policy.
	 */
	struct Rig : ProcessCheckerMachineClient
	{
		DeferredCallQueue               &queue;
		const AppUniqueness             &uniqueness;
		ProcessTable                     table;
		ProcessCheckerMachine            machine;
		std::optional<ProcessCheckError> lastError;
		int                              verdicts = 0;

		Rig(DeferredCallQueue  &queue,
		    CredentialsChecker &checker,
		    AppIdPolicy        &policy)
		  : queue(queue),
		    uniqueness(policy),
		    machine(queue, table, {checker, policy, policy, policy})
		{
			machine.set_client(*this);
		}

		void done(ProcessId, std::optional<ProcessCheckError> error) override
		{
			verdicts++;
			lastError = error;
		}

		/**
		 * Load and check `binary`, returning the process.
		 */
		Process &check(const ProcessBinary &binary)
		{
			Process &process = test::must_load(table, binary);
			int      before  = verdicts;
			TEST_SUCCESS(machine.check(process.id_get()));
			queue.run_until_idle();
			TEST_EQUAL(verdicts, before + 1, "Check did not finish");
			return process;
		}

		[[nodiscard]] bool approved() const
		{
			return !lastError.has_value();
		}

		[[nodiscard]] ProcessCheckError error() const
		{
			return lastError.value_or(ProcessCheckError::ProcessRemoved);
		}

		/**
		 * Try to start `process` the way the loader would.
		 */
		bool start(Process &process)
		{
			if (!has_unique_identifiers(process, table.processes(), uniqueness))
			{
				return false;
			}
			return process.run() == 0;
		}
	};

	std::vector<uint8_t> body_of(std::string_view text)
	{
		return std::vector<uint8_t>(text.begin(), text.end());
	}

	std::vector<uint8_t> sha(const EVP_MD *md, std::span<const uint8_t> data)
	{
		std::vector<uint8_t> out(EVP_MAX_MD_SIZE);
		unsigned int         length = 0;
		TEST_EQUAL(
		  EVP_Digest(data.data(), data.size(), out.data(), &length, md, nullptr),
		  1,
		  "Failed to compute reference digest");
		out.resize(length);
		return out;
	}

	std::vector<uint8_t> signed_image(const test::RsaSigner   &signer,
	                                  std::string_view         name,
	                                  std::span<const uint8_t> body)
	{
		TbfBuilder builder;
		builder.package_name(name).binary(body);
		return builder
		  .credential(CredentialsFormat::Rsa3072Key, signer.credential(body))
		  .build();
	}

	void test_simulated()
	{
		DeferredCallQueue   queue;
		AppCheckerSimulated checker{queue};
		Rig                 rig{queue, checker, checker};
		TEST(!checker.require_credentials(), "Simulated checker requires");

		auto image = TbfBuilder{}
		               .package_name("sim")
		               .credential(CredentialsFormat::SHA256, 32, 0)
		               .credential(CredentialsFormat::Rsa3072Key, 768, 1)
		               .build();
		auto     binary = test::must_discover(image);
		Process &first  = rig.check(binary);
		TEST(rig.approved(), "Simulated checker did not load a binary");
		TEST(!first.credential_get().has_value(),
		     "Simulated checker accepted a record");
		TEST(first.application_id() ==
		       ApplicationIdentifier::global_from(body_of("sim")),
		     "Identity is not the package name");
		TEST(first.short_id().is_locally_unique(),
		     "Simulated short ID is not locally unique");
		TEST(!first.storage_write_id(),
		     "Process without a fixed short ID has a storage tag");

		Process &second = rig.check(binary);
		TEST(!checker.different_identifier(first, second),
		     "Same name is a different application");
		TEST(rig.start(first), "First copy did not start");
		TEST(!rig.start(second), "Second copy of the same name started");

		auto     otherImage = TbfBuilder{}.package_name("other").build();
		auto     other      = test::must_discover(otherImage);
		Process &third      = rig.check(other);
		TEST(rig.start(third), "Different name did not start");
	}

	uint32_t name_length_hash(std::string_view name)
	{
		return static_cast<uint32_t>(name.size());
	}

	uint32_t zero_hash(std::string_view)
	{
		return 0;
	}

	void test_names()
	{
		DeferredCallQueue queue;
		AppCheckerNames   checker{queue, name_length_hash};
		Rig               rig{queue, checker, checker};

		auto signedImage =
		  TbfBuilder{}
		    .package_name("abc")
		    .credential(CredentialsFormat::SHA512, 64, 0x42)
		    .build();
		auto     signedBinary = test::must_discover(signedImage);
		Process &first        = rig.check(signedBinary);
		TEST(rig.approved(), "Binary with a record not loaded");
		TEST_EQUAL(first.credential_get()->format,
		           CredentialsFormat::SHA512,
		           "First record not accepted");
		TEST(!first.application_id().is_global(),
		     "Names checker produced a global identity");
		TEST_EQUAL(first.short_id(), ShortId::fixed(3), "Short ID not hashed");
		TEST_EQUAL(first.storage_write_id().value_or(0),
		           3U,
		           "Storage tag is not the short ID");

		auto     plainImage = TbfBuilder{}.package_name("xyz").build();
		auto     plain      = test::must_discover(plainImage);
		Process &second     = rig.check(plain);
		TEST(rig.approved(), "Binary without records not loaded");
		TEST(checker.different_identifier(first, second),
		     "Names checker says two processes are the same");
		TEST(rig.start(first), "First binary did not start");
		// Both names are three characters long, so the hashes collide.
		TEST(!rig.start(second), "Colliding hashes ran together");

		auto     longerImage = TbfBuilder{}.package_name("longer").build();
		auto     longer      = test::must_discover(longerImage);
		Process &third       = rig.check(longer);
		TEST(rig.start(third), "Different hash did not start");

		// A hash of zero is locally unique and never collides.
		DeferredCallQueue zeroQueue;
		AppCheckerNames   zero{zeroQueue, zero_hash};
		Rig               zeroRig{zeroQueue, zero, zero};
		Process &a = zeroRig.check(plain);
		Process &b = zeroRig.check(plain);
		TEST(a.short_id().is_locally_unique(), "Zero hash is a fixed ID");
		TEST(zeroRig.start(a), "First zero-hash process did not start");
		TEST(zeroRig.start(b), "Second zero-hash process did not start");
	}

	void test_digest()
	{
		DeferredCallQueue    queue;
		SoftwareCryptoEngine engine{queue};
		AppCheckerDigest     checker{engine};
		Rig                  rig{queue, checker, checker};
		TEST(checker.require_credentials(), "Digest checker does not require");

		auto body   = body_of("digest checked binary");
		auto digest = sha(EVP_sha384(), body);
		auto image  = TbfBuilder{}
		               .package_name("hashed")
		               .binary(body)
		               .credential(CredentialsFormat::Rsa3072Key, 768, 7)
		               .credential(CredentialsFormat::SHA384, digest)
		               .build();
		auto     binary  = test::must_discover(image);
		Process &process = rig.check(binary);
		TEST(rig.approved(), "Binary with a matching digest not loaded");
		TEST(process.application_id() ==
		       ApplicationIdentifier::global_from(digest),
		     "Identity is not the digest");
		TEST_EQUAL(process.short_id(),
		           short_id_from_prefix(
		             digest[0], digest[1], digest[2], digest[3]),
		           "Short ID not built from the digest");

		auto wrong = digest;
		wrong[0] ^= 0xff;
		auto badImage = TbfBuilder{}
		                  .package_name("hashed")
		                  .binary(body)
		                  .credential(CredentialsFormat::SHA384, wrong)
		                  .build();
		auto bad = test::must_discover(badImage);
		rig.check(bad);
		TEST_EQUAL(rig.error(),
		           ProcessCheckError::CredentialsReject,
		           "Mismatching digest not rejected");

		auto unsignedImage = TbfBuilder{}.package_name("bare").build();
		auto bare          = test::must_discover(unsignedImage);
		rig.check(bare);
		TEST_EQUAL(rig.error(),
		           ProcessCheckError::CredentialsNoAccept,
		           "Binary without a digest loaded");

		// Each build is its own application.
		auto otherBody   = body_of("digest checked binary, version 2");
		auto otherDigest = sha(EVP_sha256(), otherBody);
		auto otherImage  = TbfBuilder{}
		                    .package_name("hashed")
		                    .binary(otherBody)
		                    .credential(CredentialsFormat::SHA256, otherDigest)
		                    .build();
		auto     otherBinary  = test::must_discover(otherImage);
		Process &otherProcess = rig.check(otherBinary);
		TEST(rig.approved(), "SHA-256 digest not accepted");
		TEST(checker.different_identifier(process, otherProcess),
		     "Different builds are the same application");
	}

	void test_rsa_simulated()
	{
		DeferredCallQueue      queue;
		AppCheckerRsaSimulated checker{queue};
		Rig                    rig{queue, checker, checker};

		auto image = TbfBuilder{}
		               .credential(CredentialsFormat::SHA256, 32, 0)
		               .credential(CredentialsFormat::Rsa3072Key, 768, 0x11)
		               .build();
		auto     binary  = test::must_discover(image);
		Process &process = rig.check(binary);
		TEST(rig.approved(), "RSA record not accepted");
		TEST_EQUAL(process.application_id().data().size(),
		           size_t(384),
		           "Identity is not the public key");
		TEST_EQUAL(process.short_id(),
		           ShortId::fixed(0x91111111),
		           "Short ID not built from the key");

		auto digestOnly = TbfBuilder{}
		                    .credential(CredentialsFormat::SHA256, 32, 0)
		                    .build();
		auto unsignedBinary = test::must_discover(digestOnly);
		rig.check(unsignedBinary);
		TEST_EQUAL(rig.error(),
		           ProcessCheckError::CredentialsNoAccept,
		           "Binary without an RSA record loaded");
	}

	void test_rsa()
	{
		test::RsaSigner signer{3072};
		test::RsaSigner stranger{3072};

		DeferredCallQueue    queue;
		SoftwareCryptoEngine engine{queue};
		AppCheckerRsa        checker{engine};
		Rig                  rig{queue, checker, checker};

		// Two different binaries signed with the same key are the same
		// application.
		auto bodyA  = body_of("first application binary");
		auto bodyB  = body_of("second application binary, rebuilt");
		auto imageA = signed_image(signer, "one", bodyA);
		auto imageB = signed_image(signer, "two", bodyB);
		auto binaryA = test::must_discover(imageA);
		auto binaryB = test::must_discover(imageB);

		Process &a = rig.check(binaryA);
		TEST(rig.approved(), "Signed binary not loaded");
		Process &b = rig.check(binaryB);
		TEST(rig.approved(), "Second signed binary not loaded");
		TEST(a.application_id() == b.application_id(),
		     "Binaries signed with one key have different identities");
		TEST(std::ranges::equal(a.application_id().data(), signer.modulus()),
		     "Identity is not the public key");
		TEST(!checker.different_identifier(a, b),
		     "Binaries signed with one key are different applications");
		TEST_EQUAL(a.short_id(), b.short_id(), "Short IDs differ");
		TEST(rig.start(a), "Signed binary did not start");
		TEST(!rig.start(b), "Second binary with the same key started");

		auto     imageC  = signed_image(stranger, "three", bodyA);
		auto     binaryC = test::must_discover(imageC);
		Process &c       = rig.check(binaryC);
		TEST(rig.approved(), "Binary signed by another key not loaded");
		TEST(checker.different_identifier(a, c),
		     "Different keys are the same application");

		// A signature over a different binary.
		TbfBuilder forged;
		forged.package_name("forged").binary(bodyB).credential(
		  CredentialsFormat::Rsa3072Key, signer.credential(bodyA));
		auto forgedImage  = forged.build();
		auto forgedBinary = test::must_discover(forgedImage);
		rig.check(forgedBinary);
		TEST_EQUAL(rig.error(),
		           ProcessCheckError::CredentialsReject,
		           "Forged signature accepted");

		auto bare       = TbfBuilder{}.package_name("bare").build();
		auto bareBinary = test::must_discover(bare);
		rig.check(bareBinary);
		TEST_EQUAL(rig.error(),
		           ProcessCheckError::CredentialsNoAccept,
		           "Unsigned binary loaded");
	}

	void test_rsa_trusted_keys()
	{
		test::RsaSigner trusted{3072};
		test::RsaSigner alsoTrusted{3072};
		test::RsaSigner untrusted{3072};

		const std::span<const uint8_t> keys[] = {alsoTrusted.modulus(),
		                                         trusted.modulus()};

		DeferredCallQueue    queue;
		SoftwareCryptoEngine engine{queue};
		AppCheckerRsa        checker{engine, keys};
		Rig                  rig{queue, checker, checker};

		auto     body    = body_of("trusted binary");
		auto     image   = signed_image(trusted, "trusted", body);
		auto     binary  = test::must_discover(image);
		Process &process = rig.check(binary);
		TEST(rig.approved(), "Binary signed with a trusted key not loaded");
		TEST_EQUAL(process.short_id(),
		           ShortId::fixed(2),
		           "Short ID is not the position of the key");

		// Records signed with other keys are passed over, so a binary signed
		// with both an untrusted and a trusted key is accepted.
		TbfBuilder both;
		both.package_name("both")
		  .binary(body)
		  .credential(CredentialsFormat::Rsa3072Key, untrusted.credential(body))
		  .credential(CredentialsFormat::Rsa3072Key,
		              alsoTrusted.credential(body));
		auto     bothImage   = both.build();
		auto     bothBinary  = test::must_discover(bothImage);
		Process &bothProcess = rig.check(bothBinary);
		TEST(rig.approved(), "Trusted record after an untrusted one ignored");
		TEST_EQUAL(bothProcess.short_id(),
		           ShortId::fixed(1),
		           "Short ID is not the position of the key");

		auto untrustedImage  = signed_image(untrusted, "untrusted", body);
		auto untrustedBinary = test::must_discover(untrustedImage);
		rig.check(untrustedBinary);
		TEST_EQUAL(rig.error(),
		           ProcessCheckError::CredentialsNoAccept,
		           "Binary signed with an untrusted key loaded");
	}
} // namespace

int test_checkers()
{
	debug_log("Testing the sample checking policies");
	test_simulated();
	test_names();
	test_digest();
	test_rsa_simulated();
	test_rsa();
	test_rsa_trusted_keys();
	return 0;
}
