// Copyright Microsoft and CHERIoT Contributors.
// SPDX-License-Identifier: MIT

#define TEST_NAME "Loader"
#include "tbf_builder.hh"
#include "test_policies.hh"
#include "tests.hh"
#include <appcheck/loader.hh>
#include <errno.h>
#include <string>
#include <utility>
#include <vector>

using namespace appcheck;
using test::TbfBuilder;

namespace
{
	/**
	 * A loader over a flash image, with a scripted checker and name-based
	 * identities.
	 */
	struct Harness
	{
		DeferredCallQueue       queue;
		ProcessTable            table;
		test::ScriptedChecker   checker{queue};
		test::NamePolicy        policy;
		ProcessCheckerMachine   machine{queue,
		                              table,
		                              {checker, policy, policy, policy}};
		std::vector<uint8_t>    flash;
		SequentialProcessLoader loader{queue, table, machine, policy, flash};
		test::LoaderRecorder    recorder;

		explicit Harness(std::vector<uint8_t> image) : flash(std::move(image))
		{
			loader.set_client(recorder);
		}

		/**
		 * Load everything in flash.
		 */
		void boot()
		{
			TEST_SUCCESS(loader.start());
			TEST_EQUAL(loader.start(), -EBUSY, "Started loading twice");
			queue.run_until_idle();
			TEST(recorder.finished, "Loading did not finish");
			TEST(!loader.is_busy(), "Loader busy after loading");
		}

		/**
		 * Returns the process running `name` at `version`.  Traps if there
		 * is none.
		 */
		const Process &find(std::string_view name, uint32_t version = 0)
		{
			for (const Process &process : table.processes())
			{
				if ((process.state_get() != ProcessState::Unloaded) &&
				    (process.name() == name) &&
				    (process.binary_version() == version))
				{
					return process;
				}
			}
			TEST(false, "No process for {} version {}", name, version);
			__builtin_unreachable();
		}
	};

	void test_boot()
	{
		auto flash = test::flash_image(
		  {TbfBuilder{}.package_name("alpha").binary_version(1).build(),
		   test::padding_entry(32),
		   TbfBuilder{}.package_name("beta").build(),
		   TbfBuilder{}.package_name("broken").corrupt_checksum().build(),
		   TbfBuilder{}.package_name("off").enabled(false).build(),
		   TbfBuilder{}.package_name("alpha").binary_version(2).build()});
		Harness harness{flash};
		harness.boot();

		auto &events = harness.recorder.events;
		TEST_EQUAL(events.size(), size_t(4), "Wrong number of binaries");
		TEST(events[0].process.has_value() && !events[0].error.has_value(),
		     "First binary not loaded");
		TEST(events[1].process.has_value() && !events[1].error.has_value(),
		     "Second binary not loaded");
		TEST(!events[2].process.has_value(), "Broken binary given a slot");
		TEST_EQUAL(events[2].error.value_or(ProcessLoadError::Blocked),
		           ProcessLoadError::BinaryError,
		           "Broken binary not reported");
		TEST(events[3].process.has_value() && !events[3].error.has_value(),
		     "Last binary not loaded");
		TEST_EQUAL(harness.table.loaded_count(),
		           size_t(3),
		           "Padding or disabled binaries were loaded");

		// Slots follow flash order.
		TEST_EQUAL(harness.find("alpha", 1).id_get().index,
		           uint16_t(0),
		           "First binary not in the first slot");
		TEST_EQUAL(harness.find("alpha", 2).id_get().index,
		           uint16_t(2),
		           "Slot order does not follow flash order");

		// The newer version wins, even though it was found later.
		TEST_EQUAL(harness.find("alpha", 1).state_get(),
		           ProcessState::CredentialsApproved,
		           "Old version started");
		TEST(harness.find("alpha", 2).is_running(), "New version not started");
		TEST(harness.find("beta").is_running(), "Unrelated binary not started");
	}

	void test_equal_versions()
	{
		auto flash = test::flash_image(
		  {TbfBuilder{}.package_name("same").binary_version(3).build(),
		   TbfBuilder{}.package_name("same").binary_version(3).build()});
		Harness harness{flash};
		harness.boot();
		auto all = harness.table.processes();
		TEST(all[0].is_running(), "First copy not started");
		TEST_EQUAL(all[1].state_get(),
		           ProcessState::CredentialsApproved,
		           "Second copy of the same version started");
	}

	void test_rejected()
	{
		auto flash = test::flash_image(
		  {TbfBuilder{}
		     .package_name("signed")
		     .credential(CredentialsFormat::SHA256, 32, 0)
		     .build(),
		   TbfBuilder{}.package_name("other").build()});
		Harness harness{flash};
		harness.checker.steps = {{0, 0, CheckResult::Reject}};
		harness.boot();
		auto &events = harness.recorder.events;
		TEST_EQUAL(events.size(), size_t(2), "Wrong number of binaries");
		TEST(events[0].process.has_value(), "Rejected binary had no slot");
		TEST_EQUAL(events[0].error.value_or(ProcessLoadError::Blocked),
		           ProcessLoadError::CheckError,
		           "Rejection not reported");
		TEST_EQUAL(harness.find("signed").state_get(),
		           ProcessState::CredentialsFailed,
		           "Rejected binary not failed");
		TEST(harness.find("other").is_running(),
		     "Binary after a rejection not started");
	}

	void test_no_slot()
	{
		std::vector<uint8_t> flash;
		for (size_t i = 0; i <= config::ProcessSlots; i++)
		{
			auto name  = "app" + std::to_string(i);
			auto entry = TbfBuilder{}.package_name(name).build();
			flash.insert(flash.end(), entry.begin(), entry.end());
		}
		flash.resize(flash.size() + 16, 0xff);
		Harness harness{flash};
		harness.boot();
		auto &events = harness.recorder.events;
		TEST_EQUAL(events.size(),
		           config::ProcessSlots + 1,
		           "Wrong number of notifications");
		TEST(!events.back().process.has_value(),
		     "Binary with no slot has a process");
		TEST_EQUAL(events.back().error.value_or(ProcessLoadError::Blocked),
		           ProcessLoadError::NoProcessSlot,
		           "Running out of slots not reported");
		size_t running = 0;
		for (const Process &process : harness.table.processes())
		{
			running += process.is_running() ? 1 : 0;
		}
		TEST_EQUAL(running,
		           config::ProcessSlots,
		           "Loaded processes not started after running out of slots");
	}

	void test_runtime_load()
	{
		auto flash =
		  test::flash_image({TbfBuilder{}.package_name("beta").build()});
		Harness harness{flash};
		harness.boot();
		harness.recorder.events.clear();

		auto gamma = TbfBuilder{}.package_name("gamma").build();
		TEST_SUCCESS(harness.loader.load_binary(gamma));
		TEST_EQUAL(harness.loader.load_binary(gamma),
		           -EBUSY,
		           "Loaded two binaries at once");
		harness.queue.run_until_idle();
		TEST_EQUAL(
		  harness.recorder.events.size(), size_t(1), "Expected one event");
		TEST(!harness.recorder.events[0].error.has_value(),
		     "Runtime binary not loaded");
		TEST(harness.find("gamma").is_running(), "Runtime binary not started");

		// A second copy of a running application is approved but blocked.
		harness.recorder.events.clear();
		auto beta = TbfBuilder{}.package_name("beta").binary_version(9).build();
		TEST_SUCCESS(harness.loader.load_binary(beta));
		harness.queue.run_until_idle();
		TEST_EQUAL(
		  harness.recorder.events[0].error.value_or(ProcessLoadError::BinaryError),
		  ProcessLoadError::Blocked,
		  "Duplicate identity not blocked");
		TEST_EQUAL(harness.find("beta", 9).state_get(),
		           ProcessState::CredentialsApproved,
		           "Blocked binary not left approved");
		TEST_EQUAL(harness.recorder.events.size(),
		           size_t(1),
		           "Runtime load reported more than one event");

		// Binaries that cannot be parsed are refused straight away.
		auto broken = TbfBuilder{}.corrupt_checksum().build();
		TEST_EQUAL(harness.loader.load_binary(broken),
		           -EINVAL,
		           "Corrupt binary accepted");
		auto disabled = TbfBuilder{}.enabled(false).build();
		TEST_EQUAL(harness.loader.load_binary(disabled),
		           -EINVAL,
		           "Disabled binary accepted");

		// A process removed while its check runs is reported as failed.
		harness.recorder.events.clear();
		auto delta = TbfBuilder{}.package_name("delta").build();
		TEST_SUCCESS(harness.loader.load_binary(delta));
		ProcessId id = harness.find("delta").id_get();
		TEST_SUCCESS(harness.loader.remove(id));
		harness.queue.run_until_idle();
		TEST_EQUAL(
		  harness.recorder.events[0].error.value_or(ProcessLoadError::Blocked),
		  ProcessLoadError::CheckError,
		  "Removal during a runtime check not reported");
		TEST(!harness.loader.is_busy(), "Loader busy after removal");
	}

	void test_runtime_no_slot()
	{
		std::vector<uint8_t> flash;
		for (size_t i = 0; i < config::ProcessSlots; i++)
		{
			auto entry = TbfBuilder{}
			               .package_name("slot" + std::to_string(i))
			               .build();
			flash.insert(flash.end(), entry.begin(), entry.end());
		}
		Harness harness{flash};
		harness.boot();
		auto extra = TbfBuilder{}.package_name("extra").build();
		TEST_EQUAL(harness.loader.load_binary(extra),
		           -ENOSPC,
		           "Loaded into a full table");
	}

	void test_management()
	{
		auto flash = test::flash_image(
		  {TbfBuilder{}.package_name("svc").build(),
		   TbfBuilder{}.package_name("svc").build(),
		   TbfBuilder{}
		     .package_name("bad")
		     .credential(CredentialsFormat::SHA256, 32, 0)
		     .build()});
		Harness harness{flash};
		harness.checker.steps = {{0, 0, CheckResult::Reject}};
		harness.boot();
		auto     all     = harness.table.processes();
		ProcessId running = all[0].id_get();
		ProcessId standby = all[1].id_get();
		ProcessId failed  = all[2].id_get();
		auto    &loader  = harness.loader;

		TEST(all[0].is_running(), "First copy not running");
		TEST_EQUAL(
		  loader.try_start(standby), -EEXIST, "Started a duplicate identity");
		TEST_EQUAL(
		  loader.try_start(running), -EINVAL, "Started a running process");
		TEST_EQUAL(loader.try_start(failed), -EINVAL, "Started a failed process");
		TEST_EQUAL(
		  loader.terminate(failed), -EINVAL, "Terminated a failed process");

		// Restarting keeps the process running.
		TEST_SUCCESS(loader.restart(running));
		TEST(all[0].is_running(), "Restarted process not running");

		// Hand over to the standby copy.
		TEST_SUCCESS(loader.terminate(running));
		TEST_EQUAL(all[0].state_get(),
		           ProcessState::Terminated,
		           "Terminated process still running");
		TEST_SUCCESS(loader.try_start(standby));
		TEST_EQUAL(
		  loader.restart(running), -EEXIST, "Restarted a duplicate identity");

		// Removing frees the identity and makes the handle stale.
		TEST_SUCCESS(loader.remove(standby));
		TEST_EQUAL(loader.remove(standby), -ENOENT, "Removed twice");
		TEST_EQUAL(
		  loader.try_start(standby), -ENOENT, "Started a removed process");
		TEST_EQUAL(
		  loader.terminate(standby), -ENOENT, "Terminated a removed process");
		TEST_EQUAL(
		  loader.restart(standby), -ENOENT, "Restarted a removed process");
		TEST_SUCCESS(loader.restart(running));
		TEST(all[0].is_running(), "Terminated process did not restart");
	}
} // namespace

int test_loader()
{
	debug_log("Testing the sequential loader");
	test_boot();
	test_equal_versions();
	test_rejected();
	test_no_slot();
	test_runtime_load();
	test_runtime_no_slot();
	test_management();
	return 0;
}
