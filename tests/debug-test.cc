#define TEST_NAME "Debug"
#include "tests.hh"
#include <appcheck/app_id.hh>
#include <appcheck/process.hh>
#include <appcheck/short_id.hh>
#include <string>

using namespace appcheck;

using Quiet = ConditionalDebug<false, "Debug test">;

namespace
{
	/**
	 * Writer that collects output in a string, so that custom formatters can
	 * be checked.
	 */
	struct StringWriter : DebugWriter
	{
		using DebugWriter::write;

		std::string out;

		void write(std::string_view str) override
		{
			out += str;
		}
	};

	/**
	 * Format `value` with its adaptor and return the output.
	 */
	template<typename T>
	std::string format(T &value)
	{
		StringWriter writer;
		auto         argument = DebugFormatArgumentAdaptor<T>::construct(value);
		argument.print(argument.value, writer);
		return writer.out;
	}
} // namespace

int test_debug()
{
	unsigned char x = 'c';
	debug_log("Testing C++ debug log: 42:{}, true:{}, hello world:{}, "
	          "'c':{}, &x:{}, nullptr:{}",
	          42,
	          true,
	          "hello world",
	          'c',
	          &x,
	          nullptr);
	// Just test that these compile:
	Test::Invariant(true, "Testing C++ invariant failure: 42:{}", 42);
	Test::Invariant(true, "Testing C++ invariant failure");
	Test::Invariant(
	  true, "Testing C++ invariant failure: 42:{}", 42, 1, 3, 4, "oops");
	Quiet::log("This should not be printed (information)");
	Quiet::log<DebugLevel::Warning>("This should be printed (warning)");
	Quiet::log<DebugLevel::Error>("This should be printed (error)");

	{
		bool evaluated = false;
		Quiet::Assert(
		  [&]() {
			  evaluated = true;
			  return false;
		  },
		  "Disabled lazy assertion evaluated");
		TEST(!evaluated, "Disabled lazy assertion evaluated its condition");
	}

	auto fixed  = ShortId::fixed(0x1234);
	auto unique = ShortId::locally_unique();
	TEST_EQUAL(format(fixed), std::string{"0x1234"}, "Wrong short ID output");
	TEST_EQUAL(format(unique), std::string{"Unique"}, "Wrong sentinel output");

	const uint8_t Key[] = {0xde, 0xad, 0xbe, 0xef, 0, 1, 2, 3, 4, 5};
	auto          id    = ApplicationIdentifier::global_from(Key);
	TEST_EQUAL(format(id),
	           std::string{"Global[0xa]:deadbeef00010203"},
	           "Wrong identifier output");
	auto local = ApplicationIdentifier::locally_unique();
	TEST_EQUAL(
	  format(local), std::string{"LocallyUnique"}, "Wrong local output");

	auto state = ProcessState::CredentialsApproved;
	TEST_EQUAL(format(state),
	           std::string{"CredentialsApproved(0x3)"},
	           "Wrong enumeration output");

	debug_log("Custom formatters: {}, {}, {}, {}", fixed, unique, id, state);
	return 0;
}
