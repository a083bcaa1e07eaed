// Copyright Microsoft and CHERIoT Contributors.
// SPDX-License-Identifier: MIT

#include <cstdio>
#include <debug.hh>
#include <string>

namespace
{
	/// Escape sequences used to colour the console output.
	constexpr const char *Reset   = "\x1b[0m";
	constexpr const char *Magenta = "\x1b[35m";
	constexpr const char *Yellow  = "\x1b[33m";
	constexpr const char *Red     = "\x1b[31m";
	constexpr const char *Cyan    = "\x1b[36m";

	/**
	 * Collects one line of debug output and writes it to the console in one
	 * go, so that lines from different components do not interleave.
	 */
	struct DebugPrinter final : DebugWriter
	{
		using DebugWriter::write;

		/// The line being built.
		std::string line;

		void write(std::string_view str) override
		{
			line.append(str);
		}

		/**
		 * Write the line to the console and start a new one.
		 */
		void flush()
		{
			line.push_back('\n');
			if (fwrite(line.data(), 1, line.size(), stderr) == line.size())
			{
				fflush(stderr);
			}
			line.clear();
		}

		/**
		 * Expand `{}` placeholders in `fmt` with successive arguments.
		 */
		void format(const char                          *fmt,
		            std::span<const DebugFormatArgument> arguments)
		{
			auto next = arguments.begin();
			for (std::string_view rest{fmt}; !rest.empty();)
			{
				size_t placeholder = rest.find("{}");
				write(rest.substr(0, placeholder));
				if (placeholder == std::string_view::npos)
				{
					return;
				}
				rest.remove_prefix(placeholder + 2);
				if (next == arguments.end())
				{
					write("<missing argument>");
					continue;
				}
				next->print(next->value, *this);
				++next;
			}
		}
	};

	const char *level_colour(DebugLevel level)
	{
		switch (level)
		{
			case DebugLevel::Warning:
				return Yellow;
			case DebugLevel::Error:
				return Red;
			case DebugLevel::Information:
				break;
		}
		return Magenta;
	}
} // namespace

void debug_log_message_write(const char                          *context,
                             DebugLevel                           level,
                             const char                          *format,
                             std::span<const DebugFormatArgument> arguments)
{
	DebugPrinter printer;
	printer.write(level_colour(level));
	printer.write(context);
	printer.write(Reset);
	printer.write(": ");
	printer.format(format, arguments);
	printer.flush();
}

void debug_report_failure(const char                          *kind,
                          const std::source_location          &location,
                          const char                          *format,
                          std::span<const DebugFormatArgument> arguments)
{
	DebugPrinter printer;
	printer.write(Magenta);
	printer.write(location.file_name());
	printer.write(':');
	printer.write_decimal(location.line());
	printer.write(Red);
	printer.write(' ');
	printer.write(kind);
	printer.write(" failure");
	printer.write(Magenta);
	printer.write(" in ");
	printer.write(location.function_name());
	printer.flush();
	printer.write(Cyan);
	printer.format(format, arguments);
	printer.write(Reset);
	printer.flush();
}
