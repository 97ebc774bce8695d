#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <pryzma/Diagnostics.hh>
#include <pryzma/Interpreter.hh>

namespace
{
	constexpr int exit_ok = 0;
	constexpr int exit_script_error = 1;
	constexpr int exit_usage = 2;

	struct CliOptions
	{
		std::string input{};
		std::vector<std::string> inline_lines{};

		std::vector<std::string> include_paths{};
		std::string project_root{};
		std::string packages_dir{};
		std::optional<std::size_t> max_macro_depth{};

		bool preprocess_only{};
		bool trace{};

		pryzma::ColorMode color{pryzma::ColorMode::auto_detect};
		bool show_help{};
		bool show_version{};
	};

	[[nodiscard]] std::string_view strip_surrounding_quotes(std::string_view s) noexcept
	{
		if (s.size() < 2)
			return s;

		auto const q0 = s.front();
		auto const q1 = s.back();
		if ((q0 == '"' && q1 == '"') || (q0 == '\'' && q1 == '\''))
			return s.substr(1, s.size() - 2);

		return s;
	}

	[[nodiscard]] std::string_view trim(std::string_view s) noexcept
	{
		while (!s.empty()
			   && (s.front() == ' ' || s.front() == '\t' || s.front() == '\n' || s.front() == '\r'))
			s.remove_prefix(1);

		while (!s.empty()
			   && (s.back() == ' ' || s.back() == '\t' || s.back() == '\n' || s.back() == '\r'))
			s.remove_suffix(1);

		return s;
	}

	[[nodiscard]] std::vector<std::string> split_path_list(std::string_view s)
	{
		std::vector<std::string> out{};
		if (s.empty())
			return out;

		s = strip_surrounding_quotes(trim(s));

#if defined(_WIN32)
		auto const sep = ';';
#else
		auto const sep = ':';
#endif

		std::size_t i = 0;
		while (i <= s.size())
		{
			auto j = s.find(sep, i);
			if (j == std::string_view::npos)
				j = s.size();

			auto part = strip_surrounding_quotes(trim(s.substr(i, j - i)));
			if (!part.empty())
				out.push_back(std::string(part));

			if (j == s.size())
				break;

			i = j + 1;
		}

		return out;
	}

	[[nodiscard]] std::vector<std::string> read_env_search_paths()
	{
		auto* e = std::getenv("PRYZMA_PATH");
		if (e == nullptr)
			return {};

		return split_path_list(std::string_view(e));
	}

	[[nodiscard]] std::string read_env_packages_dir()
	{
		auto* e = std::getenv("PRYZMA_PACKAGES");
		if (e == nullptr)
			return {};

		return std::string(strip_surrounding_quotes(trim(e)));
	}

	[[nodiscard]] std::string_view exe_basename(std::string_view p) noexcept
	{
		auto const pos = p.find_last_of("/\\");
		if (pos == std::string_view::npos)
			return p;
		return p.substr(pos + 1);
	}

	void print_help(std::ostream& os, std::string_view exe)
	{
		os << "usage: " << exe << " [options] <file>\n\n"
		   << "options:\n"
		   << "  -e <code>                  run code instead of a file (repeatable)\n"
		   << "  -I <dir>                   add module search path (repeatable)\n"
		   << "      --project <dir>        project root\n"
		   << "      --packages <dir>       packages directory\n"
		   << "      --max-macro-depth <n>  maximum nested macro expansions\n"
		   << "      --preprocess           print the expanded source and exit\n"
		   << "      --trace                log executed statements and module loads\n"
		   << "      --color <auto|always|never>\n"
		   << "  -h, --help                 show this help\n"
		   << "      --version              show version\n";
	}

	void print_version(std::ostream& os, std::string_view exe)
	{
		os << exe << " (pryzma) version 0.1.0\n";
	}

	[[nodiscard]] bool parse_u64(std::string_view s, std::uint64_t& out) noexcept
	{
		if (s.empty())
			return false;

		std::uint64_t v = 0;
		for (char ch : s)
		{
			if (ch < '0' || ch > '9')
				return false;

			auto const digit = static_cast<std::uint64_t>(ch - '0');

			if (v > (std::numeric_limits<std::uint64_t>::max() - digit) / 10)
				return false;

			v = v * 10 + digit;
		}

		out = v;
		return true;
	}

	[[nodiscard]] std::optional<std::string_view> take_value(int& i, int argc, char** argv)
	{
		if (i + 1 >= argc)
			return std::nullopt;

		++i;
		return std::string_view(argv[i]);
	}

	[[nodiscard]] std::optional<CliOptions> parse_args(int argc, char** argv)
	{
		CliOptions opt{};

		for (int i = 1; i < argc; ++i)
		{
			std::string_view a(argv[i]);

			if (a == "-h" || a == "--help")
			{
				opt.show_help = true;
				return opt;
			}

			if (a == "--version")
			{
				opt.show_version = true;
				return opt;
			}

			if (a == "-e")
			{
				auto v = take_value(i, argc, argv);
				if (!v)
					return std::nullopt;

				opt.inline_lines.push_back(std::string(*v));
				continue;
			}

			if (a == "-I")
			{
				auto v = take_value(i, argc, argv);
				if (!v)
					return std::nullopt;

				opt.include_paths.push_back(std::string(*v));
				continue;
			}

			if (a.rfind("-I", 0) == 0 && a.size() > 2)
			{
				opt.include_paths.push_back(std::string{a.substr(2)});
				continue;
			}

			if (a == "--project" || a == "--packages")
			{
				auto v = take_value(i, argc, argv);
				if (!v)
					return std::nullopt;

				(a == "--project" ? opt.project_root : opt.packages_dir) = std::string(*v);
				continue;
			}

			if (a == "--max-macro-depth")
			{
				auto v = take_value(i, argc, argv);
				if (!v)
					return std::nullopt;

				std::uint64_t n = 0;
				if (!parse_u64(*v, n) || n == 0)
					return std::nullopt;

				opt.max_macro_depth = static_cast<std::size_t>(n);
				continue;
			}

			if (a == "--preprocess")
			{
				opt.preprocess_only = true;
				continue;
			}

			if (a == "--trace")
			{
				opt.trace = true;
				continue;
			}

			if (a == "--color")
			{
				auto v = take_value(i, argc, argv);
				if (!v)
					return std::nullopt;

				if (*v == "auto")
					opt.color = pryzma::ColorMode::auto_detect;
				else if (*v == "always")
					opt.color = pryzma::ColorMode::always;
				else if (*v == "never")
					opt.color = pryzma::ColorMode::never;
				else
					return std::nullopt;

				continue;
			}

			if (!a.empty() && a.front() == '-')
				return std::nullopt;

			if (opt.input.empty())
				opt.input = std::string(a);
			else
				return std::nullopt;
		}

		// A file and `-e` are exclusive, and one of them is required.
		if (opt.input.empty() == opt.inline_lines.empty())
			return std::nullopt;

		return opt;
	}

	[[nodiscard]] pryzma::InterpreterOptions interpreter_options(CliOptions const& cli)
	{
		pryzma::InterpreterOptions opt{};

		opt.search_paths = cli.include_paths;
		for (auto& p : read_env_search_paths())
			opt.search_paths.push_back(std::move(p));

		opt.project_root = cli.project_root;
		opt.packages_dir = cli.packages_dir.empty() ? read_env_packages_dir() : cli.packages_dir;

		if (cli.max_macro_depth)
			opt.macro.max_depth = *cli.max_macro_depth;

		return opt;
	}

	[[nodiscard]] std::string joined_inline_source(std::vector<std::string> const& lines)
	{
		std::string src{};
		for (auto const& line : lines)
		{
			src.append(line);
			if (src.empty() || src.back() != '\n')
				src.push_back('\n');
		}
		return src;
	}

	// The first line of a statement, for trace output.
	[[nodiscard]] std::string_view first_line(std::string_view text) noexcept
	{
		auto const nl = text.find('\n');
		return trim(nl == std::string_view::npos ? text : text.substr(0, nl));
	}

	void install_trace(pryzma::Interpreter& interp, pryzma::Diagnostics& diag)
	{
		interp.set_step_hook([&interp, &diag](pryzma::rt::StepEvent const& ev) {
			if (ev.phase != pryzma::rt::StepPhase::before)
				return;
			diag.note(ev.span, "exec: " + std::string(first_line(interp.sources().text(ev.span))));
		});

		interp.set_module_hook([&diag](pryzma::rt::Module const& mod) {
			diag.note({}, "loading module '" + mod.name + "' from " + mod.path);
		});
	}

} // namespace

int main(int argc, char** argv)
{
	auto const exe =
		exe_basename((argc > 0) ? std::string_view(argv[0]) : std::string_view("pryzma"));

	auto parsed = parse_args(argc, argv);
	if (!parsed)
	{
		print_help(std::cerr, exe);
		return exit_usage;
	}

	auto const& opt = *parsed;

	if (opt.show_help)
	{
		print_help(std::cout, exe);
		return exit_ok;
	}

	if (opt.show_version)
	{
		print_version(std::cout, exe);
		return exit_ok;
	}

	pryzma::Interpreter interp(interpreter_options(opt));

	pryzma::Diagnostics diag(interp.sources(), std::cerr);
	diag.set_color_mode(opt.color);

	if (opt.preprocess_only)
	{
		auto text = opt.inline_lines.empty()
						? interp.preprocess_file(opt.input)
						: interp.preprocess("<inline>", joined_inline_source(opt.inline_lines));
		if (!text.ok())
		{
			diag.emit(text.err());
			return exit_script_error;
		}

		std::cout << text.value();
		if (!text.value().empty() && text.value().back() != '\n')
			std::cout << '\n';
		return exit_ok;
	}

	if (opt.trace)
		install_trace(interp, diag);

	auto ran = opt.inline_lines.empty() ? interp.run_file(opt.input)
										: interp.run_source("<inline>", joined_inline_source(opt.inline_lines));
	std::cout.flush();

	if (!ran.ok())
	{
		diag.emit(ran.err());
		return exit_script_error;
	}

	return exit_ok;
}
