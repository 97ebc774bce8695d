#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>
#include <pryzma/Diagnostics.hh>
#include <pryzma/Interpreter.hh>

namespace
{
	[[nodiscard]] std::string read_text_file(std::filesystem::path const& p)
	{
		std::ifstream f(p, std::ios::binary);
		if (!f)
			return {};

		std::string s;
		f.seekg(0, std::ios::end);
		auto const size = f.tellg();
		if (size > 0)
			s.resize(static_cast<std::size_t>(size));

		f.seekg(0, std::ios::beg);
		if (!s.empty())
			f.read(s.data(), static_cast<std::streamsize>(s.size()));

		return s;
	}

	[[nodiscard]] std::string_view trim_ws(std::string_view s) noexcept
	{
		while (!s.empty() && (s.front() == ' ' || s.front() == '\t'))
			s.remove_prefix(1);
		while (!s.empty() && (s.back() == ' ' || s.back() == '\t'))
			s.remove_suffix(1);
		return s;
	}

	// Strips carriage returns so expectations written on any platform compare.
	[[nodiscard]] std::string normalize_newlines(std::string_view s)
	{
		std::string out{};
		out.reserve(s.size());
		for (auto c : s)
			if (c != '\r')
				out.push_back(c);
		return out;
	}

	[[nodiscard]] std::vector<std::string>
	read_expected_error_lines(std::filesystem::path const& expected_path, bool& ok)
	{
		ok = true;
		std::ifstream f(expected_path, std::ios::binary);
		if (!f)
		{
			ok = false;
			return {};
		}

		auto text = read_text_file(expected_path);
		std::vector<std::string> lines{};

		std::size_t pos = 0;
		while (pos <= text.size())
		{
			auto end = text.find('\n', pos);
			if (end == std::string::npos)
				end = text.size();

			auto line = std::string_view(text).substr(pos, end - pos);
			if (!line.empty() && line.back() == '\r')
				line.remove_suffix(1);

			line = trim_ws(line);
			if (!line.empty() && line.front() != '#')
				lines.emplace_back(line);

			if (end == text.size())
				break;
			pos = end + 1;
		}

		return lines;
	}

	void print_mismatch(std::string_view got, std::string_view expected)
	{
		std::size_t line = 1;
		auto const min_len = got.size() < expected.size() ? got.size() : expected.size();

		for (std::size_t i = 0; i < min_len; ++i)
		{
			if (got[i] != expected[i])
			{
				std::cerr << "output differs on line " << line << "\n";
				break;
			}
			if (got[i] == '\n')
				++line;
		}

		if (got.size() != expected.size())
			std::cerr << "size mismatch: expected " << expected.size() << " bytes, got " << got.size()
					  << " bytes\n";

		std::cerr << "--- expected\n" << expected << "--- got\n" << got;
	}

} // namespace

int main(int argc, char** argv)
{
	if (argc != 3)
	{
		std::cerr << "usage: pryzma_test_runner <script.pryzma> <expected.out|expected.err>\n";
		return 2;
	}

	auto const script_path = std::filesystem::path(argv[1]);
	auto const expected_path = std::filesystem::path(argv[2]);
	auto const expect_errors = expected_path.extension() == ".err";

	bool expected_ok = true;
	std::string expected{};
	std::vector<std::string> expected_errors{};

	if (expect_errors)
		expected_errors = read_expected_error_lines(expected_path, expected_ok);
	else
	{
		std::ifstream expected_file(expected_path, std::ios::binary);
		expected_ok = static_cast<bool>(expected_file);
		expected = normalize_newlines(read_text_file(expected_path));
	}

	if (!expected_ok)
	{
		std::cerr << "error: failed to read expected file: " << expected_path.string() << "\n";
		return 2;
	}

	std::ostringstream program_out{};
	pryzma::InterpreterOptions opt{};
	opt.out = &program_out;
	opt.project_root = script_path.parent_path().string();

	pryzma::Interpreter interp(opt);

	std::ostringstream diag_out{};
	pryzma::Diagnostics diag(interp.sources(), diag_out);
	diag.set_color_mode(pryzma::ColorMode::never);

	auto result = interp.run_file(script_path.string());
	if (!result.ok())
		diag.emit(result.err());

	auto const diag_text = diag_out.str();

	if (expect_errors)
	{
		if (diag.error_count() == 0)
		{
			std::cerr << "expected errors but none were reported for " << script_path.filename().string()
					  << "\n";
			return 1;
		}

		for (auto const& expected_line : expected_errors)
		{
			if (diag_text.find(expected_line) == std::string::npos)
			{
				std::cerr << "missing expected diagnostic: " << expected_line << "\n";
				if (!diag_text.empty())
					std::cerr << diag_text;
				return 1;
			}
		}

		return 0;
	}

	if (diag.error_count() != 0)
	{
		if (!diag_text.empty())
			std::cerr << diag_text;
		return 1;
	}

	auto const got = normalize_newlines(program_out.str());
	if (got != expected)
	{
		std::cerr << "FAIL: " << script_path.filename().string() << "\n";
		print_mismatch(got, expected);
		return 1;
	}

	return 0;
}
