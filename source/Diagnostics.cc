#include <algorithm>
#include <iostream>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <pryzma/Diagnostics.hh>

#if defined(_WIN32)
#	include <io.h>
#	define PRYZMA_ISATTY _isatty
#	define PRYZMA_FILENO _fileno
#else
#	include <unistd.h>
#	define PRYZMA_ISATTY isatty
#	define PRYZMA_FILENO fileno
#endif

namespace pryzma
{
	namespace
	{
		struct Style
		{
			std::string_view reset{"\x1b[0m"};
			std::string_view bold{"\x1b[1m"};
			std::string_view dim{"\x1b[2m"};
		};

		constexpr std::size_t tabstop = 4;

		[[nodiscard]] std::string_view level_text(DiagnosticLevel lvl) noexcept
		{
			switch (lvl)
			{
				case DiagnosticLevel::note:
					return "note";
				case DiagnosticLevel::warning:
					return "warning";
				case DiagnosticLevel::error:
					return "error";
			}
			return "error";
		}

		[[nodiscard]] std::string_view level_color(DiagnosticLevel lvl) noexcept
		{
			switch (lvl)
			{
				case DiagnosticLevel::note:
					return "\x1b[36m";
				case DiagnosticLevel::warning:
					return "\x1b[33m";
				case DiagnosticLevel::error:
					return "\x1b[31m";
			}
			return "\x1b[31m";
		}

		[[nodiscard]] std::string_view advice_text(AdviceKind k) noexcept
		{
			return k == AdviceKind::help ? "help" : "note";
		}

		[[nodiscard]] std::string_view advice_color(AdviceKind k) noexcept
		{
			return k == AdviceKind::help ? "\x1b[32m" : "\x1b[36m";
		}

		[[nodiscard]] bool is_tty(std::ostream& out) noexcept
		{
			if (out.rdbuf() == std::cout.rdbuf())
				return PRYZMA_ISATTY(PRYZMA_FILENO(stdout)) != 0;

			if (out.rdbuf() == std::cerr.rdbuf())
				return PRYZMA_ISATTY(PRYZMA_FILENO(stderr)) != 0;

			return false;
		}

		[[nodiscard]] std::size_t digits(std::size_t v) noexcept
		{
			std::size_t d = 1;
			while (v >= 10)
			{
				v /= 10;
				++d;
			}
			return d;
		}

		void write_repeat(std::ostream& out, char ch, std::size_t n)
		{
			for (std::size_t i = 0; i < n; ++i)
				out.put(ch);
		}

		[[nodiscard]] std::size_t visual_column(std::string_view line, std::size_t col) noexcept
		{
			auto visual = std::size_t{1};
			for (std::size_t i = 1; i < col && i <= line.size(); ++i)
			{
				if (line[i - 1] == '\t')
					visual += tabstop - ((visual - 1) % tabstop);
				else
					++visual;
			}
			return visual;
		}

		[[nodiscard]] std::string expand_tabs(std::string_view line)
		{
			std::string out{};
			out.reserve(line.size());

			for (auto ch : line)
			{
				if (ch == '\t')
				{
					out.append(tabstop - (out.size() % tabstop), ' ');
					continue;
				}
				out.push_back(ch);
			}

			return out;
		}

	} // namespace

	Diagnostic to_diagnostic(Error const& err)
	{
		Diagnostic d{};
		d.level = DiagnosticLevel::error;
		d.primary = err.span;

		d.message = std::string(error_kind_name(err.kind));
		d.message += ": ";
		d.message += err.message;

		for (auto const& n : err.notes)
		{
			if (n.span.valid())
				d.labels.push_back(DiagnosticLabel{n.message, n.span});
			else
				d.advices.push_back(DiagnosticAdvice{AdviceKind::note, n.message});
		}

		return d;
	}

	Diagnostics::Diagnostics(SourceManager const& sources, std::ostream& out) noexcept
		: m_sources(&sources), m_out(&out)
	{
	}

	void Diagnostics::set_color_mode(ColorMode mode) noexcept
	{
		m_color_mode = mode;
	}

	ColorMode Diagnostics::color_mode() const noexcept
	{
		return m_color_mode;
	}

	std::size_t Diagnostics::error_count() const noexcept
	{
		return m_errors;
	}

	std::size_t Diagnostics::warning_count() const noexcept
	{
		return m_warnings;
	}

	bool Diagnostics::use_color() const noexcept
	{
		switch (m_color_mode)
		{
			case ColorMode::always:
				return true;
			case ColorMode::never:
				return false;
			case ColorMode::auto_detect:
				return is_tty(*m_out);
		}
		return false;
	}

	void Diagnostics::emit_header(DiagnosticLevel level, SourceSpan span, std::string_view message)
	{
		auto& out = *m_out;
		Style st{};

		auto name = span.valid() ? m_sources->name(span.id) : std::string_view("pryzma");

		if (use_color())
			out << st.bold << name << st.reset;
		else
			out << name;

		if (span.valid())
			out << ':' << span.begin.line << ':' << span.begin.column;

		out << ": ";

		if (use_color())
			out << st.bold << level_color(level) << level_text(level) << st.reset;
		else
			out << level_text(level);

		out << ": " << message << '\n';
	}

	void Diagnostics::emit_excerpt(SourceSpan span, std::string_view label, DiagnosticLevel level)
	{
		if (!span.valid())
			return;

		auto raw = m_sources->line_view(span.id, span.begin.line);
		if (raw.empty())
			return;

		auto& out = *m_out;
		Style st{};

		auto const width = digits(span.begin.line);

		auto bar = [&] {
			write_repeat(out, ' ', width + 1);
			if (use_color())
				out << st.dim << '|' << st.reset;
			else
				out << '|';
		};

		bar();
		out << '\n';

		out << ' ' << span.begin.line << ' ';
		if (use_color())
			out << st.dim << '|' << st.reset;
		else
			out << '|';
		out << ' ' << expand_tabs(raw) << '\n';

		auto start_col = std::max<std::size_t>(span.begin.column, 1);
		auto end_col = span.end.line == span.begin.line ? span.end.column : raw.size() + 1;
		if (end_col <= start_col)
			end_col = start_col + 1;

		auto const visual_start = visual_column(raw, start_col);
		auto const visual_end = visual_column(raw, end_col);
		auto const len = visual_end > visual_start ? visual_end - visual_start : 1;

		bar();
		write_repeat(out, ' ', visual_start);

		if (use_color())
			out << st.bold << level_color(level);

		out << '^';
		write_repeat(out, '~', len - 1);

		if (use_color())
			out << st.reset;

		if (!label.empty())
			out << ' ' << label;

		out << '\n';
	}

	void Diagnostics::emit(Diagnostic const& diag)
	{
		if (!m_out || !m_sources)
			return;

		auto& out = *m_out;
		Style st{};

		if (m_need_separator)
			out << '\n';
		m_need_separator = true;

		switch (diag.level)
		{
			case DiagnosticLevel::error:
				++m_errors;
				break;
			case DiagnosticLevel::warning:
				++m_warnings;
				break;
			case DiagnosticLevel::note:
				break;
		}

		emit_header(diag.level, diag.primary, diag.message);
		emit_excerpt(diag.primary, {}, diag.level);

		for (auto const& l : diag.labels)
		{
			auto const name = m_sources->name(l.span.id);

			if (use_color())
				out << st.dim << "  --> " << st.reset;
			else
				out << "  --> ";

			out << name << ':' << l.span.begin.line << ':' << l.span.begin.column << '\n';
			emit_excerpt(l.span, l.message, DiagnosticLevel::note);
		}

		for (auto const& a : diag.advices)
		{
			if (a.message.empty())
				continue;

			if (use_color())
			{
				out << "  " << st.dim << '=' << st.reset << ' ' << st.bold
					<< advice_color(a.kind) << advice_text(a.kind) << st.reset << ": "
					<< a.message << '\n';
			}
			else
			{
				out << "  = " << advice_text(a.kind) << ": " << a.message << '\n';
			}
		}
	}

	void Diagnostics::emit(Error const& err)
	{
		emit(to_diagnostic(err));
	}

	void Diagnostics::note(SourceSpan span, std::string_view message)
	{
		if (!m_out || !m_sources)
			return;

		emit_header(DiagnosticLevel::note, span, message);
	}

} // namespace pryzma
