#ifndef PRYZMA_DIAGNOSTICS_HH
#define PRYZMA_DIAGNOSTICS_HH

#include <cstddef>
#include <iosfwd>
#include <string>
#include <vector>
#include <pryzma/Error.hh>
#include <pryzma/support/SourceManager.hh>
#include <pryzma/support/Span.hh>

namespace pryzma
{
	enum class DiagnosticLevel
	{
		note,
		warning,
		error,
	};

	enum class ColorMode
	{
		auto_detect,
		always,
		never,
	};

	enum class AdviceKind
	{
		note,
		help,
	};

	struct DiagnosticAdvice
	{
		AdviceKind kind{AdviceKind::note};
		std::string message{};
	};

	struct DiagnosticLabel
	{
		std::string message{};
		SourceSpan span{};
	};

	struct Diagnostic
	{
		DiagnosticLevel level{DiagnosticLevel::error};

		std::string message{};
		SourceSpan primary{};

		std::vector<DiagnosticLabel> labels{};
		std::vector<DiagnosticAdvice> advices{};
	};

	[[nodiscard]] Diagnostic to_diagnostic(Error const& err);

	// Renders diagnostics rustc-style: a `file:line:col: level: message` header,
	// the offending source line with a caret underline, then labels and advices.
	// Also the logging channel for trace output (`note`).
	class Diagnostics
	{
	public:
		explicit Diagnostics(SourceManager const& sources, std::ostream& out) noexcept;

		void set_color_mode(ColorMode mode) noexcept;
		[[nodiscard]] ColorMode color_mode() const noexcept;

		void emit(Diagnostic const& diag);
		void emit(Error const& err);

		// One-line note without a source excerpt.
		void note(SourceSpan span, std::string_view message);

		[[nodiscard]] std::size_t error_count() const noexcept;
		[[nodiscard]] std::size_t warning_count() const noexcept;

	private:
		void emit_header(DiagnosticLevel level, SourceSpan span, std::string_view message);
		void emit_excerpt(SourceSpan span, std::string_view label, DiagnosticLevel level);

		[[nodiscard]] bool use_color() const noexcept;

		SourceManager const* m_sources{};
		std::ostream* m_out{};

		ColorMode m_color_mode{ColorMode::auto_detect};

		std::size_t m_errors{};
		std::size_t m_warnings{};

		bool m_need_separator{};
	};

} // namespace pryzma

#endif /* PRYZMA_DIAGNOSTICS_HH */
