#ifndef PRYZMA_LEX_LEXER_HH
#define PRYZMA_LEX_LEXER_HH

#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>
#include <pryzma/lex/Tokens.hh>
#include <pryzma/support/SourceManager.hh>

namespace pryzma::lex
{
	struct LexerOptions
	{
		bool emit_newlines{true};

		// Assembler conventions: `;` comments, no keywords or directives,
		// `'c'` character literals and `h`/`b`/`o` integer suffixes.
		bool asm_syntax{false};
	};

	struct LexError
	{
		SourceSpan span{};
		std::string message{};
	};

	class Lexer
	{
	public:
		explicit Lexer(SourceManager const& sources, FileId file, LexerOptions opt = {}) noexcept;

		// Lexes only [begin, end) of the file; spans stay file-relative.
		Lexer(SourceManager const& sources,
			  FileId file,
			  FileByte begin,
			  FileByte end,
			  LexerOptions opt = {}) noexcept;

		[[nodiscard]] FileId file_id() const noexcept { return m_file; }
		[[nodiscard]] FileByte offset() const noexcept { return m_off; }

		void reset(FileByte offset = 0) noexcept;

		[[nodiscard]] Token peek();
		Token next();

		[[nodiscard]] bool has_error() const noexcept { return !m_errors.empty(); }
		[[nodiscard]] std::span<const LexError> errors() const noexcept
		{
			return {m_errors.data(), m_errors.size()};
		}

	private:
		Token lex_one();

		void skip_spaces_and_comments();

		Token lex_identifier(FileByte begin);
		Token lex_number(FileByte begin);
		Token lex_string_like(FileByte begin, char quote, TokenKind kind);
		Token lex_directive(FileByte begin);
		Token lex_asm_body(FileByte begin);

		[[nodiscard]] bool at_end() const noexcept;
		[[nodiscard]] char cur() const noexcept;
		[[nodiscard]] char peek_char(FileByte rel = 1) const noexcept;

		void advance(FileByte n = 1) noexcept;

		[[nodiscard]] Token make(TokenKind kind, FileByte begin, FileByte end) const noexcept;
		Token punct(TokenKind kind, FileByte begin, FileByte len);

		void add_error(FileByte begin, FileByte end, std::string message);
		void track_asm_header(Token const& t) noexcept;

		SourceManager const* m_sources{nullptr};
		FileId m_file{};
		std::string_view m_input{};

		FileByte m_off{};

		LexerOptions m_opt{};

		bool m_has_peek{};
		Token m_peeked{};

		// Set between `asm` and the `{` that opens its raw body.
		bool m_in_asm_header{};
		std::size_t m_asm_parens{};

		std::vector<LexError> m_errors{};
	};

	// Decodes the escapes of a quoted string or character lexeme.
	// Returns nullopt on an unknown escape sequence.
	[[nodiscard]] std::optional<std::string> unescape_string(std::string_view quoted);

} // namespace pryzma::lex

#endif /* PRYZMA_LEX_LEXER_HH */
