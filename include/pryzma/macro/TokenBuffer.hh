#ifndef PRYZMA_MACRO_TOKEN_BUFFER_HH
#define PRYZMA_MACRO_TOKEN_BUFFER_HH

#include <optional>
#include <span>
#include <vector>
#include <pryzma/Error.hh>
#include <pryzma/lex/Lexer.hh>

namespace pryzma::macro
{
	// A whole file lexed up front, terminated by an eof token.
	class TokenBuffer
	{
	public:
		TokenBuffer() = default;
		TokenBuffer(SourceManager const& sources, FileId file, lex::LexerOptions opt = {});

		void reset(SourceManager const& sources, FileId file, lex::LexerOptions opt = {});

		[[nodiscard]] std::span<const lex::Token> tokens() const noexcept
		{
			return {m_tokens.data(), m_tokens.size()};
		}

		// Tokens without the trailing eof.
		[[nodiscard]] std::span<const lex::Token> body() const noexcept;

		[[nodiscard]] std::span<const lex::LexError> errors() const noexcept
		{
			return {m_errors.data(), m_errors.size()};
		}

		[[nodiscard]] bool has_error() const noexcept { return !m_errors.empty(); }

		// The first lex error as a core error, if any.
		[[nodiscard]] std::optional<Error> first_error() const;

	private:
		std::vector<lex::Token> m_tokens{};
		std::vector<lex::LexError> m_errors{};
	};

} // namespace pryzma::macro

#endif /* PRYZMA_MACRO_TOKEN_BUFFER_HH */
