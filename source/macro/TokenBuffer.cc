#include <pryzma/macro/TokenBuffer.hh>

namespace pryzma::macro
{
	TokenBuffer::TokenBuffer(SourceManager const& sources, FileId file, lex::LexerOptions opt)
	{
		reset(sources, file, opt);
	}

	void TokenBuffer::reset(SourceManager const& sources, FileId file, lex::LexerOptions opt)
	{
		m_tokens.clear();
		m_errors.clear();

		lex::Lexer lex(sources, file, opt);

		for (;;)
		{
			auto tok = lex.next();
			m_tokens.push_back(tok);
			if (tok.is(lex::TokenKind::eof))
				break;
		}

		auto errs = lex.errors();
		m_errors.assign(errs.begin(), errs.end());
	}

	std::span<const lex::Token> TokenBuffer::body() const noexcept
	{
		auto n = m_tokens.size();
		if (n > 0 && m_tokens.back().is(lex::TokenKind::eof))
			--n;

		return {m_tokens.data(), n};
	}

	std::optional<Error> TokenBuffer::first_error() const
	{
		if (m_errors.empty())
			return std::nullopt;

		auto const& le = m_errors.front();
		return make_error(ErrorKind::lex_error, le.span, le.message);
	}

} // namespace pryzma::macro
