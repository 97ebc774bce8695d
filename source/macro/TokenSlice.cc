#include <pryzma/macro/TokenSlice.hh>

namespace pryzma::macro
{
	SourceSpan span_for_tokens(lex::Token const* begin, lex::Token const* end) noexcept
	{
		if (!begin || !end || begin == end)
			return {};

		auto const& first = *begin;
		auto const& last = *(end - 1);

		return merge_spans(first.span, last.span);
	}

	TokenSlice make_token_slice(lex::Token const* begin, lex::Token const* end) noexcept
	{
		TokenSlice slice{};
		slice.begin = begin;
		slice.end = end;
		slice.span = span_for_tokens(begin, end);
		return slice;
	}

	TokenSlice make_token_slice(std::span<const lex::Token> tokens) noexcept
	{
		return make_token_slice(tokens.data(), tokens.data() + tokens.size());
	}

	static void append_spelling(std::string& out, lex::Token const& tok)
	{
		switch (tok.kind)
		{
			case lex::TokenKind::eof:
				return;
			case lex::TokenKind::invalid:
				out += "<invalid>";
				return;
			default:
				break;
		}

		if (!tok.lexeme.empty())
			out += tok.lexeme;
		else
			out += lex::token_kind_name(tok.kind);
	}

	std::string render_tokens(std::span<const lex::Token> tokens)
	{
		std::string out{};
		bool line_start = true;

		for (auto const& tok : tokens)
		{
			if (tok.is(lex::TokenKind::newline))
			{
				out.push_back('\n');
				line_start = true;
				continue;
			}

			if (tok.is(lex::TokenKind::eof))
				break;

			if (!line_start)
				out.push_back(' ');

			append_spelling(out, tok);
			line_start = false;
		}

		return out;
	}

	std::string token_slice_to_string(TokenSlice slice)
	{
		if (!slice.begin || !slice.end || slice.begin == slice.end)
			return {};

		return render_tokens(slice.tokens());
	}

} // namespace pryzma::macro
