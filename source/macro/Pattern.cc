#include <cstddef>
#include <utility>
#include <pryzma/macro/Pattern.hh>

namespace pryzma::macro
{
	static bool has_payload(lex::TokenKind kind) noexcept
	{
		return kind == lex::TokenKind::identifier || kind == lex::TokenKind::integer
			   || kind == lex::TokenKind::floating || kind == lex::TokenKind::string
			   || kind == lex::TokenKind::char_literal || kind == lex::TokenKind::asm_body;
	}

	static bool tokens_equivalent(lex::Token const& a, lex::Token const& b) noexcept
	{
		if (a.kind != b.kind)
			return false;

		if (has_payload(a.kind))
			return a.lexeme == b.lexeme;

		return true;
	}

	static bool slice_equivalent(TokenSlice a, TokenSlice b) noexcept
	{
		if (a.size() != b.size())
			return false;

		for (std::size_t i = 0; i < a.size(); ++i)
			if (!tokens_equivalent(a.begin[i], b.begin[i]))
				return false;

		return true;
	}

	static PatternLiteral make_literal(lex::Token const& tok)
	{
		PatternLiteral lit{};
		lit.span = tok.span;
		lit.kind = tok.kind;
		if (has_payload(tok.kind))
			lit.lexeme = std::string(tok.lexeme);
		return lit;
	}

	bool is_balanced(TokenSlice slice) noexcept
	{
		std::vector<lex::TokenKind> stack{};

		for (auto const& tok : slice.tokens())
		{
			if (lex::is_open_bracket(tok.kind))
			{
				stack.push_back(tok.kind);
				continue;
			}

			if (!lex::is_close_bracket(tok.kind))
				continue;

			if (stack.empty())
				return false;

			auto open = stack.back();
			stack.pop_back();

			auto matches = (open == lex::TokenKind::lparen && tok.is(lex::TokenKind::rparen))
						   || (open == lex::TokenKind::lbracket && tok.is(lex::TokenKind::rbracket))
						   || (open == lex::TokenKind::lbrace && tok.is(lex::TokenKind::rbrace));
			if (!matches)
				return false;
		}

		return stack.empty();
	}

	PatternParseResult parse_pattern(TokenSlice slice)
	{
		PatternParseResult out{};

		if (!slice.begin || !slice.end)
			return out;

		auto count = slice.size();
		auto const* toks = slice.begin;

		for (std::size_t i = 0; i < count; ++i)
		{
			auto const& tok = toks[i];

			if (tok.is(lex::TokenKind::newline))
				continue;

			if (tok.is(lex::TokenKind::dollar))
			{
				if (i + 1 >= count || !toks[i + 1].is(lex::TokenKind::identifier))
				{
					auto const& at = i + 1 < count ? toks[i + 1] : tok;
					out.errors.push_back(
						PatternParseError{at.span, "expected binding name after '$'"});
					continue;
				}

				auto const& name_tok = toks[i + 1];

				PatternBind bind{};
				bind.span = merge_spans(tok.span, name_tok.span);
				bind.name = std::string(name_tok.lexeme);

				if (!out.pattern.elems.empty()
					&& std::holds_alternative<PatternBind>(out.pattern.elems.back()))
				{
					out.errors.push_back(PatternParseError{
						bind.span,
						"binding '$" + bind.name + "' directly follows another binding"});
				}

				out.pattern.elems.push_back(std::move(bind));
				++i;
				continue;
			}

			if (tok.is(lex::TokenKind::ellipsis))
			{
				out.pattern.elems.push_back(PatternEllipsis{tok.span});
				continue;
			}

			if (tok.is(lex::TokenKind::identifier) && tok.lexeme == "_")
			{
				out.pattern.elems.push_back(PatternWildcard{tok.span});
				continue;
			}

			out.pattern.elems.push_back(make_literal(tok));
		}

		if (!is_balanced(slice))
			out.errors.push_back(PatternParseError{slice.span, "unbalanced brackets in pattern"});

		return out;
	}

	static bool match_from(Pattern const& pattern,
						   TokenSlice input,
						   std::size_t pat_idx,
						   std::size_t tok_idx,
						   MatchResult& result)
	{
		auto pat_size = pattern.elems.size();
		auto tok_size = input.size();

		if (pat_idx == pat_size)
			return tok_idx == tok_size;

		auto const& elem = pattern.elems[pat_idx];

		if (auto lit = std::get_if<PatternLiteral>(&elem))
		{
			if (tok_idx >= tok_size)
				return false;

			auto const& tok = input.begin[tok_idx];
			if (tok.kind != lit->kind)
				return false;

			if (has_payload(lit->kind) && tok.lexeme != lit->lexeme)
				return false;

			return match_from(pattern, input, pat_idx + 1, tok_idx + 1, result);
		}

		if (std::holds_alternative<PatternWildcard>(elem))
		{
			if (tok_idx >= tok_size)
				return false;

			return match_from(pattern, input, pat_idx + 1, tok_idx + 1, result);
		}

		if (std::holds_alternative<PatternEllipsis>(elem))
		{
			for (std::size_t len = 0; tok_idx + len <= tok_size; ++len)
				if (match_from(pattern, input, pat_idx + 1, tok_idx + len, result))
					return true;
			return false;
		}

		auto const& bind = std::get<PatternBind>(elem);
		auto max_len = tok_size - tok_idx;

		for (std::size_t len = 1; len <= max_len; ++len)
		{
			auto slice = make_token_slice(input.begin + tok_idx, input.begin + tok_idx + len);
			if (!is_balanced(slice))
				continue;

			auto existing = result.bindings.find(bind.name);
			if (existing != result.bindings.end())
			{
				if (slice_equivalent(existing->second, slice)
					&& match_from(pattern, input, pat_idx + 1, tok_idx + len, result))
					return true;
				continue;
			}

			result.bindings.emplace(bind.name, slice);
			if (match_from(pattern, input, pat_idx + 1, tok_idx + len, result))
				return true;

			result.bindings.erase(bind.name);
		}

		return false;
	}

	bool match_pattern(Pattern const& pattern, TokenSlice input, MatchResult& result)
	{
		result.bindings.clear();
		if (!input.begin || !input.end)
			return pattern.elems.empty();

		return match_from(pattern, input, 0, 0, result);
	}

} // namespace pryzma::macro
