#ifndef PRYZMA_LEX_TOKENS_HH
#define PRYZMA_LEX_TOKENS_HH

#include <cstdint>
#include <string_view>
#include <pryzma/support/Span.hh>

namespace pryzma::lex
{
	enum class TokenKind : std::uint16_t
	{
		invalid,

		eof,
		newline,

		identifier,
		integer,
		floating,
		string,
		char_literal,

		kw_let,
		kw_fn,
		kw_return,
		kw_if,
		kw_elif,
		kw_else,
		kw_while,
		kw_for,
		kw_in,
		kw_break,
		kw_continue,
		kw_struct,
		kw_use,
		kw_as,
		kw_with,
		kw_export,
		kw_try,
		kw_catch,
		kw_throw,
		kw_true,
		kw_false,
		kw_none,
		kw_and,
		kw_or,
		kw_not,
		kw_asm,

		dir_macro,
		dir_keyword,
		dir_insert,

		asm_body,

		lparen,
		rparen,
		lbracket,
		rbracket,
		lbrace,
		rbrace,

		comma,
		colon,
		coloncolon,
		semicolon,
		dot,
		ellipsis,
		arrow,
		fat_arrow,

		dollar,
		question,

		plus,
		minus,
		star,
		slash,
		percent,

		amp,
		pipe,
		caret,
		tilde,
		bang,

		eq,
		lt,
		gt,

		le,
		ge,
		eqeq,
		ne,

		shl,
		shr,

		andand,
		oror,

		plus_eq,
		minus_eq,
		star_eq,
		slash_eq,
	};

	enum class NumberBase : std::uint8_t
	{
		binary = 2,
		octal = 8,
		decimal = 10,
		hexadecimal = 16,
	};

	struct IntegerValue
	{
		std::uint64_t value{};
		NumberBase base{NumberBase::decimal};
		bool overflow{};
	};

	struct Token
	{
		TokenKind kind{TokenKind::invalid};
		SourceSpan span{};

		std::string_view lexeme{};

		IntegerValue integer{};
		double real{};

		// Number of macro expansions that produced this token; 0 for source text.
		std::uint16_t depth{};

		[[nodiscard]] constexpr bool is(TokenKind k) const noexcept { return kind == k; }
	};

	[[nodiscard]] constexpr bool is_keyword(TokenKind k) noexcept
	{
		return k >= TokenKind::kw_let && k <= TokenKind::kw_asm;
	}

	[[nodiscard]] constexpr bool is_directive(TokenKind k) noexcept
	{
		return k == TokenKind::dir_macro || k == TokenKind::dir_keyword
			   || k == TokenKind::dir_insert;
	}

	[[nodiscard]] constexpr bool is_open_bracket(TokenKind k) noexcept
	{
		return k == TokenKind::lparen || k == TokenKind::lbracket || k == TokenKind::lbrace;
	}

	[[nodiscard]] constexpr bool is_close_bracket(TokenKind k) noexcept
	{
		return k == TokenKind::rparen || k == TokenKind::rbracket || k == TokenKind::rbrace;
	}

	[[nodiscard]] constexpr bool is_statement_end(TokenKind k) noexcept
	{
		return k == TokenKind::newline || k == TokenKind::semicolon || k == TokenKind::eof;
	}

	[[nodiscard]] constexpr std::string_view token_kind_name(TokenKind k) noexcept
	{
		switch (k)
		{
			case TokenKind::invalid:
				return "invalid";
			case TokenKind::eof:
				return "end of file";
			case TokenKind::newline:
				return "newline";
			case TokenKind::identifier:
				return "identifier";
			case TokenKind::integer:
				return "integer";
			case TokenKind::floating:
				return "float";
			case TokenKind::string:
				return "string";
			case TokenKind::char_literal:
				return "character";

			case TokenKind::kw_let:
				return "'let'";
			case TokenKind::kw_fn:
				return "'fn'";
			case TokenKind::kw_return:
				return "'return'";
			case TokenKind::kw_if:
				return "'if'";
			case TokenKind::kw_elif:
				return "'elif'";
			case TokenKind::kw_else:
				return "'else'";
			case TokenKind::kw_while:
				return "'while'";
			case TokenKind::kw_for:
				return "'for'";
			case TokenKind::kw_in:
				return "'in'";
			case TokenKind::kw_break:
				return "'break'";
			case TokenKind::kw_continue:
				return "'continue'";
			case TokenKind::kw_struct:
				return "'struct'";
			case TokenKind::kw_use:
				return "'use'";
			case TokenKind::kw_as:
				return "'as'";
			case TokenKind::kw_with:
				return "'with'";
			case TokenKind::kw_export:
				return "'export'";
			case TokenKind::kw_try:
				return "'try'";
			case TokenKind::kw_catch:
				return "'catch'";
			case TokenKind::kw_throw:
				return "'throw'";
			case TokenKind::kw_true:
				return "'true'";
			case TokenKind::kw_false:
				return "'false'";
			case TokenKind::kw_none:
				return "'none'";
			case TokenKind::kw_and:
				return "'and'";
			case TokenKind::kw_or:
				return "'or'";
			case TokenKind::kw_not:
				return "'not'";
			case TokenKind::kw_asm:
				return "'asm'";

			case TokenKind::dir_macro:
				return "'#macro'";
			case TokenKind::dir_keyword:
				return "'#keyword'";
			case TokenKind::dir_insert:
				return "'#insert'";

			case TokenKind::asm_body:
				return "assembly body";

			case TokenKind::lparen:
				return "'('";
			case TokenKind::rparen:
				return "')'";
			case TokenKind::lbracket:
				return "'['";
			case TokenKind::rbracket:
				return "']'";
			case TokenKind::lbrace:
				return "'{'";
			case TokenKind::rbrace:
				return "'}'";

			case TokenKind::comma:
				return "','";
			case TokenKind::colon:
				return "':'";
			case TokenKind::coloncolon:
				return "'::'";
			case TokenKind::semicolon:
				return "';'";
			case TokenKind::dot:
				return "'.'";
			case TokenKind::ellipsis:
				return "'...'";
			case TokenKind::arrow:
				return "'->'";
			case TokenKind::fat_arrow:
				return "'=>'";

			case TokenKind::dollar:
				return "'$'";
			case TokenKind::question:
				return "'?'";

			case TokenKind::plus:
				return "'+'";
			case TokenKind::minus:
				return "'-'";
			case TokenKind::star:
				return "'*'";
			case TokenKind::slash:
				return "'/'";
			case TokenKind::percent:
				return "'%'";

			case TokenKind::amp:
				return "'&'";
			case TokenKind::pipe:
				return "'|'";
			case TokenKind::caret:
				return "'^'";
			case TokenKind::tilde:
				return "'~'";
			case TokenKind::bang:
				return "'!'";

			case TokenKind::eq:
				return "'='";
			case TokenKind::lt:
				return "'<'";
			case TokenKind::gt:
				return "'>'";

			case TokenKind::le:
				return "'<='";
			case TokenKind::ge:
				return "'>='";
			case TokenKind::eqeq:
				return "'=='";
			case TokenKind::ne:
				return "'!='";

			case TokenKind::shl:
				return "'<<'";
			case TokenKind::shr:
				return "'>>'";

			case TokenKind::andand:
				return "'&&'";
			case TokenKind::oror:
				return "'||'";

			case TokenKind::plus_eq:
				return "'+='";
			case TokenKind::minus_eq:
				return "'-='";
			case TokenKind::star_eq:
				return "'*='";
			case TokenKind::slash_eq:
				return "'/='";
		}

		return "unknown";
	}

} // namespace pryzma::lex

#endif /* PRYZMA_LEX_TOKENS_HH */
