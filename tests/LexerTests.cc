#include <iostream>
#include <string>
#include <string_view>
#include <vector>
#include <pryzma/lex/Lexer.hh>
#include <pryzma/support/SourceManager.hh>

namespace
{
	using pryzma::lex::TokenKind;

	struct Lexed
	{
		std::vector<pryzma::lex::Token> tokens{};
		std::vector<pryzma::lex::LexError> errors{};
	};

	Lexed lex_all(pryzma::SourceManager& sources, std::string_view text, pryzma::lex::LexerOptions opt = {})
	{
		auto id = sources.add_virtual("lex", std::string(text));
		pryzma::lex::Lexer lexer(sources, id, opt);

		Lexed out{};
		for (;;)
		{
			auto t = lexer.next();
			out.tokens.push_back(t);
			if (t.is(TokenKind::eof) || t.is(TokenKind::invalid))
				break;
		}

		auto errs = lexer.errors();
		out.errors.assign(errs.begin(), errs.end());
		return out;
	}

	std::vector<TokenKind> kinds_of(Lexed const& l)
	{
		std::vector<TokenKind> out{};
		for (auto const& t : l.tokens)
			out.push_back(t.kind);
		return out;
	}

	bool check(bool cond, std::string_view msg)
	{
		if (cond)
			return true;

		std::cerr << "FAIL: " << msg << "\n";
		return false;
	}

	bool lexes_with_error(std::string_view text, std::string_view message_part)
	{
		pryzma::SourceManager sources{};
		auto l = lex_all(sources, text);
		if (l.errors.empty())
			return false;
		return l.errors.front().message.find(message_part) != std::string::npos;
	}

} // namespace

int main()
{
	int failures = 0;

	{
		pryzma::SourceManager sources{};
		auto l = lex_all(sources, "let x = 5\nx += 2; fn f(a) { a }");
		auto expect = std::vector<TokenKind>{
			TokenKind::kw_let,	   TokenKind::identifier, TokenKind::eq,		 TokenKind::integer,
			TokenKind::newline,	   TokenKind::identifier, TokenKind::plus_eq,	 TokenKind::integer,
			TokenKind::semicolon,  TokenKind::kw_fn,	  TokenKind::identifier, TokenKind::lparen,
			TokenKind::identifier, TokenKind::rparen,	  TokenKind::lbrace,	 TokenKind::identifier,
			TokenKind::rbrace,	   TokenKind::eof,
		};
		failures += !check(l.errors.empty(), "statements lex cleanly");
		failures += !check(kinds_of(l) == expect, "statement token kinds");
		failures += !check(l.tokens[1].lexeme == "x", "identifier lexeme");
		failures += !check(l.tokens[0].depth == 0, "source tokens have depth 0");
	}

	{
		pryzma::SourceManager sources{};
		auto l = lex_all(sources, "0x1F 0b101 0o17 1_000 1.5 2e3");
		failures += !check(l.errors.empty(), "numbers lex cleanly");
		failures += !check(l.tokens[0].integer.value == 31, "hex literal");
		failures += !check(l.tokens[1].integer.value == 5, "binary literal");
		failures += !check(l.tokens[2].integer.value == 15, "octal literal");
		failures += !check(l.tokens[3].integer.value == 1000, "underscore separators");
		failures += !check(l.tokens[4].is(TokenKind::floating) && l.tokens[4].real == 1.5, "float literal");
		failures += !check(l.tokens[5].is(TokenKind::floating) && l.tokens[5].real == 2000.0, "exponent literal");
	}

	{
		pryzma::SourceManager sources{};
		auto l = lex_all(sources, ":: -> => ... $ ? <= >= == != << >> && || -= *= /=");
		auto expect = std::vector<TokenKind>{
			TokenKind::coloncolon, TokenKind::arrow, TokenKind::fat_arrow, TokenKind::ellipsis,
			TokenKind::dollar,	   TokenKind::question, TokenKind::le,	   TokenKind::ge,
			TokenKind::eqeq,	   TokenKind::ne,	  TokenKind::shl,	   TokenKind::shr,
			TokenKind::andand,	   TokenKind::oror,	  TokenKind::minus_eq, TokenKind::star_eq,
			TokenKind::slash_eq,   TokenKind::eof,
		};
		failures += !check(kinds_of(l) == expect, "multi-character punctuation");
	}

	{
		pryzma::SourceManager sources{};
		auto l = lex_all(sources, "#macro sq(v) { v }\n#keyword #insert \"a\"");
		failures += !check(l.tokens[0].is(TokenKind::dir_macro), "#macro directive");
		failures += !check(l.tokens[9].is(TokenKind::dir_keyword), "#keyword directive");
		failures += !check(l.tokens[10].is(TokenKind::dir_insert), "#insert directive");
		failures += !check(l.tokens[11].is(TokenKind::string) && l.tokens[11].lexeme == "\"a\"",
						   "string lexeme keeps its quotes");
	}

	{
		pryzma::SourceManager sources{};
		auto l = lex_all(sources, "asm (rax = x) -> (x = rax) { inc rax ; { nested } }\nx");
		auto const& body = l.tokens[12];
		failures += !check(l.tokens[0].is(TokenKind::kw_asm), "asm keyword");
		failures += !check(body.is(TokenKind::asm_body), "asm body is one raw token");
		failures += !check(body.lexeme == "{ inc rax ; { nested } }", "asm body keeps balanced braces");
		failures += !check(l.tokens[13].is(TokenKind::newline), "lexing resumes after the asm body");
	}

	{
		pryzma::SourceManager sources{};
		auto l = lex_all(sources, "a // line comment\n/* block\ncomment */ b");
		auto expect = std::vector<TokenKind>{
			TokenKind::identifier, TokenKind::newline, TokenKind::identifier, TokenKind::eof};
		failures += !check(kinds_of(l) == expect, "comments are skipped");
		failures += !check(l.tokens[2].span.begin.line == 3, "line numbers advance through comments");
	}

	{
		auto s = pryzma::lex::unescape_string("\"a\\nb\\t\\\\\\\"\\0\"");
		failures += !check(s && *s == std::string("a\nb\t\\\"\0", 7), "escape sequences decode");
		failures += !check(!pryzma::lex::unescape_string("\"\\q\""), "unknown escape is rejected");
	}

	{
		pryzma::SourceManager sources{};
		pryzma::lex::LexerOptions opt{};
		opt.asm_syntax = true;
		auto l = lex_all(sources, "mov al, 'A' ; comment\nmov rax, 0FFh", opt);
		failures += !check(l.errors.empty(), "assembler syntax lexes cleanly");
		failures += !check(l.tokens[0].is(TokenKind::identifier), "mnemonics are identifiers");
		failures += !check(l.tokens[3].is(TokenKind::char_literal), "character literal in asm syntax");
		failures += !check(l.tokens[4].is(TokenKind::newline), "semicolon starts a comment");
		failures += !check(l.tokens[8].integer.value == 255, "h suffix is hexadecimal");
	}

	failures += !check(lexes_with_error("\"open", "unterminated string"), "unterminated string");
	failures += !check(lexes_with_error("/* open", "unterminated block comment"), "unterminated comment");
	failures += !check(lexes_with_error("asm { mov", "unterminated assembly"), "unterminated asm body");
	failures += !check(lexes_with_error("let a = @", "invalid character"), "unknown character");
	failures += !check(lexes_with_error("let a = \xc3\xa9", "invalid character '\\xc3'"),
					   "non-ASCII bytes are shown escaped");
	failures += !check(lexes_with_error("#define", "unknown directive"), "unknown directive");
	failures += !check(lexes_with_error("99999999999999999999", "overflows"), "integer overflow");

	{
		pryzma::SourceManager sources{};
		auto l = lex_all(sources, "x\n  @");
		failures += !check(!l.errors.empty() && l.errors.front().span.begin.line == 2
							   && l.errors.front().span.begin.column == 3,
						   "errors carry their position");
	}

	if (failures != 0)
		std::cerr << failures << " test(s) failed\n";

	return failures == 0 ? 0 : 1;
}
