#include <charconv>
#include <limits>
#include <string>
#include <pryzma/lex/Lexer.hh>
#include <pryzma/support/Ctype.hh>

namespace pryzma::lex
{
	static TokenKind classify_keyword(std::string_view s) noexcept
	{
		struct Keyword
		{
			std::string_view text;
			TokenKind kind;
		};

		static constexpr Keyword keywords[] = {
			{"let", TokenKind::kw_let},			  {"fn", TokenKind::kw_fn},
			{"return", TokenKind::kw_return},	  {"if", TokenKind::kw_if},
			{"elif", TokenKind::kw_elif},		  {"else", TokenKind::kw_else},
			{"while", TokenKind::kw_while},		  {"for", TokenKind::kw_for},
			{"in", TokenKind::kw_in},			  {"break", TokenKind::kw_break},
			{"continue", TokenKind::kw_continue}, {"struct", TokenKind::kw_struct},
			{"use", TokenKind::kw_use},			  {"as", TokenKind::kw_as},
			{"with", TokenKind::kw_with},		  {"export", TokenKind::kw_export},
			{"try", TokenKind::kw_try},			  {"catch", TokenKind::kw_catch},
			{"throw", TokenKind::kw_throw},		  {"true", TokenKind::kw_true},
			{"false", TokenKind::kw_false},		  {"none", TokenKind::kw_none},
			{"and", TokenKind::kw_and},			  {"or", TokenKind::kw_or},
			{"not", TokenKind::kw_not},			  {"asm", TokenKind::kw_asm},
		};

		for (auto const& kw : keywords)
			if (kw.text == s)
				return kw.kind;

		return TokenKind::identifier;
	}

	// Printable ASCII as itself, anything else as a `\xNN` escape.
	static std::string describe_char(char c)
	{
		auto u = static_cast<unsigned char>(c);
		if (u >= 0x20 && u < 0x7f)
			return std::string(1, c);

		static constexpr char digits[] = "0123456789abcdef";
		std::string out = "\\x";
		out.push_back(digits[u >> 4]);
		out.push_back(digits[u & 0xf]);
		return out;
	}

	static bool is_digit_for_base(char c, NumberBase base) noexcept
	{
		if (c == '_')
			return true;

		switch (base)
		{
			case NumberBase::binary:
				return c == '0' || c == '1';
			case NumberBase::octal:
				return c >= '0' && c <= '7';
			case NumberBase::decimal:
				return is_ascii_digit(c);
			case NumberBase::hexadecimal:
			{
				auto lc = ascii_tolower(c);
				return is_ascii_digit(c) || (lc >= 'a' && lc <= 'f');
			}
		}

		return false;
	}

	static int digit_value(char c) noexcept
	{
		if (c >= '0' && c <= '9')
			return c - '0';

		auto lc = ascii_tolower(c);
		if (lc >= 'a' && lc <= 'f')
			return lc - 'a' + 10;

		return -1;
	}

	Lexer::Lexer(SourceManager const& sources, FileId file, LexerOptions opt) noexcept
		: m_sources(&sources), m_file(file), m_input(sources.content(file)), m_opt(opt)
	{
	}

	Lexer::Lexer(SourceManager const& sources,
				 FileId file,
				 FileByte begin,
				 FileByte end,
				 LexerOptions opt) noexcept
		: m_sources(&sources), m_file(file), m_input(sources.content(file)), m_opt(opt)
	{
		if (end < m_input.size())
			m_input = m_input.substr(0, end);

		m_off = begin < m_input.size() ? begin : m_input.size();
	}

	void Lexer::reset(FileByte offset) noexcept
	{
		m_off = offset;
		m_has_peek = false;
		m_peeked = {};
		m_in_asm_header = false;
		m_asm_parens = 0;
		m_errors.clear();
	}

	Token Lexer::peek()
	{
		if (!m_has_peek)
		{
			m_peeked = lex_one();
			m_has_peek = true;
		}
		return m_peeked;
	}

	Token Lexer::next()
	{
		if (m_has_peek)
		{
			m_has_peek = false;
			return m_peeked;
		}
		return lex_one();
	}

	bool Lexer::at_end() const noexcept
	{
		return m_off >= m_input.size();
	}

	char Lexer::cur() const noexcept
	{
		if (at_end())
			return '\0';

		return m_input[m_off];
	}

	char Lexer::peek_char(FileByte rel) const noexcept
	{
		auto idx = m_off + rel;
		if (idx >= m_input.size())
			return '\0';

		return m_input[idx];
	}

	void Lexer::advance(FileByte n) noexcept
	{
		m_off += n;
		if (m_off > m_input.size())
			m_off = m_input.size();
	}

	Token Lexer::make(TokenKind kind, FileByte begin, FileByte end) const noexcept
	{
		Token t{};
		t.kind = kind;
		t.span = m_sources->span_from_offsets(m_file, begin, end);
		if (begin <= end && end <= m_input.size())
			t.lexeme = m_input.substr(begin, end - begin);

		return t;
	}

	Token Lexer::punct(TokenKind kind, FileByte begin, FileByte len)
	{
		advance(len);
		auto t = make(kind, begin, m_off);
		track_asm_header(t);
		return t;
	}

	void Lexer::add_error(FileByte begin, FileByte end, std::string message)
	{
		LexError e{};
		e.span = m_sources->span_from_offsets(m_file, begin, end);
		e.message = std::move(message);
		m_errors.push_back(std::move(e));
	}

	void Lexer::track_asm_header(Token const& t) noexcept
	{
		if (!m_in_asm_header)
			return;

		if (t.is(TokenKind::lparen))
			++m_asm_parens;
		else if (t.is(TokenKind::rparen) && m_asm_parens > 0)
			--m_asm_parens;
	}

	void Lexer::skip_spaces_and_comments()
	{
		for (;;)
		{
			if (at_end())
				return;

			auto c = cur();

			if (c == '\n' || c == '\r')
			{
				if (m_opt.emit_newlines)
					return;

				advance(c == '\r' && peek_char() == '\n' ? 2 : 1);
				continue;
			}

			if (is_ascii_space(c))
			{
				advance();
				continue;
			}

			auto line_comment = m_opt.asm_syntax ? c == ';' : (c == '/' && peek_char() == '/');
			if (line_comment)
			{
				while (!at_end() && cur() != '\n' && cur() != '\r')
					advance();
				continue;
			}

			if (!m_opt.asm_syntax && c == '/' && peek_char() == '*')
			{
				auto begin = m_off;
				advance(2);

				auto closed = false;
				while (!at_end())
				{
					if (cur() == '*' && peek_char() == '/')
					{
						advance(2);
						closed = true;
						break;
					}
					advance();
				}

				if (!closed)
					add_error(begin, m_off, "unterminated block comment");

				continue;
			}

			return;
		}
	}

	Token Lexer::lex_string_like(FileByte begin, char quote, TokenKind kind)
	{
		advance();

		while (!at_end())
		{
			auto c = cur();

			if (c == '\n' || c == '\r')
				break;

			if (c == quote)
			{
				advance();
				auto t = make(kind, begin, m_off);
				if (!unescape_string(t.lexeme))
					add_error(begin, m_off, "unknown escape sequence in string literal");
				return t;
			}

			if (c == '\\')
			{
				advance();
				if (!at_end() && cur() != '\n' && cur() != '\r')
					advance();
				continue;
			}

			advance();
		}

		add_error(begin, m_off, "unterminated string literal");
		return make(TokenKind::invalid, begin, m_off);
	}

	Token Lexer::lex_identifier(FileByte begin)
	{
		advance();

		while (!at_end() && is_ident_continue(cur()))
			advance();

		auto t = make(TokenKind::identifier, begin, m_off);

		if (!m_opt.asm_syntax)
			t.kind = classify_keyword(t.lexeme);

		if (t.is(TokenKind::kw_asm))
		{
			m_in_asm_header = true;
			m_asm_parens = 0;
		}

		return t;
	}

	Token Lexer::lex_directive(FileByte begin)
	{
		advance();

		auto name_begin = m_off;
		while (!at_end() && is_ident_continue(cur()))
			advance();

		auto name = m_input.substr(name_begin, m_off - name_begin);

		if (name == "macro")
			return make(TokenKind::dir_macro, begin, m_off);
		if (name == "keyword")
			return make(TokenKind::dir_keyword, begin, m_off);
		if (name == "insert")
			return make(TokenKind::dir_insert, begin, m_off);

		if (name.empty())
			add_error(begin, m_off + (at_end() ? 0 : 1), "expected directive name after '#'");
		else
			add_error(begin, m_off, "unknown directive '#" + std::string(name) + "'");

		return make(TokenKind::invalid, begin, m_off);
	}

	Token Lexer::lex_asm_body(FileByte begin)
	{
		m_in_asm_header = false;
		advance();

		std::size_t depth = 1;
		while (!at_end())
		{
			auto c = cur();
			if (c == '{')
				++depth;
			else if (c == '}' && --depth == 0)
			{
				advance();
				return make(TokenKind::asm_body, begin, m_off);
			}
			advance();
		}

		add_error(begin, m_off, "unterminated assembly block");
		return make(TokenKind::invalid, begin, m_off);
	}

	Token Lexer::lex_number(FileByte begin)
	{
		auto base = NumberBase::decimal;
		auto is_float = false;

		if (cur() == '0' && (ascii_tolower(peek_char()) == 'x' || ascii_tolower(peek_char()) == 'b'
							 || ascii_tolower(peek_char()) == 'o')
			&& is_digit_for_base(peek_char(2), ascii_tolower(peek_char()) == 'x'
												   ? NumberBase::hexadecimal
												   : NumberBase::decimal))
		{
			auto p = ascii_tolower(peek_char());
			base = p == 'x' ? NumberBase::hexadecimal
							: (p == 'b' ? NumberBase::binary : NumberBase::octal);
			advance(2);
			while (!at_end() && is_digit_for_base(cur(), NumberBase::hexadecimal))
				advance();
		}
		else if (m_opt.asm_syntax)
		{
			while (!at_end() && is_digit_for_base(cur(), NumberBase::hexadecimal))
				advance();

			auto suf = ascii_tolower(cur());
			if (suf == 'h' || suf == 'o' || suf == 'q')
				advance();
		}
		else
		{
			while (!at_end() && is_digit_for_base(cur(), NumberBase::decimal))
				advance();

			if (cur() == '.' && is_ascii_digit(peek_char()))
			{
				is_float = true;
				advance();
				while (!at_end() && is_digit_for_base(cur(), NumberBase::decimal))
					advance();
			}

			auto e = ascii_tolower(cur());
			auto sign = peek_char() == '+' || peek_char() == '-';
			if (e == 'e' && (is_ascii_digit(peek_char()) || (sign && is_ascii_digit(peek_char(2)))))
			{
				is_float = true;
				advance(sign ? 2 : 1);
				while (!at_end() && is_ascii_digit(cur()))
					advance();
			}
		}

		if (!at_end() && is_ident_continue(cur()))
		{
			while (!at_end() && is_ident_continue(cur()))
				advance();

			add_error(begin, m_off, "invalid digit in number literal");
			return make(TokenKind::invalid, begin, m_off);
		}

		auto t = make(is_float ? TokenKind::floating : TokenKind::integer, begin, m_off);

		std::string digits{};
		for (char c : t.lexeme)
			if (c != '_')
				digits.push_back(c);

		if (is_float)
		{
			auto res = std::from_chars(digits.data(), digits.data() + digits.size(), t.real);
			if (res.ec != std::errc{})
				add_error(begin, m_off, "malformed float literal");
			return t;
		}

		std::string_view s = digits;
		if (s.size() >= 2 && s[0] == '0' && base != NumberBase::decimal)
			s.remove_prefix(2);

		if (m_opt.asm_syntax && !s.empty())
		{
			auto suf = ascii_tolower(s.back());
			if (suf == 'h')
			{
				base = NumberBase::hexadecimal;
				s.remove_suffix(1);
			}
			else if (suf == 'o' || suf == 'q')
			{
				base = NumberBase::octal;
				s.remove_suffix(1);
			}
		}

		std::uint64_t value{};
		bool overflow{};

		auto maxv = std::numeric_limits<std::uint64_t>::max();
		auto b = static_cast<std::uint64_t>(base);

		for (char c : s)
		{
			auto d = digit_value(c);
			if (d < 0 || static_cast<std::uint64_t>(d) >= b)
			{
				add_error(begin, m_off, "invalid digit in integer literal");
				return t;
			}

			auto ud = static_cast<std::uint64_t>(d);
			if (value > (maxv - ud) / b)
			{
				overflow = true;
				value = maxv;
				break;
			}

			value = value * b + ud;
		}

		t.integer.value = value;
		t.integer.base = base;
		t.integer.overflow = overflow;

		if (overflow)
			add_error(begin, m_off, "integer literal overflows 64-bit");

		return t;
	}

	Token Lexer::lex_one()
	{
		skip_spaces_and_comments();

		if (at_end())
			return make(TokenKind::eof, m_off, m_off);

		auto begin = m_off;
		auto c = cur();

		if (c == '\n' || c == '\r')
		{
			advance(c == '\r' && peek_char() == '\n' ? 2 : 1);
			return make(TokenKind::newline, begin, m_off);
		}

		if (c == '"')
			return lex_string_like(begin, '"', TokenKind::string);

		if (c == '\'')
			return lex_string_like(begin,
								   '\'',
								   m_opt.asm_syntax ? TokenKind::char_literal : TokenKind::string);

		if (is_ascii_digit(c))
			return lex_number(begin);

		if (is_ident_start(c))
			return lex_identifier(begin);

		if (c == '#' && !m_opt.asm_syntax)
			return lex_directive(begin);

		if (c == '{' && m_in_asm_header && m_asm_parens == 0)
			return lex_asm_body(begin);

		auto n = peek_char();

		switch (c)
		{
			case '(':
				return punct(TokenKind::lparen, begin, 1);
			case ')':
				return punct(TokenKind::rparen, begin, 1);
			case '[':
				return punct(TokenKind::lbracket, begin, 1);
			case ']':
				return punct(TokenKind::rbracket, begin, 1);
			case '{':
				return punct(TokenKind::lbrace, begin, 1);
			case '}':
				return punct(TokenKind::rbrace, begin, 1);

			case ',':
				return punct(TokenKind::comma, begin, 1);
			case ';':
				return punct(TokenKind::semicolon, begin, 1);
			case ':':
				if (n == ':')
					return punct(TokenKind::coloncolon, begin, 2);
				return punct(TokenKind::colon, begin, 1);
			case '.':
				if (n == '.' && peek_char(2) == '.')
					return punct(TokenKind::ellipsis, begin, 3);
				return punct(TokenKind::dot, begin, 1);

			case '$':
				return punct(TokenKind::dollar, begin, 1);
			case '?':
				return punct(TokenKind::question, begin, 1);

			case '+':
				if (n == '=')
					return punct(TokenKind::plus_eq, begin, 2);
				return punct(TokenKind::plus, begin, 1);
			case '-':
				if (n == '=')
					return punct(TokenKind::minus_eq, begin, 2);
				if (n == '>')
					return punct(TokenKind::arrow, begin, 2);
				return punct(TokenKind::minus, begin, 1);
			case '*':
				if (n == '=')
					return punct(TokenKind::star_eq, begin, 2);
				return punct(TokenKind::star, begin, 1);
			case '/':
				if (n == '=')
					return punct(TokenKind::slash_eq, begin, 2);
				return punct(TokenKind::slash, begin, 1);
			case '%':
				return punct(TokenKind::percent, begin, 1);

			case '~':
				return punct(TokenKind::tilde, begin, 1);
			case '^':
				return punct(TokenKind::caret, begin, 1);

			case '!':
				if (n == '=')
					return punct(TokenKind::ne, begin, 2);
				return punct(TokenKind::bang, begin, 1);

			case '&':
				if (n == '&')
					return punct(TokenKind::andand, begin, 2);
				return punct(TokenKind::amp, begin, 1);

			case '|':
				if (n == '|')
					return punct(TokenKind::oror, begin, 2);
				return punct(TokenKind::pipe, begin, 1);

			case '=':
				if (n == '=')
					return punct(TokenKind::eqeq, begin, 2);
				if (n == '>')
					return punct(TokenKind::fat_arrow, begin, 2);
				return punct(TokenKind::eq, begin, 1);

			case '<':
				if (n == '=')
					return punct(TokenKind::le, begin, 2);
				if (n == '<')
					return punct(TokenKind::shl, begin, 2);
				return punct(TokenKind::lt, begin, 1);

			case '>':
				if (n == '=')
					return punct(TokenKind::ge, begin, 2);
				if (n == '>')
					return punct(TokenKind::shr, begin, 2);
				return punct(TokenKind::gt, begin, 1);
		}

		advance();
		add_error(begin, m_off, "invalid character '" + describe_char(c) + "'");
		return make(TokenKind::invalid, begin, m_off);
	}

	std::optional<std::string> unescape_string(std::string_view quoted)
	{
		if (quoted.size() < 2)
			return std::string(quoted);

		auto body = quoted.substr(1, quoted.size() - 2);

		std::string out{};
		out.reserve(body.size());

		for (std::size_t i = 0; i < body.size(); ++i)
		{
			auto c = body[i];
			if (c != '\\')
			{
				out.push_back(c);
				continue;
			}

			if (++i >= body.size())
				return std::nullopt;

			switch (body[i])
			{
				case 'n':
					out.push_back('\n');
					break;
				case 't':
					out.push_back('\t');
					break;
				case 'r':
					out.push_back('\r');
					break;
				case '0':
					out.push_back('\0');
					break;
				case '\\':
				case '"':
				case '\'':
					out.push_back(body[i]);
					break;
				default:
					return std::nullopt;
			}
		}

		return out;
	}

} // namespace pryzma::lex
