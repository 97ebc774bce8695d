#include <algorithm>
#include <cstdint>
#include <limits>
#include <utility>
#include <pryzma/fe/Parser.hh>
#include <pryzma/lex/Lexer.hh>

namespace pryzma::fe
{
	namespace
	{
		constexpr std::uint64_t int64_min_magnitude = std::uint64_t{1} << 63;

		// Counts open brackets, blocks and the links of left-nested operator and
		// postfix chains, so the evaluator's recursion is bounded as well.
		constexpr std::size_t max_nesting_depth = 1000;

		class NestingGuard
		{
		public:
			explicit NestingGuard(std::size_t& depth) noexcept : m_depth(&depth) {}
			~NestingGuard() { *m_depth -= m_levels; }

			NestingGuard(NestingGuard const&) = delete;
			NestingGuard& operator=(NestingGuard const&) = delete;

			[[nodiscard]] bool enter() noexcept
			{
				++*m_depth;
				++m_levels;
				return *m_depth <= max_nesting_depth;
			}

		private:
			std::size_t* m_depth{};
			std::size_t m_levels{};
		};

	} // namespace

	std::string describe_token(lex::Token const& tok)
	{
		switch (tok.kind)
		{
			case lex::TokenKind::identifier:
				return "identifier '" + std::string(tok.lexeme) + "'";
			case lex::TokenKind::integer:
			case lex::TokenKind::floating:
				return "number '" + std::string(tok.lexeme) + "'";
			case lex::TokenKind::string:
				return "string " + std::string(tok.lexeme);
			default:
				return std::string(lex::token_kind_name(tok.kind));
		}
	}

	Parser::Parser(std::span<const lex::Token> tokens) noexcept : m_tokens(tokens) {}

	bool Parser::at_end() const noexcept
	{
		return cur().is(lex::TokenKind::eof);
	}

	lex::Token const& Parser::cur() const noexcept
	{
		if (m_tokens.empty())
		{
			static lex::Token const empty{lex::TokenKind::eof};
			return empty;
		}

		if (m_index >= m_tokens.size())
			return m_tokens.back();

		return m_tokens[m_index];
	}

	lex::Token const& Parser::next() const noexcept
	{
		if (m_tokens.empty())
			return cur();

		auto next_index = m_index + 1;
		if (next_index >= m_tokens.size())
			return m_tokens.back();

		return m_tokens[next_index];
	}

	lex::TokenKind Parser::peek_past_newlines() const noexcept
	{
		auto i = m_index;
		while (i < m_tokens.size() && m_tokens[i].is(lex::TokenKind::newline))
			++i;

		if (i >= m_tokens.size())
			return lex::TokenKind::eof;

		return m_tokens[i].kind;
	}

	void Parser::advance() noexcept
	{
		if (m_index + 1 < m_tokens.size())
			++m_index;

		skip_insignificant();
	}

	bool Parser::accept(lex::TokenKind k) noexcept
	{
		if (!cur().is(k))
			return false;

		advance();
		return true;
	}

	lex::Token Parser::consume() noexcept
	{
		auto t = cur();
		advance();
		return t;
	}

	bool Parser::expect(lex::TokenKind k, std::string_view message)
	{
		if (cur().is(k))
		{
			advance();
			return true;
		}

		error_unexpected(message);
		return false;
	}

	void Parser::skip_newlines() noexcept
	{
		while (cur().is(lex::TokenKind::newline) && m_index + 1 < m_tokens.size())
			++m_index;
	}

	void Parser::skip_separators() noexcept
	{
		while ((cur().is(lex::TokenKind::newline) || cur().is(lex::TokenKind::semicolon))
			   && m_index + 1 < m_tokens.size())
			++m_index;
	}

	void Parser::skip_insignificant() noexcept
	{
		if (!m_skip_newlines.empty() && m_skip_newlines.back())
			skip_newlines();
	}

	void Parser::push_newline_mode(bool skip) noexcept
	{
		m_skip_newlines.push_back(skip);
	}

	void Parser::pop_newline_mode() noexcept
	{
		if (!m_skip_newlines.empty())
			m_skip_newlines.pop_back();
	}

	void Parser::add_error(SourceSpan span, std::string message)
	{
		if (!m_error)
			m_error = make_error(ErrorKind::parse_error, span, std::move(message));
	}

	void Parser::error_unexpected(std::string_view expected)
	{
		add_error(cur().span,
				  "expected " + std::string(expected) + ", found " + describe_token(cur()));
	}

	SourceSpan Parser::prev_span() const noexcept
	{
		auto i = std::min(m_index, m_tokens.size());
		while (i > 0)
		{
			--i;
			if (!m_tokens[i].is(lex::TokenKind::newline))
				return m_tokens[i].span;
		}

		return cur().span;
	}

	bool Parser::at_stmt_end() const noexcept
	{
		auto k = cur().kind;
		return lex::is_statement_end(k) || k == lex::TokenKind::rbrace;
	}

	bool Parser::expect_stmt_end()
	{
		if (cur().is(lex::TokenKind::newline) || cur().is(lex::TokenKind::semicolon))
		{
			advance();
			return true;
		}

		if (at_stmt_end())
			return true;

		error_unexpected("end of statement");
		return false;
	}

	ErrorOr<Program> Parser::parse_program()
	{
		Program prog{};
		if (!m_tokens.empty())
			prog.file = m_tokens.back().span.id;

		skip_separators();

		while (!at_end() && !failed())
		{
			if (cur().is(lex::TokenKind::rbrace))
			{
				error_unexpected("statement");
				break;
			}

			auto stmt = parse_stmt();
			if (failed() || !expect_stmt_end())
				break;

			prog.stmts.push_back(std::move(stmt));
			skip_separators();
		}

		if (m_error)
			return std::move(*m_error);

		return prog;
	}

	bool Parser::parse_block(StmtList& out, std::string_view what)
	{
		if (!cur().is(lex::TokenKind::lbrace))
		{
			error_unexpected("'{' to open " + std::string(what));
			return false;
		}

		NestingGuard nesting(m_depth);
		if (!nesting.enter())
		{
			add_error(cur().span, "blocks nested too deeply");
			return false;
		}

		auto open_span = cur().span;
		push_newline_mode(false);
		advance();
		skip_separators();

		while (!cur().is(lex::TokenKind::rbrace))
		{
			if (at_end())
			{
				add_error(open_span, "unterminated " + std::string(what));
				return false;
			}

			auto stmt = parse_stmt();
			if (failed() || !expect_stmt_end())
				return false;

			out.push_back(std::move(stmt));
			skip_separators();
		}

		pop_newline_mode();
		advance();
		return true;
	}

	StmtPtr Parser::parse_stmt()
	{
		switch (cur().kind)
		{
			case lex::TokenKind::kw_let:
				return parse_stmt_let();
			case lex::TokenKind::kw_fn:
				if (next().is(lex::TokenKind::identifier))
					return parse_stmt_fn();
				return parse_stmt_expr_or_assign();
			case lex::TokenKind::kw_return:
				return parse_stmt_return();
			case lex::TokenKind::kw_if:
				return parse_stmt_if();
			case lex::TokenKind::kw_while:
				return parse_stmt_while();
			case lex::TokenKind::kw_for:
				return parse_stmt_for();
			case lex::TokenKind::kw_break:
				return std::make_unique<Stmt>(StmtBreak{consume().span});
			case lex::TokenKind::kw_continue:
				return std::make_unique<Stmt>(StmtContinue{consume().span});
			case lex::TokenKind::kw_struct:
				return parse_stmt_struct();
			case lex::TokenKind::kw_use:
				return parse_stmt_use();
			case lex::TokenKind::kw_export:
				return parse_stmt_export();
			case lex::TokenKind::kw_try:
				return parse_stmt_try();
			case lex::TokenKind::kw_throw:
				return parse_stmt_throw();
			case lex::TokenKind::kw_asm:
				return parse_stmt_asm();
			case lex::TokenKind::dir_macro:
			case lex::TokenKind::dir_keyword:
				return parse_stmt_directive();
			case lex::TokenKind::dir_insert:
				add_error(cur().span, "'#insert' reached the parser unexpanded");
				return nullptr;
			default:
				return parse_stmt_expr_or_assign();
		}
	}

	StmtPtr Parser::parse_stmt_let()
	{
		auto start = consume();

		if (!cur().is(lex::TokenKind::identifier))
		{
			error_unexpected("variable name after 'let'");
			return nullptr;
		}

		auto name = consume();

		StmtLet s{};
		s.name = std::string(name.lexeme);
		s.name_span = name.span;

		if (accept(lex::TokenKind::eq))
		{
			s.value = parse_expr();
			if (!s.value)
				return nullptr;
		}
		else if (!at_stmt_end())
		{
			error_unexpected("'=' or end of statement");
			return nullptr;
		}

		s.span = merge_spans(start.span, prev_span());
		return std::make_unique<Stmt>(std::move(s));
	}

	StmtPtr Parser::parse_stmt_fn()
	{
		auto start = consume();
		auto name = consume();

		auto decl = parse_fn_rest(start.span, std::string(name.lexeme));
		if (!decl)
			return nullptr;

		auto span = decl->span;
		return std::make_unique<Stmt>(StmtFn{span, std::move(decl)});
	}

	std::shared_ptr<FnDecl> Parser::parse_fn_rest(SourceSpan start, std::string name)
	{
		auto decl = std::make_shared<FnDecl>();
		decl->name = std::move(name);

		if (!parse_params(decl->params))
			return nullptr;

		if (!parse_block(decl->body, "function body"))
			return nullptr;

		decl->span = merge_spans(start, prev_span());
		return decl;
	}

	bool Parser::parse_params(std::vector<Param>& out)
	{
		if (!cur().is(lex::TokenKind::lparen))
		{
			error_unexpected("'(' to open the parameter list");
			return false;
		}

		push_newline_mode(true);
		advance();

		while (!cur().is(lex::TokenKind::rparen))
		{
			if (!cur().is(lex::TokenKind::identifier))
			{
				error_unexpected("parameter name");
				return false;
			}

			auto tok = consume();
			if (has_param(out, tok.lexeme))
			{
				add_error(tok.span, "duplicate parameter '" + std::string(tok.lexeme) + "'");
				return false;
			}

			out.push_back(Param{tok.span, std::string(tok.lexeme)});

			if (!accept(lex::TokenKind::comma))
				break;
		}

		pop_newline_mode();
		return expect(lex::TokenKind::rparen, "')' to close the parameter list");
	}

	StmtPtr Parser::parse_stmt_return()
	{
		auto start = consume();

		StmtReturn s{};
		if (!at_stmt_end())
		{
			s.value = parse_expr();
			if (!s.value)
				return nullptr;
		}

		s.span = merge_spans(start.span, prev_span());
		return std::make_unique<Stmt>(std::move(s));
	}

	StmtPtr Parser::parse_stmt_if()
	{
		auto start = consume();

		StmtIf s{};

		for (;;)
		{
			IfBranch branch{};
			branch.span = prev_span();
			branch.cond = parse_expr();
			if (!branch.cond)
				return nullptr;

			if (!parse_block(branch.body, "'if' body"))
				return nullptr;

			s.branches.push_back(std::move(branch));

			auto k = peek_past_newlines();
			if (k == lex::TokenKind::kw_elif)
			{
				skip_newlines();
				advance();
				continue;
			}

			if (k != lex::TokenKind::kw_else)
				break;

			skip_newlines();
			advance();

			if (accept(lex::TokenKind::kw_if))
				continue;

			if (!parse_block(s.else_body, "'else' body"))
				return nullptr;

			s.has_else = true;
			break;
		}

		s.span = merge_spans(start.span, prev_span());
		return std::make_unique<Stmt>(std::move(s));
	}

	StmtPtr Parser::parse_stmt_while()
	{
		auto start = consume();

		StmtWhile s{};
		s.cond = parse_expr();
		if (!s.cond)
			return nullptr;

		if (!parse_block(s.body, "'while' body"))
			return nullptr;

		s.span = merge_spans(start.span, prev_span());
		return std::make_unique<Stmt>(std::move(s));
	}

	StmtPtr Parser::parse_stmt_for()
	{
		auto start = consume();

		if (!cur().is(lex::TokenKind::identifier))
		{
			error_unexpected("loop variable after 'for'");
			return nullptr;
		}

		StmtFor s{};
		s.var = std::string(consume().lexeme);

		if (!expect(lex::TokenKind::kw_in, "'in'"))
			return nullptr;

		s.iterable = parse_expr();
		if (!s.iterable)
			return nullptr;

		if (!parse_block(s.body, "'for' body"))
			return nullptr;

		s.span = merge_spans(start.span, prev_span());
		return std::make_unique<Stmt>(std::move(s));
	}

	StmtPtr Parser::parse_stmt_struct()
	{
		auto start = consume();

		if (!cur().is(lex::TokenKind::identifier))
		{
			error_unexpected("struct name");
			return nullptr;
		}

		auto decl = std::make_shared<StructDecl>();
		decl->name = std::string(consume().lexeme);

		if (!cur().is(lex::TokenKind::lbrace))
		{
			error_unexpected("'{' to open struct fields");
			return nullptr;
		}

		auto open_span = cur().span;
		push_newline_mode(false);
		advance();

		for (;;)
		{
			skip_newlines();
			if (cur().is(lex::TokenKind::rbrace))
				break;

			if (at_end())
			{
				add_error(open_span, "unterminated struct declaration");
				return nullptr;
			}

			FieldDecl field{};
			auto field_start = cur().span;

			if (accept(lex::TokenKind::question))
				field.kind = FieldKind::optional;

			if (!cur().is(lex::TokenKind::identifier))
			{
				error_unexpected("field name");
				return nullptr;
			}

			auto name = consume();
			field.name = std::string(name.lexeme);

			if (decl->find_field(field.name))
			{
				add_error(name.span,
						  "duplicate field '" + field.name + "' in struct '" + decl->name + "'");
				return nullptr;
			}

			if (field.kind == FieldKind::required && accept(lex::TokenKind::eq))
			{
				field.kind = FieldKind::defaulted;
				field.default_value = parse_expr();
				if (!field.default_value)
					return nullptr;
			}

			field.span = merge_spans(field_start, prev_span());
			decl->fields.push_back(std::move(field));

			if (accept(lex::TokenKind::comma) || cur().is(lex::TokenKind::newline)
				|| cur().is(lex::TokenKind::rbrace))
				continue;

			error_unexpected("',' or '}' after field");
			return nullptr;
		}

		pop_newline_mode();
		advance();

		decl->span = merge_spans(start.span, prev_span());
		auto span = decl->span;
		return std::make_unique<Stmt>(StmtStruct{span, std::move(decl)});
	}

	StmtPtr Parser::parse_stmt_use()
	{
		auto start = consume();

		StmtUse s{};

		if (cur().is(lex::TokenKind::string))
		{
			auto tok = consume();
			auto path = lex::unescape_string(tok.lexeme);
			if (!path)
			{
				add_error(tok.span, "invalid escape sequence in module path");
				return nullptr;
			}
			s.reference = std::move(*path);
		}
		else if (cur().is(lex::TokenKind::identifier))
		{
			s.is_package = true;
			s.reference = std::string(consume().lexeme);

			while (accept(lex::TokenKind::coloncolon))
			{
				if (!cur().is(lex::TokenKind::identifier))
				{
					error_unexpected("module name after '::'");
					return nullptr;
				}
				s.reference += "::";
				s.reference += consume().lexeme;
			}
		}
		else
		{
			error_unexpected("module path after 'use'");
			return nullptr;
		}

		if (accept(lex::TokenKind::kw_as))
		{
			if (!cur().is(lex::TokenKind::identifier))
			{
				error_unexpected("alias name after 'as'");
				return nullptr;
			}
			s.alias = std::string(consume().lexeme);
		}

		if (accept(lex::TokenKind::kw_with))
		{
			if (!cur().is(lex::TokenKind::identifier) || cur().lexeme != "nan")
			{
				error_unexpected("'nan' after 'with'");
				return nullptr;
			}
			advance();
			s.merge = true;
		}

		s.span = merge_spans(start.span, prev_span());
		return std::make_unique<Stmt>(std::move(s));
	}

	StmtPtr Parser::parse_stmt_export()
	{
		auto start = consume();

		StmtExport s{};

		do
		{
			if (!cur().is(lex::TokenKind::identifier))
			{
				error_unexpected("name to export");
				return nullptr;
			}

			auto tok = consume();
			s.names.push_back(Param{tok.span, std::string(tok.lexeme)});
		} while (accept(lex::TokenKind::comma));

		s.span = merge_spans(start.span, prev_span());
		return std::make_unique<Stmt>(std::move(s));
	}

	StmtPtr Parser::parse_stmt_try()
	{
		auto start = consume();

		StmtTry s{};
		if (!parse_block(s.body, "'try' body"))
			return nullptr;

		if (peek_past_newlines() != lex::TokenKind::kw_catch)
		{
			error_unexpected("'catch' after 'try' block");
			return nullptr;
		}

		skip_newlines();
		advance();

		s.err_name = "err";
		if (cur().is(lex::TokenKind::identifier))
			s.err_name = std::string(consume().lexeme);

		if (!parse_block(s.handler, "'catch' body"))
			return nullptr;

		s.span = merge_spans(start.span, prev_span());
		return std::make_unique<Stmt>(std::move(s));
	}

	StmtPtr Parser::parse_stmt_throw()
	{
		auto start = consume();

		StmtThrow s{};
		s.value = parse_expr();
		if (!s.value)
			return nullptr;

		s.span = merge_spans(start.span, prev_span());
		return std::make_unique<Stmt>(std::move(s));
	}

	bool Parser::parse_u64(std::uint64_t& out, std::string_view what)
	{
		if (!cur().is(lex::TokenKind::integer))
		{
			error_unexpected(what);
			return false;
		}

		out = consume().integer.value;
		return true;
	}

	bool Parser::parse_asm_location(AsmLocation& out)
	{
		if (!cur().is(lex::TokenKind::identifier))
		{
			error_unexpected("register or 'mem[...]'");
			return false;
		}

		auto tok = consume();
		out.span = tok.span;

		if (tok.lexeme != "mem" || !cur().is(lex::TokenKind::lbracket))
		{
			out.kind = AsmLocationKind::reg;
			out.reg = std::string(tok.lexeme);
			return true;
		}

		out.kind = AsmLocationKind::mem;

		push_newline_mode(true);
		advance();

		if (!parse_u64(out.offset, "memory offset"))
			return false;

		if (accept(lex::TokenKind::colon))
		{
			std::uint64_t len{};
			if (!parse_u64(len, "memory length"))
				return false;
			out.length = len;
		}

		pop_newline_mode();
		if (!expect(lex::TokenKind::rbracket, "']' to close the memory slot"))
			return false;

		out.span = merge_spans(tok.span, prev_span());
		return true;
	}

	bool Parser::parse_asm_inputs(AsmDecl& decl)
	{
		push_newline_mode(true);
		advance();

		while (!cur().is(lex::TokenKind::rparen))
		{
			AsmInput in{};
			if (!parse_asm_location(in.loc))
				return false;

			if (!expect(lex::TokenKind::eq, "'=' after input location"))
				return false;

			in.value = parse_expr();
			if (!in.value)
				return false;

			decl.inputs.push_back(std::move(in));

			if (!accept(lex::TokenKind::comma))
				break;
		}

		pop_newline_mode();
		return expect(lex::TokenKind::rparen, "')' to close the input list");
	}

	bool Parser::parse_asm_outputs(AsmDecl& decl)
	{
		if (!cur().is(lex::TokenKind::lparen))
		{
			error_unexpected("'(' to open the output list");
			return false;
		}

		push_newline_mode(true);
		advance();

		while (!cur().is(lex::TokenKind::rparen))
		{
			AsmOutput out{};

			if (cur().is(lex::TokenKind::identifier) && next().is(lex::TokenKind::eq))
			{
				auto target = consume();
				out.target = std::string(target.lexeme);
				out.target_span = target.span;
				advance();
			}

			if (!parse_asm_location(out.loc))
				return false;

			if (decl.name.empty() && out.target.empty())
			{
				add_error(out.loc.span,
						  "inline assembly output needs a target, as in 'x = "
							  + std::string(out.loc.kind == AsmLocationKind::reg ? out.loc.reg
																				: "mem[0]")
							  + "'");
				return false;
			}

			decl.outputs.push_back(std::move(out));

			if (!accept(lex::TokenKind::comma))
				break;
		}

		pop_newline_mode();
		return expect(lex::TokenKind::rparen, "')' to close the output list");
	}

	StmtPtr Parser::parse_stmt_asm()
	{
		auto start = consume();
		auto decl = std::make_shared<AsmDecl>();

		if (cur().is(lex::TokenKind::identifier) && next().is(lex::TokenKind::lparen))
		{
			decl->name = std::string(consume().lexeme);
			if (!parse_params(decl->params))
				return nullptr;
		}

		if (cur().is(lex::TokenKind::lparen) && !parse_asm_inputs(*decl))
			return nullptr;

		if (accept(lex::TokenKind::arrow) && !parse_asm_outputs(*decl))
			return nullptr;

		if (cur().is(lex::TokenKind::identifier) && cur().lexeme == "mem")
		{
			advance();
			std::uint64_t size{};
			if (!parse_u64(size, "memory size after 'mem'"))
				return nullptr;
			decl->mem_size = size;
		}

		if (!cur().is(lex::TokenKind::asm_body))
		{
			error_unexpected("assembly body '{ ... }'");
			return nullptr;
		}

		decl->body = consume().span;
		decl->span = merge_spans(start.span, decl->body);

		auto span = decl->span;
		return std::make_unique<Stmt>(StmtAsm{span, std::move(decl)});
	}

	void Parser::skip_raw_group()
	{
		auto open_span = cur().span;
		std::size_t depth = 0;

		while (m_index + 1 < m_tokens.size())
		{
			auto const& tok = m_tokens[m_index];

			if (lex::is_open_bracket(tok.kind))
				++depth;
			else if (lex::is_close_bracket(tok.kind) && --depth == 0)
			{
				advance();
				return;
			}

			++m_index;
		}

		add_error(open_span, "unclosed bracket in directive");
	}

	StmtPtr Parser::parse_stmt_directive()
	{
		auto start = consume();

		StmtDirective s{};
		s.kind = start.is(lex::TokenKind::dir_macro) ? DirectiveKind::macro : DirectiveKind::keyword;

		if (!cur().is(lex::TokenKind::identifier))
		{
			error_unexpected("name after directive");
			return nullptr;
		}

		s.name = std::string(consume().lexeme);

		if (s.kind == DirectiveKind::macro)
		{
			if (cur().is(lex::TokenKind::lparen))
				skip_raw_group();
		}
		else
		{
			std::size_t depth = 0;
			while (!at_end() && !(depth == 0 && cur().is(lex::TokenKind::fat_arrow)))
			{
				if (lex::is_open_bracket(cur().kind))
					++depth;
				else if (lex::is_close_bracket(cur().kind) && depth > 0)
					--depth;
				++m_index;
			}

			if (!expect(lex::TokenKind::fat_arrow, "'=>' in keyword definition"))
				return nullptr;
		}

		if (!cur().is(lex::TokenKind::lbrace))
		{
			error_unexpected("'{' to open the directive body");
			return nullptr;
		}

		skip_raw_group();
		if (failed())
			return nullptr;

		s.span = merge_spans(start.span, prev_span());
		return std::make_unique<Stmt>(std::move(s));
	}

	StmtPtr Parser::parse_stmt_expr_or_assign()
	{
		auto expr = parse_expr();
		if (!expr)
			return nullptr;

		std::optional<BinaryOp> op{};
		switch (cur().kind)
		{
			case lex::TokenKind::eq:
				break;
			case lex::TokenKind::plus_eq:
				op = BinaryOp::add;
				break;
			case lex::TokenKind::minus_eq:
				op = BinaryOp::sub;
				break;
			case lex::TokenKind::star_eq:
				op = BinaryOp::mul;
				break;
			case lex::TokenKind::slash_eq:
				op = BinaryOp::div;
				break;
			default:
			{
				auto span = expr->span;
				return std::make_unique<Stmt>(StmtExpr{span, std::move(expr)});
			}
		}

		if (!is_assign_target(*expr))
		{
			add_error(expr->span, "invalid assignment target");
			return nullptr;
		}

		advance();

		StmtAssign s{};
		s.op = op;
		s.value = parse_expr();
		if (!s.value)
			return nullptr;

		s.span = merge_spans(expr->span, s.value->span);
		s.target = std::move(expr);
		return std::make_unique<Stmt>(std::move(s));
	}

	std::optional<BinaryOp> Parser::token_to_binary_op(lex::TokenKind k) noexcept
	{
		switch (k)
		{
			case lex::TokenKind::plus:
				return BinaryOp::add;
			case lex::TokenKind::minus:
				return BinaryOp::sub;
			case lex::TokenKind::star:
				return BinaryOp::mul;
			case lex::TokenKind::slash:
				return BinaryOp::div;
			case lex::TokenKind::percent:
				return BinaryOp::mod;

			case lex::TokenKind::shl:
				return BinaryOp::shl;
			case lex::TokenKind::shr:
				return BinaryOp::shr;

			case lex::TokenKind::amp:
				return BinaryOp::bit_and;
			case lex::TokenKind::pipe:
				return BinaryOp::bit_or;
			case lex::TokenKind::caret:
				return BinaryOp::bit_xor;

			case lex::TokenKind::andand:
			case lex::TokenKind::kw_and:
				return BinaryOp::log_and;
			case lex::TokenKind::oror:
			case lex::TokenKind::kw_or:
				return BinaryOp::log_or;

			case lex::TokenKind::eqeq:
				return BinaryOp::eq;
			case lex::TokenKind::ne:
				return BinaryOp::ne;
			case lex::TokenKind::lt:
				return BinaryOp::lt;
			case lex::TokenKind::le:
				return BinaryOp::le;
			case lex::TokenKind::gt:
				return BinaryOp::gt;
			case lex::TokenKind::ge:
				return BinaryOp::ge;

			default:
				return std::nullopt;
		}
	}

	std::size_t Parser::precedence(BinaryOp op) noexcept
	{
		switch (op)
		{
			case BinaryOp::log_or:
				return 1;
			case BinaryOp::log_and:
				return 2;

			case BinaryOp::bit_or:
				return 3;
			case BinaryOp::bit_xor:
				return 4;
			case BinaryOp::bit_and:
				return 5;

			case BinaryOp::eq:
			case BinaryOp::ne:
				return 6;

			case BinaryOp::lt:
			case BinaryOp::le:
			case BinaryOp::gt:
			case BinaryOp::ge:
				return 7;

			case BinaryOp::shl:
			case BinaryOp::shr:
				return 8;

			case BinaryOp::add:
			case BinaryOp::sub:
				return 9;

			case BinaryOp::mul:
			case BinaryOp::div:
			case BinaryOp::mod:
				return 10;
		}

		return 0;
	}

	ExprPtr Parser::parse_expr(std::size_t min_prec)
	{
		auto lhs = parse_unary();
		if (!lhs)
			return nullptr;

		NestingGuard nesting(m_depth);
		for (;;)
		{
			auto op = token_to_binary_op(cur().kind);
			if (!op)
				break;

			auto prec = precedence(*op);
			if (prec < min_prec)
				break;

			if (!nesting.enter())
			{
				add_error(cur().span, "expression nested too deeply");
				return nullptr;
			}
			advance();

			auto rhs = parse_expr(prec + 1);
			if (!rhs)
				return nullptr;

			auto span = merge_spans(lhs->span, rhs->span);
			lhs = std::make_unique<Expr>(span, ExprBinary{*op, std::move(lhs), std::move(rhs)});
		}

		return lhs;
	}

	ExprPtr Parser::parse_unary()
	{
		NestingGuard nesting(m_depth);
		if (!nesting.enter())
		{
			add_error(cur().span, "expression nested too deeply");
			return nullptr;
		}

		std::optional<UnaryOp> op{};
		switch (cur().kind)
		{
			case lex::TokenKind::minus:
				op = UnaryOp::minus;
				break;
			case lex::TokenKind::bang:
			case lex::TokenKind::kw_not:
				op = UnaryOp::log_not;
				break;
			case lex::TokenKind::tilde:
				op = UnaryOp::bit_not;
				break;
			default:
				return parse_postfix();
		}

		auto start = consume();

		if (*op == UnaryOp::minus && cur().is(lex::TokenKind::integer)
			&& cur().integer.base == lex::NumberBase::decimal
			&& cur().integer.value == int64_min_magnitude)
		{
			auto lit = consume();
			return std::make_unique<Expr>(merge_spans(start.span, lit.span),
										  ExprInt{std::numeric_limits<std::int64_t>::min()});
		}

		auto rhs = parse_unary();
		if (!rhs)
			return nullptr;

		auto span = merge_spans(start.span, rhs->span);
		return std::make_unique<Expr>(span, ExprUnary{*op, std::move(rhs)});
	}

	bool Parser::parse_call_args(std::vector<CallArg>& out)
	{
		push_newline_mode(true);
		advance();

		auto seen_named = false;
		while (!cur().is(lex::TokenKind::rparen))
		{
			CallArg arg{};
			arg.span = cur().span;

			if (cur().is(lex::TokenKind::identifier) && next().is(lex::TokenKind::colon))
			{
				arg.name = std::string(consume().lexeme);
				advance();
				seen_named = true;
			}
			else if (seen_named)
			{
				add_error(cur().span, "positional argument after a named argument");
				return false;
			}

			arg.value = parse_expr();
			if (!arg.value)
				return false;

			arg.span = merge_spans(arg.span, arg.value->span);
			out.push_back(std::move(arg));

			if (!accept(lex::TokenKind::comma))
				break;
		}

		pop_newline_mode();
		return expect(lex::TokenKind::rparen, "')' to close the argument list");
	}

	ExprPtr Parser::parse_postfix()
	{
		auto e = parse_primary();
		if (!e)
			return nullptr;

		NestingGuard nesting(m_depth);
		for (;;)
		{
			auto postfix = cur().is(lex::TokenKind::lparen) || cur().is(lex::TokenKind::dot)
						   || cur().is(lex::TokenKind::lbracket);
			if (postfix && !nesting.enter())
			{
				add_error(cur().span, "expression nested too deeply");
				return nullptr;
			}

			if (cur().is(lex::TokenKind::lparen))
			{
				ExprCall call{};
				if (!parse_call_args(call.args))
					return nullptr;

				auto span = merge_spans(e->span, prev_span());
				call.callee = std::move(e);
				e = std::make_unique<Expr>(span, std::move(call));
				continue;
			}

			if (cur().is(lex::TokenKind::dot))
			{
				advance();
				if (!cur().is(lex::TokenKind::identifier))
				{
					error_unexpected("field name after '.'");
					return nullptr;
				}

				auto name = consume();
				auto span = merge_spans(e->span, name.span);
				e = std::make_unique<Expr>(
					span, ExprMember{std::move(e), std::string(name.lexeme), name.span});
				continue;
			}

			if (cur().is(lex::TokenKind::lbracket))
			{
				push_newline_mode(true);
				advance();

				auto index = parse_expr();
				if (!index)
					return nullptr;

				pop_newline_mode();
				if (!expect(lex::TokenKind::rbracket, "']' to close the index"))
					return nullptr;

				auto span = merge_spans(e->span, prev_span());
				e = std::make_unique<Expr>(span, ExprIndex{std::move(e), std::move(index)});
				continue;
			}

			return e;
		}
	}

	ExprPtr Parser::parse_primary()
	{
		auto const& tok = cur();

		switch (tok.kind)
		{
			case lex::TokenKind::integer:
			{
				auto lit = consume();
				if (lit.integer.base == lex::NumberBase::decimal
					&& lit.integer.value
						   > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max()))
				{
					add_error(lit.span, "integer literal '" + std::string(lit.lexeme) + "' is out of range");
					return nullptr;
				}

				return std::make_unique<Expr>(lit.span,
											  ExprInt{static_cast<std::int64_t>(lit.integer.value)});
			}

			case lex::TokenKind::floating:
			{
				auto lit = consume();
				return std::make_unique<Expr>(lit.span, ExprFloat{lit.real});
			}

			case lex::TokenKind::string:
			{
				auto lit = consume();
				auto text = lex::unescape_string(lit.lexeme);
				if (!text)
				{
					add_error(lit.span, "invalid escape sequence in string");
					return nullptr;
				}
				return std::make_unique<Expr>(lit.span, ExprStr{std::move(*text)});
			}

			case lex::TokenKind::kw_true:
			case lex::TokenKind::kw_false:
			{
				auto lit = consume();
				return std::make_unique<Expr>(lit.span, ExprBool{lit.is(lex::TokenKind::kw_true)});
			}

			case lex::TokenKind::kw_none:
				return std::make_unique<Expr>(consume().span, ExprNone{});

			case lex::TokenKind::identifier:
			{
				auto id = consume();
				return std::make_unique<Expr>(id.span, ExprIdent{std::string(id.lexeme)});
			}

			case lex::TokenKind::lparen:
			{
				push_newline_mode(true);
				advance();

				auto inner = parse_expr();
				if (!inner)
					return nullptr;

				pop_newline_mode();
				if (!expect(lex::TokenKind::rparen, "')'"))
					return nullptr;

				return inner;
			}

			case lex::TokenKind::lbracket:
			{
				auto start = cur().span;
				push_newline_mode(true);
				advance();

				ExprList list{};
				while (!cur().is(lex::TokenKind::rbracket))
				{
					auto item = parse_expr();
					if (!item)
						return nullptr;

					list.items.push_back(std::move(item));
					if (!accept(lex::TokenKind::comma))
						break;
				}

				pop_newline_mode();
				if (!expect(lex::TokenKind::rbracket, "']' to close the list"))
					return nullptr;

				return std::make_unique<Expr>(merge_spans(start, prev_span()), std::move(list));
			}

			case lex::TokenKind::kw_fn:
			{
				auto start = consume();
				auto decl = parse_fn_rest(start.span, {});
				if (!decl)
					return nullptr;

				auto span = decl->span;
				return std::make_unique<Expr>(span, ExprFn{std::move(decl)});
			}

			default:
				error_unexpected("expression");
				return nullptr;
		}
	}

} // namespace pryzma::fe
