#ifndef PRYZMA_FE_PARSER_HH
#define PRYZMA_FE_PARSER_HH

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>
#include <pryzma/Error.hh>
#include <pryzma/fe/Ast.hh>
#include <pryzma/lex/Tokens.hh>

namespace pryzma::fe
{
	// Builds a Program from an expanded token stream. The first error ends the
	// parse and no partial program is returned.
	class Parser
	{
	public:
		// `tokens` must end with an eof token and outlive the parser.
		explicit Parser(std::span<const lex::Token> tokens) noexcept;

		[[nodiscard]] ErrorOr<Program> parse_program();

	private:
		[[nodiscard]] bool at_end() const noexcept;
		[[nodiscard]] lex::Token const& cur() const noexcept;
		[[nodiscard]] lex::Token const& next() const noexcept;
		[[nodiscard]] lex::TokenKind peek_past_newlines() const noexcept;

		void advance() noexcept;
		bool accept(lex::TokenKind k) noexcept;
		lex::Token consume() noexcept;
		bool expect(lex::TokenKind k, std::string_view message);

		void skip_newlines() noexcept;
		void skip_separators() noexcept;
		void skip_insignificant() noexcept;

		// Inside `()` and `[]` newlines are not statement ends; inside `{}`
		// they are again.
		void push_newline_mode(bool skip) noexcept;
		void pop_newline_mode() noexcept;

		void add_error(SourceSpan span, std::string message);
		void error_unexpected(std::string_view expected);
		[[nodiscard]] bool failed() const noexcept { return m_error.has_value(); }

		[[nodiscard]] bool at_stmt_end() const noexcept;
		bool expect_stmt_end();

		bool parse_block(StmtList& out, std::string_view what);
		StmtPtr parse_stmt();
		StmtPtr parse_stmt_let();
		StmtPtr parse_stmt_fn();
		StmtPtr parse_stmt_return();
		StmtPtr parse_stmt_if();
		StmtPtr parse_stmt_while();
		StmtPtr parse_stmt_for();
		StmtPtr parse_stmt_struct();
		StmtPtr parse_stmt_use();
		StmtPtr parse_stmt_export();
		StmtPtr parse_stmt_try();
		StmtPtr parse_stmt_throw();
		StmtPtr parse_stmt_asm();
		StmtPtr parse_stmt_directive();
		StmtPtr parse_stmt_expr_or_assign();

		std::shared_ptr<FnDecl> parse_fn_rest(SourceSpan start, std::string name);
		bool parse_params(std::vector<Param>& out);

		bool parse_asm_location(AsmLocation& out);
		bool parse_asm_inputs(AsmDecl& decl);
		bool parse_asm_outputs(AsmDecl& decl);
		bool parse_u64(std::uint64_t& out, std::string_view what);

		void skip_raw_group();

		ExprPtr parse_expr(std::size_t min_prec = 0);
		ExprPtr parse_unary();
		ExprPtr parse_postfix();
		ExprPtr parse_primary();
		bool parse_call_args(std::vector<CallArg>& out);

		[[nodiscard]] static std::optional<BinaryOp> token_to_binary_op(lex::TokenKind k) noexcept;
		[[nodiscard]] static std::size_t precedence(BinaryOp op) noexcept;

		[[nodiscard]] SourceSpan prev_span() const noexcept;

		std::span<const lex::Token> m_tokens{};
		std::size_t m_index{};

		std::vector<bool> m_skip_newlines{};

		// Open expressions and blocks.
		std::size_t m_depth{};

		std::optional<Error> m_error{};
	};

	// `identifier 'foo'`, `'('`, `end of file`: how a token is named in errors.
	[[nodiscard]] std::string describe_token(lex::Token const& tok);

} // namespace pryzma::fe

#endif /* PRYZMA_FE_PARSER_HH */
