#ifndef PRYZMA_FE_AST_HH
#define PRYZMA_FE_AST_HH

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>
#include <pryzma/support/Span.hh>

namespace pryzma::fe
{
	enum class UnaryOp
	{
		minus,
		bit_not,
		log_not,
	};

	enum class BinaryOp
	{
		add,
		sub,
		mul,
		div,
		mod,

		shl,
		shr,

		bit_and,
		bit_or,
		bit_xor,

		log_and,
		log_or,

		eq,
		ne,
		lt,
		le,
		gt,
		ge,
	};

	struct Expr;
	struct Stmt;

	using ExprPtr = std::unique_ptr<Expr>;
	using StmtPtr = std::unique_ptr<Stmt>;
	using StmtList = std::vector<StmtPtr>;

	struct Param
	{
		SourceSpan span{};
		std::string name{};
	};

	struct FnDecl
	{
		SourceSpan span{};
		std::string name{};
		std::vector<Param> params{};
		StmtList body{};
	};

	enum class FieldKind
	{
		required,
		defaulted,
		optional,
	};

	struct FieldDecl
	{
		SourceSpan span{};
		std::string name{};
		FieldKind kind{FieldKind::required};

		// Kept unevaluated; only set for `name = expr`.
		ExprPtr default_value{};
	};

	struct StructDecl
	{
		SourceSpan span{};
		std::string name{};
		std::vector<FieldDecl> fields{};

		[[nodiscard]] FieldDecl const* find_field(std::string_view field) const noexcept
		{
			for (auto const& f : fields)
				if (f.name == field)
					return &f;
			return nullptr;
		}
	};

	enum class AsmLocationKind
	{
		reg,
		mem,
	};

	// `rax`, `mem[16]` or `mem[16:5]`.
	struct AsmLocation
	{
		SourceSpan span{};
		AsmLocationKind kind{AsmLocationKind::reg};

		std::string reg{};
		std::uint64_t offset{};
		std::optional<std::uint64_t> length{};
	};

	struct AsmInput
	{
		AsmLocation loc{};
		ExprPtr value{};
	};

	struct AsmOutput
	{
		AsmLocation loc{};

		// Binding written back by an inline block; empty for callable blocks.
		std::string target{};
		SourceSpan target_span{};
	};

	struct AsmDecl
	{
		SourceSpan span{};

		// Empty for an inline block.
		std::string name{};
		std::vector<Param> params{};

		std::vector<AsmInput> inputs{};
		std::vector<AsmOutput> outputs{};
		std::optional<std::uint64_t> mem_size{};

		// The raw `{ ... }` text, braces included.
		SourceSpan body{};
	};

	struct ExprIdent
	{
		std::string name{};
	};

	struct ExprInt
	{
		std::int64_t value{};
	};

	struct ExprFloat
	{
		double value{};
	};

	struct ExprStr
	{
		std::string value{};
	};

	struct ExprBool
	{
		bool value{};
	};

	struct ExprNone
	{
	};

	struct ExprList
	{
		std::vector<ExprPtr> items{};
	};

	struct ExprUnary
	{
		UnaryOp op{};
		ExprPtr rhs{};
	};

	struct ExprBinary
	{
		BinaryOp op{};
		ExprPtr lhs{};
		ExprPtr rhs{};
	};

	struct CallArg
	{
		SourceSpan span{};

		// Set for `name: value`.
		std::string name{};
		ExprPtr value{};
	};

	struct ExprCall
	{
		ExprPtr callee{};
		std::vector<CallArg> args{};
	};

	struct ExprMember
	{
		ExprPtr object{};
		std::string name{};
		SourceSpan name_span{};
	};

	struct ExprIndex
	{
		ExprPtr object{};
		ExprPtr index{};
	};

	struct ExprFn
	{
		std::shared_ptr<FnDecl const> decl{};
	};

	struct Expr
	{
		SourceSpan span{};
		std::variant<ExprIdent,
					 ExprInt,
					 ExprFloat,
					 ExprStr,
					 ExprBool,
					 ExprNone,
					 ExprList,
					 ExprUnary,
					 ExprBinary,
					 ExprCall,
					 ExprMember,
					 ExprIndex,
					 ExprFn>
			node{};

		Expr() = default;

		template <class T> Expr(SourceSpan s, T v) : span(s), node(std::move(v)) {}
	};

	struct StmtExpr
	{
		SourceSpan span{};
		ExprPtr expr{};
	};

	struct StmtLet
	{
		SourceSpan span{};
		std::string name{};
		SourceSpan name_span{};
		ExprPtr value{};
	};

	// `target = value`, or `target op= value` when `op` is set.
	struct StmtAssign
	{
		SourceSpan span{};
		ExprPtr target{};
		std::optional<BinaryOp> op{};
		ExprPtr value{};
	};

	struct StmtFn
	{
		SourceSpan span{};
		std::shared_ptr<FnDecl const> decl{};
	};

	struct StmtReturn
	{
		SourceSpan span{};
		ExprPtr value{};
	};

	struct IfBranch
	{
		SourceSpan span{};
		ExprPtr cond{};
		StmtList body{};
	};

	struct StmtIf
	{
		SourceSpan span{};
		std::vector<IfBranch> branches{};
		StmtList else_body{};
		bool has_else{};
	};

	struct StmtWhile
	{
		SourceSpan span{};
		ExprPtr cond{};
		StmtList body{};
	};

	struct StmtFor
	{
		SourceSpan span{};
		std::string var{};
		ExprPtr iterable{};
		StmtList body{};
	};

	struct StmtBreak
	{
		SourceSpan span{};
	};

	struct StmtContinue
	{
		SourceSpan span{};
	};

	struct StmtStruct
	{
		SourceSpan span{};
		std::shared_ptr<StructDecl const> decl{};
	};

	struct StmtUse
	{
		SourceSpan span{};

		// `"lib/util"` keeps the path as written, `a::b::c` is joined with "::".
		std::string reference{};
		bool is_package{};

		std::string alias{};
		bool merge{};
	};

	struct StmtExport
	{
		SourceSpan span{};
		std::vector<Param> names{};
	};

	struct StmtTry
	{
		SourceSpan span{};
		StmtList body{};
		std::string err_name{};
		StmtList handler{};
	};

	struct StmtThrow
	{
		SourceSpan span{};
		ExprPtr value{};
	};

	struct StmtAsm
	{
		SourceSpan span{};
		std::shared_ptr<AsmDecl const> decl{};
	};

	enum class DirectiveKind
	{
		macro,
		keyword,
	};

	// A `#macro` or `#keyword` definition already registered by the expander.
	struct StmtDirective
	{
		SourceSpan span{};
		DirectiveKind kind{DirectiveKind::macro};
		std::string name{};
	};

	struct Stmt
	{
		using Node = std::variant<StmtExpr,
								  StmtLet,
								  StmtAssign,
								  StmtFn,
								  StmtReturn,
								  StmtIf,
								  StmtWhile,
								  StmtFor,
								  StmtBreak,
								  StmtContinue,
								  StmtStruct,
								  StmtUse,
								  StmtExport,
								  StmtTry,
								  StmtThrow,
								  StmtAsm,
								  StmtDirective>;

		Node node{};

		template <class T> explicit Stmt(T v) : node(std::move(v)) {}

		[[nodiscard]] SourceSpan span() const noexcept
		{
			return std::visit([](auto const& s) { return s.span; }, node);
		}
	};

	struct Program
	{
		FileId file{};
		StmtList stmts{};
	};

} // namespace pryzma::fe

#endif /* PRYZMA_FE_AST_HH */
