#ifndef PRYZMA_RT_EVALUATOR_HH
#define PRYZMA_RT_EVALUATOR_HH

#include <cstddef>
#include <functional>
#include <iosfwd>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <unordered_map>
#include <vector>
#include <pryzma/Error.hh>
#include <pryzma/fe/Ast.hh>
#include <pryzma/rt/Environment.hh>
#include <pryzma/rt/FrameCollector.hh>
#include <pryzma/rt/Module.hh>
#include <pryzma/rt/Value.hh>
#include <pryzma/support/SourceManager.hh>
#include <pryzma/x86/Instruction.hh>

namespace pryzma::rt
{
	struct EvalLimits
	{
		std::size_t max_call_depth{256};

		std::size_t asm_stack_reserve{256};
		std::size_t asm_max_steps{1000000};
	};

	enum class StepPhase
	{
		before,
		after,
	};

	struct StepEvent
	{
		StepPhase phase{StepPhase::before};
		SourceSpan span{};
		Environment const* env{};
	};

	using StepHook = std::function<void(StepEvent const&)>;

	// Resolves and loads the module named by a `use` statement.
	class ModuleLoader
	{
	public:
		virtual ~ModuleLoader() = default;

		[[nodiscard]] virtual ErrorOr<std::shared_ptr<Module>> load(fe::StmtUse const& use,
																	 FileId from) = 0;
	};

	// An evaluated call argument; `name` is set for `name: value`.
	struct Arg
	{
		std::string name{};
		Value value{};
		SourceSpan span{};
	};

	enum class FlowKind
	{
		normal,
		break_loop,
		continue_loop,
		return_value,
	};

	struct Flow
	{
		FlowKind kind{FlowKind::normal};

		// For `return`, the returned value; for a normal flow, the value of
		// the last statement when it was an expression statement.
		Value value{};
	};

	class Evaluator
	{
	public:
		Evaluator(SourceManager const& sources, std::ostream& out, EvalLimits limits = {});

		Evaluator(Evaluator const&) = delete;
		Evaluator& operator=(Evaluator const&) = delete;

		void set_loader(ModuleLoader* loader) noexcept { m_loader = loader; }
		void set_step_hook(StepHook hook) { m_step_hook = std::move(hook); }

		[[nodiscard]] std::ostream& out() noexcept { return *m_out; }
		void set_output(std::ostream& out) noexcept { m_out = &out; }

		[[nodiscard]] SourceManager const& sources() const noexcept { return *m_sources; }
		[[nodiscard]] EvalLimits const& limits() const noexcept { return m_limits; }
		[[nodiscard]] FrameCollector const& frames() const noexcept { return m_frames; }
		std::size_t collect_frames(std::span<std::shared_ptr<Environment> const> closing = {})
		{
			return m_frames.collect(closing);
		}

		// Runs a module body in `env`. `module` collects `export` statements;
		// it may be null for code that is not a module.
		[[nodiscard]] ErrorOr<Value>
		run_program(fe::Program const& prog, std::shared_ptr<Environment> const& env, Module* module);

		[[nodiscard]] ErrorOr<Value> eval(fe::Expr const& expr, std::shared_ptr<Environment> const& env);

		[[nodiscard]] ErrorOr<Value> call(Value const& callee, std::vector<Arg> args, SourceSpan where);

		[[nodiscard]] ErrorOr<Value> construct(std::shared_ptr<StructType const> const& type,
											   std::vector<Arg> args,
											   SourceSpan where);

	private:
		[[nodiscard]] ErrorOr<Flow> exec_block(fe::StmtList const& stmts,
											   std::shared_ptr<Environment> const& env);
		[[nodiscard]] ErrorOr<Flow> exec(fe::Stmt const& stmt, std::shared_ptr<Environment> const& env);

		[[nodiscard]] ErrorOr<Flow> exec_node(fe::StmtExpr const& s, std::shared_ptr<Environment> const& env);
		[[nodiscard]] ErrorOr<Flow> exec_node(fe::StmtLet const& s, std::shared_ptr<Environment> const& env);
		[[nodiscard]] ErrorOr<Flow> exec_node(fe::StmtAssign const& s, std::shared_ptr<Environment> const& env);
		[[nodiscard]] ErrorOr<Flow> exec_node(fe::StmtFn const& s, std::shared_ptr<Environment> const& env);
		[[nodiscard]] ErrorOr<Flow> exec_node(fe::StmtReturn const& s, std::shared_ptr<Environment> const& env);
		[[nodiscard]] ErrorOr<Flow> exec_node(fe::StmtIf const& s, std::shared_ptr<Environment> const& env);
		[[nodiscard]] ErrorOr<Flow> exec_node(fe::StmtWhile const& s, std::shared_ptr<Environment> const& env);
		[[nodiscard]] ErrorOr<Flow> exec_node(fe::StmtFor const& s, std::shared_ptr<Environment> const& env);
		[[nodiscard]] ErrorOr<Flow> exec_node(fe::StmtBreak const& s, std::shared_ptr<Environment> const& env);
		[[nodiscard]] ErrorOr<Flow> exec_node(fe::StmtContinue const& s, std::shared_ptr<Environment> const& env);
		[[nodiscard]] ErrorOr<Flow> exec_node(fe::StmtStruct const& s, std::shared_ptr<Environment> const& env);
		[[nodiscard]] ErrorOr<Flow> exec_node(fe::StmtUse const& s, std::shared_ptr<Environment> const& env);
		[[nodiscard]] ErrorOr<Flow> exec_node(fe::StmtExport const& s, std::shared_ptr<Environment> const& env);
		[[nodiscard]] ErrorOr<Flow> exec_node(fe::StmtTry const& s, std::shared_ptr<Environment> const& env);
		[[nodiscard]] ErrorOr<Flow> exec_node(fe::StmtThrow const& s, std::shared_ptr<Environment> const& env);
		[[nodiscard]] ErrorOr<Flow> exec_node(fe::StmtAsm const& s, std::shared_ptr<Environment> const& env);
		[[nodiscard]] ErrorOr<Flow> exec_node(fe::StmtDirective const& s, std::shared_ptr<Environment> const& env);

		[[nodiscard]] ErrorOr<Value> eval_ident(fe::ExprIdent const& e, SourceSpan span, Environment const& env);
		[[nodiscard]] ErrorOr<Value> eval_logical(fe::ExprBinary const& e, std::shared_ptr<Environment> const& env);
		[[nodiscard]] ErrorOr<Value> eval_call(fe::ExprCall const& e, SourceSpan span, std::shared_ptr<Environment> const& env);
		[[nodiscard]] ErrorOr<Value> eval_member(fe::ExprMember const& e, SourceSpan span, std::shared_ptr<Environment> const& env);
		[[nodiscard]] ErrorOr<Value> eval_index(fe::ExprIndex const& e, SourceSpan span, std::shared_ptr<Environment> const& env);

		[[nodiscard]] ErrorOr<std::vector<Arg>> eval_args(std::vector<fe::CallArg> const& args,
														  std::shared_ptr<Environment> const& env);

		// The module an expression such as `u` or `u.inner` names, if any.
		[[nodiscard]] std::shared_ptr<Module> module_of(fe::Expr const& expr, Environment const& env) const;
		[[nodiscard]] std::shared_ptr<StructType const> struct_of(fe::Expr const& expr, Environment const& env) const;

		[[nodiscard]] Status assign_name(std::string const& name, Value value, SourceSpan span, Environment& env);

		[[nodiscard]] ErrorOr<Value> call_function(FunctionObject const& fn, std::vector<Arg> args, SourceSpan where);
		[[nodiscard]] ErrorOr<Value> call_asm(AsmObject const& block, std::vector<Arg> args, SourceSpan where);

		// Runs a block against a fresh machine and returns its exit values in
		// declaration order. Nothing is written back here.
		[[nodiscard]] ErrorOr<std::vector<Value>> run_asm(std::shared_ptr<fe::AsmDecl const> const& decl,
														  std::shared_ptr<Environment> const& env);
		[[nodiscard]] ErrorOr<std::shared_ptr<x86::AsmProgram const>>
		decoded(std::shared_ptr<fe::AsmDecl const> const& decl);

		[[nodiscard]] ErrorOr<bool> condition(fe::Expr const& expr, std::shared_ptr<Environment> const& env);

		void step(StepPhase phase, SourceSpan span, Environment const& env) const;

		SourceManager const* m_sources{};
		std::ostream* m_out{};
		EvalLimits m_limits{};

		ModuleLoader* m_loader{};
		StepHook m_step_hook{};

		std::size_t m_call_depth{};

		// Nested run_program and call entries; frames are swept at zero.
		std::size_t m_entries{};
		FrameCollector m_frames{};

		// The back entry is the module whose top level is running; calls push null.
		std::vector<Module*> m_modules{};

		struct DecodedAsm
		{
			std::shared_ptr<fe::AsmDecl const> decl{};
			std::shared_ptr<x86::AsmProgram const> program{};
		};

		std::unordered_map<fe::AsmDecl const*, DecodedAsm> m_asm_cache{};
	};

} // namespace pryzma::rt

#endif /* PRYZMA_RT_EVALUATOR_HH */
