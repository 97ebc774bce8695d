#ifndef PRYZMA_INTERPRETER_HH
#define PRYZMA_INTERPRETER_HH

#include <functional>
#include <iosfwd>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>
#include <pryzma/Error.hh>
#include <pryzma/fe/Ast.hh>
#include <pryzma/macro/Expander.hh>
#include <pryzma/macro/MacroTable.hh>
#include <pryzma/rt/Environment.hh>
#include <pryzma/rt/Evaluator.hh>
#include <pryzma/rt/Module.hh>
#include <pryzma/support/SourceManager.hh>

namespace pryzma
{
	struct InterpreterOptions
	{
		// `-I` directories first, then `PRYZMA_PATH` entries.
		std::vector<std::string> search_paths{};
		std::string project_root{};
		std::string packages_dir{};

		macro::ExpandOptions macro{};
		rt::EvalLimits limits{};

		// Where `print` writes; standard output when null.
		std::ostream* out{};
	};

	using ModuleHook = std::function<void(rt::Module const&)>;

	// One session: its sources, macro table, module cache and global frame.
	// Not thread-safe; give each thread its own session.
	class Interpreter final : private rt::ModuleLoader
	{
	public:
		explicit Interpreter(InterpreterOptions opt = {});
		~Interpreter() override;

		Interpreter(Interpreter const&) = delete;
		Interpreter& operator=(Interpreter const&) = delete;

		[[nodiscard]] SourceManager& sources() noexcept { return m_sources; }
		[[nodiscard]] macro::MacroTable& macros() noexcept { return m_macros; }
		[[nodiscard]] InterpreterOptions const& options() const noexcept { return m_opt; }

		// Runs code in the global frame; the result is the value of the last
		// top-level expression statement, or none.
		[[nodiscard]] ErrorOr<rt::Value> run_source(std::string name, std::string text);
		[[nodiscard]] ErrorOr<rt::Value> run_file(std::string_view path);
		[[nodiscard]] ErrorOr<rt::Value> evaluate(std::string text);

		[[nodiscard]] ErrorOr<std::shared_ptr<rt::Module>> import_module(std::string_view reference);

		// Imports the module at `path` and returns its exported `name`.
		[[nodiscard]] ErrorOr<rt::Value> import_function(std::string_view path, std::string_view name);

		[[nodiscard]] ErrorOr<rt::Value> call(rt::Value const& fn, std::vector<rt::Value> args);

		// Expands macros, keywords and inserts and renders the result as text.
		[[nodiscard]] ErrorOr<std::string> preprocess(std::string name, std::string text);
		[[nodiscard]] ErrorOr<std::string> preprocess_file(std::string_view path);

		[[nodiscard]] std::shared_ptr<rt::Environment> const& globals() const noexcept { return m_globals; }

		// Call and block frames still alive after the last run.
		[[nodiscard]] std::size_t live_frames() const noexcept { return m_evaluator.frames().live_frames(); }

		void set_step_hook(rt::StepHook hook);

		// Called when a module starts loading.
		void set_module_hook(ModuleHook hook) { m_module_hook = std::move(hook); }

	private:
		[[nodiscard]] ErrorOr<std::shared_ptr<rt::Module>> load(fe::StmtUse const& use, FileId from) override;

		[[nodiscard]] ErrorOr<std::shared_ptr<rt::Module>>
		load_path(std::string const& path, std::string name, SourceSpan where);

		[[nodiscard]] ErrorOr<fe::Program> compile(FileId file);
		[[nodiscard]] ErrorOr<std::vector<lex::Token>> expand(FileId file);
		[[nodiscard]] ErrorOr<rt::Value> run_main(FileId file, std::string const& key);

		[[nodiscard]] ErrorOr<FileId> resolve_insert(std::string_view reference, FileId from, SourceSpan where);
		[[nodiscard]] std::string directory_of(FileId file) const;

		InterpreterOptions m_opt{};

		SourceManager m_sources{};
		macro::MacroTable m_macros{};
		rt::ImportResolver m_resolver{};
		rt::Evaluator m_evaluator;

		std::shared_ptr<rt::Environment> m_builtins{};
		std::shared_ptr<rt::Environment> m_globals{};

		// Stands for the code run through run_source and run_file.
		std::shared_ptr<rt::Module> m_main{};

		// Keyed by canonical path.
		std::unordered_map<std::string, std::shared_ptr<rt::Module>> m_modules{};
		std::vector<std::shared_ptr<rt::Module>> m_loading{};

		// Frames of modules that failed to load, cleared with the session.
		std::vector<std::shared_ptr<rt::Environment>> m_retired{};

		ModuleHook m_module_hook{};
	};

} // namespace pryzma

#endif /* PRYZMA_INTERPRETER_HH */
