#include <filesystem>
#include <iostream>
#include <utility>
#include <pryzma/Interpreter.hh>
#include <pryzma/fe/Parser.hh>
#include <pryzma/macro/TokenSlice.hh>
#include <pryzma/rt/Builtins.hh>

namespace pryzma
{
	namespace
	{
		namespace fs = std::filesystem;

		[[nodiscard]] rt::ResolverConfig resolver_config(InterpreterOptions const& opt)
		{
			return rt::ResolverConfig{opt.project_root, opt.search_paths, opt.packages_dir};
		}

		[[nodiscard]] bool is_package_reference(std::string_view reference) noexcept
		{
			return reference.find("::") != std::string_view::npos;
		}

	} // namespace

	Interpreter::Interpreter(InterpreterOptions opt)
		: m_opt(std::move(opt)),
		  m_resolver(resolver_config(m_opt)),
		  m_evaluator(m_sources, m_opt.out ? *m_opt.out : std::cout, m_opt.limits)
	{
		m_builtins = std::make_shared<rt::Environment>();
		rt::install_builtins(*m_builtins);

		m_globals = std::make_shared<rt::Environment>(m_builtins);

		m_main = std::make_shared<rt::Module>();
		m_main->name = "main";
		m_main->state = rt::ModuleState::ready;
		m_main->env = m_globals;

		m_evaluator.set_loader(this);
	}

	Interpreter::~Interpreter()
	{
		// Closures hold their defining frame, and frames hold the closures.
		std::vector<std::shared_ptr<rt::Environment>> closing{m_globals, m_builtins};
		for (auto& [path, mod] : m_modules)
			if (mod->env)
				closing.push_back(mod->env);
		closing.insert(closing.end(), m_retired.begin(), m_retired.end());

		m_evaluator.collect_frames(closing);
		for (auto& env : closing)
			env->clear();
	}

	void Interpreter::set_step_hook(rt::StepHook hook)
	{
		m_evaluator.set_step_hook(std::move(hook));
	}

	ErrorOr<rt::Value> Interpreter::run_source(std::string name, std::string text)
	{
		auto file = m_sources.add_virtual(std::move(name), std::move(text));

		auto prog = compile(file);
		if (!prog.ok())
			return prog.take_err();

		return m_evaluator.run_program(prog.value(), m_globals, m_main.get());
	}

	ErrorOr<rt::Value> Interpreter::evaluate(std::string text)
	{
		return run_source("<eval>", std::move(text));
	}

	ErrorOr<rt::Value> Interpreter::run_file(std::string_view path)
	{
		auto key = fs::path(path).lexically_normal().string();
		{
			std::error_code ec{};
			auto c = fs::weakly_canonical(fs::path(path), ec);
			if (!ec)
				key = c.string();
		}

		auto opened = m_sources.open_read(key);
		if (!opened.ok())
			return make_error(ErrorKind::module_not_found,
							  SourceSpan{},
							  "cannot read '" + std::string(path) + "': " + opened.err(),
							  std::string(path));

		return run_main(opened.value(), key);
	}

	ErrorOr<rt::Value> Interpreter::run_main(FileId file, std::string const& key)
	{
		// Registered like any module so that an import of the main file is
		// reported as a cycle.
		auto mod = std::make_shared<rt::Module>();
		mod->name = rt::module_stem(key, false);
		mod->path = key;
		mod->file = file;
		mod->env = m_globals;

		if (auto it = m_modules.find(key); it != m_modules.end() && it->second->state == rt::ModuleState::loading)
			return make_error(ErrorKind::circular_import,
							  SourceSpan{},
							  "'" + key + "' is already running",
							  key);

		m_modules[key] = mod;
		m_loading.push_back(mod);
		if (m_module_hook)
			m_module_hook(*mod);

		auto prog = compile(file);
		ErrorOr<rt::Value> result = prog.ok() ? m_evaluator.run_program(prog.value(), m_globals, mod.get())
											  : ErrorOr<rt::Value>(prog.take_err());

		m_loading.pop_back();
		if (!result.ok())
		{
			m_modules.erase(key);
			return result.take_err();
		}

		mod->state = rt::ModuleState::ready;
		return result.take();
	}

	ErrorOr<std::shared_ptr<rt::Module>> Interpreter::import_module(std::string_view reference)
	{
		auto pkg = is_package_reference(reference);

		auto path = m_resolver.resolve(reference, pkg, ".", SourceSpan{});
		if (!path.ok())
			return path.take_err();

		return load_path(path.value(), rt::module_stem(reference, pkg), SourceSpan{});
	}

	ErrorOr<rt::Value> Interpreter::import_function(std::string_view path, std::string_view name)
	{
		auto mod = import_module(path);
		if (!mod.ok())
			return mod.take_err();

		auto const& m = *mod.value();
		auto const* v = m.exports_name(name) && m.env->defines_here(name) ? m.env->lookup(name) : nullptr;
		if (!v)
			return make_error(ErrorKind::undefined_name,
							  SourceSpan{},
							  "module '" + m.name + "' has no exported name '" + std::string(name) + "'",
							  std::string(name));

		if (!v->is(rt::ValueKind::function) && !v->is(rt::ValueKind::asm_block))
			return make_error(ErrorKind::type_error,
							  SourceSpan{},
							  "'" + std::string(name) + "' in module '" + m.name + "' is a "
								  + rt::kind_name(*v) + ", not a function",
							  std::string(name));

		return *v;
	}

	ErrorOr<rt::Value> Interpreter::call(rt::Value const& fn, std::vector<rt::Value> args)
	{
		std::vector<rt::Arg> list{};
		list.reserve(args.size());
		for (auto& a : args)
			list.push_back(rt::Arg{{}, std::move(a), {}});

		return m_evaluator.call(fn, std::move(list), SourceSpan{});
	}

	ErrorOr<std::string> Interpreter::preprocess(std::string name, std::string text)
	{
		auto tokens = expand(m_sources.add_virtual(std::move(name), std::move(text)));
		if (!tokens.ok())
			return tokens.take_err();
		return macro::render_tokens(tokens.value());
	}

	ErrorOr<std::string> Interpreter::preprocess_file(std::string_view path)
	{
		auto opened = m_sources.open_read(path);
		if (!opened.ok())
			return make_error(ErrorKind::module_not_found,
							  SourceSpan{},
							  "cannot read '" + std::string(path) + "': " + opened.err(),
							  std::string(path));

		auto tokens = expand(opened.value());
		if (!tokens.ok())
			return tokens.take_err();
		return macro::render_tokens(tokens.value());
	}

	ErrorOr<std::shared_ptr<rt::Module>> Interpreter::load(fe::StmtUse const& use, FileId from)
	{
		auto path = m_resolver.resolve(use.reference, use.is_package, directory_of(from), use.span);
		if (!path.ok())
			return path.take_err();

		auto mod = load_path(path.value(), rt::module_stem(use.reference, use.is_package), use.span);
		if (!mod.ok())
		{
			auto e = mod.take_err();
			if (e.kind != ErrorKind::circular_import)
				e.notes.push_back(ErrorNote{use.span, "while importing '" + use.reference + "'"});
			return e;
		}
		return mod.take();
	}

	ErrorOr<std::shared_ptr<rt::Module>>
	Interpreter::load_path(std::string const& path, std::string name, SourceSpan where)
	{
		if (auto it = m_modules.find(path); it != m_modules.end())
		{
			auto const& cached = it->second;
			if (cached->state == rt::ModuleState::ready)
				return cached;

			std::string chain{};
			auto in_cycle = false;
			for (auto const& m : m_loading)
			{
				in_cycle = in_cycle || m == cached;
				if (in_cycle)
					chain += m->name + " -> ";
			}
			chain += cached->name;

			return make_error(ErrorKind::circular_import, where, "circular import: " + chain, path);
		}

		auto opened = m_sources.open_read(path);
		if (!opened.ok())
			return make_error(ErrorKind::module_not_found,
							  where,
							  "cannot read module '" + path + "': " + opened.err(),
							  path);

		auto mod = std::make_shared<rt::Module>();
		mod->name = std::move(name);
		mod->path = path;
		mod->file = opened.value();
		mod->env = std::make_shared<rt::Environment>(m_builtins);

		m_modules.emplace(path, mod);
		m_loading.push_back(mod);
		if (m_module_hook)
			m_module_hook(*mod);

		auto prog = compile(mod->file);
		ErrorOr<rt::Value> ran = prog.ok() ? m_evaluator.run_program(prog.value(), mod->env, mod.get())
										   : ErrorOr<rt::Value>(prog.take_err());

		m_loading.pop_back();
		if (!ran.ok())
		{
			m_modules.erase(path);
			m_retired.push_back(mod->env);
			return ran.take_err();
		}

		mod->state = rt::ModuleState::ready;
		return mod;
	}

	ErrorOr<std::vector<lex::Token>> Interpreter::expand(FileId file)
	{
		macro::Expander expander(m_sources, m_macros, m_opt.macro);
		expander.set_insert_resolver([this](std::string_view reference, FileId from, SourceSpan where) {
			return resolve_insert(reference, from, where);
		});
		return expander.expand_file(file);
	}

	ErrorOr<fe::Program> Interpreter::compile(FileId file)
	{
		auto tokens = expand(file);
		if (!tokens.ok())
			return tokens.take_err();

		fe::Parser parser(tokens.value());
		return parser.parse_program();
	}

	ErrorOr<FileId> Interpreter::resolve_insert(std::string_view reference, FileId from, SourceSpan where)
	{
		auto path = m_resolver.resolve(reference, false, directory_of(from), where);
		if (!path.ok())
			return path.take_err();

		auto opened = m_sources.open_read(path.value());
		if (!opened.ok())
			return make_error(ErrorKind::module_not_found,
							  where,
							  "cannot read '" + path.value() + "': " + opened.err(),
							  std::string(reference));
		return opened.value();
	}

	std::string Interpreter::directory_of(FileId file) const
	{
		// Code without a file resolves against the working directory.
		if (!m_sources.has(file) || m_sources.is_virtual(file))
			return ".";

		auto dir = fs::path(m_sources.name(file)).parent_path();
		return dir.empty() ? std::string(".") : dir.string();
	}

} // namespace pryzma
