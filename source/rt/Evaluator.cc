#include <utility>
#include <pryzma/rt/Builtins.hh>
#include <pryzma/rt/Evaluator.hh>

namespace pryzma::rt
{
	namespace
	{
		template <class... Ts> struct Overloaded : Ts...
		{
			using Ts::operator()...;
		};
		template <class... Ts> Overloaded(Ts...) -> Overloaded<Ts...>;

		// Pops what it pushed, whatever way the scope is left.
		class ModuleScope
		{
		public:
			ModuleScope(std::vector<Module*>& stack, Module* module) : m_stack(&stack)
			{
				m_stack->push_back(module);
			}
			~ModuleScope() { m_stack->pop_back(); }

			ModuleScope(ModuleScope const&) = delete;
			ModuleScope& operator=(ModuleScope const&) = delete;

		private:
			std::vector<Module*>* m_stack{};
		};

		class DepthGuard
		{
		public:
			explicit DepthGuard(std::size_t& depth) noexcept : m_depth(&depth) { ++*m_depth; }
			~DepthGuard() { --*m_depth; }

			DepthGuard(DepthGuard const&) = delete;
			DepthGuard& operator=(DepthGuard const&) = delete;

		private:
			std::size_t* m_depth{};
		};

		// The outermost entry from the host sweeps frames kept alive only by
		// closure cycles once it returns.
		class EntryScope
		{
		public:
			EntryScope(std::size_t& depth, FrameCollector& frames) noexcept : m_depth(&depth), m_frames(&frames)
			{
				++*m_depth;
			}
			~EntryScope()
			{
				if (--*m_depth == 0)
					m_frames->collect();
			}

			EntryScope(EntryScope const&) = delete;
			EntryScope& operator=(EntryScope const&) = delete;

		private:
			std::size_t* m_depth{};
			FrameCollector* m_frames{};
		};

		[[nodiscard]] Error undefined_name(std::string const& name, SourceSpan span)
		{
			return make_error(ErrorKind::undefined_name, span, "undefined name '" + name + "'", name);
		}

		[[nodiscard]] Error not_a_condition(Value const& v, SourceSpan span)
		{
			return make_error(ErrorKind::type_error,
							  span,
							  "value of type " + kind_name(v) + " cannot be used as a condition",
							  kind_name(v));
		}

		[[nodiscard]] Error stray_loop_control(bool is_break, SourceSpan span)
		{
			return make_error(ErrorKind::parse_error,
							  span,
							  is_break ? "'break' outside of a loop" : "'continue' outside of a loop");
		}

		[[nodiscard]] std::string plural(std::size_t n, std::string_view word)
		{
			return std::to_string(n) + " " + std::string(word) + (n == 1 ? "" : "s");
		}

		// Maps `index` into [0, size), counting negative indexes from the end.
		[[nodiscard]] std::optional<std::size_t> normalize_index(std::int64_t index, std::size_t size) noexcept
		{
			auto n = static_cast<std::int64_t>(size);
			if (index < 0)
				index += n;
			if (index < 0 || index >= n)
				return std::nullopt;
			return static_cast<std::size_t>(index);
		}

		[[nodiscard]] Error index_error(std::int64_t index, std::size_t size, std::string_view what, SourceSpan span)
		{
			return make_error(ErrorKind::index_error,
							  span,
							  std::string(what) + " index " + std::to_string(index) + " out of range (length "
								  + std::to_string(size) + ")");
		}

	} // namespace

	Evaluator::Evaluator(SourceManager const& sources, std::ostream& out, EvalLimits limits)
		: m_sources(&sources), m_out(&out), m_limits(limits)
	{
	}

	void Evaluator::step(StepPhase phase, SourceSpan span, Environment const& env) const
	{
		if (m_step_hook)
			m_step_hook(StepEvent{phase, span, &env});
	}

	ErrorOr<Value>
	Evaluator::run_program(fe::Program const& prog, std::shared_ptr<Environment> const& env, Module* module)
	{
		EntryScope entry(m_entries, m_frames);
		ModuleScope scope(m_modules, module);

		Value last{};
		for (auto const& stmt : prog.stmts)
		{
			auto r = exec(*stmt, env);
			if (!r.ok())
				return r.take_err();

			auto flow = r.take();
			if (flow.kind == FlowKind::break_loop || flow.kind == FlowKind::continue_loop)
				return stray_loop_control(flow.kind == FlowKind::break_loop, stmt->span());

			last = std::move(flow.value);
			if (flow.kind == FlowKind::return_value)
				break;
		}

		if (module && module->has_export_list)
		{
			for (auto const& name : module->exports)
			{
				if (env->declares_here(name))
					continue;

				return make_error(ErrorKind::undefined_name,
								  SourceSpan{},
								  "module '" + module->name + "' exports '" + name + "' but never defines it",
								  name);
			}
		}

		return last;
	}

	ErrorOr<Flow> Evaluator::exec_block(fe::StmtList const& stmts, std::shared_ptr<Environment> const& env)
	{
		Flow last{};
		for (auto const& stmt : stmts)
		{
			auto r = exec(*stmt, env);
			if (!r.ok())
				return r.take_err();

			auto flow = r.take();
			if (flow.kind != FlowKind::normal)
				return flow;
			last = std::move(flow);
		}

		return last;
	}

	ErrorOr<Flow> Evaluator::exec(fe::Stmt const& stmt, std::shared_ptr<Environment> const& env)
	{
		auto span = stmt.span();
		step(StepPhase::before, span, *env);

		auto r = std::visit([&](auto const& node) { return exec_node(node, env); }, stmt.node);

		step(StepPhase::after, span, *env);
		return r;
	}

	ErrorOr<Flow> Evaluator::exec_node(fe::StmtExpr const& s, std::shared_ptr<Environment> const& env)
	{
		auto v = eval(*s.expr, env);
		if (!v.ok())
			return v.take_err();
		return Flow{FlowKind::normal, v.take()};
	}

	ErrorOr<Flow> Evaluator::exec_node(fe::StmtLet const& s, std::shared_ptr<Environment> const& env)
	{
		Value v{};
		if (s.value)
		{
			auto r = eval(*s.value, env);
			if (!r.ok())
				return r.take_err();
			v = r.take();
		}

		env->define(s.name, std::move(v));
		return Flow{};
	}

	Status Evaluator::assign_name(std::string const& name, Value value, SourceSpan span, Environment& env)
	{
		switch (env.assign(name, std::move(value)))
		{
			case AssignResult::ok:
				return Unit{};
			case AssignResult::read_only:
				return make_error(ErrorKind::type_error,
								  span,
								  "cannot assign to imported binding '" + name + "'",
								  name);
			case AssignResult::undefined:
				break;
		}

		return undefined_name(name, span);
	}

	ErrorOr<Flow> Evaluator::exec_node(fe::StmtAssign const& s, std::shared_ptr<Environment> const& env)
	{
		auto const& target = *s.target;

		// `x op= v` reads the target once, then combines.
		auto combine = [&](Value const* current) -> ErrorOr<Value> {
			auto rhs = eval(*s.value, env);
			if (!rhs.ok() || !s.op)
				return rhs;
			return apply_binary(*s.op, *current, rhs.value(), s.span);
		};

		if (auto const* id = std::get_if<fe::ExprIdent>(&target.node))
		{
			Value current{};
			if (s.op)
			{
				auto const* found = env->lookup(id->name);
				if (!found)
					return undefined_name(id->name, target.span);
				current = *found;
			}

			auto v = combine(&current);
			if (!v.ok())
				return v.take_err();

			auto st = assign_name(id->name, v.take(), target.span, *env);
			if (!st.ok())
				return st.take_err();
			return Flow{};
		}

		if (auto const* member = std::get_if<fe::ExprMember>(&target.node))
		{
			if (auto mod = module_of(*member->object, *env))
				return make_error(ErrorKind::type_error,
								  target.span,
								  "cannot assign to imported binding '" + mod->name + "." + member->name + "'",
								  member->name);

			auto obj = eval(*member->object, env);
			if (!obj.ok())
				return obj.take_err();

			auto const& o = obj.value();
			if (!o.is(ValueKind::instance))
				return make_error(ErrorKind::type_error,
								  target.span,
								  "cannot set field '" + member->name + "' on a value of type " + kind_name(o),
								  member->name);

			auto inst = o.as_instance();
			auto* slot = inst->find(member->name);
			if (!slot)
				return make_error(ErrorKind::undefined_name,
								  member->name_span,
								  "struct " + inst->type_name() + " has no field '" + member->name + "'",
								  member->name);

			Value current = *slot;
			auto v = combine(&current);
			if (!v.ok())
				return v.take_err();

			*slot = v.take();
			return Flow{};
		}

		if (auto const* index = std::get_if<fe::ExprIndex>(&target.node))
		{
			auto obj = eval(*index->object, env);
			if (!obj.ok())
				return obj.take_err();
			auto idx = eval(*index->index, env);
			if (!idx.ok())
				return idx.take_err();

			auto const& o = obj.value();
			if (!o.is(ValueKind::list))
				return make_error(ErrorKind::type_error,
								  target.span,
								  "value of type " + kind_name(o) + " does not support item assignment");
			if (!idx.value().is(ValueKind::integer))
				return make_error(ErrorKind::type_error,
								  index->index->span,
								  "list index must be an int, not " + kind_name(idx.value()));

			auto list = o.as_list();
			auto raw = idx.value().as_int();
			auto pos = normalize_index(raw, list->items.size());
			if (!pos)
				return index_error(raw, list->items.size(), "list", target.span);

			Value current = list->items[*pos];
			auto v = combine(&current);
			if (!v.ok())
				return v.take_err();

			pos = normalize_index(raw, list->items.size());
			if (!pos)
				return index_error(raw, list->items.size(), "list", target.span);
			list->items[*pos] = v.take();
			return Flow{};
		}

		return make_error(ErrorKind::parse_error, target.span, "invalid assignment target");
	}

	ErrorOr<Flow> Evaluator::exec_node(fe::StmtFn const& s, std::shared_ptr<Environment> const& env)
	{
		auto fn = std::make_shared<FunctionObject>();
		fn->name = s.decl->name;
		fn->decl = s.decl;
		fn->closure = env;

		env->define(s.decl->name, Value::from_function(std::move(fn)));
		return Flow{};
	}

	ErrorOr<Flow> Evaluator::exec_node(fe::StmtReturn const& s, std::shared_ptr<Environment> const& env)
	{
		Value v{};
		if (s.value)
		{
			auto r = eval(*s.value, env);
			if (!r.ok())
				return r.take_err();
			v = r.take();
		}

		return Flow{FlowKind::return_value, std::move(v)};
	}

	ErrorOr<Flow> Evaluator::exec_node(fe::StmtIf const& s, std::shared_ptr<Environment> const& env)
	{
		fe::StmtList const* body = nullptr;

		for (auto const& branch : s.branches)
		{
			auto c = condition(*branch.cond, env);
			if (!c.ok())
				return c.take_err();

			if (c.value())
			{
				body = &branch.body;
				break;
			}
		}

		if (!body && s.has_else)
			body = &s.else_body;

		if (!body)
			return Flow{};

		auto r = exec_block(*body, m_frames.make_frame(env));
		if (!r.ok())
			return r.take_err();

		auto flow = r.take();
		if (flow.kind == FlowKind::normal)
			return Flow{};
		return flow;
	}

	ErrorOr<Flow> Evaluator::exec_node(fe::StmtWhile const& s, std::shared_ptr<Environment> const& env)
	{
		for (;;)
		{
			auto c = condition(*s.cond, env);
			if (!c.ok())
				return c.take_err();
			if (!c.value())
				break;

			auto r = exec_block(s.body, m_frames.make_frame(env));
			if (!r.ok())
				return r.take_err();

			auto flow = r.take();
			if (flow.kind == FlowKind::break_loop)
				break;
			if (flow.kind == FlowKind::return_value)
				return flow;
		}

		return Flow{};
	}

	ErrorOr<Flow> Evaluator::exec_node(fe::StmtFor const& s, std::shared_ptr<Environment> const& env)
	{
		auto it = eval(*s.iterable, env);
		if (!it.ok())
			return it.take_err();

		std::vector<Value> items{};
		auto const& iterable = it.value();

		if (iterable.is(ValueKind::list))
			items = iterable.as_list()->items;
		else if (iterable.is(ValueKind::string))
		{
			for (auto c : iterable.as_string())
				items.push_back(Value::from_string(std::string(1, c)));
		}
		else
			return make_error(ErrorKind::type_error,
							  s.iterable->span,
							  "cannot iterate over a value of type " + kind_name(iterable),
							  kind_name(iterable));

		for (auto& item : items)
		{
			auto frame = m_frames.make_frame(env);
			frame->define(s.var, std::move(item));

			auto r = exec_block(s.body, frame);
			if (!r.ok())
				return r.take_err();

			auto flow = r.take();
			if (flow.kind == FlowKind::break_loop)
				break;
			if (flow.kind == FlowKind::return_value)
				return flow;
		}

		return Flow{};
	}

	ErrorOr<Flow> Evaluator::exec_node(fe::StmtBreak const&, std::shared_ptr<Environment> const&)
	{
		return Flow{FlowKind::break_loop, {}};
	}

	ErrorOr<Flow> Evaluator::exec_node(fe::StmtContinue const&, std::shared_ptr<Environment> const&)
	{
		return Flow{FlowKind::continue_loop, {}};
	}

	ErrorOr<Flow> Evaluator::exec_node(fe::StmtStruct const& s, std::shared_ptr<Environment> const& env)
	{
		env->define_struct(s.decl->name, std::make_shared<StructType const>(StructType{s.decl, env}));
		return Flow{};
	}

	ErrorOr<Flow> Evaluator::exec_node(fe::StmtUse const& s, std::shared_ptr<Environment> const& env)
	{
		if (!m_loader)
			return make_error(ErrorKind::module_not_found,
							  s.span,
							  "cannot import '" + s.reference + "': no module loader is configured",
							  s.reference);

		auto loaded = m_loader->load(s, s.span.id);
		if (!loaded.ok())
			return loaded.take_err();

		auto mod = loaded.take();

		if (s.merge)
		{
			auto const& src = *mod->env;
			src.for_each_binding([&](std::string const& name, Value const& value, bool) {
				if (!mod->exports_name(name))
					return;
				env->define(name, value);
				env->freeze(name);
			});
			src.for_each_struct([&](std::string const& name, std::shared_ptr<StructType const> const& type) {
				if (mod->exports_name(name))
					env->define_struct(name, type);
			});
			src.for_each_module([&](std::string const& alias, std::shared_ptr<Module> const& inner) {
				if (mod->exports_name(alias))
					env->define_module(alias, inner);
			});
		}

		if (!s.alias.empty())
			env->define_module(s.alias, mod);
		else if (!s.merge)
			env->define_module(module_stem(s.reference, s.is_package), mod);

		return Flow{};
	}

	ErrorOr<Flow> Evaluator::exec_node(fe::StmtExport const& s, std::shared_ptr<Environment> const&)
	{
		if (m_modules.empty() || !m_modules.back())
			return make_error(ErrorKind::parse_error,
							  s.span,
							  "'export' is only allowed at the top level of a module");

		auto* mod = m_modules.back();
		mod->has_export_list = true;
		for (auto const& name : s.names)
			mod->exports.insert(name.name);
		return Flow{};
	}

	ErrorOr<Flow> Evaluator::exec_node(fe::StmtTry const& s, std::shared_ptr<Environment> const& env)
	{
		auto r = exec_block(s.body, m_frames.make_frame(env));
		if (r.ok())
		{
			auto flow = r.take();
			if (flow.kind == FlowKind::normal)
				return Flow{};
			return flow;
		}

		auto handler_env = m_frames.make_frame(env);
		handler_env->define(s.err_name, error_to_value(r.err()));

		auto h = exec_block(s.handler, handler_env);
		if (!h.ok())
			return h.take_err();

		auto flow = h.take();
		if (flow.kind == FlowKind::normal)
			return Flow{};
		return flow;
	}

	ErrorOr<Flow> Evaluator::exec_node(fe::StmtThrow const& s, std::shared_ptr<Environment> const& env)
	{
		auto v = eval(*s.value, env);
		if (!v.ok())
			return v.take_err();

		if (auto rethrown = value_to_error(v.value(), s.span))
			return std::move(*rethrown);

		return make_error(ErrorKind::user_error, s.span, to_display(v.value()));
	}

	ErrorOr<Flow> Evaluator::exec_node(fe::StmtDirective const&, std::shared_ptr<Environment> const&)
	{
		return Flow{};
	}

	ErrorOr<bool> Evaluator::condition(fe::Expr const& expr, std::shared_ptr<Environment> const& env)
	{
		auto v = eval(expr, env);
		if (!v.ok())
			return v.take_err();

		auto t = truthy(v.value());
		if (!t)
			return not_a_condition(v.value(), expr.span);
		return *t;
	}

	ErrorOr<Value> Evaluator::eval(fe::Expr const& expr, std::shared_ptr<Environment> const& env)
	{
		auto const span = expr.span;

		return std::visit(
			Overloaded{
				[&](fe::ExprIdent const& e) { return eval_ident(e, span, *env); },
				[&](fe::ExprInt const& e) { return ErrorOr<Value>(Value::from_int(e.value)); },
				[&](fe::ExprFloat const& e) { return ErrorOr<Value>(Value::from_float(e.value)); },
				[&](fe::ExprStr const& e) { return ErrorOr<Value>(Value::from_string(e.value)); },
				[&](fe::ExprBool const& e) { return ErrorOr<Value>(Value::from_bool(e.value)); },
				[&](fe::ExprNone const&) { return ErrorOr<Value>(Value::none()); },
				[&](fe::ExprList const& e) -> ErrorOr<Value> {
					std::vector<Value> items{};
					items.reserve(e.items.size());
					for (auto const& item : e.items)
					{
						auto v = eval(*item, env);
						if (!v.ok())
							return v.take_err();
						items.push_back(v.take());
					}
					return Value::from_list(std::move(items));
				},
				[&](fe::ExprUnary const& e) -> ErrorOr<Value> {
					auto v = eval(*e.rhs, env);
					if (!v.ok())
						return v.take_err();
					return apply_unary(e.op, v.value(), span);
				},
				[&](fe::ExprBinary const& e) -> ErrorOr<Value> {
					if (e.op == fe::BinaryOp::log_and || e.op == fe::BinaryOp::log_or)
						return eval_logical(e, env);

					auto lhs = eval(*e.lhs, env);
					if (!lhs.ok())
						return lhs.take_err();
					auto rhs = eval(*e.rhs, env);
					if (!rhs.ok())
						return rhs.take_err();

					if (e.op == fe::BinaryOp::eq || e.op == fe::BinaryOp::ne)
					{
						auto same = equals(lhs.value(), rhs.value());
						return Value::from_bool(e.op == fe::BinaryOp::eq ? same : !same);
					}

					return apply_binary(e.op, lhs.value(), rhs.value(), span);
				},
				[&](fe::ExprCall const& e) { return eval_call(e, span, env); },
				[&](fe::ExprMember const& e) { return eval_member(e, span, env); },
				[&](fe::ExprIndex const& e) { return eval_index(e, span, env); },
				[&](fe::ExprFn const& e) -> ErrorOr<Value> {
					auto fn = std::make_shared<FunctionObject>();
					fn->decl = e.decl;
					fn->closure = env;
					return Value::from_function(std::move(fn));
				},
			},
			expr.node);
	}

	ErrorOr<Value> Evaluator::eval_ident(fe::ExprIdent const& e, SourceSpan span, Environment const& env)
	{
		if (auto const* v = env.lookup(e.name))
			return *v;

		if (env.lookup_struct(e.name))
			return make_error(ErrorKind::type_error,
							  span,
							  "struct '" + e.name + "' is not a value; call " + e.name + "(...) to build one",
							  e.name);

		if (env.lookup_module(e.name))
			return make_error(ErrorKind::type_error,
							  span,
							  "module '" + e.name + "' is not a value; use " + e.name + ".name",
							  e.name);

		return undefined_name(e.name, span);
	}

	ErrorOr<Value> Evaluator::eval_logical(fe::ExprBinary const& e, std::shared_ptr<Environment> const& env)
	{
		auto lhs = condition(*e.lhs, env);
		if (!lhs.ok())
			return lhs.take_err();

		auto is_and = e.op == fe::BinaryOp::log_and;
		if (lhs.value() != is_and)
			return Value::from_bool(lhs.value());

		auto rhs = condition(*e.rhs, env);
		if (!rhs.ok())
			return rhs.take_err();
		return Value::from_bool(rhs.value());
	}

	std::shared_ptr<Module> Evaluator::module_of(fe::Expr const& expr, Environment const& env) const
	{
		if (auto const* id = std::get_if<fe::ExprIdent>(&expr.node))
		{
			if (env.lookup(id->name))
				return nullptr;
			return env.lookup_module(id->name);
		}

		if (auto const* member = std::get_if<fe::ExprMember>(&expr.node))
		{
			auto parent = module_of(*member->object, env);
			if (!parent || !parent->exports_name(member->name))
				return nullptr;
			return parent->env->lookup_module(member->name);
		}

		return nullptr;
	}

	std::shared_ptr<StructType const> Evaluator::struct_of(fe::Expr const& expr, Environment const& env) const
	{
		if (auto const* id = std::get_if<fe::ExprIdent>(&expr.node))
		{
			if (env.lookup(id->name))
				return nullptr;
			return env.lookup_struct(id->name);
		}

		if (auto const* member = std::get_if<fe::ExprMember>(&expr.node))
		{
			auto mod = module_of(*member->object, env);
			if (!mod || !mod->exports_name(member->name) || mod->env->defines_here(member->name))
				return nullptr;
			return mod->env->lookup_struct(member->name);
		}

		return nullptr;
	}

	ErrorOr<std::vector<Arg>> Evaluator::eval_args(std::vector<fe::CallArg> const& args,
												   std::shared_ptr<Environment> const& env)
	{
		std::vector<Arg> out{};
		out.reserve(args.size());

		for (auto const& a : args)
		{
			auto v = eval(*a.value, env);
			if (!v.ok())
				return v.take_err();
			out.push_back(Arg{a.name, v.take(), a.span});
		}

		return out;
	}

	ErrorOr<Value> Evaluator::eval_call(fe::ExprCall const& e, SourceSpan span, std::shared_ptr<Environment> const& env)
	{
		if (auto type = struct_of(*e.callee, *env))
		{
			auto args = eval_args(e.args, env);
			if (!args.ok())
				return args.take_err();
			return construct(type, args.take(), span);
		}

		auto callee = eval(*e.callee, env);
		if (!callee.ok())
			return callee.take_err();

		auto args = eval_args(e.args, env);
		if (!args.ok())
			return args.take_err();

		return call(callee.value(), args.take(), span);
	}

	ErrorOr<Value> Evaluator::eval_member(fe::ExprMember const& e, SourceSpan span, std::shared_ptr<Environment> const& env)
	{
		if (auto mod = module_of(*e.object, *env))
		{
			if (!mod->exports_name(e.name))
				return make_error(ErrorKind::undefined_name,
								  e.name_span,
								  "module '" + mod->name + "' does not export '" + e.name + "'",
								  e.name);

			if (mod->env->defines_here(e.name))
				return *mod->env->lookup(e.name);

			if (mod->env->lookup_struct(e.name))
				return make_error(ErrorKind::type_error,
								  span,
								  "struct '" + e.name + "' is not a value; call it to build one",
								  e.name);

			return make_error(ErrorKind::undefined_name,
							  e.name_span,
							  "module '" + mod->name + "' has no member '" + e.name + "'",
							  e.name);
		}

		auto obj = eval(*e.object, env);
		if (!obj.ok())
			return obj.take_err();

		auto const& o = obj.value();
		if (!o.is(ValueKind::instance))
			return make_error(ErrorKind::type_error,
							  span,
							  "value of type " + kind_name(o) + " has no member '" + e.name + "'",
							  e.name);

		auto const& inst = *o.as_instance();
		if (auto const* field = inst.find(e.name))
			return *field;

		return make_error(ErrorKind::undefined_name,
						  e.name_span,
						  "struct " + inst.type_name() + " has no field '" + e.name + "'",
						  e.name);
	}

	ErrorOr<Value> Evaluator::eval_index(fe::ExprIndex const& e, SourceSpan span, std::shared_ptr<Environment> const& env)
	{
		auto obj = eval(*e.object, env);
		if (!obj.ok())
			return obj.take_err();
		auto idx = eval(*e.index, env);
		if (!idx.ok())
			return idx.take_err();

		auto const& o = obj.value();
		auto const& i = idx.value();

		if (!o.is(ValueKind::list) && !o.is(ValueKind::string))
			return make_error(ErrorKind::type_error,
							  span,
							  "value of type " + kind_name(o) + " cannot be indexed");

		if (!i.is(ValueKind::integer))
			return make_error(ErrorKind::type_error,
							  e.index->span,
							  "index must be an int, not " + kind_name(i));

		if (o.is(ValueKind::list))
		{
			auto const& items = o.as_list()->items;
			auto pos = normalize_index(i.as_int(), items.size());
			if (!pos)
				return index_error(i.as_int(), items.size(), "list", span);
			return items[*pos];
		}

		auto const& s = o.as_string();
		auto pos = normalize_index(i.as_int(), s.size());
		if (!pos)
			return index_error(i.as_int(), s.size(), "string", span);
		return Value::from_string(std::string(1, s[*pos]));
	}

	ErrorOr<Value> Evaluator::call(Value const& callee, std::vector<Arg> args, SourceSpan where)
	{
		EntryScope entry(m_entries, m_frames);
		if (callee.is(ValueKind::asm_block))
			return call_asm(*callee.as_asm(), std::move(args), where);

		if (!callee.is(ValueKind::function))
			return make_error(ErrorKind::type_error,
							  where,
							  "value of type " + kind_name(callee) + " is not callable",
							  kind_name(callee));

		auto const& fn = *callee.as_function();
		if (!fn.is_builtin())
			return call_function(fn, std::move(args), where);

		std::vector<Value> values{};
		values.reserve(args.size());
		for (auto& a : args)
		{
			if (!a.name.empty())
				return make_error(ErrorKind::type_error,
								  a.span,
								  fn.name + "() does not take named arguments",
								  a.name);
			values.push_back(std::move(a.value));
		}

		if (values.size() < fn.min_args || (fn.max_args && values.size() > *fn.max_args))
		{
			std::string expected = std::to_string(fn.min_args);
			if (!fn.max_args)
				expected = "at least " + expected;
			else if (*fn.max_args != fn.min_args)
				expected += " to " + std::to_string(*fn.max_args);

			return make_error(ErrorKind::arity_error,
							  where,
							  fn.name + "() expects " + expected + " argument(s), got "
								  + std::to_string(values.size()),
							  fn.name);
		}

		return fn.builtin(*this, std::span<Value>(values), where);
	}

	ErrorOr<Value> Evaluator::call_function(FunctionObject const& fn, std::vector<Arg> args, SourceSpan where)
	{
		auto const& decl = *fn.decl;
		auto display = fn.name.empty() ? std::string("<fn>") : "'" + fn.name + "'";

		if (m_call_depth >= m_limits.max_call_depth)
			return make_error(ErrorKind::resource_limit,
							  where,
							  "maximum call depth of " + std::to_string(m_limits.max_call_depth) + " exceeded",
							  fn.name);

		if (args.size() > decl.params.size())
			return make_error(ErrorKind::arity_error,
							  where,
							  "function " + display + " expects " + plural(decl.params.size(), "argument")
								  + ", got " + std::to_string(args.size()),
							  fn.name);

		std::vector<std::optional<Value>> bound(decl.params.size());
		std::size_t positional = 0;

		for (auto& a : args)
		{
			if (a.name.empty())
			{
				if (bound[positional])
					return make_error(ErrorKind::type_error,
									  a.span,
									  "parameter '" + decl.params[positional].name + "' of " + display
										  + " is bound twice",
									  decl.params[positional].name);
				bound[positional++] = std::move(a.value);
				continue;
			}

			std::size_t i = 0;
			while (i < decl.params.size() && decl.params[i].name != a.name)
				++i;

			if (i == decl.params.size())
				return make_error(ErrorKind::type_error,
								  a.span,
								  "function " + display + " has no parameter '" + a.name + "'",
								  a.name);
			if (bound[i])
				return make_error(ErrorKind::type_error,
								  a.span,
								  "parameter '" + a.name + "' of " + display + " is bound twice",
								  a.name);
			bound[i] = std::move(a.value);
		}

		for (std::size_t i = 0; i < bound.size(); ++i)
			if (!bound[i])
				return make_error(ErrorKind::arity_error,
								  where,
								  "function " + display + " expects " + plural(decl.params.size(), "argument")
									  + ", got " + std::to_string(args.size()),
								  fn.name);

		DepthGuard depth(m_call_depth);
		ModuleScope scope(m_modules, nullptr);

		auto frame = m_frames.make_frame(fn.closure);
		for (std::size_t i = 0; i < bound.size(); ++i)
			frame->define(decl.params[i].name, std::move(*bound[i]));

		auto r = exec_block(decl.body, frame);
		if (!r.ok())
			return r.take_err();

		auto flow = r.take();
		if (flow.kind == FlowKind::break_loop || flow.kind == FlowKind::continue_loop)
			return stray_loop_control(flow.kind == FlowKind::break_loop, decl.span);

		return std::move(flow.value);
	}

	ErrorOr<Value> Evaluator::construct(std::shared_ptr<StructType const> const& type,
										std::vector<Arg> args,
										SourceSpan where)
	{
		auto const& decl = *type->decl;
		auto const n = decl.fields.size();

		if (m_call_depth >= m_limits.max_call_depth)
			return make_error(ErrorKind::resource_limit,
							  where,
							  "maximum call depth of " + std::to_string(m_limits.max_call_depth) + " exceeded",
							  decl.name);

		std::vector<std::optional<Value>> bound(n);
		std::size_t positional = 0;
		std::size_t positional_total = 0;
		for (auto const& a : args)
			if (a.name.empty())
				++positional_total;

		for (auto& a : args)
		{
			if (a.name.empty())
			{
				if (positional >= n)
					return make_error(ErrorKind::arity_error,
									  where,
									  decl.name + " takes at most " + plural(n, "field value") + ", got "
										  + std::to_string(positional_total) + " positional",
									  decl.name);
				if (bound[positional])
					return make_error(ErrorKind::type_error,
									  a.span,
									  "field '" + decl.fields[positional].name + "' of " + decl.name + " is bound twice",
									  decl.fields[positional].name);
				bound[positional++] = std::move(a.value);
				continue;
			}

			auto const* field = decl.find_field(a.name);
			if (!field)
				return make_error(ErrorKind::type_error,
								  a.span,
								  "struct " + decl.name + " has no field '" + a.name + "'",
								  a.name);

			auto i = static_cast<std::size_t>(field - decl.fields.data());
			if (bound[i])
				return make_error(ErrorKind::type_error,
								  a.span,
								  "field '" + a.name + "' of " + decl.name + " is bound twice",
								  a.name);
			bound[i] = std::move(a.value);
		}

		auto needs_defaults = false;
		for (std::size_t i = 0; i < n; ++i)
		{
			if (bound[i])
				continue;

			auto const& f = decl.fields[i];
			if (f.kind == fe::FieldKind::required)
				return make_error(ErrorKind::missing_field,
								  where,
								  "missing required field '" + f.name + "' of struct " + decl.name,
								  f.name);
			if (f.kind == fe::FieldKind::defaulted)
				needs_defaults = true;
		}

		if (needs_defaults)
		{
			auto parent = type->env.lock();
			if (!parent)
				return make_error(ErrorKind::type_error,
								  where,
								  "the scope that declared struct " + decl.name + " no longer exists",
								  decl.name);

			DepthGuard depth(m_call_depth);
			ModuleScope scope(m_modules, nullptr);

			// Defaults see the fields bound so far, in declaration order.
			auto frame = m_frames.make_frame(parent);
			for (std::size_t i = 0; i < n; ++i)
				if (bound[i])
					frame->define(decl.fields[i].name, *bound[i]);

			for (std::size_t i = 0; i < n; ++i)
			{
				if (bound[i])
					continue;

				auto const& f = decl.fields[i];
				Value v{};
				if (f.kind == fe::FieldKind::defaulted)
				{
					auto r = eval(*f.default_value, frame);
					if (!r.ok())
						return r.take_err();
					v = r.take();
				}

				frame->define(f.name, v);
				bound[i] = std::move(v);
			}
		}

		auto inst = std::make_shared<StructInstance>();
		inst->type = type;
		inst->fields.reserve(n);
		for (auto& b : bound)
			inst->fields.push_back(b ? std::move(*b) : Value::none());

		return Value::from_instance(std::move(inst));
	}

} // namespace pryzma::rt
