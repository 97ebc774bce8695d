#include <algorithm>
#include <bit>
#include <utility>
#include <pryzma/rt/Evaluator.hh>
#include <pryzma/x86/Decoder.hh>
#include <pryzma/x86/Machine.hh>

namespace pryzma::rt
{
	namespace
	{
		constexpr std::uint64_t max_asm_memory = 64ull * 1024 * 1024;

		[[nodiscard]] std::string location_name(fe::AsmLocation const& loc)
		{
			if (loc.kind == fe::AsmLocationKind::reg)
				return loc.reg;

			auto s = "mem[" + std::to_string(loc.offset);
			if (loc.length)
				s += ":" + std::to_string(*loc.length);
			return s + "]";
		}

		[[nodiscard]] ErrorOr<x86::RegRef> register_of(fe::AsmLocation const& loc)
		{
			auto r = x86::parse_register(loc.reg);
			if (!r)
				return make_error(ErrorKind::parse_error, loc.span, "unknown register '" + loc.reg + "'", loc.reg);
			return *r;
		}

		// Ints, bools and none travel as integers, floats as their bit pattern.
		[[nodiscard]] ErrorOr<std::uint64_t> to_register(Value const& v, fe::AsmLocation const& loc)
		{
			switch (v.kind())
			{
				case ValueKind::integer:
					return static_cast<std::uint64_t>(v.as_int());
				case ValueKind::boolean:
					return std::uint64_t{v.as_bool() ? 1u : 0u};
				case ValueKind::none:
					return std::uint64_t{0};
				case ValueKind::floating:
					return std::bit_cast<std::uint64_t>(v.as_float());
				default:
					return make_error(ErrorKind::type_error,
									  loc.span,
									  "cannot pass a value of type " + kind_name(v) + " in register " + loc.reg,
									  kind_name(v));
			}
		}

		void append_qword(std::vector<std::uint8_t>& out, std::uint64_t v)
		{
			for (int i = 0; i < 8; ++i)
				out.push_back(static_cast<std::uint8_t>(v >> (8 * i)));
		}

		[[nodiscard]] ErrorOr<std::vector<std::uint8_t>> to_memory(Value const& v, fe::AsmLocation const& loc)
		{
			std::vector<std::uint8_t> out{};

			switch (v.kind())
			{
				case ValueKind::integer:
				case ValueKind::boolean:
				case ValueKind::none:
				case ValueKind::floating:
				{
					auto bits = to_register(v, loc);
					if (!bits.ok())
						return bits.take_err();
					append_qword(out, bits.value());
					return out;
				}

				case ValueKind::string:
					out.assign(v.as_string().begin(), v.as_string().end());
					return out;

				case ValueKind::list:
					for (auto const& item : v.as_list()->items)
					{
						if (!item.is(ValueKind::integer))
							return make_error(ErrorKind::type_error,
											  loc.span,
											  "lists passed into " + location_name(loc)
												  + " must hold ints, found " + kind_name(item),
											  kind_name(item));
						append_qword(out, static_cast<std::uint64_t>(item.as_int()));
					}
					return out;

				default:
					return make_error(ErrorKind::type_error,
									  loc.span,
									  "cannot pass a value of type " + kind_name(v) + " into " + location_name(loc),
									  kind_name(v));
			}
		}

		[[nodiscard]] Status grow(std::uint64_t& top, std::uint64_t offset, std::uint64_t size, SourceSpan span)
		{
			if (offset > max_asm_memory || size > max_asm_memory - offset)
				return make_error(ErrorKind::resource_limit,
								  span,
								  "assembly memory slot ends beyond the " + std::to_string(max_asm_memory)
									  + " byte limit");
			top = std::max(top, offset + size);
			return Unit{};
		}

	} // namespace

	ErrorOr<std::shared_ptr<x86::AsmProgram const>>
	Evaluator::decoded(std::shared_ptr<fe::AsmDecl const> const& decl)
	{
		if (auto it = m_asm_cache.find(decl.get()); it != m_asm_cache.end())
			return it->second.program;

		auto prog = x86::decode(*m_sources, decl->body);
		if (!prog.ok())
			return prog.take_err();

		auto shared = std::make_shared<x86::AsmProgram const>(prog.take());
		m_asm_cache.emplace(decl.get(), DecodedAsm{decl, shared});
		return shared;
	}

	ErrorOr<std::vector<Value>> Evaluator::run_asm(std::shared_ptr<fe::AsmDecl const> const& decl,
												   std::shared_ptr<Environment> const& env)
	{
		auto prog = decoded(decl);
		if (!prog.ok())
			return prog.take_err();

		struct Entry
		{
			fe::AsmLocation const* loc{};
			x86::RegRef reg{};
			std::uint64_t bits{};
			std::vector<std::uint8_t> bytes{};
		};

		std::uint64_t top = decl->mem_size.value_or(0);
		std::vector<Entry> entries{};

		for (auto const& in : decl->inputs)
		{
			auto v = eval(*in.value, env);
			if (!v.ok())
				return v.take_err();

			Entry e{};
			e.loc = &in.loc;

			if (in.loc.kind == fe::AsmLocationKind::reg)
			{
				auto r = register_of(in.loc);
				if (!r.ok())
					return r.take_err();
				auto bits = to_register(v.value(), in.loc);
				if (!bits.ok())
					return bits.take_err();
				e.reg = r.value();
				e.bits = bits.value();
			}
			else
			{
				auto bytes = to_memory(v.value(), in.loc);
				if (!bytes.ok())
					return bytes.take_err();
				e.bytes = bytes.take();

				if (auto st = grow(top, in.loc.offset, e.bytes.size(), in.loc.span); !st.ok())
					return st.take_err();
			}

			entries.push_back(std::move(e));
		}

		for (auto const& out : decl->outputs)
		{
			if (out.loc.kind == fe::AsmLocationKind::reg)
			{
				if (auto r = register_of(out.loc); !r.ok())
					return r.take_err();
				continue;
			}

			if (auto st = grow(top, out.loc.offset, out.loc.length.value_or(8), out.loc.span); !st.ok())
				return st.take_err();
		}

		x86::Machine machine(static_cast<std::size_t>(top) + m_limits.asm_stack_reserve);
		machine.set_data_limit(static_cast<std::size_t>(top));

		for (auto const& e : entries)
		{
			if (e.loc->kind == fe::AsmLocationKind::reg)
			{
				machine.write(e.reg, e.bits);
				continue;
			}

			auto st = machine.write_bytes(e.loc->offset, e.bytes, e.loc->span);
			if (!st.ok())
				return st.take_err();
		}

		auto ran = machine.run(*prog.value(), m_limits.asm_max_steps);
		if (!ran.ok())
			return ran.take_err();

		std::vector<Value> results{};
		results.reserve(decl->outputs.size());

		for (auto const& out : decl->outputs)
		{
			if (out.loc.kind == fe::AsmLocationKind::reg)
			{
				auto r = register_of(out.loc);
				if (!r.ok())
					return r.take_err();
				results.push_back(Value::from_int(static_cast<std::int64_t>(machine.read(r.value()))));
				continue;
			}

			if (out.loc.length)
			{
				auto bytes = machine.read_bytes(out.loc.offset, static_cast<std::size_t>(*out.loc.length), out.loc.span);
				if (!bytes.ok())
					return bytes.take_err();
				auto const& b = bytes.value();
				results.push_back(Value::from_string(std::string(b.begin(), b.end())));
				continue;
			}

			auto q = machine.load(out.loc.offset, 8, out.loc.span);
			if (!q.ok())
				return q.take_err();
			results.push_back(Value::from_int(static_cast<std::int64_t>(q.value())));
		}

		return results;
	}

	ErrorOr<Flow> Evaluator::exec_node(fe::StmtAsm const& s, std::shared_ptr<Environment> const& env)
	{
		auto const& decl = s.decl;

		if (!decl->name.empty())
		{
			auto block = std::make_shared<AsmObject>();
			block->decl = decl;
			block->closure = env;
			env->define(decl->name, Value::from_asm(std::move(block)));
			return Flow{};
		}

		// Read-only targets are rejected before the block runs.
		for (auto const& out : decl->outputs)
		{
			if (env->lookup(out.target) && env->is_frozen(out.target))
				return make_error(ErrorKind::type_error,
								  out.target_span,
								  "cannot assign to imported binding '" + out.target + "'",
								  out.target);
		}

		auto results = run_asm(decl, env);
		if (!results.ok())
			return results.take_err();

		auto values = results.take();
		for (std::size_t i = 0; i < values.size(); ++i)
		{
			auto const& target = decl->outputs[i].target;
			if (!env->lookup(target))
			{
				env->define(target, std::move(values[i]));
				continue;
			}

			auto st = assign_name(target, std::move(values[i]), decl->outputs[i].target_span, *env);
			if (!st.ok())
				return st.take_err();
		}

		return Flow{};
	}

	ErrorOr<Value> Evaluator::call_asm(AsmObject const& block, std::vector<Arg> args, SourceSpan where)
	{
		auto const& decl = *block.decl;
		auto display = "'" + decl.name + "'";

		if (m_call_depth >= m_limits.max_call_depth)
			return make_error(ErrorKind::resource_limit,
							  where,
							  "maximum call depth of " + std::to_string(m_limits.max_call_depth) + " exceeded",
							  decl.name);

		std::vector<std::optional<Value>> bound(decl.params.size());
		std::size_t positional = 0;

		for (auto& a : args)
		{
			std::size_t i = positional;
			if (!a.name.empty())
			{
				i = 0;
				while (i < decl.params.size() && decl.params[i].name != a.name)
					++i;
				if (i == decl.params.size())
					return make_error(ErrorKind::type_error,
									  a.span,
									  "assembly block " + display + " has no parameter '" + a.name + "'",
									  a.name);
			}
			else if (positional++ >= decl.params.size())
				break;

			if (bound[i])
				return make_error(ErrorKind::type_error,
								  a.span,
								  "parameter '" + decl.params[i].name + "' of " + display + " is bound twice",
								  decl.params[i].name);
			bound[i] = std::move(a.value);
		}

		auto missing = false;
		for (auto const& b : bound)
			missing = missing || !b;

		if (args.size() > decl.params.size() || missing)
			return make_error(ErrorKind::arity_error,
							  where,
							  "assembly block " + display + " expects " + std::to_string(decl.params.size())
								  + " argument(s), got " + std::to_string(args.size()),
							  decl.name);

		std::size_t depth = m_call_depth;
		++m_call_depth;

		auto frame = m_frames.make_frame(block.closure);
		for (std::size_t i = 0; i < bound.size(); ++i)
			frame->define(decl.params[i].name, std::move(*bound[i]));

		auto results = run_asm(block.decl, frame);
		m_call_depth = depth;

		if (!results.ok())
			return results.take_err();

		auto values = results.take();
		if (values.empty())
			return Value::none();
		if (values.size() == 1)
			return std::move(values.front());
		return Value::from_list(std::move(values));
	}

} // namespace pryzma::rt
