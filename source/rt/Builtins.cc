#include <charconv>
#include <cmath>
#include <limits>
#include <ostream>
#include <string>
#include <utility>
#include <pryzma/rt/Builtins.hh>
#include <pryzma/rt/Evaluator.hh>

namespace pryzma::rt
{
	namespace
	{
		constexpr std::size_t max_range_items = 10'000'000;

		[[nodiscard]] Error arg_type_error(std::string_view fn, std::string_view wanted, Value const& got, SourceSpan call)
		{
			return make_error(ErrorKind::type_error,
							  call,
							  std::string(fn) + "() expects " + std::string(wanted) + ", got " + kind_name(got),
							  std::string(fn));
		}

		[[nodiscard]] std::string_view trim(std::string_view s) noexcept
		{
			while (!s.empty() && (s.front() == ' ' || s.front() == '\t' || s.front() == '\n'))
				s.remove_prefix(1);
			while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\n'))
				s.remove_suffix(1);
			return s;
		}

		ErrorOr<Value> builtin_print(Evaluator& ev, std::span<Value> args, SourceSpan)
		{
			auto& out = ev.out();
			for (std::size_t i = 0; i < args.size(); ++i)
			{
				if (i)
					out << ' ';
				out << to_display(args[i]);
			}
			out << '\n';
			return Value::none();
		}

		ErrorOr<Value> builtin_len(Evaluator&, std::span<Value> args, SourceSpan call)
		{
			auto const& v = args[0];
			if (v.is(ValueKind::string))
				return Value::from_int(static_cast<std::int64_t>(v.as_string().size()));
			if (v.is(ValueKind::list))
				return Value::from_int(static_cast<std::int64_t>(v.as_list()->items.size()));
			return arg_type_error("len", "a string or list", v, call);
		}

		ErrorOr<Value> builtin_str(Evaluator&, std::span<Value> args, SourceSpan)
		{
			return Value::from_string(to_display(args[0]));
		}

		ErrorOr<Value> builtin_int(Evaluator&, std::span<Value> args, SourceSpan call)
		{
			auto const& v = args[0];
			switch (v.kind())
			{
				case ValueKind::integer:
					return v;
				case ValueKind::boolean:
					return Value::from_int(v.as_bool() ? 1 : 0);
				case ValueKind::floating:
				{
					auto f = std::trunc(v.as_float());
					if (!std::isfinite(f) || f < -9.2233720368547758e18 || f >= 9.2233720368547758e18)
						return make_error(ErrorKind::type_error, call, "int() cannot convert " + to_display(v));
					return Value::from_int(static_cast<std::int64_t>(f));
				}
				case ValueKind::string:
				{
					auto s = trim(v.as_string());
					if (!s.empty() && s.front() == '+')
						s.remove_prefix(1);

					std::int64_t out{};
					auto res = std::from_chars(s.data(), s.data() + s.size(), out);
					if (s.empty() || res.ec != std::errc{} || res.ptr != s.data() + s.size())
						return make_error(ErrorKind::type_error,
										  call,
										  "invalid integer literal " + to_repr(v));
					return Value::from_int(out);
				}
				default:
					return arg_type_error("int", "a number, bool or string", v, call);
			}
		}

		ErrorOr<Value> builtin_float(Evaluator&, std::span<Value> args, SourceSpan call)
		{
			auto const& v = args[0];
			switch (v.kind())
			{
				case ValueKind::floating:
					return v;
				case ValueKind::integer:
					return Value::from_float(static_cast<double>(v.as_int()));
				case ValueKind::boolean:
					return Value::from_float(v.as_bool() ? 1.0 : 0.0);
				case ValueKind::string:
				{
					auto s = trim(v.as_string());
					if (!s.empty() && s.front() == '+')
						s.remove_prefix(1);

					double out{};
					auto res = std::from_chars(s.data(), s.data() + s.size(), out);
					if (s.empty() || res.ec != std::errc{} || res.ptr != s.data() + s.size())
						return make_error(ErrorKind::type_error,
										  call,
										  "invalid float literal " + to_repr(v));
					return Value::from_float(out);
				}
				default:
					return arg_type_error("float", "a number, bool or string", v, call);
			}
		}

		ErrorOr<Value> builtin_type(Evaluator&, std::span<Value> args, SourceSpan)
		{
			return Value::from_string(kind_name(args[0]));
		}

		ErrorOr<Value> builtin_range(Evaluator&, std::span<Value> args, SourceSpan call)
		{
			for (auto const& a : args)
				if (!a.is(ValueKind::integer))
					return arg_type_error("range", "integer arguments", a, call);

			std::int64_t begin = 0;
			std::int64_t end = 0;
			std::int64_t step = 1;

			if (args.size() == 1)
				end = args[0].as_int();
			else
			{
				begin = args[0].as_int();
				end = args[1].as_int();
				if (args.size() == 3)
					step = args[2].as_int();
			}

			if (step == 0)
				return make_error(ErrorKind::type_error, call, "range() step must not be zero");

			std::vector<Value> items{};
			for (auto i = begin; step > 0 ? i < end : i > end;)
			{
				if (items.size() >= max_range_items)
					return make_error(ErrorKind::resource_limit,
									  call,
									  "range() would produce more than " + std::to_string(max_range_items) + " items");
				items.push_back(Value::from_int(i));

				if ((step > 0 && i > std::numeric_limits<std::int64_t>::max() - step)
					|| (step < 0 && i < std::numeric_limits<std::int64_t>::min() - step))
					break;
				i += step;
			}

			return Value::from_list(std::move(items));
		}

		ErrorOr<Value> builtin_push(Evaluator&, std::span<Value> args, SourceSpan call)
		{
			if (!args[0].is(ValueKind::list))
				return arg_type_error("push", "a list", args[0], call);
			args[0].as_list()->items.push_back(args[1]);
			return Value::none();
		}

		ErrorOr<Value> builtin_pop(Evaluator&, std::span<Value> args, SourceSpan call)
		{
			if (!args[0].is(ValueKind::list))
				return arg_type_error("pop", "a list", args[0], call);

			auto& items = args[0].as_list()->items;
			if (items.empty())
				return make_error(ErrorKind::index_error, call, "pop() from an empty list");

			auto v = std::move(items.back());
			items.pop_back();
			return v;
		}

		ErrorOr<Value> builtin_fields(Evaluator&, std::span<Value> args, SourceSpan call)
		{
			if (!args[0].is(ValueKind::instance))
				return arg_type_error("fields", "a struct instance", args[0], call);

			std::vector<Value> names{};
			for (auto const& f : args[0].as_instance()->type->decl->fields)
				names.push_back(Value::from_string(f.name));
			return Value::from_list(std::move(names));
		}

		ErrorOr<Value> builtin_assert(Evaluator&, std::span<Value> args, SourceSpan call)
		{
			auto t = truthy(args[0]);
			if (!t)
				return make_error(ErrorKind::type_error,
								  call,
								  kind_name(args[0]) + " value cannot be used as a condition");
			if (*t)
				return Value::none();

			std::string message = "assertion failed";
			if (args.size() > 1)
				message += ": " + to_display(args[1]);
			return make_error(ErrorKind::user_error, call, std::move(message));
		}

		struct BuiltinEntry
		{
			std::string_view name;
			BuiltinFn fn;
			std::size_t min_args;
			std::optional<std::size_t> max_args;
		};

		[[nodiscard]] std::shared_ptr<fe::StructDecl const> make_error_decl()
		{
			auto decl = std::make_shared<fe::StructDecl>();
			decl->name = "Error";
			for (auto name : {"kind", "message", "line", "column"})
			{
				fe::FieldDecl f{};
				f.name = name;
				decl->fields.push_back(std::move(f));
			}
			return decl;
		}

	} // namespace

	std::shared_ptr<StructType const> const& error_struct_type()
	{
		static auto const type = std::make_shared<StructType const>(StructType{make_error_decl(), {}});
		return type;
	}

	Value error_to_value(Error const& err)
	{
		auto inst = std::make_shared<StructInstance>();
		inst->type = error_struct_type();
		inst->fields = {
			Value::from_string(std::string(error_kind_name(err.kind))),
			Value::from_string(err.message),
			Value::from_int(static_cast<std::int64_t>(err.span.begin.line)),
			Value::from_int(static_cast<std::int64_t>(err.span.begin.column)),
		};
		return Value::from_instance(std::move(inst));
	}

	std::optional<Error> value_to_error(Value const& v, SourceSpan where)
	{
		if (!v.is(ValueKind::instance) || v.as_instance()->type->decl != error_struct_type()->decl)
			return std::nullopt;

		auto const& inst = *v.as_instance();
		auto const* kind = inst.find("kind");
		auto const* message = inst.find("message");

		auto e = make_error(ErrorKind::user_error, where, message ? to_display(*message) : std::string{});
		if (kind && kind->is(ValueKind::string))
		{
			for (auto k = static_cast<int>(ErrorKind::lex_error); k <= static_cast<int>(ErrorKind::resource_limit); ++k)
			{
				auto ek = static_cast<ErrorKind>(k);
				if (error_kind_name(ek) == kind->as_string())
					e.kind = ek;
			}
		}
		return e;
	}

	void install_builtins(Environment& env)
	{
		static constexpr BuiltinEntry table[] = {
			{"print", builtin_print, 0, std::nullopt},
			{"len", builtin_len, 1, 1},
			{"str", builtin_str, 1, 1},
			{"int", builtin_int, 1, 1},
			{"float", builtin_float, 1, 1},
			{"type", builtin_type, 1, 1},
			{"range", builtin_range, 1, 3},
			{"push", builtin_push, 2, 2},
			{"pop", builtin_pop, 1, 1},
			{"fields", builtin_fields, 1, 1},
			{"assert", builtin_assert, 1, 2},
		};

		for (auto const& b : table)
		{
			auto fn = std::make_shared<FunctionObject>();
			fn->name = std::string(b.name);
			fn->builtin = b.fn;
			fn->min_args = b.min_args;
			fn->max_args = b.max_args;
			env.define(std::string(b.name), Value::from_function(std::move(fn)));
		}

		env.define_struct("Error", error_struct_type());
	}

} // namespace pryzma::rt
