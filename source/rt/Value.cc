#include <cmath>
#include <cstdio>
#include <limits>
#include <utility>
#include <vector>
#include <pryzma/rt/Value.hh>

namespace pryzma::rt
{
	namespace
	{
		constexpr std::uint64_t max_string_bytes = 64ull * 1024 * 1024;

		[[nodiscard]] std::int64_t wrap_add(std::int64_t a, std::int64_t b) noexcept
		{
			return static_cast<std::int64_t>(static_cast<std::uint64_t>(a)
											 + static_cast<std::uint64_t>(b));
		}

		[[nodiscard]] std::int64_t wrap_sub(std::int64_t a, std::int64_t b) noexcept
		{
			return static_cast<std::int64_t>(static_cast<std::uint64_t>(a)
											 - static_cast<std::uint64_t>(b));
		}

		[[nodiscard]] std::int64_t wrap_mul(std::int64_t a, std::int64_t b) noexcept
		{
			return static_cast<std::int64_t>(static_cast<std::uint64_t>(a)
											 * static_cast<std::uint64_t>(b));
		}

		[[nodiscard]] std::string format_float(double v)
		{
			if (std::isnan(v))
				return "nan";
			if (std::isinf(v))
				return v < 0 ? "-inf" : "inf";

			char buf[64];
			std::snprintf(buf, sizeof buf, "%.15g", v);
			std::string s(buf);

			if (s.find_first_of(".eE") == std::string::npos)
				s += ".0";
			return s;
		}

		[[nodiscard]] std::string quote(std::string_view s)
		{
			std::string out{"\""};
			for (auto c : s)
			{
				switch (c)
				{
					case '\n':
						out += "\\n";
						break;
					case '\t':
						out += "\\t";
						break;
					case '"':
						out += "\\\"";
						break;
					case '\\':
						out += "\\\\";
						break;
					default:
						out += c;
				}
			}
			out += '"';
			return out;
		}

		[[nodiscard]] Error operand_error(fe::BinaryOp op, Value const& a, Value const& b, SourceSpan span)
		{
			return make_error(ErrorKind::type_error,
							  span,
							  "unsupported operand types for '" + std::string(binary_op_spelling(op))
								  + "': " + kind_name(a) + " and " + kind_name(b),
							  std::string(binary_op_spelling(op)));
		}

		[[nodiscard]] std::optional<int> compare(Value const& a, Value const& b)
		{
			if (a.is(ValueKind::integer) && b.is(ValueKind::integer))
				return a.as_int() < b.as_int() ? -1 : (a.as_int() > b.as_int() ? 1 : 0);

			if (a.is_number() && b.is_number())
			{
				auto x = a.as_number();
				auto y = b.as_number();
				if (std::isnan(x) || std::isnan(y))
					return std::nullopt;
				return x < y ? -1 : (x > y ? 1 : 0);
			}

			if (a.is(ValueKind::string) && b.is(ValueKind::string))
			{
				auto c = a.as_string().compare(b.as_string());
				return c < 0 ? -1 : (c > 0 ? 1 : 0);
			}

			return std::nullopt;
		}

		[[nodiscard]] ErrorOr<Value> integer_op(fe::BinaryOp op,
												std::int64_t a,
												std::int64_t b,
												SourceSpan span)
		{
			switch (op)
			{
				case fe::BinaryOp::add:
					return Value::from_int(wrap_add(a, b));
				case fe::BinaryOp::sub:
					return Value::from_int(wrap_sub(a, b));
				case fe::BinaryOp::mul:
					return Value::from_int(wrap_mul(a, b));

				case fe::BinaryOp::div:
				case fe::BinaryOp::mod:
					if (b == 0)
						return make_error(ErrorKind::division_by_zero, span, "integer division by zero");
					if (a == std::numeric_limits<std::int64_t>::min() && b == -1)
						return Value::from_int(op == fe::BinaryOp::div ? a : 0);
					return Value::from_int(op == fe::BinaryOp::div ? a / b : a % b);

				case fe::BinaryOp::shl:
					return Value::from_int(
						static_cast<std::int64_t>(static_cast<std::uint64_t>(a) << (b & 63)));
				case fe::BinaryOp::shr:
					return Value::from_int(a >> (b & 63));

				case fe::BinaryOp::bit_and:
					return Value::from_int(a & b);
				case fe::BinaryOp::bit_or:
					return Value::from_int(a | b);
				case fe::BinaryOp::bit_xor:
					return Value::from_int(a ^ b);

				default:
					return Value::none();
			}
		}

		[[nodiscard]] ErrorOr<Value> float_op(fe::BinaryOp op, double a, double b, SourceSpan span)
		{
			switch (op)
			{
				case fe::BinaryOp::add:
					return Value::from_float(a + b);
				case fe::BinaryOp::sub:
					return Value::from_float(a - b);
				case fe::BinaryOp::mul:
					return Value::from_float(a * b);
				case fe::BinaryOp::div:
					if (b == 0.0)
						return make_error(ErrorKind::division_by_zero, span, "float division by zero");
					return Value::from_float(a / b);
				case fe::BinaryOp::mod:
					if (b == 0.0)
						return make_error(ErrorKind::division_by_zero, span, "float modulo by zero");
					return Value::from_float(std::fmod(a, b));
				default:
					return Value::none();
			}
		}

	} // namespace

	Value Value::from_list(std::vector<Value> items)
	{
		auto list = std::make_shared<ListObject>();
		list->items = std::move(items);
		return from_list(std::move(list));
	}

	Value const* StructInstance::find(std::string_view name) const noexcept
	{
		auto const& fields_decl = type->decl->fields;
		for (std::size_t i = 0; i < fields_decl.size(); ++i)
			if (fields_decl[i].name == name)
				return &fields[i];
		return nullptr;
	}

	Value* StructInstance::find(std::string_view name) noexcept
	{
		auto const* self = this;
		return const_cast<Value*>(self->find(name));
	}

	std::string kind_name(Value const& v)
	{
		switch (v.kind())
		{
			case ValueKind::none:
				return "none";
			case ValueKind::boolean:
				return "bool";
			case ValueKind::integer:
				return "int";
			case ValueKind::floating:
				return "float";
			case ValueKind::string:
				return "string";
			case ValueKind::list:
				return "list";
			case ValueKind::instance:
				return v.as_instance()->type_name();
			case ValueKind::function:
				return "function";
			case ValueKind::asm_block:
				return "asm";
		}

		return "unknown";
	}

	std::optional<bool> truthy(Value const& v) noexcept
	{
		switch (v.kind())
		{
			case ValueKind::none:
				return false;
			case ValueKind::boolean:
				return v.as_bool();
			case ValueKind::integer:
				return v.as_int() != 0;
			case ValueKind::floating:
				return v.as_float() != 0.0;
			case ValueKind::string:
				return !v.as_string().empty();
			case ValueKind::list:
				return !v.as_list()->items.empty();
			case ValueKind::instance:
			case ValueKind::function:
			case ValueKind::asm_block:
				return std::nullopt;
		}

		return std::nullopt;
	}

	namespace
	{
		// Pairs of containers whose comparison is in progress. Meeting a pair
		// again means the values are cyclic in the same shape.
		using ComparePath = std::vector<std::pair<void const*, void const*>>;

		// Containers being rendered, outermost first.
		using DisplayPath = std::vector<void const*>;

		template <class Path> class PathGuard
		{
		public:
			PathGuard(Path& path, typename Path::value_type entry) : m_path(&path) { m_path->push_back(entry); }
			~PathGuard() { m_path->pop_back(); }

			PathGuard(PathGuard const&) = delete;
			PathGuard& operator=(PathGuard const&) = delete;

		private:
			Path* m_path{};
		};

		[[nodiscard]] bool on_path(ComparePath const& path, void const* x, void const* y) noexcept
		{
			for (auto const& [px, py] : path)
				if (px == x && py == y)
					return true;
			return false;
		}

		[[nodiscard]] bool on_path(DisplayPath const& path, void const* p) noexcept
		{
			for (auto const* q : path)
				if (q == p)
					return true;
			return false;
		}

		[[nodiscard]] bool equals_in(Value const& a, Value const& b, ComparePath& path)
		{
			if (a.is_number() && b.is_number())
			{
				if (a.is(ValueKind::integer) && b.is(ValueKind::integer))
					return a.as_int() == b.as_int();
				return a.as_number() == b.as_number();
			}

			if (a.kind() != b.kind())
				return false;

			switch (a.kind())
			{
				case ValueKind::none:
					return true;
				case ValueKind::boolean:
					return a.as_bool() == b.as_bool();
				case ValueKind::string:
					return a.as_string() == b.as_string();

				case ValueKind::list:
				{
					auto const* xl = a.as_list().get();
					auto const* yl = b.as_list().get();
					if (xl == yl || on_path(path, xl, yl))
						return true;

					auto const& x = xl->items;
					auto const& y = yl->items;
					if (x.size() != y.size())
						return false;

					PathGuard guard(path, {xl, yl});
					for (std::size_t i = 0; i < x.size(); ++i)
						if (!equals_in(x[i], y[i], path))
							return false;
					return true;
				}

				case ValueKind::instance:
				{
					auto const* xp = a.as_instance().get();
					auto const* yp = b.as_instance().get();
					if (xp == yp || on_path(path, xp, yp))
						return true;
					if (xp->type->decl != yp->type->decl)
						return false;

					PathGuard guard(path, {xp, yp});
					for (std::size_t i = 0; i < xp->fields.size(); ++i)
						if (!equals_in(xp->fields[i], yp->fields[i], path))
							return false;
					return true;
				}

				case ValueKind::function:
				{
					auto const& x = *a.as_function();
					auto const& y = *b.as_function();
					if (x.is_builtin() || y.is_builtin())
						return x.builtin == y.builtin;
					return x.decl == y.decl;
				}

				case ValueKind::asm_block:
					return a.as_asm()->decl == b.as_asm()->decl;

				default:
					return false;
			}
		}

		[[nodiscard]] std::string display_in(Value const& v, DisplayPath& path);

		[[nodiscard]] std::string repr_in(Value const& v, DisplayPath& path)
		{
			if (v.is(ValueKind::string))
				return quote(v.as_string());
			return display_in(v, path);
		}

		std::string display_in(Value const& v, DisplayPath& path)
		{
			switch (v.kind())
			{
				case ValueKind::none:
					return "none";
				case ValueKind::boolean:
					return v.as_bool() ? "true" : "false";
				case ValueKind::integer:
					return std::to_string(v.as_int());
				case ValueKind::floating:
					return format_float(v.as_float());
				case ValueKind::string:
					return v.as_string();

				case ValueKind::list:
				{
					auto const* list = v.as_list().get();
					if (on_path(path, list))
						return "[...]";

					PathGuard guard(path, list);
					std::string out{"["};
					auto const& items = list->items;
					for (std::size_t i = 0; i < items.size(); ++i)
					{
						if (i)
							out += ", ";
						out += repr_in(items[i], path);
					}
					out += "]";
					return out;
				}

				case ValueKind::instance:
				{
					auto const& inst = *v.as_instance();
					auto const& decl = *inst.type->decl;
					if (on_path(path, &inst))
						return decl.name + "(...)";

					PathGuard guard(path, &inst);
					std::string out = decl.name + "(";
					for (std::size_t i = 0; i < decl.fields.size(); ++i)
					{
						if (i)
							out += ", ";
						out += decl.fields[i].name + ": " + repr_in(inst.fields[i], path);
					}
					out += ")";
					return out;
				}

				case ValueKind::function:
				{
					auto const& fn = *v.as_function();
					if (fn.is_builtin())
						return "<builtin " + fn.name + ">";
					return fn.name.empty() ? "<fn>" : "<fn " + fn.name + ">";
				}

				case ValueKind::asm_block:
					return "<asm " + v.as_asm()->decl->name + ">";
			}

			return "?";
		}

	} // namespace

	bool equals(Value const& a, Value const& b)
	{
		ComparePath path{};
		return equals_in(a, b, path);
	}

	std::string to_repr(Value const& v)
	{
		DisplayPath path{};
		return repr_in(v, path);
	}

	std::string to_display(Value const& v)
	{
		DisplayPath path{};
		return display_in(v, path);
	}

	std::string_view binary_op_spelling(fe::BinaryOp op) noexcept
	{
		switch (op)
		{
			case fe::BinaryOp::add:
				return "+";
			case fe::BinaryOp::sub:
				return "-";
			case fe::BinaryOp::mul:
				return "*";
			case fe::BinaryOp::div:
				return "/";
			case fe::BinaryOp::mod:
				return "%";
			case fe::BinaryOp::shl:
				return "<<";
			case fe::BinaryOp::shr:
				return ">>";
			case fe::BinaryOp::bit_and:
				return "&";
			case fe::BinaryOp::bit_or:
				return "|";
			case fe::BinaryOp::bit_xor:
				return "^";
			case fe::BinaryOp::log_and:
				return "and";
			case fe::BinaryOp::log_or:
				return "or";
			case fe::BinaryOp::eq:
				return "==";
			case fe::BinaryOp::ne:
				return "!=";
			case fe::BinaryOp::lt:
				return "<";
			case fe::BinaryOp::le:
				return "<=";
			case fe::BinaryOp::gt:
				return ">";
			case fe::BinaryOp::ge:
				return ">=";
		}

		return "?";
	}

	ErrorOr<Value> apply_binary(fe::BinaryOp op, Value const& lhs, Value const& rhs, SourceSpan span)
	{
		switch (op)
		{
			case fe::BinaryOp::eq:
				return Value::from_bool(equals(lhs, rhs));
			case fe::BinaryOp::ne:
				return Value::from_bool(!equals(lhs, rhs));

			case fe::BinaryOp::lt:
			case fe::BinaryOp::le:
			case fe::BinaryOp::gt:
			case fe::BinaryOp::ge:
			{
				if (!(lhs.is_number() && rhs.is_number())
					&& !(lhs.is(ValueKind::string) && rhs.is(ValueKind::string)))
					return operand_error(op, lhs, rhs, span);

				auto c = compare(lhs, rhs);
				if (!c)
					return Value::from_bool(false);

				switch (op)
				{
					case fe::BinaryOp::lt:
						return Value::from_bool(*c < 0);
					case fe::BinaryOp::le:
						return Value::from_bool(*c <= 0);
					case fe::BinaryOp::gt:
						return Value::from_bool(*c > 0);
					default:
						return Value::from_bool(*c >= 0);
				}
			}

			case fe::BinaryOp::log_and:
			case fe::BinaryOp::log_or:
				return operand_error(op, lhs, rhs, span);

			default:
				break;
		}

		if (lhs.is(ValueKind::integer) && rhs.is(ValueKind::integer))
			return integer_op(op, lhs.as_int(), rhs.as_int(), span);

		auto arithmetic = op == fe::BinaryOp::add || op == fe::BinaryOp::sub
						  || op == fe::BinaryOp::mul || op == fe::BinaryOp::div
						  || op == fe::BinaryOp::mod;

		if (arithmetic && lhs.is_number() && rhs.is_number())
			return float_op(op, lhs.as_number(), rhs.as_number(), span);

		if (op == fe::BinaryOp::add && lhs.is(ValueKind::string) && rhs.is(ValueKind::string))
		{
			if (lhs.as_string().size() + rhs.as_string().size() > max_string_bytes)
				return make_error(ErrorKind::resource_limit,
								  span,
								  "string would exceed " + std::to_string(max_string_bytes) + " bytes");
			return Value::from_string(lhs.as_string() + rhs.as_string());
		}

		if (op == fe::BinaryOp::add && lhs.is(ValueKind::list) && rhs.is(ValueKind::list))
		{
			auto items = lhs.as_list()->items;
			auto const& more = rhs.as_list()->items;
			items.insert(items.end(), more.begin(), more.end());
			return Value::from_list(std::move(items));
		}

		if (op == fe::BinaryOp::mul && lhs.is(ValueKind::string) && rhs.is(ValueKind::integer))
		{
			auto const& piece = lhs.as_string();
			auto count = rhs.as_int() > 0 && !piece.empty() ? static_cast<std::uint64_t>(rhs.as_int()) : 0u;
			if (!piece.empty() && count > max_string_bytes / piece.size())
				return make_error(ErrorKind::resource_limit,
								  span,
								  "repeated string would exceed " + std::to_string(max_string_bytes) + " bytes");

			std::string out{};
			out.reserve(piece.size() * count);
			for (std::uint64_t i = 0; i < count; ++i)
				out += piece;
			return Value::from_string(std::move(out));
		}

		return operand_error(op, lhs, rhs, span);
	}

	ErrorOr<Value> apply_unary(fe::UnaryOp op, Value const& rhs, SourceSpan span)
	{
		switch (op)
		{
			case fe::UnaryOp::minus:
				if (rhs.is(ValueKind::integer))
					return Value::from_int(wrap_sub(0, rhs.as_int()));
				if (rhs.is(ValueKind::floating))
					return Value::from_float(-rhs.as_float());
				break;

			case fe::UnaryOp::bit_not:
				if (rhs.is(ValueKind::integer))
					return Value::from_int(~rhs.as_int());
				break;

			case fe::UnaryOp::log_not:
			{
				auto t = truthy(rhs);
				if (!t)
					return make_error(ErrorKind::type_error,
									  span,
									  "value of type " + kind_name(rhs) + " cannot be used as a condition",
									  kind_name(rhs));
				return Value::from_bool(!*t);
			}
		}

		auto spelling = op == fe::UnaryOp::minus ? "-" : "~";
		return make_error(ErrorKind::type_error,
						  span,
						  "unsupported operand type for unary '" + std::string(spelling)
							  + "': " + kind_name(rhs),
						  spelling);
	}

} // namespace pryzma::rt
