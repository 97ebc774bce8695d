#ifndef PRYZMA_RT_VALUE_HH
#define PRYZMA_RT_VALUE_HH

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>
#include <pryzma/Error.hh>
#include <pryzma/fe/Ast.hh>

namespace pryzma::rt
{
	class Environment;
	class Evaluator;

	struct ListObject;
	struct StructType;
	struct StructInstance;
	struct FunctionObject;
	struct AsmObject;

	enum class ValueKind : std::uint8_t
	{
		none,
		boolean,
		integer,
		floating,
		string,
		list,
		instance,
		function,
		asm_block,
	};

	class Value
	{
	public:
		using Storage = std::variant<std::monostate,
									 bool,
									 std::int64_t,
									 double,
									 std::string,
									 std::shared_ptr<ListObject>,
									 std::shared_ptr<StructInstance>,
									 std::shared_ptr<FunctionObject const>,
									 std::shared_ptr<AsmObject const>>;

		Value() = default;

		[[nodiscard]] static Value none() { return Value{}; }
		[[nodiscard]] static Value from_bool(bool v) { return Value{Storage{v}}; }
		[[nodiscard]] static Value from_int(std::int64_t v) { return Value{Storage{v}}; }
		[[nodiscard]] static Value from_float(double v) { return Value{Storage{v}}; }
		[[nodiscard]] static Value from_string(std::string v)
		{
			return Value{Storage{std::move(v)}};
		}
		[[nodiscard]] static Value from_list(std::vector<Value> items);
		[[nodiscard]] static Value from_list(std::shared_ptr<ListObject> list)
		{
			return Value{Storage{std::move(list)}};
		}
		[[nodiscard]] static Value from_instance(std::shared_ptr<StructInstance> inst)
		{
			return Value{Storage{std::move(inst)}};
		}
		[[nodiscard]] static Value from_function(std::shared_ptr<FunctionObject const> fn)
		{
			return Value{Storage{std::move(fn)}};
		}
		[[nodiscard]] static Value from_asm(std::shared_ptr<AsmObject const> block)
		{
			return Value{Storage{std::move(block)}};
		}

		[[nodiscard]] ValueKind kind() const noexcept
		{
			return static_cast<ValueKind>(m_data.index());
		}
		[[nodiscard]] bool is(ValueKind k) const noexcept { return kind() == k; }
		[[nodiscard]] bool is_number() const noexcept
		{
			return is(ValueKind::integer) || is(ValueKind::floating);
		}

		[[nodiscard]] bool as_bool() const { return std::get<bool>(m_data); }
		[[nodiscard]] std::int64_t as_int() const { return std::get<std::int64_t>(m_data); }
		[[nodiscard]] double as_float() const { return std::get<double>(m_data); }
		[[nodiscard]] double as_number() const
		{
			return is(ValueKind::integer) ? static_cast<double>(as_int()) : as_float();
		}
		[[nodiscard]] std::string const& as_string() const { return std::get<std::string>(m_data); }
		[[nodiscard]] std::shared_ptr<ListObject> const& as_list() const
		{
			return std::get<std::shared_ptr<ListObject>>(m_data);
		}
		[[nodiscard]] std::shared_ptr<StructInstance> const& as_instance() const
		{
			return std::get<std::shared_ptr<StructInstance>>(m_data);
		}
		[[nodiscard]] std::shared_ptr<FunctionObject const> const& as_function() const
		{
			return std::get<std::shared_ptr<FunctionObject const>>(m_data);
		}
		[[nodiscard]] std::shared_ptr<AsmObject const> const& as_asm() const
		{
			return std::get<std::shared_ptr<AsmObject const>>(m_data);
		}

	private:
		explicit Value(Storage data) : m_data(std::move(data)) {}

		Storage m_data{};
	};

	struct ListObject
	{
		std::vector<Value> items{};
	};

	// A struct declaration bound in some frame. Defaults are evaluated in a
	// child of that frame, which must still be alive at construction.
	struct StructType
	{
		std::shared_ptr<fe::StructDecl const> decl{};
		std::weak_ptr<Environment> env{};
	};

	struct StructInstance
	{
		std::shared_ptr<StructType const> type{};

		// Indexed like `type->decl->fields`.
		std::vector<Value> fields{};

		[[nodiscard]] std::string const& type_name() const noexcept { return type->decl->name; }
		[[nodiscard]] Value const* find(std::string_view name) const noexcept;
		[[nodiscard]] Value* find(std::string_view name) noexcept;
	};

	using BuiltinFn = ErrorOr<Value> (*)(Evaluator& ev, std::span<Value> args, SourceSpan call);

	struct FunctionObject
	{
		std::string name{};

		// User function: declaration plus the frame it closes over.
		std::shared_ptr<fe::FnDecl const> decl{};
		std::shared_ptr<Environment> closure{};

		// Builtin: `max_args` of nullopt means variadic.
		BuiltinFn builtin{};
		std::size_t min_args{};
		std::optional<std::size_t> max_args{};

		[[nodiscard]] bool is_builtin() const noexcept { return builtin != nullptr; }
	};

	struct AsmObject
	{
		std::shared_ptr<fe::AsmDecl const> decl{};
		std::shared_ptr<Environment> closure{};
	};

	[[nodiscard]] std::string kind_name(Value const& v);

	// nullopt for values that cannot be used as a condition.
	[[nodiscard]] std::optional<bool> truthy(Value const& v) noexcept;

	[[nodiscard]] bool equals(Value const& a, Value const& b);

	// Strings print raw at top level and quoted inside containers.
	[[nodiscard]] std::string to_display(Value const& v);
	[[nodiscard]] std::string to_repr(Value const& v);

	[[nodiscard]] std::string_view binary_op_spelling(fe::BinaryOp op) noexcept;

	// Arithmetic, bitwise and comparison operators. `and`/`or` short-circuit
	// in the evaluator and never reach here.
	[[nodiscard]] ErrorOr<Value> apply_binary(fe::BinaryOp op,
											  Value const& lhs,
											  Value const& rhs,
											  SourceSpan span);
	[[nodiscard]] ErrorOr<Value> apply_unary(fe::UnaryOp op, Value const& rhs, SourceSpan span);

} // namespace pryzma::rt

#endif /* PRYZMA_RT_VALUE_HH */
