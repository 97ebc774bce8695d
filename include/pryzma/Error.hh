#ifndef PRYZMA_ERROR_HH
#define PRYZMA_ERROR_HH

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>
#include <pryzma/support/Result.hh>
#include <pryzma/support/Span.hh>

namespace pryzma
{
	enum class ErrorKind : std::uint8_t
	{
		lex_error,
		parse_error,
		macro_expansion_limit,
		circular_import,
		module_not_found,
		arity_error,
		missing_field,
		type_error,
		undefined_name,
		unsupported_opcode,
		memory_fault,

		division_by_zero,
		index_error,
		user_error,
		resource_limit,
	};

	[[nodiscard]] constexpr std::string_view error_kind_name(ErrorKind k) noexcept
	{
		switch (k)
		{
			case ErrorKind::lex_error:
				return "LexError";
			case ErrorKind::parse_error:
				return "ParseError";
			case ErrorKind::macro_expansion_limit:
				return "MacroExpansionLimit";
			case ErrorKind::circular_import:
				return "CircularImport";
			case ErrorKind::module_not_found:
				return "ModuleNotFound";
			case ErrorKind::arity_error:
				return "ArityError";
			case ErrorKind::missing_field:
				return "MissingField";
			case ErrorKind::type_error:
				return "TypeError";
			case ErrorKind::undefined_name:
				return "UndefinedNameError";
			case ErrorKind::unsupported_opcode:
				return "UnsupportedOpcode";
			case ErrorKind::memory_fault:
				return "MemoryFault";
			case ErrorKind::division_by_zero:
				return "DivisionByZero";
			case ErrorKind::index_error:
				return "IndexError";
			case ErrorKind::user_error:
				return "UserError";
			case ErrorKind::resource_limit:
				return "ResourceLimit";
		}

		return "Error";
	}

	struct ErrorNote
	{
		SourceSpan span{};
		std::string message{};
	};

	// Every failure in the core is reported as one of these. `subject` holds the
	// offending name, field or opcode when there is one.
	struct Error
	{
		ErrorKind kind{ErrorKind::type_error};
		SourceSpan span{};

		std::string message{};
		std::string subject{};

		std::vector<ErrorNote> notes{};

		[[nodiscard]] bool is(ErrorKind k) const noexcept { return kind == k; }
	};

	[[nodiscard]] Error
	make_error(ErrorKind kind, SourceSpan span, std::string message, std::string subject = {});

	template <class V> using ErrorOr = Result<V, Error>;
	using Status = Result<Unit, Error>;

} // namespace pryzma

#endif /* PRYZMA_ERROR_HH */
