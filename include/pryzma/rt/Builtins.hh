#ifndef PRYZMA_RT_BUILTINS_HH
#define PRYZMA_RT_BUILTINS_HH

#include <memory>
#include <optional>
#include <pryzma/Error.hh>
#include <pryzma/rt/Environment.hh>
#include <pryzma/rt/Value.hh>

namespace pryzma::rt
{
	// Binds print, len, str, int, float, type, range, push, pop, fields and
	// assert, plus the `Error` struct, into `env`.
	void install_builtins(Environment& env);

	// `Error { kind, message, line, column }`, the type of a caught error.
	[[nodiscard]] std::shared_ptr<StructType const> const& error_struct_type();

	[[nodiscard]] Value error_to_value(Error const& err);

	// Rebuilds an error from an `Error` instance, for `throw err` in a handler.
	[[nodiscard]] std::optional<Error> value_to_error(Value const& v, SourceSpan where);

} // namespace pryzma::rt

#endif /* PRYZMA_RT_BUILTINS_HH */
