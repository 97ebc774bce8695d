#include <utility>
#include <pryzma/Error.hh>

namespace pryzma
{
	Error make_error(ErrorKind kind, SourceSpan span, std::string message, std::string subject)
	{
		Error e{};
		e.kind = kind;
		e.span = span;
		e.message = std::move(message);
		e.subject = std::move(subject);
		return e;
	}

} // namespace pryzma
