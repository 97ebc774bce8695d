#ifndef PRYZMA_MACRO_PATTERN_HH
#define PRYZMA_MACRO_PATTERN_HH

#include <string>
#include <unordered_map>
#include <variant>
#include <vector>
#include <pryzma/lex/Tokens.hh>
#include <pryzma/macro/TokenSlice.hh>
#include <pryzma/support/Span.hh>

namespace pryzma::macro
{
	struct PatternLiteral
	{
		SourceSpan span{};
		lex::TokenKind kind{lex::TokenKind::invalid};
		std::string lexeme{};
	};

	// `_`: exactly one token.
	struct PatternWildcard
	{
		SourceSpan span{};
	};

	// `...`: any run of tokens, possibly empty.
	struct PatternEllipsis
	{
		SourceSpan span{};
	};

	// `$name`: a non-empty, bracket-balanced run of tokens.
	struct PatternBind
	{
		SourceSpan span{};
		std::string name{};
	};

	using PatternElem = std::variant<PatternLiteral, PatternWildcard, PatternEllipsis, PatternBind>;

	struct Pattern
	{
		std::vector<PatternElem> elems{};
	};

	struct PatternParseError
	{
		SourceSpan span{};
		std::string message{};
	};

	struct PatternParseResult
	{
		Pattern pattern{};
		std::vector<PatternParseError> errors{};

		[[nodiscard]] bool ok() const noexcept { return errors.empty(); }
	};

	PatternParseResult parse_pattern(TokenSlice slice);

	struct MatchResult
	{
		std::unordered_map<std::string, TokenSlice> bindings{};
	};

	[[nodiscard]] bool match_pattern(Pattern const& pattern, TokenSlice input, MatchResult& result);

	// True when every bracket opened in the slice is closed inside it, in order.
	[[nodiscard]] bool is_balanced(TokenSlice slice) noexcept;

} // namespace pryzma::macro

#endif /* PRYZMA_MACRO_PATTERN_HH */
