#ifndef PRYZMA_MACRO_TOKEN_SLICE_HH
#define PRYZMA_MACRO_TOKEN_SLICE_HH

#include <cstddef>
#include <span>
#include <string>
#include <pryzma/lex/Tokens.hh>
#include <pryzma/support/Span.hh>

namespace pryzma::macro
{
	struct TokenSlice
	{
		lex::Token const* begin{};
		lex::Token const* end{};
		SourceSpan span{};

		[[nodiscard]] bool empty() const noexcept { return begin == end; }
		[[nodiscard]] std::size_t size() const noexcept
		{
			return static_cast<std::size_t>(end - begin);
		}
		[[nodiscard]] std::span<const lex::Token> tokens() const noexcept
		{
			return {begin, size()};
		}
	};

	[[nodiscard]] SourceSpan span_for_tokens(lex::Token const* begin,
											 lex::Token const* end) noexcept;
	[[nodiscard]] TokenSlice make_token_slice(lex::Token const* begin,
											  lex::Token const* end) noexcept;
	[[nodiscard]] TokenSlice make_token_slice(std::span<const lex::Token> tokens) noexcept;

	// Renders tokens as source text: single spaces between tokens, newline
	// tokens as line breaks.
	[[nodiscard]] std::string token_slice_to_string(TokenSlice slice);
	[[nodiscard]] std::string render_tokens(std::span<const lex::Token> tokens);

} // namespace pryzma::macro

#endif /* PRYZMA_MACRO_TOKEN_SLICE_HH */
