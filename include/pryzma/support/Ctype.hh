#ifndef PRYZMA_SUPPORT_CTYPE_HH
#define PRYZMA_SUPPORT_CTYPE_HH

namespace pryzma
{
	[[nodiscard]] constexpr bool is_ascii_alpha(char c) noexcept
	{
		return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
	}

	[[nodiscard]] constexpr bool is_ascii_digit(char c) noexcept
	{
		return c >= '0' && c <= '9';
	}

	[[nodiscard]] constexpr bool is_ascii_alnum(char c) noexcept
	{
		return is_ascii_alpha(c) || is_ascii_digit(c);
	}

	[[nodiscard]] constexpr bool is_ascii_space(char c) noexcept
	{
		return c == ' ' || c == '\t' || c == '\v' || c == '\f';
	}

	[[nodiscard]] constexpr char ascii_tolower(char c) noexcept
	{
		if (c >= 'A' && c <= 'Z')
			return static_cast<char>(c - 'A' + 'a');

		return c;
	}

	[[nodiscard]] constexpr bool is_ident_start(char c) noexcept
	{
		return is_ascii_alpha(c) || c == '_';
	}

	[[nodiscard]] constexpr bool is_ident_continue(char c) noexcept
	{
		return is_ascii_alnum(c) || c == '_';
	}

} // namespace pryzma

#endif /* PRYZMA_SUPPORT_CTYPE_HH */
