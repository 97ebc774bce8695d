#ifndef PRYZMA_MACRO_MACRO_TABLE_HH
#define PRYZMA_MACRO_MACRO_TABLE_HH

#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>
#include <pryzma/lex/Tokens.hh>
#include <pryzma/macro/Pattern.hh>
#include <pryzma/support/Span.hh>

namespace pryzma::macro
{
	struct MacroDef
	{
		std::string name{};
		SourceSpan span{};

		bool function_like{};
		std::vector<std::string> params{};

		std::vector<lex::Token> body{};
	};

	struct KeywordRule
	{
		std::string trigger{};
		SourceSpan span{};

		Pattern pattern{};
		std::vector<lex::Token> templ{};
	};

	// Registered macros and keyword rules of one interpreter session. Tokens
	// stored here view into the session's SourceManager buffers.
	class MacroTable
	{
	public:
		MacroTable() = default;

		// Returns false and leaves the table unchanged when `def.name` is taken.
		bool define_macro(MacroDef def);
		void add_keyword_rule(KeywordRule rule);

		[[nodiscard]] MacroDef const* find_macro(std::string_view name) const;
		[[nodiscard]] std::span<const KeywordRule> keyword_rules(std::string_view trigger) const;

		[[nodiscard]] bool is_keyword(std::string_view trigger) const;

		[[nodiscard]] std::size_t macro_count() const noexcept { return m_macros.size(); }
		[[nodiscard]] std::size_t keyword_count() const noexcept { return m_keywords.size(); }

		void clear() noexcept;

	private:
		std::unordered_map<std::string, MacroDef> m_macros{};
		std::unordered_map<std::string, std::vector<KeywordRule>> m_keywords{};
	};

} // namespace pryzma::macro

#endif /* PRYZMA_MACRO_MACRO_TABLE_HH */
