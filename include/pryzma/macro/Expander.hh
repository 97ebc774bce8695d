#ifndef PRYZMA_MACRO_EXPANDER_HH
#define PRYZMA_MACRO_EXPANDER_HH

#include <cstddef>
#include <functional>
#include <span>
#include <string_view>
#include <vector>
#include <pryzma/Error.hh>
#include <pryzma/lex/Tokens.hh>
#include <pryzma/macro/MacroTable.hh>

namespace pryzma
{
	class SourceManager;

} // namespace pryzma

namespace pryzma::macro
{
	struct ExpandOptions
	{
		std::size_t max_depth{64};
		std::size_t max_expansions{100000};
	};

	// Maps the path of an `#insert` to an opened file.
	using InsertResolver =
		std::function<ErrorOr<FileId>(std::string_view reference, FileId from, SourceSpan where)>;

	// Token-level preprocessor. Registers `#macro` and `#keyword` definitions
	// into the table it is given, splices `#insert` files, and rewrites every
	// invocation until none are left.
	//
	// Expansion runs left to right, outside-in: the first invocation is replaced
	// and its expansion is rescanned before anything to its right. Arguments are
	// substituted unexpanded. Definitions stay in the output so the parser can
	// record them; they only affect tokens that follow them.
	class Expander
	{
	public:
		Expander(SourceManager& sources, MacroTable& table, ExpandOptions opt = {}) noexcept;

		void set_insert_resolver(InsertResolver resolver);

		// `tokens` must end with the eof token of `origin`.
		[[nodiscard]] ErrorOr<std::vector<lex::Token>> expand(std::span<const lex::Token> tokens,
															  FileId origin);

		[[nodiscard]] ErrorOr<std::vector<lex::Token>> expand_file(FileId file);

	private:
		SourceManager* m_sources{};
		MacroTable* m_table{};
		ExpandOptions m_opt{};
		InsertResolver m_resolver{};
	};

} // namespace pryzma::macro

#endif /* PRYZMA_MACRO_EXPANDER_HH */
