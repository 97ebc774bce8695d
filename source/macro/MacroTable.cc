#include <utility>
#include <pryzma/macro/MacroTable.hh>

namespace pryzma::macro
{
	bool MacroTable::define_macro(MacroDef def)
	{
		if (m_macros.contains(def.name))
			return false;

		auto name = def.name;
		m_macros.emplace(std::move(name), std::move(def));
		return true;
	}

	void MacroTable::add_keyword_rule(KeywordRule rule)
	{
		auto& rules = m_keywords[rule.trigger];
		rules.push_back(std::move(rule));
	}

	MacroDef const* MacroTable::find_macro(std::string_view name) const
	{
		auto it = m_macros.find(std::string(name));
		if (it == m_macros.end())
			return nullptr;

		return &it->second;
	}

	std::span<const KeywordRule> MacroTable::keyword_rules(std::string_view trigger) const
	{
		auto it = m_keywords.find(std::string(trigger));
		if (it == m_keywords.end())
			return {};

		return {it->second.data(), it->second.size()};
	}

	bool MacroTable::is_keyword(std::string_view trigger) const
	{
		return m_keywords.contains(std::string(trigger));
	}

	void MacroTable::clear() noexcept
	{
		m_macros.clear();
		m_keywords.clear();
	}

} // namespace pryzma::macro
