#include <utility>
#include <pryzma/rt/Environment.hh>

namespace pryzma::rt
{
	Environment::Environment(std::shared_ptr<Environment> parent) noexcept
		: m_parent(std::move(parent))
	{
	}

	void Environment::define(std::string name, Value value)
	{
		m_values.insert_or_assign(std::move(name), Binding{std::move(value), false});
	}

	Value const* Environment::lookup(std::string_view name) const
	{
		auto key = std::string(name);
		for (auto const* env = this; env; env = env->m_parent.get())
		{
			auto it = env->m_values.find(key);
			if (it != env->m_values.end())
				return &it->second.value;
		}

		return nullptr;
	}

	bool Environment::defines_here(std::string_view name) const
	{
		return m_values.contains(std::string(name));
	}

	bool Environment::declares_here(std::string_view name) const
	{
		auto key = std::string(name);
		return m_values.contains(key) || m_structs.contains(key) || m_modules.contains(key);
	}

	AssignResult Environment::assign(std::string_view name, Value value)
	{
		auto key = std::string(name);
		for (auto* env = this; env; env = env->m_parent.get())
		{
			auto it = env->m_values.find(key);
			if (it == env->m_values.end())
				continue;

			if (it->second.frozen)
				return AssignResult::read_only;

			it->second.value = std::move(value);
			return AssignResult::ok;
		}

		return AssignResult::undefined;
	}

	bool Environment::freeze(std::string_view name)
	{
		auto it = m_values.find(std::string(name));
		if (it == m_values.end())
			return false;

		it->second.frozen = true;
		return true;
	}

	bool Environment::is_frozen(std::string_view name) const
	{
		auto key = std::string(name);
		for (auto const* env = this; env; env = env->m_parent.get())
		{
			auto it = env->m_values.find(key);
			if (it != env->m_values.end())
				return it->second.frozen;
		}

		return false;
	}

	void Environment::define_struct(std::string name, std::shared_ptr<StructType const> type)
	{
		m_structs.insert_or_assign(std::move(name), std::move(type));
	}

	std::shared_ptr<StructType const> Environment::lookup_struct(std::string_view name) const
	{
		auto key = std::string(name);
		for (auto const* env = this; env; env = env->m_parent.get())
		{
			auto it = env->m_structs.find(key);
			if (it != env->m_structs.end())
				return it->second;
		}

		return nullptr;
	}

	void Environment::define_module(std::string alias, std::shared_ptr<Module> module)
	{
		m_modules.insert_or_assign(std::move(alias), std::move(module));
	}

	std::shared_ptr<Module> Environment::lookup_module(std::string_view alias) const
	{
		auto key = std::string(alias);
		for (auto const* env = this; env; env = env->m_parent.get())
		{
			auto it = env->m_modules.find(key);
			if (it != env->m_modules.end())
				return it->second;
		}

		return nullptr;
	}

	void Environment::for_each_binding(
		std::function<void(std::string const&, Value const&, bool)> const& fn) const
	{
		for (auto const& [name, binding] : m_values)
			fn(name, binding.value, binding.frozen);
	}

	void Environment::for_each_struct(
		std::function<void(std::string const&, std::shared_ptr<StructType const> const&)> const& fn)
		const
	{
		for (auto const& [name, type] : m_structs)
			fn(name, type);
	}

	void Environment::for_each_module(
		std::function<void(std::string const&, std::shared_ptr<Module> const&)> const& fn) const
	{
		for (auto const& [alias, module] : m_modules)
			fn(alias, module);
	}

	void Environment::clear() noexcept
	{
		m_values.clear();
		m_structs.clear();
		m_modules.clear();
	}

} // namespace pryzma::rt
