#ifndef PRYZMA_RT_ENVIRONMENT_HH
#define PRYZMA_RT_ENVIRONMENT_HH

#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <pryzma/rt/Value.hh>

namespace pryzma::rt
{
	struct Module;

	enum class AssignResult
	{
		ok,
		undefined,
		read_only,
	};

	// One frame of the lexical scope chain. The parent is fixed at
	// construction, so a chain can never loop back on itself.
	class Environment
	{
	public:
		explicit Environment(std::shared_ptr<Environment> parent = nullptr) noexcept;

		Environment(Environment const&) = delete;
		Environment& operator=(Environment const&) = delete;

		[[nodiscard]] std::shared_ptr<Environment> const& parent() const noexcept { return m_parent; }

		// Binds in this frame, replacing any binding of the same name here.
		void define(std::string name, Value value);

		[[nodiscard]] Value const* lookup(std::string_view name) const;
		[[nodiscard]] bool defines_here(std::string_view name) const;
		// Any value, struct or module alias bound in this frame.
		[[nodiscard]] bool declares_here(std::string_view name) const;

		// Rebinds in the nearest frame that defines `name`.
		[[nodiscard]] AssignResult assign(std::string_view name, Value value);

		bool freeze(std::string_view name);
		[[nodiscard]] bool is_frozen(std::string_view name) const;

		void define_struct(std::string name, std::shared_ptr<StructType const> type);
		[[nodiscard]] std::shared_ptr<StructType const> lookup_struct(std::string_view name) const;

		void define_module(std::string alias, std::shared_ptr<Module> module);
		[[nodiscard]] std::shared_ptr<Module> lookup_module(std::string_view alias) const;

		// Visits the bindings of this frame only.
		void for_each_binding(
			std::function<void(std::string const& name, Value const& value, bool frozen)> const& fn)
			const;
		void for_each_struct(
			std::function<void(std::string const& name, std::shared_ptr<StructType const> const&)> const&
				fn) const;
		void for_each_module(
			std::function<void(std::string const& alias, std::shared_ptr<Module> const&)> const& fn)
			const;

		// Drops every binding; breaks closure cycles when a session ends.
		void clear() noexcept;

	private:
		struct Binding
		{
			Value value{};
			bool frozen{};
		};

		std::shared_ptr<Environment> m_parent{};

		std::unordered_map<std::string, Binding> m_values{};
		std::unordered_map<std::string, std::shared_ptr<StructType const>> m_structs{};
		std::unordered_map<std::string, std::shared_ptr<Module>> m_modules{};
	};

} // namespace pryzma::rt

#endif /* PRYZMA_RT_ENVIRONMENT_HH */
