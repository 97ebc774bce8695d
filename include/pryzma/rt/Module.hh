#ifndef PRYZMA_RT_MODULE_HH
#define PRYZMA_RT_MODULE_HH

#include <memory>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>
#include <pryzma/Error.hh>
#include <pryzma/rt/Environment.hh>

namespace pryzma::rt
{
	enum class ModuleState
	{
		loading,
		ready,
	};

	struct Module
	{
		std::string name{};
		std::string path{};
		FileId file{};

		ModuleState state{ModuleState::loading};
		std::shared_ptr<Environment> env{};

		// Without an `export` statement every top-level binding is visible.
		bool has_export_list{};
		std::unordered_set<std::string> exports{};

		[[nodiscard]] bool exports_name(std::string_view n) const
		{
			return !has_export_list || exports.contains(std::string(n));
		}
	};

	struct ResolverConfig
	{
		std::string project_root{};
		std::vector<std::string> search_paths{};
		std::string packages_dir{};
	};

	// Maps a `use` or `#insert` reference to the canonical path of a file.
	class ImportResolver
	{
	public:
		ImportResolver() = default;
		explicit ImportResolver(ResolverConfig config);

		[[nodiscard]] ResolverConfig const& config() const noexcept { return m_config; }
		void set_config(ResolverConfig config);

		// `importer_dir` is searched first; pass an empty string for sources
		// without a directory.
		[[nodiscard]] ErrorOr<std::string> resolve(std::string_view reference,
												   bool is_package,
												   std::string_view importer_dir,
												   SourceSpan where) const;

		// The directories searched for `importer_dir`, in order.
		[[nodiscard]] std::vector<std::string> roots(std::string_view importer_dir) const;

	private:
		ResolverConfig m_config{};
	};

	// `"lib/util.pryzma"` and `lib::util` both name a module `util`.
	[[nodiscard]] std::string module_stem(std::string_view reference, bool is_package);

} // namespace pryzma::rt

#endif /* PRYZMA_RT_MODULE_HH */
