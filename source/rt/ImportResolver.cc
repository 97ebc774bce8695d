#include <filesystem>
#include <utility>
#include <pryzma/rt/Module.hh>

namespace pryzma::rt
{
	namespace
	{
		namespace fs = std::filesystem;

		[[nodiscard]] std::string package_to_path(std::string_view reference)
		{
			std::string out{};
			std::size_t pos = 0;

			for (;;)
			{
				auto sep = reference.find("::", pos);
				out += reference.substr(pos, sep == std::string_view::npos ? sep : sep - pos);
				if (sep == std::string_view::npos)
					break;
				out += '/';
				pos = sep + 2;
			}

			return out;
		}

		[[nodiscard]] bool is_file(fs::path const& p)
		{
			std::error_code ec{};
			return fs::is_regular_file(p, ec);
		}

		[[nodiscard]] std::string canonical_path(fs::path const& p)
		{
			std::error_code ec{};
			auto c = fs::weakly_canonical(p, ec);
			return ec ? p.lexically_normal().string() : c.string();
		}

		// The reference as given, then with each known extension.
		[[nodiscard]] std::vector<fs::path> candidates(fs::path const& base)
		{
			std::vector<fs::path> out{base};
			if (!base.has_extension())
			{
				out.push_back(fs::path(base.string() + ".pryzma"));
				out.push_back(fs::path(base.string() + ".prz"));
			}
			return out;
		}

	} // namespace

	ImportResolver::ImportResolver(ResolverConfig config) : m_config(std::move(config)) {}

	void ImportResolver::set_config(ResolverConfig config)
	{
		m_config = std::move(config);
	}

	std::vector<std::string> ImportResolver::roots(std::string_view importer_dir) const
	{
		std::vector<std::string> out{};

		auto add = [&](std::string dir) {
			for (auto const& d : out)
				if (d == dir)
					return;
			out.push_back(std::move(dir));
		};

		if (!importer_dir.empty())
			add(std::string(importer_dir));

		if (!m_config.project_root.empty())
		{
			add(m_config.project_root);
			add((fs::path(m_config.project_root) / "src").string());
		}

		for (auto const& p : m_config.search_paths)
			add(p);

		if (!m_config.packages_dir.empty())
			add(m_config.packages_dir);

		if (out.empty())
			out.push_back(".");

		return out;
	}

	ErrorOr<std::string> ImportResolver::resolve(std::string_view reference,
												 bool is_package,
												 std::string_view importer_dir,
												 SourceSpan where) const
	{
		auto rel = is_package ? package_to_path(reference) : std::string(reference);

		fs::path rel_path(rel);
		if (rel_path.is_absolute())
		{
			for (auto const& c : candidates(rel_path))
				if (is_file(c))
					return canonical_path(c);
		}
		else
		{
			for (auto const& root : roots(importer_dir))
				for (auto const& c : candidates(fs::path(root) / rel_path))
					if (is_file(c))
						return canonical_path(c);
		}

		if (is_package && !m_config.packages_dir.empty()
			&& reference.find("::") == std::string_view::npos)
		{
			auto pkg = fs::path(m_config.packages_dir) / rel / (rel + ".pryzma");
			if (is_file(pkg))
				return canonical_path(pkg);
		}

		auto e = make_error(ErrorKind::module_not_found,
							where,
							"module '" + std::string(reference) + "' not found",
							std::string(reference));

		std::string searched{};
		for (auto const& root : roots(importer_dir))
		{
			if (!searched.empty())
				searched += ", ";
			searched += root;
		}
		e.notes.push_back(ErrorNote{{}, "searched in: " + searched});
		return e;
	}

	std::string module_stem(std::string_view reference, bool is_package)
	{
		if (is_package)
		{
			auto sep = reference.rfind("::");
			return std::string(sep == std::string_view::npos ? reference : reference.substr(sep + 2));
		}

		return fs::path(reference).stem().string();
	}

} // namespace pryzma::rt
