#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>
#include <pryzma/Interpreter.hh>

namespace
{
	namespace fs = std::filesystem;
	using pryzma::ErrorKind;

	// A scratch directory removed when the test finishes.
	class TempTree
	{
	public:
		TempTree()
		{
			auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
			m_root = fs::temp_directory_path() / ("pryzma_import_tests_" + std::to_string(stamp));
			fs::create_directories(m_root);
		}

		~TempTree()
		{
			std::error_code ec{};
			fs::remove_all(m_root, ec);
		}

		TempTree(TempTree const&) = delete;
		TempTree& operator=(TempTree const&) = delete;

		void write(std::string const& rel, std::string_view text) const
		{
			auto p = m_root / rel;
			fs::create_directories(p.parent_path());
			std::ofstream f(p, std::ios::binary);
			f << text;
		}

		[[nodiscard]] std::string path(std::string const& rel = {}) const
		{
			return rel.empty() ? m_root.string() : (m_root / rel).string();
		}

	private:
		fs::path m_root{};
	};

	bool check(bool cond, std::string_view msg)
	{
		if (cond)
			return true;

		std::cerr << "FAIL: " << msg << "\n";
		return false;
	}

	pryzma::InterpreterOptions options_for(TempTree const& tree, std::ostringstream& out)
	{
		pryzma::InterpreterOptions opt{};
		opt.out = &out;
		opt.project_root = tree.path("project");
		opt.search_paths.push_back(tree.path("extra"));
		opt.packages_dir = tree.path("packages");
		return opt;
	}

	void report(pryzma::ErrorOr<pryzma::rt::Value> const& r)
	{
		if (!r.ok())
			std::cerr << "  " << pryzma::error_kind_name(r.err().kind) << ": " << r.err().message << "\n";
	}

} // namespace

int main()
{
	int failures = 0;

	TempTree tree{};
	tree.write("project/util.pryzma",
			   "export add, Point, scale\n"
			   "print(\"loading util\")\n"
			   "fn add(a, b) { a + b }\n"
			   "struct Point { x, y = 0 }\n"
			   "let scale = 10\n"
			   "let hidden = 1\n");
	tree.write("project/open.pryzma", "let a = 1\nlet b = 2\n");
	tree.write("project/cycle_a.pryzma", "use \"cycle_b\"\nlet from_a = 1\n");
	tree.write("project/cycle_b.pryzma", "use \"cycle_a\"\nlet from_b = 1\n");
	tree.write("project/broken.pryzma", "print(\"loading broken\")\nmissing_name\n");
	tree.write("project/bad_export.pryzma", "export ghost\nlet real = 1\n");
	tree.write("project/borrowed_export.pryzma", "export Error\nlet real = 1\n");
	tree.write("project/src/helper.pryzma", "let where = \"src\"\n");
	tree.write("project/short.prz", "let kind = \"prz\"\n");
	tree.write("project/sub/inner.pryzma", "use \"sibling\"\nlet total = sibling.value + 1\n");
	tree.write("project/sub/sibling.pryzma", "let value = 41\n");
	tree.write("project/sub/defs.pryzma", "#macro DOUBLE(v) { (v) * 2 }\n");
	tree.write("project/sub/uses_insert.pryzma", "#insert \"defs\"\nlet twelve = DOUBLE(6)\n");
	tree.write("extra/from_path.pryzma", "let origin = \"search path\"\n");
	tree.write("packages/geom/shapes.pryzma", "export area\nfn area(w, h) { w * h }\n");
	tree.write("packages/tools/tools.pryzma", "let name = \"tools\"\n");

	{
		std::ostringstream out{};
		pryzma::Interpreter interp(options_for(tree, out));

		auto first = interp.import_module("util");
		auto second = interp.import_module("util");
		failures += !check(first.ok() && second.ok(), "module imports");
		failures += !check(first.ok() && second.ok() && first.value() == second.value(),
						   "importing twice returns the cached module");
		failures += !check(out.str() == "loading util\n", "a module body runs once per session");
		failures += !check(first.ok() && first.value()->state == pryzma::rt::ModuleState::ready, "module is ready");
		failures += !check(first.ok() && first.value()->name == "util", "module named after its stem");
	}

	{
		std::ostringstream out{};
		pryzma::Interpreter interp(options_for(tree, out));
		auto r = interp.run_source("main",
								   "use \"util\"\nuse \"util\" as u\n"
								   "let p = u.Point(x: 1)\n"
								   "print(util.add(2, 3), u.scale, p.y)");
		report(r);
		failures += !check(r.ok() && out.str() == "loading util\n5 10 0\n", "exported names through alias and stem");
	}

	{
		std::ostringstream out{};
		pryzma::Interpreter interp(options_for(tree, out));
		auto hidden = interp.run_source("main", "use \"util\" as u\nu.hidden");
		failures += !check(!hidden.ok() && hidden.err().kind == ErrorKind::undefined_name,
						   "unexported names are not visible");

		auto write = interp.run_source("assign", "u.scale = 5");
		failures += !check(!write.ok() && write.err().kind == ErrorKind::type_error,
						   "imported bindings cannot be assigned through the module");
	}

	{
		std::ostringstream out{};
		pryzma::Interpreter interp(options_for(tree, out));
		auto r = interp.run_source("main", "use \"util\" with nan\nprint(add(scale, 1))");
		report(r);
		failures += !check(r.ok() && out.str() == "loading util\n11\n", "merged import binds exported names");

		auto alias = interp.evaluate("util");
		failures += !check(!alias.ok() && alias.err().kind == ErrorKind::undefined_name,
						   "merge without alias binds no module name");

		auto frozen = interp.evaluate("scale = 3");
		failures += !check(!frozen.ok() && frozen.err().kind == ErrorKind::type_error, "merged bindings are frozen");

		auto secret = interp.evaluate("hidden");
		failures += !check(!secret.ok() && secret.err().kind == ErrorKind::undefined_name,
						   "merge skips unexported names");
	}

	{
		std::ostringstream out{};
		pryzma::Interpreter interp(options_for(tree, out));
		auto r = interp.run_source("main", "use \"open\" with nan\nprint(a + b)");
		report(r);
		failures += !check(r.ok() && out.str() == "3\n", "without an export list everything is visible");
	}

	{
		std::ostringstream out{};
		pryzma::Interpreter interp(options_for(tree, out));
		auto r = interp.run_source("main", "use \"cycle_a\"");
		failures += !check(!r.ok() && r.err().kind == ErrorKind::circular_import, "import cycle is detected");
		failures += !check(!r.ok() && r.err().message.find("cycle_a -> cycle_b -> cycle_a") != std::string::npos,
						   "cycle message lists the chain");
	}

	{
		std::ostringstream out{};
		pryzma::Interpreter interp(options_for(tree, out));
		auto once = interp.run_source("main", "use \"broken\"");
		auto twice = interp.run_source("again", "use \"broken\"");
		failures += !check(!once.ok() && once.err().kind == ErrorKind::undefined_name, "module errors propagate");
		failures += !check(!once.ok() && !once.err().notes.empty()
							   && once.err().notes.back().message.find("while importing 'broken'") != std::string::npos,
						   "import failure carries a note");
		failures += !check(!twice.ok() && out.str() == "loading broken\nloading broken\n",
						   "failed modules are not cached");
	}

	{
		std::ostringstream out{};
		pryzma::Interpreter interp(options_for(tree, out));
		auto r = interp.import_module("bad_export");
		failures += !check(!r.ok() && r.err().kind == ErrorKind::undefined_name && r.err().subject == "ghost",
						   "exporting an undefined name fails");

		auto outer = interp.import_module("borrowed_export");
		failures += !check(!outer.ok() && outer.err().kind == ErrorKind::undefined_name && outer.err().subject == "Error",
						   "exports must be defined by the module itself");
	}

	{
		std::ostringstream out{};
		pryzma::Interpreter interp(options_for(tree, out));
		auto r = interp.run_source("main",
								   "use \"helper\"\nuse \"short\"\nuse \"from_path\"\n"
								   "print(helper.where, short.kind, from_path.origin)");
		report(r);
		failures += !check(r.ok() && out.str() == "src prz search path\n",
						   "src directory, .prz fallback and search paths");
	}

	{
		std::ostringstream out{};
		pryzma::Interpreter interp(options_for(tree, out));
		auto r = interp.run_source("main", "use geom::shapes\nuse tools\nprint(shapes.area(3, 4), tools.name)");
		report(r);
		failures += !check(r.ok() && out.str() == "12 tools\n", "package references");
	}

	{
		std::ostringstream out{};
		pryzma::Interpreter interp(options_for(tree, out));
		auto r = interp.run_source("main", "use \"sub/inner\" as inner\nprint(inner.total)");
		report(r);
		failures += !check(r.ok() && out.str() == "42\n", "imports resolve relative to the importing file");
	}

	{
		std::ostringstream out{};
		pryzma::Interpreter interp(options_for(tree, out));
		auto r = interp.run_file(tree.path("project/sub/uses_insert.pryzma"));
		report(r);
		auto v = r.ok() ? interp.evaluate("twelve") : pryzma::ErrorOr<pryzma::rt::Value>(pryzma::rt::Value::none());
		failures += !check(v.ok() && v.value().is(pryzma::rt::ValueKind::integer) && v.value().as_int() == 12,
						   "#insert next to the running file");
	}

	{
		std::ostringstream out{};
		pryzma::Interpreter interp(options_for(tree, out));
		auto r = interp.run_source("main", "use \"nowhere\"");
		failures += !check(!r.ok() && r.err().kind == ErrorKind::module_not_found && r.err().subject == "nowhere",
						   "missing module");

		auto pkg = interp.import_module("no::such::pkg");
		failures += !check(!pkg.ok() && pkg.err().kind == ErrorKind::module_not_found, "missing package");
	}

	{
		std::ostringstream out{};
		pryzma::Interpreter interp(options_for(tree, out));
		auto add = interp.import_function("util", "add");
		auto sum = add.ok() ? interp.call(add.value(), {pryzma::rt::Value::from_int(20), pryzma::rt::Value::from_int(22)})
							: pryzma::ErrorOr<pryzma::rt::Value>(pryzma::rt::Value::none());
		failures += !check(sum.ok() && sum.value().is(pryzma::rt::ValueKind::integer) && sum.value().as_int() == 42, "import_function returns a callable");

		auto hidden = interp.import_function("util", "hidden");
		failures += !check(!hidden.ok() && hidden.err().kind == ErrorKind::undefined_name,
						   "import_function respects exports");

		auto not_fn = interp.import_function("util", "scale");
		failures += !check(!not_fn.ok() && not_fn.err().kind == ErrorKind::type_error,
						   "import_function wants a function");
	}

	{
		pryzma::rt::ResolverConfig config{};
		config.project_root = tree.path("project");
		config.search_paths.push_back(tree.path("extra"));
		config.packages_dir = tree.path("packages");
		pryzma::rt::ImportResolver resolver(config);

		auto roots = resolver.roots("here");
		failures += !check(roots.size() == 5 && roots[0] == "here" && roots[1] == tree.path("project")
							   && roots[3] == tree.path("extra") && roots[4] == tree.path("packages"),
						   "search order");

		auto r = resolver.resolve("util.pryzma", false, tree.path("project"), {});
		failures += !check(r.ok() && fs::path(r.value()).filename() == "util.pryzma", "explicit extension");

		failures += !check(pryzma::rt::module_stem("a::b::c", true) == "c", "package stem");
		failures += !check(pryzma::rt::module_stem("lib/util.pryzma", false) == "util", "path stem");
	}

	if (failures != 0)
		std::cerr << failures << " test(s) failed\n";

	return failures == 0 ? 0 : 1;
}
