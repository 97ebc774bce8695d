#include <iostream>
#include <string>
#include <string_view>
#include <pryzma/macro/Expander.hh>
#include <pryzma/macro/MacroTable.hh>
#include <pryzma/macro/TokenSlice.hh>
#include <pryzma/support/SourceManager.hh>

namespace
{
	struct Session
	{
		pryzma::SourceManager sources{};
		pryzma::macro::MacroTable table{};
		pryzma::macro::ExpandOptions opt{};
	};

	pryzma::ErrorOr<std::string> expand_text(Session& s, std::string_view text)
	{
		auto id = s.sources.add_virtual("main", std::string(text));

		pryzma::macro::Expander expander(s.sources, s.table, s.opt);
		auto out = expander.expand_file(id);
		if (!out.ok())
			return out.take_err();
		return pryzma::macro::render_tokens(out.value());
	}

	bool check(bool cond, std::string_view msg)
	{
		if (cond)
			return true;

		std::cerr << "FAIL: " << msg << "\n";
		return false;
	}

	bool expands_to(std::string_view text, std::string_view expected_part)
	{
		Session s{};
		auto out = expand_text(s, text);
		if (!out.ok())
		{
			std::cerr << "  unexpected error: " << out.err().message << "\n";
			return false;
		}
		if (out.value().find(expected_part) == std::string::npos)
		{
			std::cerr << "  got: " << out.value() << "\n";
			return false;
		}
		return true;
	}

	bool fails_with(std::string_view text, pryzma::ErrorKind kind, std::string_view subject = {})
	{
		Session s{};
		auto out = expand_text(s, text);
		if (out.ok())
			return false;
		return out.err().kind == kind && (subject.empty() || out.err().subject == subject);
	}

} // namespace

int main()
{
	using pryzma::ErrorKind;

	int failures = 0;

	failures += !check(expands_to("#macro PI { 3.14159 }\nlet r = PI", "let r = 3.14159"), "object-like macro");
	failures += !check(expands_to("#macro square(v) { (v) * (v) }\nsquare(2 + 1)", "( 2 + 1 ) * ( 2 + 1 )"),
					   "function-like macro substitutes its argument");
	failures += !check(expands_to("#macro pair(a, b) { [a, b] }\npair(f(1, 2), 3)", "[ f ( 1 , 2 ) , 3 ]"),
					   "arguments split at top-level commas only");
	failures += !check(expands_to("#macro twice(x) { x + x }\n#macro quad(x) { twice(twice(x)) }\nquad(1)",
								  "1 + 1 + 1 + 1"),
					   "nested invocations expand on rescan");
	failures += !check(expands_to("#macro square(v) { v * v }\nlet f = square", "let f = square"),
					   "function-like macro needs a following paren");
	failures += !check(expands_to("#macro x { 1 }\np.x", "p . x"), "member name after a dot is not expanded");
	failures += !check(expands_to("PI\n#macro PI { 3 }\nPI", "PI\n#macro"), "earlier tokens are not rewritten");
	failures += !check(expands_to("PI\n#macro PI { 3 }\nPI", "}\n3"), "later tokens are rewritten");

	{
		Session s{};
		auto id = s.sources.add_virtual("main", "#macro one { 1 }\none");
		pryzma::macro::Expander expander(s.sources, s.table, s.opt);
		auto out = expander.expand_file(id);

		auto ok = out.ok() && out.value().size() == 8;

		failures += !check(ok, "expansion succeeds");
		failures += !check(s.table.macro_count() == 1, "definition is registered in the session table");
		failures += !check(ok && out.value()[6].depth == 1, "produced tokens carry depth 1");
		failures += !check(ok && out.value()[3].depth == 0, "the definition body itself keeps depth 0");
	}

	failures += !check(fails_with("#macro again { again }\nagain", ErrorKind::macro_expansion_limit, "again"),
					   "self-referential macro hits the depth limit");
	failures += !check(fails_with("#macro ping { pong }\n#macro pong { ping }\nping",
								  ErrorKind::macro_expansion_limit),
					   "mutually recursive macros hit the depth limit");
	failures += !check(fails_with("#macro m { 1 }\n#macro m { 2 }", ErrorKind::parse_error, "m"),
					   "redefinition is an error");
	failures += !check(fails_with("#macro add(a, b) { a + b }\nadd(1)", ErrorKind::arity_error, "add"),
					   "macro argument count is checked");

	{
		Session s{};
		s.opt.max_depth = 3;
		auto chain = std::string("#macro a { b }\n#macro b { c }\n#macro c { d }\n#macro d { 4 }\n");

		auto deep = expand_text(s, chain + "a");
		failures += !check(!deep.ok() && deep.err().kind == ErrorKind::macro_expansion_limit,
						   "a chain deeper than max_depth fails");

		Session t{};
		t.opt.max_depth = 4;
		auto fits = expand_text(t, chain + "a");
		failures += !check(fits.ok() && fits.value().ends_with("4"), "a chain within max_depth terminates");
	}

	{
		Session s{};
		s.opt.max_expansions = 5;
		auto out = expand_text(s, "#macro one { 1 }\none one one one one one");
		failures += !check(!out.ok() && out.err().kind == ErrorKind::macro_expansion_limit,
						   "total expansions are limited per file");
	}

	failures += !check(expands_to("#keyword unless $c { $body } => { if !($c) { $body } }\n"
								  "unless x > 1 { print(x) }",
								  "if ! ( x > 1 ) { print ( x ) }"),
					   "keyword rule rewrites the statement");
	failures += !check(expands_to("#keyword swap $a , $b => { let t = $a ; $a = $b ; $b = t }\n"
								  "fn f() {\nswap p, q\n}",
								  "{\nlet t = p ; p = q ; q = t\n}"),
					   "keyword statement ends before the closing brace");
	failures += !check(expands_to("#keyword say $x => { print($x) }\nlet say = 1\nlet y = say",
								  "let y = say"),
					   "keyword triggers only at statement start");
	failures += !check(expands_to("#keyword show _ => { print(\"one\") }\n"
								  "#keyword show ... => { print(\"many\") }\n"
								  "show a\nshow a b",
								  "print ( \"one\" )\nprint ( \"many\" )"),
					   "rules are tried in registration order");
	failures += !check(fails_with("#keyword only $a ; => { $a }\nonly 1 2", ErrorKind::parse_error),
					   "malformed keyword definition is a parse error");
	failures += !check(fails_with("#keyword pick $a then $b => { $a }\npick 1 2", ErrorKind::parse_error, "pick"),
					   "no matching rule is a parse error");
	failures += !check(fails_with("#keyword bad $a => { $b }", ErrorKind::parse_error, "b"),
					   "template bindings must come from the pattern");

	{
		Session s{};
		pryzma::macro::Expander expander(s.sources, s.table, s.opt);
		expander.set_insert_resolver(
			[&s](std::string_view ref, pryzma::FileId, pryzma::SourceSpan where) -> pryzma::ErrorOr<pryzma::FileId> {
				if (ref == "common")
					return s.sources.add_virtual("common", "#macro TWO { 2 }\nlet shared = 1\n");
				if (ref == "loop")
					return s.sources.add_virtual("loop", "#insert \"loop\"\n");
				return pryzma::make_error(ErrorKind::module_not_found, where, "no such file", std::string(ref));
			});

		auto spliced = expander.expand_file(s.sources.add_virtual("main", "#insert \"common\"\nlet x = TWO\n"));
		auto text = spliced.ok() ? pryzma::macro::render_tokens(spliced.value()) : std::string{};
		failures += !check(text.find("let shared = 1") != std::string::npos, "#insert splices the file");
		failures += !check(text.find("let x = 2") != std::string::npos, "macros from inserted files apply");

		auto cycle = expander.expand_file(s.sources.add_virtual("top", "#insert \"loop\"\n"));
		failures += !check(!cycle.ok() && cycle.err().kind == ErrorKind::circular_import,
						   "recursive #insert is a circular import");

		auto missing = expander.expand_file(s.sources.add_virtual("other", "#insert \"nowhere\"\n"));
		failures += !check(!missing.ok() && missing.err().kind == ErrorKind::module_not_found,
						   "missing #insert target");
	}

	failures += !check(fails_with("#insert \"definitely/not/here.pryzma\"", ErrorKind::module_not_found),
					   "default resolver reports a missing file");

	if (failures != 0)
		std::cerr << failures << " test(s) failed\n";

	return failures == 0 ? 0 : 1;
}
