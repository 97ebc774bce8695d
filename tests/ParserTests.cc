#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <pryzma/fe/Parser.hh>
#include <pryzma/macro/TokenBuffer.hh>
#include <pryzma/support/SourceManager.hh>

namespace
{
	using namespace pryzma::fe;

	struct Parsed
	{
		std::optional<Program> program{};
		std::optional<pryzma::Error> error{};
	};

	Parsed parse(std::string_view text)
	{
		pryzma::SourceManager sources{};
		auto id = sources.add_virtual("parse", std::string(text));

		pryzma::macro::TokenBuffer buf(sources, id);
		Parsed out{};
		if (auto err = buf.first_error())
		{
			out.error = *err;
			return out;
		}

		Parser parser(buf.tokens());
		auto prog = parser.parse_program();
		if (prog.ok())
			out.program = prog.take();
		else
			out.error = prog.take_err();
		return out;
	}

	template <class T> T const* stmt_at(Parsed const& p, std::size_t i)
	{
		if (!p.program || i >= p.program->stmts.size())
			return nullptr;
		return std::get_if<T>(&p.program->stmts[i]->node);
	}

	template <class T> T const* expr_as(ExprPtr const& e)
	{
		return e ? std::get_if<T>(&e->node) : nullptr;
	}

	bool check(bool cond, std::string_view msg)
	{
		if (cond)
			return true;

		std::cerr << "FAIL: " << msg << "\n";
		return false;
	}

	bool fails_to_parse(std::string_view text, std::string_view message_part)
	{
		auto p = parse(text);
		if (!p.error)
			return false;
		if (p.error->kind != pryzma::ErrorKind::parse_error && p.error->kind != pryzma::ErrorKind::lex_error)
			return false;
		return p.error->message.find(message_part) != std::string::npos;
	}

} // namespace

int main()
{
	int failures = 0;

	{
		auto p = parse("let x = 1 + 2 * 3");
		auto const* let = stmt_at<StmtLet>(p, 0);
		auto const* add = let ? expr_as<ExprBinary>(let->value) : nullptr;
		auto const* mul = add ? expr_as<ExprBinary>(add->rhs) : nullptr;
		failures += !check(let && let->name == "x", "let statement");
		failures += !check(add && add->op == BinaryOp::add, "addition at the top");
		failures += !check(mul && mul->op == BinaryOp::mul, "multiplication binds tighter");
	}

	{
		auto p = parse("a or b and not c == d");
		auto const* s = stmt_at<StmtExpr>(p, 0);
		auto const* top = s ? expr_as<ExprBinary>(s->expr) : nullptr;
		auto const* rhs = top ? expr_as<ExprBinary>(top->rhs) : nullptr;
		failures += !check(top && top->op == BinaryOp::log_or, "'or' has the lowest precedence");
		failures += !check(rhs && rhs->op == BinaryOp::log_and, "'and' binds tighter than 'or'");
	}

	{
		auto p = parse("struct Point { x, y = 0, ?tag }");
		auto const* s = stmt_at<StmtStruct>(p, 0);
		auto ok = s && s->decl->fields.size() == 3;
		failures += !check(ok && s->decl->name == "Point", "struct declaration");
		failures += !check(ok && s->decl->fields[0].kind == FieldKind::required, "required field");
		failures += !check(ok && s->decl->fields[1].kind == FieldKind::defaulted
							   && s->decl->fields[1].default_value != nullptr,
						   "defaulted field keeps its expression");
		failures += !check(ok && s->decl->fields[2].kind == FieldKind::optional && s->decl->fields[2].name == "tag",
						   "optional field");
	}

	{
		auto p = parse("fn add(a, b) { a + b }\nlet twice = fn(f, v) { f(f(v)) }");
		auto const* fn = stmt_at<StmtFn>(p, 0);
		auto const* let = stmt_at<StmtLet>(p, 1);
		failures += !check(fn && fn->decl->name == "add" && fn->decl->params.size() == 2, "named function");
		failures += !check(let && expr_as<ExprFn>(let->value), "anonymous function expression");
	}

	{
		auto p = parse("use \"lib/util\" as u\nuse a::b::c with nan\nexport add, Point");
		auto const* u1 = stmt_at<StmtUse>(p, 0);
		auto const* u2 = stmt_at<StmtUse>(p, 1);
		auto const* ex = stmt_at<StmtExport>(p, 2);
		failures += !check(u1 && u1->reference == "lib/util" && u1->alias == "u" && !u1->is_package,
						   "path import with alias");
		failures += !check(u2 && u2->reference == "a::b::c" && u2->is_package && u2->merge, "package import merged");
		failures += !check(ex && ex->names.size() == 2 && ex->names[1].name == "Point", "export list");
	}

	{
		auto p = parse("if a { 1 } elif b { 2 } else { 3 }\nwhile x { break }\nfor i in xs { continue }");
		auto const* s = stmt_at<StmtIf>(p, 0);
		failures += !check(s && s->branches.size() == 2 && s->has_else, "if/elif/else");
		failures += !check(stmt_at<StmtWhile>(p, 1) != nullptr, "while loop");
		auto const* f = stmt_at<StmtFor>(p, 2);
		failures += !check(f && f->var == "i", "for loop variable");
	}

	{
		auto p = parse("let q = Point(y: 4,\n x: 3)\nq.y = 7\nxs[1] += 9");
		auto const* let = stmt_at<StmtLet>(p, 0);
		auto const* call = let ? expr_as<ExprCall>(let->value) : nullptr;
		failures += !check(call && call->args.size() == 2 && call->args[0].name == "y",
						   "named call arguments across a newline");

		auto const* member = stmt_at<StmtAssign>(p, 1);
		failures += !check(member && expr_as<ExprMember>(member->target) && !member->op, "member assignment");

		auto const* index = stmt_at<StmtAssign>(p, 2);
		failures += !check(index && expr_as<ExprIndex>(index->target) && index->op == BinaryOp::add,
						   "compound index assignment");
	}

	{
		auto p = parse("try { throw \"x\" } catch { 1 }\ntry { 1 } catch e { 2 }");
		auto const* t1 = stmt_at<StmtTry>(p, 0);
		auto const* t2 = stmt_at<StmtTry>(p, 1);
		failures += !check(t1 && t1->err_name == "err", "catch without a name binds err");
		failures += !check(t2 && t2->err_name == "e", "named catch binding");
	}

	{
		auto p = parse("asm add3(a, b) (rax = a, mem[8] = b) -> (rax, mem[16:4]) mem 64 { add rax, [8] }");
		auto const* s = stmt_at<StmtAsm>(p, 0);
		auto ok = s && s->decl->inputs.size() == 2 && s->decl->outputs.size() == 2;
		failures += !check(ok && s->decl->name == "add3" && s->decl->params.size() == 2, "callable asm header");
		failures += !check(ok && s->decl->inputs[1].loc.kind == AsmLocationKind::mem
							   && s->decl->inputs[1].loc.offset == 8,
						   "memory input slot");
		failures += !check(ok && s->decl->outputs[1].loc.length == 4u, "memory output slice");
		failures += !check(ok && s->decl->mem_size == 64u, "mem size clause");
	}

	{
		auto p = parse("asm (rax = x) -> (x = rax) { inc rax }");
		auto const* s = stmt_at<StmtAsm>(p, 0);
		failures += !check(s && s->decl->name.empty() && s->decl->outputs[0].target == "x", "inline asm block");
	}

	{
		auto p = parse("#macro sq(v) { v * v }\n#keyword unless $c { $b } => { if !($c) { $b } }\nlet y = 1");
		auto const* m = stmt_at<StmtDirective>(p, 0);
		auto const* k = stmt_at<StmtDirective>(p, 1);
		failures += !check(m && m->kind == DirectiveKind::macro && m->name == "sq", "macro directive is opaque");
		failures += !check(k && k->kind == DirectiveKind::keyword && k->name == "unless",
						   "keyword directive is opaque");
		failures += !check(stmt_at<StmtLet>(p, 2) != nullptr, "parsing continues after directives");
	}

	failures += !check(fails_to_parse("struct P { a, a }", "duplicate field"), "duplicate field");
	failures += !check(fails_to_parse("fn f(a, a) { a }", "duplicate parameter"), "duplicate parameter");
	failures += !check(fails_to_parse("let = 5", "variable name"), "let without a name");
	failures += !check(fails_to_parse("fn f() {\n  1\n", ""), "unterminated block");
	failures += !check(fails_to_parse("asm (rax = 1) -> (rax) { nop }", "needs a target"),
					   "inline asm output needs a target");
	failures += !check(fails_to_parse("let s = \"open", "unterminated"), "lex errors surface first");
	failures += !check(fails_to_parse("P(x: 3, 4)", "positional argument after a named argument"),
					   "positional argument after a named one");
	failures += !check(!parse("f(1, b: 2)").error, "named arguments after positional ones");

	{
		auto deep = "let x = " + std::string(2000, '(') + "1" + std::string(2000, ')');
		failures += !check(fails_to_parse(deep, "nested too deeply"), "deeply nested parentheses");

		std::string chain = "let x = 1";
		for (int i = 0; i < 5000; ++i)
			chain += " + 1";
		failures += !check(fails_to_parse(chain, "nested too deeply"), "long operator chain");

		std::string calls = "f";
		for (int i = 0; i < 5000; ++i)
			calls += "()";
		failures += !check(fails_to_parse(calls, "nested too deeply"), "long postfix chain");

		std::string blocks{};
		for (int i = 0; i < 2000; ++i)
			blocks += "if true { ";
		blocks += "1";
		for (int i = 0; i < 2000; ++i)
			blocks += " }";
		failures += !check(fails_to_parse(blocks, "nested too deeply"), "deeply nested blocks");

		auto fine = "let x = " + std::string(100, '(') + "1" + std::string(100, ')');
		failures += !check(!parse(fine).error, "moderate nesting parses");
	}

	{
		auto p = parse("let a = 1\nlet b = )\nlet c = 3");
		failures += !check(!p.program && p.error && p.error->span.begin.line == 2,
						   "first error aborts the file with its position");
	}

	if (failures != 0)
		std::cerr << failures << " test(s) failed\n";

	return failures == 0 ? 0 : 1;
}
