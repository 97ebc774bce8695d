#include <iostream>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>
#include <pryzma/Interpreter.hh>

namespace
{
	using pryzma::ErrorKind;

	struct Run
	{
		bool ok{};
		std::string out{};
		pryzma::Error error{};
	};

	Run run(std::string_view text)
	{
		std::ostringstream out{};
		pryzma::InterpreterOptions opt{};
		opt.out = &out;

		pryzma::Interpreter interp(opt);
		auto r = interp.run_source("eval", std::string(text));

		Run result{};
		result.ok = r.ok();
		if (!r.ok())
			result.error = r.take_err();
		result.out = out.str();
		return result;
	}

	bool check(bool cond, std::string_view msg)
	{
		if (cond)
			return true;

		std::cerr << "FAIL: " << msg << "\n";
		return false;
	}

	bool prints(std::string_view text, std::string_view expected)
	{
		auto r = run(text);
		if (!r.ok)
		{
			std::cerr << "  unexpected " << pryzma::error_kind_name(r.error.kind) << ": " << r.error.message
					  << "\n";
			return false;
		}
		if (r.out != expected)
		{
			std::cerr << "  got: " << r.out;
			return false;
		}
		return true;
	}

	bool fails_with(std::string_view text, ErrorKind kind, std::string_view subject = {})
	{
		auto r = run(text);
		if (r.ok)
			return false;
		if (r.error.kind != kind || (!subject.empty() && r.error.subject != subject))
		{
			std::cerr << "  got " << pryzma::error_kind_name(r.error.kind) << " (" << r.error.subject
					  << "): " << r.error.message << "\n";
			return false;
		}
		return true;
	}

} // namespace

int main()
{
	int failures = 0;

	{
		struct PrintCase
		{
			std::string_view source{};
			std::string_view expected{};
			std::string_view label{};
		};

		auto const cases = std::vector<PrintCase>{
			{"struct Point { x, y = 0 }\n"
			 "print(Point(3).y)\n"
			 "print(Point(3, 4) == Point(3, 4))\n"
			 "print(Point(3, 4) == Point(3, 5))\n",
			 "0\ntrue\nfalse\n",
			 "struct Point end to end"},

			{"struct P { x, y = 0 }\n"
			 "let a = P(1, 2)\n"
			 "let b = P(1, 2)\n"
			 "print(a == b)\n"
			 "a.x = 9\n"
			 "print(a == b, a)\n",
			 "true\nfalse P(x: 9, y: 2)\n",
			 "mutating a field breaks equality"},

			{"let counter = 0\n"
			 "fn next() { counter += 1; counter }\n"
			 "struct Tagged { v, id = next() }\n"
			 "print(Tagged(1).id, Tagged(2).id, Tagged(3, 0).id)\n",
			 "1 2 0\n",
			 "defaults are evaluated fresh per instantiation"},

			{"struct Rect { w, h = w * 2, ?label }\n"
			 "print(Rect(3))\n"
			 "print(Rect(h: 1, w: 2, label: \"sq\"))\n",
			 "Rect(w: 3, h: 6, label: none)\nRect(w: 2, h: 1, label: \"sq\")\n",
			 "defaults see bound fields and optional fields default to none"},

			{"let n = 1\n"
			 "let get = fn() { n }\n"
			 "n = 5\n"
			 "print(get())\n",
			 "5\n",
			 "closures observe later assignments"},

			{"fn make() {\n"
			 "  let c = 0\n"
			 "  fn inc() { c += 1; c }\n"
			 "  inc\n"
			 "}\n"
			 "let f = make()\n"
			 "f(); f()\n"
			 "print(f(), make()())\n",
			 "3 1\n",
			 "each call gets its own captured frame"},

			{"let xs = [1]\nlet ys = xs\npush(ys, 2)\nprint(xs, len(xs))\n",
			 "[1, 2] 2\n",
			 "lists are shared by reference"},

			{"print(7 / 2, -7 / 2, -7 % 3, 7.0 / 2, \"ab\" * 3, [1] + [2])\n",
			 "3 -3 -1 3.5 ababab [1, 2]\n",
			 "arithmetic rules"},

			{"print(9223372036854775807 + 1)\n", "-9223372036854775808\n", "integer addition wraps"},

			{"print(1 == 1.0, \"a\" < \"b\", [1, [2]] == [1, [2]], none == false, 0x10 | 1, 1 << 4)\n",
			 "true true true false 17 16\n",
			 "comparisons and bitwise operators"},

			{"print(0 or \"\", 3 and \"x\", not [])\n", "false true true\n", "logical operators yield bools"},

			{"fn sign(v) {\n"
			 "  if v > 0 { return \"pos\" } elif v < 0 { return \"neg\" }\n"
			 "  \"zero\"\n"
			 "}\n"
			 "print(sign(2), sign(-2), sign(0))\n",
			 "pos neg zero\n",
			 "return and last expression value"},

			{"fn sub(a, b) { a - b }\nprint(sub(b: 1, a: 5))\n", "4\n", "named function arguments"},

			{"let total = 0\n"
			 "for i in range(10) {\n"
			 "  if i % 2 == 0 { continue }\n"
			 "  if i > 7 { break }\n"
			 "  total += i\n"
			 "}\n"
			 "print(total)\n",
			 "16\n",
			 "for with break and continue"},

			{"let i = 0\nwhile i < 3 { i += 1 }\nprint(i)\nfor c in \"ab\" { print(c) }\n",
			 "3\na\nb\n",
			 "while loop and string iteration"},

			{"let x = 1\nif true { let x = 2; x = 3 }\nprint(x)\n", "1\n", "block bodies get their own frame"},

			{"let x = 1\nif true { x = 2 }\nprint(x)\n", "2\n", "assignment reaches the defining frame"},

			{"print(range(5, 0, -2), [1, 2, 3][-1], \"hey\"[1])\n", "[5, 3, 1] 3 e\n", "ranges and indexing"},

			{"let xs = [1, 2]\nxs[0] = 7\nxs[1] += 1\nprint(xs, pop(xs), xs)\n",
			 "[7] 3 [7]\n",
			 "index assignment"},

			{"struct P { x }\n"
			 "print(len(\"abc\"), str(12) + \"!\", int(\" 42 \"), float(\"1.5\"), type(P(1)), type(1.0), fields(P(1)))\n",
			 "3 12! 42 1.5 P float [\"x\"]\n",
			 "builtins"},

			{"try { let z = 1 / 0 } catch e { print(e.kind, e.message, e.line) }\n",
			 "DivisionByZero integer division by zero 1\n",
			 "caught error carries kind, message and line"},

			{"try { throw \"boom\" } catch { print(err.kind, err.message) }\n",
			 "UserError boom\n",
			 "throw raises a user error"},

			{"try {\n"
			 "  try { missing } catch e { throw e }\n"
			 "} catch f { print(f.kind) }\n",
			 "UndefinedNameError\n",
			 "rethrowing keeps the kind"},

			{"let x = 5\n"
			 "asm (rax = x) -> (x = rax) { inc rax }\n"
			 "print(x)\n",
			 "6\n",
			 "inline asm increments a bound value"},

			{"asm (rax = 2) -> (fresh = rax) { shl rax, 3 }\nprint(fresh)\n",
			 "16\n",
			 "inline asm defines a new binding"},

			{"asm add3(a, b) (rax = a, rbx = b) -> (rax) {\n"
			 "  add rax, rbx\n"
			 "  add rax, 3\n"
			 "}\n"
			 "print(add3(1, 2), add3(b: 10, a: 20))\n",
			 "6 33\n",
			 "callable asm block"},

			{"asm divmod(a, b) (rax = a, rcx = b) -> (rax, rdx) { cqo\n idiv rcx }\n"
			 "print(divmod(-7, 2))\n",
			 "[-3, -1]\n",
			 "several exits come back as a list"},

			{"asm (mem[0] = \"hi\") -> (s = mem[0:2]) { mov byte [1], 'o' }\nprint(s)\n",
			 "ho\n",
			 "string memory slots"},

			{"let x = 5\n"
			 "let y = 7\n"
			 "try {\n"
			 "  asm (rax = x) -> (x = rax, y = rbx) mem 16 {\n"
			 "    inc rax\n"
			 "    mov rbx, 1\n"
			 "    mov rcx, 4096\n"
			 "    mov qword [rcx], rbx\n"
			 "  }\n"
			 "} catch e { print(e.kind) }\n"
			 "print(x, y)\n",
			 "MemoryFault\n5 7\n",
			 "a faulting block commits nothing"},

			{"let y = 7\n"
			 "try {\n"
			 "  asm (rax = 1) -> (x = rax, y = rax) mem 16 { mov qword [200], rax }\n"
			 "} catch e { print(e.kind) }\n"
			 "try {\n"
			 "  asm (rax = 1) -> (y = rax) mem 16 { mov qword [16], rax }\n"
			 "} catch e { print(e.kind) }\n"
			 "print(y)\n",
			 "MemoryFault\nMemoryFault\n7\n",
			 "data writes past the declared memory fault"},

			{"asm (rax = 5) -> (r = rax) mem 8 {\n"
			 "  mov qword [0], rax\n"
			 "  push rax\n"
			 "  pop rcx\n"
			 "  mov rax, rcx\n"
			 "  inc rax\n"
			 "}\n"
			 "print(r)\n",
			 "6\n",
			 "the stack above declared memory stays usable"},

			{"let a = [1]\npush(a, a)\nprint(a)\nprint(len(a))\n", "[1, [...]]\n2\n", "self-containing list prints"},

			{"let a = [1]\npush(a, a)\nlet b = [1]\npush(b, b)\nprint(a == b, a == a, a == [1])\n",
			 "true true false\n",
			 "self-containing lists compare"},

			{"struct Node { next = none }\n"
			 "let n = Node()\n"
			 "n.next = n\n"
			 "print(n)\n",
			 "Node(next: Node(...))\n",
			 "self-referencing instance prints"},

			{"fn make() {\n"
			 "  let count = 0\n"
			 "  fn inc() { count = count + 1\n count }\n"
			 "  inc\n"
			 "}\n"
			 "let c = make()\n"
			 "c()\n"
			 "print(c())\n",
			 "2\n",
			 "escaping closure keeps its frame"},

			{"#macro square(v) { (v) * (v) }\n"
			 "#keyword unless $c { $body } => { if !($c) { $body } }\n"
			 "unless square(2) == 5 { print(\"not five\") }\n",
			 "not five\n",
			 "macros and keywords feed the evaluator"},
		};

		for (auto const& c : cases)
			failures += !check(prints(c.source, c.expected), c.label);
	}

	{
		struct ErrorCase
		{
			std::string_view source{};
			ErrorKind kind{};
			std::string_view subject{};
			std::string_view label{};
		};

		auto const cases = std::vector<ErrorCase>{
			{"print(undefined_var)", ErrorKind::undefined_name, "undefined_var", "undefined name"},
			{"nope = 1", ErrorKind::undefined_name, "nope", "assignment to an undefined name"},
			{"fn f(a) { a }\nf(1, 2)", ErrorKind::arity_error, {}, "too many arguments"},
			{"fn f(a, b) { a }\nf(1)", ErrorKind::arity_error, {}, "too few arguments"},
			{"struct P { x, y = 0 }\nP()", ErrorKind::missing_field, "x", "missing required field"},
			{"struct P { x }\nP(1, 2)", ErrorKind::arity_error, {}, "too many positional fields"},
			{"struct P { x }\nP(z: 1)", ErrorKind::type_error, "z", "unknown field in construction"},
			{"struct P { x }\nP(1, x: 2)", ErrorKind::type_error, "x", "field bound twice"},
			{"struct P { x }\nP(1).z", ErrorKind::undefined_name, "z", "unknown field read"},
			{"1 + \"a\"", ErrorKind::type_error, {}, "mixed operand kinds"},
			{"struct P { x, y = 0 }\nP(x: 3, 4)", ErrorKind::parse_error, {}, "positional field after a named one"},
			{"fn f(a, b) { a - b }\nf(a: 10, 1)", ErrorKind::parse_error, {}, "positional argument after a named one"},
			{"fn f(a, b) { a - b }\nf(b: 1, b: 2)", ErrorKind::type_error, "b", "parameter bound twice"},
			{"\"abcdefgh\" * 4000000000", ErrorKind::resource_limit, {}, "huge string repetition"},
			{"struct P { x }\nif P(1) { }", ErrorKind::type_error, {}, "struct is not a condition"},
			{"[1][5]", ErrorKind::index_error, {}, "index out of range"},
			{"1 % 0", ErrorKind::division_by_zero, {}, "modulo by zero"},
			{"fn r() { r() }\nr()", ErrorKind::resource_limit, {}, "call depth limit"},
			{"assert(1 == 2, \"nope\")", ErrorKind::user_error, {}, "failed assertion"},
			{"break", ErrorKind::parse_error, {}, "break outside a loop"},
			{"5(1)", ErrorKind::type_error, {}, "calling a non-function"},
			{"asm (rax = 1) -> (x = rax) { frobnicate rax }", ErrorKind::unsupported_opcode, "frobnicate",
			 "unknown mnemonic"},
			{"asm (rax = 1) -> (x = rax) { jmp nowhere }", ErrorKind::undefined_name, "nowhere",
			 "undefined jump target"},
			{"asm (rax = 1, rcx = 0) -> (x = rax) { div rcx }", ErrorKind::division_by_zero, {},
			 "asm division by zero"},
			{"asm (rax = \"s\") -> (x = rax) { nop }", ErrorKind::type_error, {}, "string in a register"},
			{"asm spin() () -> (rax) { top: jmp top }\nspin()", ErrorKind::resource_limit, {},
			 "asm step limit"},
		};

		for (auto const& c : cases)
			failures += !check(fails_with(c.source, c.kind, c.subject), c.label);
	}

	{
		std::ostringstream out{};
		pryzma::InterpreterOptions opt{};
		opt.out = &out;
		pryzma::Interpreter interp(opt);

		auto first = interp.run_source("one", "let base = 40\nfn plus(v) { base + v }");
		auto second = interp.evaluate("plus(2)");
		failures += !check(first.ok(), "session keeps running sources");
		failures += !check(second.ok() && second.value().is(pryzma::rt::ValueKind::integer)
							   && second.value().as_int() == 42,
						   "evaluate sees earlier globals");

		auto const* fn = interp.globals()->lookup("plus");
		failures += !check(fn != nullptr, "script function is visible in the global frame");
		if (fn)
		{
			auto called = interp.call(*fn, {pryzma::rt::Value::from_int(1)});
			failures += !check(called.ok() && called.value().as_int() == 41, "embedder calls a script function");
		}

		std::size_t steps = 0;
		interp.set_step_hook([&steps](pryzma::rt::StepEvent const& ev) {
			if (ev.phase == pryzma::rt::StepPhase::before && ev.env != nullptr)
				++steps;
		});
		auto traced = interp.run_source("two", "let a = 1\nlet b = 2\n");
		failures += !check(traced.ok() && steps == 2, "step hook runs for every statement");

		auto text = interp.preprocess("three", "#macro K { 7 }\nlet k = K\n");
		failures += !check(text.ok() && text.value().find("let k = 7") != std::string::npos,
						   "preprocess renders the expanded text");
	}

	{
		std::ostringstream out{};
		pryzma::InterpreterOptions opt{};
		opt.out = &out;
		pryzma::Interpreter interp(opt);

		auto r = interp.run_source("frames",
								   "fn outer(n) {\n"
								   "  fn inner() { n }\n"
								   "  let f = fn() { inner() }\n"
								   "  let l = [f]\n"
								   "  push(l, l)\n"
								   "  f()\n"
								   "}\n"
								   "let total = 0\n"
								   "for i in range(1000) { total = total + outer(i) }\n"
								   "print(total)\n");
		failures += !check(r.ok() && out.str() == "499500\n", "closures inside calls");
		failures += !check(interp.live_frames() == 0, "call frames captured by their own closures are reclaimed");

		auto kept = interp.run_source("kept",
									  "fn make() { let v = 41\n fn get() { v + 1 }\n get }\n"
									  "let g = make()\n");
		failures += !check(kept.ok() && interp.live_frames() == 1, "a frame reachable from a global survives");

		auto later = interp.evaluate("g()");
		failures += !check(later.ok() && later.value().as_int() == 42, "surviving frame still works");

		auto held = interp.evaluate("make()");
		failures += !check(held.ok() && held.value().is(pryzma::rt::ValueKind::function),
						   "a returned closure comes back");
		auto again = held.ok() ? interp.call(held.value(), {})
							   : pryzma::ErrorOr<pryzma::rt::Value>(pryzma::rt::Value::none());
		failures += !check(again.ok() && again.value().as_int() == 42, "a frame held by the host survives");
	}

	{
		pryzma::InterpreterOptions opt{};
		std::ostringstream out{};
		opt.out = &out;
		opt.limits.max_call_depth = 8;
		pryzma::Interpreter interp(opt);

		auto r = interp.run_source("deep", "fn d(n) { if n == 0 { return 0 }; d(n - 1) }\nd(20)");
		failures += !check(!r.ok() && r.err().kind == ErrorKind::resource_limit, "call depth limit is configurable");
	}

	if (failures != 0)
		std::cerr << failures << " test(s) failed\n";

	return failures == 0 ? 0 : 1;
}
