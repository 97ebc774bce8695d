#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <pryzma/support/SourceManager.hh>
#include <pryzma/x86/Decoder.hh>
#include <pryzma/x86/Machine.hh>

namespace
{
	using pryzma::ErrorKind;
	using pryzma::x86::Flag;
	using pryzma::x86::Machine;
	using pryzma::x86::Reg;

	constexpr std::size_t test_memory = 256;
	constexpr std::size_t test_steps = 10000;

	pryzma::ErrorOr<pryzma::x86::AsmProgram> decode_text(pryzma::SourceManager& sources, std::string_view body)
	{
		auto text = "{\n" + std::string(body) + "\n}";
		auto id = sources.add_virtual("asm", text);
		pryzma::SourceSpan span(id, pryzma::SourcePosition(0, 1, 1), pryzma::SourcePosition(text.size(), 1, 1));
		return pryzma::x86::decode(sources, span);
	}

	struct Outcome
	{
		std::optional<pryzma::Error> error{};
		pryzma::x86::RunStats stats{};
	};

	// Decodes and runs `body` on `m`.
	Outcome execute(Machine& m, std::string_view body, std::size_t steps = test_steps)
	{
		pryzma::SourceManager sources{};
		Outcome out{};

		auto prog = decode_text(sources, body);
		if (!prog.ok())
		{
			out.error = prog.take_err();
			return out;
		}

		auto ran = m.run(prog.value(), steps);
		if (!ran.ok())
			out.error = ran.take_err();
		else
			out.stats = ran.value();
		return out;
	}

	bool check(bool cond, std::string_view msg)
	{
		if (cond)
			return true;

		std::cerr << "FAIL: " << msg << "\n";
		return false;
	}

	bool runs_to(std::string_view body, Reg r, std::uint64_t expected)
	{
		Machine m(test_memory);
		auto out = execute(m, body);
		if (out.error)
		{
			std::cerr << "  " << pryzma::error_kind_name(out.error->kind) << ": " << out.error->message << "\n";
			return false;
		}
		if (m.reg(r) != expected)
		{
			std::cerr << "  got: " << m.reg(r) << "\n";
			return false;
		}
		return true;
	}

	bool fails_with(std::string_view body, ErrorKind kind)
	{
		Machine m(test_memory);
		auto out = execute(m, body);
		return out.error && out.error->kind == kind;
	}

} // namespace

int main()
{
	int failures = 0;

	failures += !check(runs_to("mov rax, 40\nadd rax, 2", Reg::rax, 42), "mov and add");
	failures += !check(runs_to("mov rax, 1\nshl rax, 4\nor rax, 3\nxor rax, 1", Reg::rax, 18), "logic and shifts");
	failures += !check(runs_to("mov rax, -1\nmov eax, 5", Reg::rax, 5), "32-bit writes zero the upper half");
	failures += !check(runs_to("mov rax, 0x1122334455667788\nmov al, 0", Reg::rax, 0x1122334455667700ULL),
					   "8-bit writes merge");
	failures += !check(runs_to("mov rax, 0\nmov ah, 0x12", Reg::rax, 0x1200), "high byte register");
	failures += !check(runs_to("mov rax, -8\nsar rax, 1", Reg::rax, static_cast<std::uint64_t>(-4)),
					   "arithmetic shift keeps the sign");
	failures += !check(runs_to("mov rax, -8\nshr rax, 60", Reg::rax, 15), "logical shift fills with zeros");
	failures += !check(runs_to("mov rax, 7\nmov rcx, 6\nimul rax, rcx", Reg::rax, 42), "two-operand imul");
	failures += !check(runs_to("mov rax, 100\nmov rdx, 0\nmov rcx, 7\ndiv rcx", Reg::rdx, 2), "div remainder");
	failures += !check(runs_to("mov rax, -7\ncqo\nmov rcx, 2\nidiv rcx", Reg::rax, static_cast<std::uint64_t>(-3)),
					   "idiv truncates toward zero");
	failures += !check(runs_to("mov rax, 0xFFFFFFFFFFFFFFFF\nmov rcx, 2\nmul rcx", Reg::rdx, 1),
					   "mul writes the high half to rdx");
	failures += !check(runs_to("mov rcx, 5\nmov rax, 0\nagain:\nadd rax, rcx\nloop again", Reg::rax, 15),
					   "loop counts rcx down");
	failures += !check(runs_to("mov rbx, 3\npush rbx\npush 9\npop rax\npop rcx\nadd rax, rcx", Reg::rax, 12),
					   "push and pop");
	failures += !check(runs_to("mov rax, 1\ncall twice\ncall twice\njmp done\ntwice:\nadd rax, rax\nret\ndone:",
							   Reg::rax,
							   4),
					   "call and ret");
	failures += !check(runs_to("mov rax, 3\ncmp rax, 5\nsetl bl\nmovzx rax, bl", Reg::rax, 1), "setcc");
	failures += !check(runs_to("mov rax, 1\nmov rcx, 9\ncmp rax, 0\ncmovne rax, rcx", Reg::rax, 9), "cmovcc");
	failures += !check(runs_to("mov rax, 2\ncmp rax, 2\nje eq\nmov rax, 0\neq:", Reg::rax, 2), "conditional jump");
	failures += !check(runs_to("mov qword [8], 77\nmov rax, [8]\nlea rbx, [rax + rax*2 + 1]", Reg::rbx, 232),
					   "memory and lea");
	failures += !check(runs_to("mov al, 'A'\nmovzx rax, al", Reg::rax, 65), "character immediates");

	{
		Machine m(test_memory);
		auto out = execute(m, "mov rax, 1\nsub rax, 1");
		failures += !check(!out.error && m.flag(Flag::zf) && !m.flag(Flag::cf), "zero result sets ZF");

		Machine n(test_memory);
		out = execute(n, "mov rax, 0\nsub rax, 1");
		failures += !check(!out.error && n.flag(Flag::cf) && n.flag(Flag::sf), "borrow sets CF and SF");

		Machine o(test_memory);
		out = execute(o, "mov rax, 0x7FFFFFFFFFFFFFFF\nadd rax, 1");
		failures += !check(!out.error && o.flag(Flag::of), "signed overflow sets OF");
	}

	{
		Machine m(test_memory);
		auto out = execute(m, "mov rax, 1\nret\nmov rax, 2");
		failures += !check(!out.error && m.reg(Reg::rax) == 1, "top-level ret stops the block");

		Machine h(test_memory);
		out = execute(h, "hlt\nmov rax, 2");
		failures += !check(!out.error && out.stats.halted && h.reg(Reg::rax) == 0, "hlt stops the block");
	}

	{
		Machine m(test_memory);
		failures += !check(m.reg(Reg::rsp) == test_memory, "stack starts at the top of memory");

		auto bytes = std::string("hi");
		auto st = m.write_bytes(4, {reinterpret_cast<std::uint8_t const*>(bytes.data()), bytes.size()}, {});
		auto back = m.read_bytes(4, 2, {});
		failures += !check(st.ok() && back.ok() && back.value()[1] == 'i', "byte access round trip");
		failures += !check(!m.read_bytes(test_memory - 1, 2, {}).ok(), "byte access is bounds checked");
	}

	{
		Machine m(test_memory);
		m.set_data_limit(16);
		auto out = execute(m, "mov rax, 5\nmov qword [8], rax");
		failures += !check(!out.error, "data access inside the data region");

		Machine n(test_memory);
		n.set_data_limit(16);
		out = execute(n, "mov rax, 5\nmov qword [12], rax");
		failures += !check(out.error && out.error->kind == ErrorKind::memory_fault, "data store straddling the limit");

		Machine o(test_memory);
		o.set_data_limit(16);
		out = execute(o, "mov rcx, 200\nmov rax, [rcx]");
		failures += !check(out.error && out.error->kind == ErrorKind::memory_fault, "data load from the stack area");

		Machine p(test_memory);
		p.set_data_limit(16);
		out = execute(p, "push 9\nmov rax, [rsp]\nmov rbp, rsp\nmov qword [rbp], 4\npop rbx\nadd rax, rbx");
		failures += !check(!out.error && p.reg(Reg::rax) == 13, "stack-relative operands reach the stack");
	}

	failures += !check(fails_with("mov rax, [1000]", ErrorKind::memory_fault), "out-of-range load");
	failures += !check(fails_with("mov rsp, 0\npush rax", ErrorKind::memory_fault), "stack underflow faults");
	failures += !check(fails_with("mov rcx, 0\ndiv rcx", ErrorKind::division_by_zero), "division by zero");
	failures += !check(fails_with("mov rdx, 1\nmov rcx, 1\ndiv rcx", ErrorKind::division_by_zero), "quotient overflow");
	failures += !check(fails_with("spin:\njmp spin", ErrorKind::resource_limit), "step limit");
	failures += !check(fails_with("frobnicate rax", ErrorKind::unsupported_opcode), "unknown mnemonic");
	failures += !check(fails_with("jmp nowhere", ErrorKind::undefined_name), "undefined label");
	failures += !check(fails_with("mov rax", ErrorKind::parse_error), "missing operand");
	failures += !check(fails_with("mov [8], 1", ErrorKind::parse_error), "memory operand without a size");
	failures += !check(fails_with("mov eax, rbx", ErrorKind::parse_error), "mismatched operand sizes");
	failures += !check(fails_with("mov 5, rax", ErrorKind::parse_error), "immediate destination");
	failures += !check(fails_with("shl rax, rbx", ErrorKind::parse_error), "shift count must be cl or immediate");
	failures += !check(fails_with("a:\na:\nnop", ErrorKind::parse_error), "duplicate label");

	{
		pryzma::SourceManager sources{};
		auto prog = decode_text(sources, "start: mov rax, 1\n; a comment\njne start");
		failures += !check(prog.ok() && prog.value().code.size() == 2 && prog.value().labels.at("start") == 0,
						   "labels on instruction lines");
		failures += !check(prog.ok() && std::get<pryzma::x86::LabelRef>(prog.value().code[1].operands[0]).target == 0,
						   "jump targets are resolved");
	}

	{
		auto r = pryzma::x86::parse_register("r10d");
		failures += !check(r && r->reg == Reg::r10 && r->width == 4, "extended 32-bit register name");
		failures += !check(!pryzma::x86::parse_register("rzx"), "unknown register name");

		auto jge = pryzma::x86::lookup_mnemonic("jge");
		failures += !check(jge && jge->op == pryzma::x86::Mnemonic::jcc && jge->cc == pryzma::x86::Cond::ge,
						   "conditional mnemonic splits its suffix");
	}

	if (failures != 0)
		std::cerr << failures << " test(s) failed\n";

	return failures == 0 ? 0 : 1;
}
