#ifndef PRYZMA_X86_INSTRUCTION_HH
#define PRYZMA_X86_INSTRUCTION_HH

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>
#include <pryzma/support/Span.hh>

namespace pryzma::x86
{
	// Hardware encoding order.
	enum class Reg : std::uint8_t
	{
		rax,
		rcx,
		rdx,
		rbx,
		rsp,
		rbp,
		rsi,
		rdi,
		r8,
		r9,
		r10,
		r11,
		r12,
		r13,
		r14,
		r15,
	};

	inline constexpr std::size_t reg_count = 16;

	// A register as named in source: `eax` is rax at width 4, `ah` is rax
	// at width 1 with `high8` set.
	struct RegRef
	{
		Reg reg{Reg::rax};
		std::uint8_t width{8};
		bool high8{};
	};

	[[nodiscard]] std::optional<RegRef> parse_register(std::string_view name);
	[[nodiscard]] std::string register_name(RegRef r);

	struct Imm
	{
		std::int64_t value{};
	};

	// `[base + index*scale + disp]`; `size` is 0 when the operand gives none.
	struct Mem
	{
		std::optional<Reg> base{};
		std::optional<Reg> index{};
		std::uint8_t scale{1};
		std::int64_t disp{};
		std::uint8_t size{};
	};

	struct LabelRef
	{
		std::string name{};
		std::size_t target{};
	};

	using Operand = std::variant<RegRef, Imm, Mem, LabelRef>;

	enum class Mnemonic : std::uint8_t
	{
		mov,
		movzx,
		movsx,
		lea,
		xchg,

		add,
		sub,
		adc,
		sbb,
		inc,
		dec,
		neg,
		not_,
		and_,
		or_,
		xor_,
		cmp,
		test,

		imul,
		mul,
		div,
		idiv,
		cqo,

		shl,
		shr,
		sar,
		rol,
		ror,

		push,
		pop,

		jmp,
		jcc,
		call,
		ret,
		loop,
		setcc,
		cmovcc,

		nop,
		hlt,
	};

	enum class Cond : std::uint8_t
	{
		o,
		no,
		b,
		ae,
		e,
		ne,
		be,
		a,
		s,
		ns,
		p,
		np,
		l,
		ge,
		le,
		g,
	};

	struct Instruction
	{
		SourceSpan span{};
		Mnemonic op{Mnemonic::nop};
		Cond cc{Cond::o};
		std::vector<Operand> operands{};
	};

	struct AsmProgram
	{
		std::vector<Instruction> code{};
		std::unordered_map<std::string, std::size_t> labels{};
	};

	[[nodiscard]] std::string_view mnemonic_name(Mnemonic m) noexcept;

	// `jne`, `setge`, `cmovz`: splits off the condition suffix of the
	// conditional families, and resolves aliases such as `sal`.
	struct MnemonicInfo
	{
		Mnemonic op{};
		Cond cc{};
	};

	[[nodiscard]] std::optional<MnemonicInfo> lookup_mnemonic(std::string_view name);

} // namespace pryzma::x86

#endif /* PRYZMA_X86_INSTRUCTION_HH */
