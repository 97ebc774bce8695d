#ifndef PRYZMA_X86_MACHINE_HH
#define PRYZMA_X86_MACHINE_HH

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>
#include <pryzma/Error.hh>
#include <pryzma/x86/Instruction.hh>

namespace pryzma::x86
{
	enum class Flag : std::uint8_t
	{
		cf,
		pf,
		zf,
		sf,
		of,
	};

	struct RunStats
	{
		std::size_t steps{};
		bool halted{};
	};

	// A 64-bit register file, the five arithmetic flags and a flat byte
	// memory addressed from 0. `rsp` starts at the top of memory so pushes
	// grow down into it.
	class Machine
	{
	public:
		explicit Machine(std::size_t memory_size);

		[[nodiscard]] std::uint64_t reg(Reg r) const noexcept
		{
			return m_regs[static_cast<std::size_t>(r)];
		}
		void set_reg(Reg r, std::uint64_t v) noexcept { m_regs[static_cast<std::size_t>(r)] = v; }

		// Narrow reads see the low bits (or bits 8..15 for ah..bh). Writes
		// of 32 bits zero the upper half, narrower writes merge.
		[[nodiscard]] std::uint64_t read(RegRef r) const noexcept;
		void write(RegRef r, std::uint64_t v) noexcept;

		[[nodiscard]] bool flag(Flag f) const noexcept { return m_flags[static_cast<std::size_t>(f)]; }
		void set_flag(Flag f, bool v) noexcept { m_flags[static_cast<std::size_t>(f)] = v; }

		[[nodiscard]] std::size_t memory_size() const noexcept { return m_mem.size(); }

		// Memory operands not based on rsp or rbp must end at or below the
		// data limit. The bytes above it belong to the stack.
		void set_data_limit(std::size_t limit) noexcept { m_data_limit = limit; }
		[[nodiscard]] std::size_t data_limit() const noexcept { return m_data_limit; }
		[[nodiscard]] Status check_data(std::uint64_t addr, std::size_t size, SourceSpan where) const;

		// Little-endian scalar access of 1, 2, 4 or 8 bytes.
		[[nodiscard]] ErrorOr<std::uint64_t> load(std::uint64_t addr, std::size_t size, SourceSpan where) const;
		[[nodiscard]] Status store(std::uint64_t addr, std::uint64_t value, std::size_t size, SourceSpan where);

		[[nodiscard]] Status write_bytes(std::uint64_t addr, std::span<const std::uint8_t> bytes, SourceSpan where);
		[[nodiscard]] ErrorOr<std::vector<std::uint8_t>>
		read_bytes(std::uint64_t addr, std::size_t size, SourceSpan where) const;

		// Runs until `ret` with no pending call, `hlt`, or falling off the end.
		[[nodiscard]] ErrorOr<RunStats> run(AsmProgram const& prog, std::size_t max_steps);

	private:
		[[nodiscard]] Status check_range(std::uint64_t addr, std::size_t size, SourceSpan where) const;

		std::array<std::uint64_t, reg_count> m_regs{};
		std::array<bool, 5> m_flags{};
		std::vector<std::uint8_t> m_mem{};
		std::size_t m_data_limit{};
	};

	[[nodiscard]] bool condition_holds(Machine const& m, Cond cc) noexcept;

} // namespace pryzma::x86

#endif /* PRYZMA_X86_MACHINE_HH */
