#include <array>
#include <pryzma/support/Ctype.hh>
#include <pryzma/x86/Instruction.hh>

namespace pryzma::x86
{
	namespace
	{
		constexpr std::array<std::string_view, reg_count> names64{
			"rax", "rcx", "rdx", "rbx", "rsp", "rbp", "rsi", "rdi",
			"r8",  "r9",  "r10", "r11", "r12", "r13", "r14", "r15",
		};

		constexpr std::array<std::string_view, 8> names32{
			"eax", "ecx", "edx", "ebx", "esp", "ebp", "esi", "edi",
		};

		constexpr std::array<std::string_view, 8> names16{
			"ax", "cx", "dx", "bx", "sp", "bp", "si", "di",
		};

		constexpr std::array<std::string_view, 8> names8{
			"al", "cl", "dl", "bl", "spl", "bpl", "sil", "dil",
		};

		constexpr std::array<std::string_view, 4> names8_high{"ah", "ch", "dh", "bh"};

		struct CondName
		{
			std::string_view suffix;
			Cond cc;
		};

		constexpr std::array<CondName, 30> cond_names{{
			{"o", Cond::o},	   {"no", Cond::no},  {"b", Cond::b},	  {"c", Cond::b},
			{"nae", Cond::b},  {"ae", Cond::ae},  {"nb", Cond::ae},	  {"nc", Cond::ae},
			{"e", Cond::e},	   {"z", Cond::e},	  {"ne", Cond::ne},	  {"nz", Cond::ne},
			{"be", Cond::be},  {"na", Cond::be},  {"a", Cond::a},	  {"nbe", Cond::a},
			{"s", Cond::s},	   {"ns", Cond::ns},  {"p", Cond::p},	  {"pe", Cond::p},
			{"np", Cond::np},  {"po", Cond::np},  {"l", Cond::l},	  {"nge", Cond::l},
			{"ge", Cond::ge},  {"nl", Cond::ge},  {"le", Cond::le},	  {"ng", Cond::le},
			{"g", Cond::g},	   {"nle", Cond::g},
		}};

		struct PlainName
		{
			std::string_view name;
			Mnemonic op;
		};

		constexpr std::array<PlainName, 37> plain_names{{
			{"mov", Mnemonic::mov},	  {"movzx", Mnemonic::movzx}, {"movsx", Mnemonic::movsx},
			{"lea", Mnemonic::lea},	  {"xchg", Mnemonic::xchg},	  {"add", Mnemonic::add},
			{"sub", Mnemonic::sub},	  {"adc", Mnemonic::adc},	  {"sbb", Mnemonic::sbb},
			{"inc", Mnemonic::inc},	  {"dec", Mnemonic::dec},	  {"neg", Mnemonic::neg},
			{"not", Mnemonic::not_},  {"and", Mnemonic::and_},	  {"or", Mnemonic::or_},
			{"xor", Mnemonic::xor_},  {"cmp", Mnemonic::cmp},	  {"test", Mnemonic::test},
			{"imul", Mnemonic::imul}, {"mul", Mnemonic::mul},	  {"div", Mnemonic::div},
			{"idiv", Mnemonic::idiv}, {"cqo", Mnemonic::cqo},	  {"shl", Mnemonic::shl},
			{"sal", Mnemonic::shl},	  {"shr", Mnemonic::shr},	  {"sar", Mnemonic::sar},
			{"rol", Mnemonic::rol},	  {"ror", Mnemonic::ror},	  {"push", Mnemonic::push},
			{"pop", Mnemonic::pop},	  {"jmp", Mnemonic::jmp},	  {"call", Mnemonic::call},
			{"ret", Mnemonic::ret},	  {"loop", Mnemonic::loop},	  {"nop", Mnemonic::nop},
			{"hlt", Mnemonic::hlt},
		}};

		[[nodiscard]] std::string lower(std::string_view s)
		{
			std::string out(s);
			for (auto& c : out)
				c = ascii_tolower(c);
			return out;
		}

		[[nodiscard]] std::optional<Cond> lookup_cond(std::string_view suffix) noexcept
		{
			for (auto const& c : cond_names)
				if (c.suffix == suffix)
					return c.cc;
			return std::nullopt;
		}

	} // namespace

	std::optional<RegRef> parse_register(std::string_view name)
	{
		auto n = lower(name);

		for (std::size_t i = 0; i < names64.size(); ++i)
			if (names64[i] == n)
				return RegRef{static_cast<Reg>(i), 8, false};

		for (std::size_t i = 0; i < names32.size(); ++i)
		{
			if (names32[i] == n)
				return RegRef{static_cast<Reg>(i), 4, false};
			if (names16[i] == n)
				return RegRef{static_cast<Reg>(i), 2, false};
			if (names8[i] == n)
				return RegRef{static_cast<Reg>(i), 1, false};
		}

		for (std::size_t i = 0; i < names8_high.size(); ++i)
			if (names8_high[i] == n)
				return RegRef{static_cast<Reg>(i), 1, true};

		// r8d, r8w, r8b and friends.
		if (n.size() >= 3 && n[0] == 'r' && is_ascii_digit(n[1]))
		{
			std::size_t i = 1;
			unsigned num = 0;
			while (i < n.size() && is_ascii_digit(n[i]))
				num = num * 10 + static_cast<unsigned>(n[i++] - '0');

			if (num < 8 || num > 15 || i + 1 != n.size())
				return std::nullopt;

			auto reg = static_cast<Reg>(num);
			switch (n[i])
			{
				case 'd':
					return RegRef{reg, 4, false};
				case 'w':
					return RegRef{reg, 2, false};
				case 'b':
					return RegRef{reg, 1, false};
				default:
					return std::nullopt;
			}
		}

		return std::nullopt;
	}

	std::string register_name(RegRef r)
	{
		auto idx = static_cast<std::size_t>(r.reg);

		if (r.high8)
			return std::string(names8_high[idx]);

		if (idx >= 8)
		{
			auto base = std::string(names64[idx]);
			switch (r.width)
			{
				case 4:
					return base + "d";
				case 2:
					return base + "w";
				case 1:
					return base + "b";
				default:
					return base;
			}
		}

		switch (r.width)
		{
			case 4:
				return std::string(names32[idx]);
			case 2:
				return std::string(names16[idx]);
			case 1:
				return std::string(names8[idx]);
			default:
				return std::string(names64[idx]);
		}
	}

	std::string_view mnemonic_name(Mnemonic m) noexcept
	{
		for (auto const& p : plain_names)
			if (p.op == m)
				return p.name;

		switch (m)
		{
			case Mnemonic::jcc:
				return "jcc";
			case Mnemonic::setcc:
				return "setcc";
			case Mnemonic::cmovcc:
				return "cmovcc";
			default:
				return "?";
		}
	}

	std::optional<MnemonicInfo> lookup_mnemonic(std::string_view name)
	{
		auto n = lower(name);

		for (auto const& p : plain_names)
			if (p.name == n)
				return MnemonicInfo{p.op, Cond::o};

		struct Family
		{
			std::string_view prefix;
			Mnemonic op;
		};

		constexpr std::array<Family, 3> families{{
			{"cmov", Mnemonic::cmovcc},
			{"set", Mnemonic::setcc},
			{"j", Mnemonic::jcc},
		}};

		for (auto const& f : families)
		{
			if (!n.starts_with(f.prefix))
				continue;

			if (auto cc = lookup_cond(std::string_view(n).substr(f.prefix.size())))
				return MnemonicInfo{f.op, *cc};
		}

		return std::nullopt;
	}

} // namespace pryzma::x86
